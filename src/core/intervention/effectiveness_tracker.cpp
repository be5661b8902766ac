#include "core/intervention/effectiveness_tracker.h"

#include <algorithm>

namespace lp {

EffectivenessTracker::EffectivenessTracker(int sampleSignals)
    : m_sampleSignals(sampleSignals > 0 ? sampleSignals : 1)
{
}

void EffectivenessTracker::track(const QString& interventionId, UserResponse response,
                                 double attentionBefore)
{
    m_pending.erase(std::remove_if(m_pending.begin(), m_pending.end(),
                                   [&interventionId](const Pending& p) {
                                       return p.interventionId == interventionId;
                                   }),
                    m_pending.end());

    Pending pending;
    pending.interventionId = interventionId;
    pending.response = response;
    pending.attentionBefore = attentionBefore;
    pending.remainingSignals = m_sampleSignals;
    m_pending.push_back(pending);
}

std::vector<EffectivenessMeasurement> EffectivenessTracker::onSignal(double attentionNow)
{
    std::vector<EffectivenessMeasurement> completed;
    for (auto it = m_pending.begin(); it != m_pending.end();) {
        --it->remainingSignals;
        if (it->remainingSignals > 0) {
            ++it;
            continue;
        }
        EffectivenessMeasurement m;
        m.interventionId = it->interventionId;
        m.response = it->response;
        m.attentionBefore = it->attentionBefore;
        m.attentionAfter = attentionNow;
        m.score = effectivenessScore(it->attentionBefore, attentionNow);
        completed.push_back(m);
        it = m_pending.erase(it);
    }
    return completed;
}

double EffectivenessTracker::effectivenessScore(double attentionBefore, double attentionAfter)
{
    return std::clamp(0.5 + (attentionAfter - attentionBefore), 0.0, 1.0);
}

} // namespace lp
