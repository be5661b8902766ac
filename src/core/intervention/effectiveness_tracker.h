#pragma once

#include "core/shared/types.h"

#include <QString>

#include <vector>

namespace lp {

struct EffectivenessMeasurement {
    QString interventionId;
    UserResponse response = UserResponse::None;
    double attentionBefore = 0.0;
    double attentionAfter = 0.0;
    double score = 0.5;
};

// Before/after engagement delta for interventions a learner responded to.
// Lives inside one session actor, so it is never shared across threads.
class EffectivenessTracker {
public:
    explicit EffectivenessTracker(int sampleSignals = 3);

    // Re-tracking an id restarts its measurement.
    void track(const QString& interventionId, UserResponse response, double attentionBefore);

    // Counts one applied signal; returns the measurements that completed.
    std::vector<EffectivenessMeasurement> onSignal(double attentionNow);

    size_t pending() const { return m_pending.size(); }

    // clamp(0.5 + (after - before), 0, 1)
    static double effectivenessScore(double attentionBefore, double attentionAfter);

private:
    struct Pending {
        QString interventionId;
        UserResponse response = UserResponse::None;
        double attentionBefore = 0.0;
        int remainingSignals = 0;
    };

    int m_sampleSignals = 3;
    std::vector<Pending> m_pending;
};

} // namespace lp
