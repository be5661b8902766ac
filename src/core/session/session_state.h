#pragma once

#include "core/scoring/struggle_scorer.h"
#include "core/shared/settings.h"
#include "core/shared/struggle_types.h"

#include <QString>

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>

namespace lp {

// Rolling per-session window and the features derived from it.
// Owned by exactly one SessionActor; not thread-safe on its own.
class SessionState {
public:
    using FeatureFn = std::function<std::optional<SessionFeatures>(
        const std::deque<BehavioralSignal>& window,
        const std::optional<FactorInputs>& previousInputs)>;

    SessionState(const QString& sessionId, const QString& tenantId,
                 const QString& userId, const QString& courseId,
                 const SessionConfig& config, const StruggleScorer& scorer);

    // Appends the signal, trims the window and recomputes features.
    // Returns false on a ModelError; the last good features are kept.
    bool apply(const BehavioralSignal& signal);

    // Replaces the built-in feature computation. An empty function restores it.
    void setFeatureFunction(FeatureFn fn);

    bool readyForScoring() const;

    const SessionFeatures& features() const { return m_features; }
    const std::deque<BehavioralSignal>& window() const { return m_window; }

    const QString& sessionId() const { return m_sessionId; }
    const QString& tenantId() const { return m_tenantId; }
    const QString& userId() const { return m_userId; }
    const QString& courseId() const { return m_courseId; }
    const QString& lastPageContentHash() const { return m_lastPageContentHash; }

    int64_t openedAtMs() const { return m_openedAtMs; }
    int64_t lastSignalAtMs() const { return m_lastSignalAtMs; }
    int totalSignals() const { return m_totalSignals; }
    int modelErrors() const { return m_modelErrors; }

    // nullopt when a derived value is not finite.
    static std::optional<SessionFeatures> computeFeatures(
        const std::deque<BehavioralSignal>& window,
        const SessionConfig& config,
        const StruggleScorer& scorer,
        const std::optional<FactorInputs>& previousInputs);

private:
    void trimWindow();

    QString m_sessionId;
    QString m_tenantId;
    QString m_userId;
    QString m_courseId;
    QString m_lastPageContentHash;
    SessionConfig m_config;
    const StruggleScorer& m_scorer;

    std::deque<BehavioralSignal> m_window;
    SessionFeatures m_features;
    std::optional<FactorInputs> m_lastInputs;
    FeatureFn m_featureFn;

    int64_t m_openedAtMs = 0;
    int64_t m_lastSignalAtMs = 0;
    int m_totalSignals = 0;
    int m_modelErrors = 0;
};

} // namespace lp
