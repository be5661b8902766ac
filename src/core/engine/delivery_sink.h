#pragma once

#include "core/shared/struggle_types.h"

namespace lp {

// Receives intervention commands for the chat delivery collaborator.
// Called from session worker threads.
class InterventionSink {
public:
    virtual ~InterventionSink() = default;
    virtual void deliverIntervention(const InterventionCommand& command) = 0;
};

// Receives systemic failures that must not degrade silently.
// Called from whichever thread detected the failure.
class OperationalAlertSink {
public:
    virtual ~OperationalAlertSink() = default;
    virtual void raiseOperationalAlert(const OperationalAlert& alert) = 0;
};

} // namespace lp
