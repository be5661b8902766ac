#pragma once

#include "core/shared/struggle_types.h"

#include <QString>

namespace lp {

enum class ConsentLookupStatus {
    Found,
    NotFound,
    Unavailable,   // store unreachable or query failed
};

struct ConsentLookup {
    ConsentLookupStatus status = ConsentLookupStatus::Unavailable;
    ConsentRecord record;
    QString error;
};

// Authoritative consent backend behind the gate's cache.
class ConsentSource {
public:
    virtual ~ConsentSource() = default;
    virtual ConsentLookup lookupConsent(const QString& tenantId, const QString& userId) = 0;
};

} // namespace lp
