#pragma once

namespace lp {

// Per-connection pragmas, safe on every open.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
PRAGMA wal_autocheckpoint = 10000;
PRAGMA cache_size = -32768;
PRAGMA journal_size_limit = 33554432;
)";

// Database-level pragmas, run once when creating the DB.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x4C504C53;
PRAGMA user_version = 1;
)";

// Schema v1. All timestamps are epoch milliseconds. Every table holding
// learner data is tenant-scoped and carries an anonymized_at column or is
// deleted outright by the retention sweep.
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS privacy_consent (
    tenant_id TEXT NOT NULL,
    user_id TEXT NOT NULL,
    behavioral_timing INTEGER NOT NULL DEFAULT 0,
    assessment_patterns INTEGER NOT NULL DEFAULT 0,
    chat_interactions INTEGER NOT NULL DEFAULT 0,
    cross_course_correlation INTEGER NOT NULL DEFAULT 0,
    anonymized_analytics INTEGER NOT NULL DEFAULT 0,
    collection_level TEXT NOT NULL DEFAULT 'minimal',
    withdrawn_at INTEGER,
    purged_at INTEGER,
    updated_at INTEGER NOT NULL,
    PRIMARY KEY (tenant_id, user_id)
);

CREATE INDEX IF NOT EXISTS idx_consent_withdrawn ON privacy_consent(withdrawn_at)
    WHERE withdrawn_at IS NOT NULL AND purged_at IS NULL;

CREATE TABLE IF NOT EXISTS behavioral_signals (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    tenant_id TEXT NOT NULL,
    session_id TEXT NOT NULL,
    user_id TEXT NOT NULL,
    course_id TEXT,
    signal_type TEXT NOT NULL,
    duration_ms INTEGER NOT NULL,
    element_context TEXT,
    page_content_hash TEXT,
    outcome TEXT NOT NULL DEFAULT 'none',
    signal_ts INTEGER NOT NULL,
    received_at INTEGER NOT NULL,
    nonce TEXT NOT NULL,
    origin TEXT NOT NULL,
    UNIQUE (session_id, nonce)
);

CREATE INDEX IF NOT EXISTS idx_signals_user ON behavioral_signals(tenant_id, user_id);
CREATE INDEX IF NOT EXISTS idx_signals_ts ON behavioral_signals(tenant_id, signal_ts);

CREATE TABLE IF NOT EXISTS session_snapshots (
    session_id TEXT PRIMARY KEY,
    tenant_id TEXT NOT NULL,
    user_id TEXT NOT NULL,
    course_id TEXT,
    sample_count INTEGER NOT NULL DEFAULT 0,
    features_json TEXT NOT NULL,
    opened_at INTEGER NOT NULL,
    closed_at INTEGER NOT NULL,
    close_reason TEXT NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_snapshots_user ON session_snapshots(tenant_id, user_id);

CREATE TABLE IF NOT EXISTS struggle_events (
    id TEXT PRIMARY KEY,
    tenant_id TEXT NOT NULL,
    session_id TEXT NOT NULL,
    user_id TEXT NOT NULL,
    course_id TEXT,
    risk_level REAL NOT NULL,
    confidence REAL NOT NULL,
    time_to_struggle_minutes REAL,
    contributing_factors TEXT NOT NULL DEFAULT '',
    model_version TEXT NOT NULL,
    computed_at INTEGER NOT NULL,
    valid_until INTEGER NOT NULL,
    anonymized_at INTEGER
);

CREATE INDEX IF NOT EXISTS idx_struggle_course ON struggle_events(tenant_id, course_id, computed_at);
CREATE INDEX IF NOT EXISTS idx_struggle_user ON struggle_events(tenant_id, user_id);

CREATE TABLE IF NOT EXISTS proactive_interventions (
    id TEXT PRIMARY KEY,
    tenant_id TEXT NOT NULL,
    session_id TEXT NOT NULL,
    user_id TEXT NOT NULL,
    course_id TEXT,
    struggle_event_id TEXT,
    intervention_type TEXT NOT NULL,
    urgency TEXT NOT NULL,
    risk_level REAL NOT NULL DEFAULT 0,
    message_intent TEXT NOT NULL,
    triggered_at INTEGER NOT NULL,
    delivered_at INTEGER,
    user_response TEXT NOT NULL DEFAULT 'none',
    responded_at INTEGER,
    effectiveness_score REAL,
    anonymized_at INTEGER
);

CREATE INDEX IF NOT EXISTS idx_interventions_user ON proactive_interventions(tenant_id, user_id, triggered_at);
CREATE INDEX IF NOT EXISTS idx_interventions_course ON proactive_interventions(tenant_id, course_id, triggered_at);

CREATE TABLE IF NOT EXISTS intervention_suppressions (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    tenant_id TEXT NOT NULL,
    session_id TEXT NOT NULL,
    user_id TEXT NOT NULL,
    course_id TEXT,
    reason TEXT NOT NULL,
    risk_level REAL NOT NULL,
    confidence REAL NOT NULL,
    decided_at INTEGER NOT NULL,
    anonymized_at INTEGER
);

CREATE INDEX IF NOT EXISTS idx_suppressions_course ON intervention_suppressions(tenant_id, course_id, decided_at);
CREATE INDEX IF NOT EXISTS idx_suppressions_user ON intervention_suppressions(tenant_id, user_id);

CREATE TABLE IF NOT EXISTS course_instructors (
    tenant_id TEXT NOT NULL,
    course_id TEXT NOT NULL,
    instructor_id TEXT NOT NULL,
    PRIMARY KEY (tenant_id, course_id)
);

CREATE TABLE IF NOT EXISTS instructor_alerts (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    tenant_id TEXT NOT NULL,
    course_id TEXT NOT NULL,
    instructor_id TEXT NOT NULL DEFAULT '',
    student_id TEXT,
    student_key TEXT NOT NULL,
    alert_type TEXT NOT NULL,
    severity TEXT NOT NULL,
    risk_score REAL NOT NULL,
    evidence_json TEXT NOT NULL,
    concerns_json TEXT NOT NULL,
    actions_json TEXT NOT NULL,
    status TEXT NOT NULL DEFAULT 'new',
    window_start INTEGER NOT NULL,
    window_end INTEGER NOT NULL,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL,
    resolved_at INTEGER,
    anonymized_at INTEGER
);

CREATE UNIQUE INDEX IF NOT EXISTS idx_alerts_open_key
    ON instructor_alerts(tenant_id, course_id, student_key, alert_type)
    WHERE status IN ('new', 'acknowledged', 'in_progress');
CREATE INDEX IF NOT EXISTS idx_alerts_feed ON instructor_alerts(tenant_id, course_id, status, updated_at DESC);

CREATE TABLE IF NOT EXISTS alert_actions (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    alert_id INTEGER NOT NULL REFERENCES instructor_alerts(id) ON DELETE CASCADE,
    actor_id TEXT NOT NULL,
    action_taken TEXT NOT NULL,
    from_status TEXT NOT NULL,
    to_status TEXT NOT NULL,
    note TEXT,
    acted_at INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_alert_actions_alert ON alert_actions(alert_id);

CREATE TABLE IF NOT EXISTS settings (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);
)";

// Default settings rows
constexpr const char* kDefaultSettings = R"(
INSERT OR IGNORE INTO settings (key, value) VALUES ('schema_version', '1');
INSERT OR IGNORE INTO settings (key, value) VALUES ('lastAlertScanAtMs', '0');
INSERT OR IGNORE INTO settings (key, value) VALUES ('lastRetentionSweepAtMs', '0');
)";

constexpr int kCurrentSchemaVersion = 2;

} // namespace lp
