#pragma once

#include "dss_errors.h"
#include "dss_tuning.h"

#include <QString>
#include <QUrl>

namespace dss {

// Session configuration. Tuning values are initial values only; the
// adaptive tuner overwrites them at runtime.
struct SyncConfig {
    QString api_base;              // http(s)://host[:port]
    QString session_id;
    double fps = 30.0;             // video frame rate, sets the request grid
    TuningSnapshot initial_tuning;
    int status_poll_interval_ms = 500;
    int health_interval_ms = 5000;
};

SyncConfig default_config();

// Overlay DSS_API_BASE, DSS_SESSION_ID, DSS_FPS, DSS_MAX_INFLIGHT,
// DSS_LEAD_MS and DSS_AUTO_LEAD. Unparseable values are logged and ignored.
SyncConfig apply_environment(SyncConfig config);

// Forward DSS_LOG_RULES to QLoggingCategory::setFilterRules, if set
void apply_log_rules_from_environment();

Result<void> validate_config(const SyncConfig& config);

// ws(s)://<base>/api/sessions/<id>/stream
QUrl stream_url(const SyncConfig& config);

// http(s)://<base>/api/sessions/<id>/status
QUrl status_url(const SyncConfig& config);

// http(s)://<base>/api/log
QUrl log_url(const SyncConfig& config);

} // namespace dss
