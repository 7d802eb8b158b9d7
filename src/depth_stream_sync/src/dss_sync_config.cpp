#include <depth_stream_sync/dss_sync_config.h>

#include <QLoggingCategory>
#include <QtGlobal>

Q_LOGGING_CATEGORY(dssConfig, "dss.config")

namespace dss {

namespace {

template<typename T, typename Parse>
void override_from_env(const char* name, T& target, Parse parse) {
    if (!qEnvironmentVariableIsSet(name)) return;
    const QString raw = qEnvironmentVariable(name).trimmed();
    bool ok = false;
    T value = parse(raw, &ok);
    if (!ok) {
        qCWarning(dssConfig, "Ignoring %s=%s (not a valid value)", name, qPrintable(raw));
        return;
    }
    target = value;
    qCInfo(dssConfig, "%s overridden from environment", name);
}

bool parse_bool(const QString& raw, bool* ok) {
    const QString v = raw.toLower();
    *ok = true;
    if (v == QLatin1String("1") || v == QLatin1String("true") || v == QLatin1String("on")) return true;
    if (v == QLatin1String("0") || v == QLatin1String("false") || v == QLatin1String("off")) return false;
    *ok = false;
    return false;
}

QUrl api_url(const SyncConfig& config, const QString& route) {
    QUrl url(config.api_base);
    QString path = url.path();
    while (path.endsWith(QLatin1Char('/'))) path.chop(1);
    url.setPath(path + QStringLiteral("/api/") + route);
    return url;
}

QUrl session_url(const SyncConfig& config, const QString& leaf) {
    return api_url(config, QStringLiteral("sessions/") + config.session_id + QLatin1Char('/') + leaf);
}

} // namespace

SyncConfig default_config() {
    SyncConfig config;
    config.api_base = QStringLiteral("http://127.0.0.1:8000");
    config.fps = 30.0;
    config.initial_tuning.max_inflight_requests = 8;
    config.initial_tuning.lead_time_ms = 2000;
    config.initial_tuning.auto_lead_enabled = false;
    config.status_poll_interval_ms = 500;
    config.health_interval_ms = 5000;
    return config;
}

SyncConfig apply_environment(SyncConfig config) {
    if (qEnvironmentVariableIsSet("DSS_API_BASE")) {
        config.api_base = qEnvironmentVariable("DSS_API_BASE").trimmed();
    }
    if (qEnvironmentVariableIsSet("DSS_SESSION_ID")) {
        config.session_id = qEnvironmentVariable("DSS_SESSION_ID").trimmed();
    }
    override_from_env("DSS_FPS", config.fps,
                      [](const QString& s, bool* ok) { return s.toDouble(ok); });
    override_from_env("DSS_MAX_INFLIGHT", config.initial_tuning.max_inflight_requests,
                      [](const QString& s, bool* ok) { return s.toInt(ok); });
    override_from_env("DSS_LEAD_MS", config.initial_tuning.lead_time_ms,
                      [](const QString& s, bool* ok) { return s.toInt(ok); });
    override_from_env("DSS_AUTO_LEAD", config.initial_tuning.auto_lead_enabled, parse_bool);
    return config;
}

void apply_log_rules_from_environment() {
    if (!qEnvironmentVariableIsSet("DSS_LOG_RULES")) return;
    // Rules are ';'-separated in the variable, newline-separated for Qt
    QString rules = qEnvironmentVariable("DSS_LOG_RULES");
    rules.replace(QLatin1Char(';'), QLatin1Char('\n'));
    QLoggingCategory::setFilterRules(rules);
}

Result<void> validate_config(const SyncConfig& config) {
    const QUrl base(config.api_base);
    if (!base.isValid() || base.host().isEmpty()) {
        return Error::invalid_arg("api_base is not a URL: " + config.api_base.toStdString());
    }
    const QString scheme = base.scheme();
    if (scheme != QLatin1String("http") && scheme != QLatin1String("https")) {
        return Error::invalid_arg("api_base must be http or https");
    }
    if (config.session_id.isEmpty()) {
        return Error::invalid_arg("session_id is empty");
    }
    if (!(config.fps > 0.0)) {
        return Error::invalid_arg("fps must be positive");
    }
    if (config.initial_tuning.max_inflight_requests < 1) {
        return Error::invalid_arg("max_inflight_requests must be at least 1");
    }
    if (config.initial_tuning.lead_time_ms < 0) {
        return Error::invalid_arg("lead_time_ms must not be negative");
    }
    return {};
}

QUrl stream_url(const SyncConfig& config) {
    QUrl url = session_url(config, QStringLiteral("stream"));
    url.setScheme(url.scheme() == QLatin1String("https") ? QStringLiteral("wss") : QStringLiteral("ws"));
    return url;
}

QUrl status_url(const SyncConfig& config) {
    return session_url(config, QStringLiteral("status"));
}

QUrl log_url(const SyncConfig& config) {
    return api_url(config, QStringLiteral("log"));
}

} // namespace dss
