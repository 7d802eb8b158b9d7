#include <QCoreApplication>
#include <QElapsedTimer>
#include <QLoggingCategory>
#include <QTimer>

#include <depth_stream_sync/dss_depth_sync_session.h>
#include <depth_stream_sync/dss_sync_config.h>

Q_LOGGING_CATEGORY(dssMonitor, "dss.monitor")

namespace {

constexpr int DISPLAY_REFRESH_MS = 16;

void print_usage(const char* argv0)
{
    qCCritical(dssMonitor, "Usage: %s <api-base> <session-id> [fps] [run-seconds]", argv0);
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("depth_sync_monitor");
    app.setApplicationVersion("1.0.0");

    QLoggingCategory::setFilterRules("dss.*.debug=false\ndss.*=true");
    dss::apply_log_rules_from_environment();

    dss::SyncConfig config = dss::apply_environment(dss::default_config());
    int run_seconds = 0;

    const QStringList args = app.arguments();
    if (args.size() > 1) config.api_base = args.at(1);
    if (args.size() > 2) config.session_id = args.at(2);
    if (args.size() > 3) {
        bool ok = false;
        const double fps = args.at(3).toDouble(&ok);
        if (!ok) {
            qCCritical(dssMonitor, "Invalid fps: %s", qPrintable(args.at(3)));
            print_usage(argv[0]);
            return 2;
        }
        config.fps = fps;
    }
    if (args.size() > 4) {
        bool ok = false;
        run_seconds = args.at(4).toInt(&ok);
        if (!ok || run_seconds < 0) {
            qCCritical(dssMonitor, "Invalid run-seconds: %s", qPrintable(args.at(4)));
            print_usage(argv[0]);
            return 2;
        }
    }

    auto valid = dss::validate_config(config);
    if (valid.is_error()) {
        qCCritical(dssMonitor, "Invalid configuration: %s", qPrintable(QString::fromStdString(valid.error().message)));
        print_usage(argv[0]);
        return 2;
    }

    auto session = dss::DepthSyncSession::Create(config);
    QObject::connect(session.get(), &dss::DepthSyncSession::connectedChanged, [](bool connected) {
        qCInfo(dssMonitor, "Stream %s", connected ? "connected" : "disconnected");
    });

    // Stand-in for a video element: playback advances in real time from zero
    QElapsedTimer playback_clock;
    QTimer refresh;
    refresh.setInterval(DISPLAY_REFRESH_MS);
    QObject::connect(&refresh, &QTimer::timeout, [&]() {
        const double playback_ms = static_cast<double>(playback_clock.elapsed());
        session->Tick(playback_ms);
        session->FrameAt(playback_ms);
    });

    if (run_seconds > 0) {
        QTimer::singleShot(run_seconds * 1000, &app, [&]() {
            refresh.stop();
            session->ReportHealth();
            session->Stop();
            app.quit();
        });
    }

    session->Start();
    playback_clock.start();
    refresh.start();

    qCInfo(dssMonitor, "Monitoring %s (session %s)", qPrintable(dss::stream_url(config).toString()),
           qPrintable(config.session_id));

    return app.exec();
}
