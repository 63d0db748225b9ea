#include <atomic>
#include <csignal>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QTimer>

#include "bridge.h"
#include "bridgeconfig.h"

Q_LOGGING_CATEGORY(mainLog, "hmbridge.main")

namespace {

std::atomic_bool g_running{true};

void handleSignal(int)
{
    g_running.store(false);
}

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("hm-mqtt-bridge"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));
    qSetMessagePattern(QStringLiteral("%{time yyyy-MM-dd hh:mm:ss.zzz} %{if-category}%{category}: %{endif}%{message}"));

    QCommandLineParser parser;
    hmbridge::configureParser(parser);
    parser.process(app);

    hmbridge::BridgeConfig config;
    QString errorString;
    const bool configured = hmbridge::loadConfig(parser, config, errorString);

    QLoggingCategory::setFilterRules(config.debug ? QStringLiteral("hmbridge.*.debug=true")
                                                  : QStringLiteral("hmbridge.*.debug=false"));
    if (!configured) {
        qCCritical(mainLog).noquote() << errorString;
        return 1;
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    hmbridge::Bridge bridge(config);
    QObject::connect(&bridge, &hmbridge::Bridge::commandFailed, &app,
                     [](const hmbridge::Command &command, const QString &error) {
        qCWarning(mainLog).noquote() << "Command" << command.key << "for" << command.address
                                     << "channel" << command.channel << "failed:" << error;
    });

    if (!bridge.start(errorString)) {
        qCCritical(mainLog).noquote() << "Startup failed:" << errorString;
        return 1;
    }

    // Signal handlers may only touch the flag; the event loop polls it.
    QTimer signalPoll;
    QObject::connect(&signalPoll, &QTimer::timeout, &app, [&app]() {
        if (!g_running.load())
            app.quit();
    });
    signalPoll.start(250);
    app.exec();

    qCInfo(mainLog) << "Signal received, shutting down";
    bridge.stop();
    return 0;
}
