#include <signal.h>
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDBusConnection>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QLoggingCategory>
#include <QStandardPaths>
#include <memory>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include "core/YamlConfig.hpp"
#include "core/bus/KdeConnectGateway.hpp"
#include "core/notify/KConfigFileStore.hpp"
#include "core/notify/NativeNotifier.hpp"
#include "core/notify/NotificationArbiter.hpp"
#include "core/services/ConfigService.hpp"
#include "core/services/EventBus.hpp"
#include "core/services/IpcServer.hpp"
#include "core/services/NotificationService.hpp"
#include "core/session/SessionManager.hpp"

namespace {

void applyLogLevel(const QString& level)
{
    namespace logging = boost::log;
    auto severity = logging::trivial::info;
    QString rules;
    if (level == QLatin1String("trace") || level == QLatin1String("debug")) {
        severity = level == QLatin1String("trace") ? logging::trivial::trace : logging::trivial::debug;
        rules = QStringLiteral("*.debug=true");
    } else if (level == QLatin1String("warning")) {
        severity = logging::trivial::warning;
        rules = QStringLiteral("*.debug=false\n*.info=false");
    } else if (level == QLatin1String("error")) {
        severity = logging::trivial::error;
        rules = QStringLiteral("*.debug=false\n*.info=false\n*.warning=false");
    } else {
        rules = QStringLiteral("*.debug=false");
    }
    logging::core::get()->set_filter(logging::trivial::severity >= severity);
    QLoggingCategory::setFilterRules(rules);
}

QString defaultPath(QStandardPaths::StandardLocation location, const QString& fileName)
{
    return QStandardPaths::writableLocation(location) + QLatin1Char('/') + fileName;
}

// XDG_STATE_HOME, falling back to ~/.local/state
QString stateDir()
{
    const QString dir = qEnvironmentVariable("XDG_STATE_HOME");
    return dir.isEmpty() ? QDir::homePath() + QStringLiteral("/.local/state") : dir;
}

QString runtimeSocketPath()
{
    QString dir = QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    if (dir.isEmpty())
        dir = QDir::tempPath();
    return dir + QStringLiteral("/kdeconnect-bridge.sock");
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("kdeconnect-bridge");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("KDE Connect device and plugin session manager");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption({"c", "config"}, "Configuration file.", "path");
    parser.addOption(configOption);
    parser.process(app);

    // Load from the given or default path if it exists; otherwise use built-in defaults
    QString yamlPath = parser.isSet(configOption)
        ? parser.value(configOption)
        : defaultPath(QStandardPaths::AppConfigLocation, "config.yaml");
    auto yamlConfig = std::make_shared<kcb::YamlConfig>();
    if (!QFile::exists(yamlPath))
        BOOST_LOG_TRIVIAL(info) << "No config at " << yamlPath.toStdString() << ", using defaults";
    else if (!yamlConfig->load(yamlPath))
        BOOST_LOG_TRIVIAL(warning) << "Ignoring unreadable config " << yamlPath.toStdString();

    applyLogLevel(yamlConfig->logLevel());

    auto configService = new kcb::ConfigService(yamlConfig.get(), yamlPath, &app);
    auto eventBus = new kcb::EventBus(&app);

    // --- Daemon gateway ---
    auto gateway = new kcb::KdeConnectGateway(configService, &app);

    // --- Notification arbitration ---
    QString notifyrcPath = yamlConfig->notifyrcPath();
    if (notifyrcPath.isEmpty())
        notifyrcPath = defaultPath(QStandardPaths::GenericConfigLocation, "kdeconnect.notifyrc");
    QString backupPath = yamlConfig->backupPath();
    if (backupPath.isEmpty())
        backupPath = stateDir() + QStringLiteral("/kdeconnect-bridge/notify-backup.yaml");

    auto arbiter = new kcb::NotificationArbiter(
        std::make_unique<kcb::KConfigFileStore>(notifyrcPath, yamlConfig->lockTimeoutMs()),
        backupPath);
    arbiter->setEnabled(yamlConfig->suppressDaemonNotifications());

    // --- Session ---
    auto sessionManager = new kcb::SessionManager(gateway, configService, arbiter, &app);
    sessionManager->setEventBus(eventBus);

    // --- Native notifications ---
    if (yamlConfig->nativeNotifications()) {
        auto notificationService = new kcb::NotificationService(QDBusConnection::sessionBus(), &app);
        auto notifier = new kcb::NativeNotifier(notificationService, eventBus,
            [sessionManager](const kcb::CommandRequest& request, kcb::ResultCallback callback) {
                sessionManager->submit(request, std::move(callback));
            }, &app);
        notifier->start();
    }

    // --- IPC server for consumers ---
    QString socketPath = yamlConfig->socketPath();
    if (socketPath.isEmpty())
        socketPath = runtimeSocketPath();
    auto ipcServer = new kcb::IpcServer(&app);
    ipcServer->setSessionManager(sessionManager);
    ipcServer->setEventBus(eventBus);
    if (!ipcServer->start(socketPath))
        qWarning() << "[Main] IPC server unavailable, consumers cannot attach";

    gateway->start();
    sessionManager->start();

    // SIGINT/SIGTERM → leave the event loop so suppression is reverted on the way out
    auto quitHandler = [](int) {
        QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                                  Qt::QueuedConnection);
    };
    signal(SIGINT, quitHandler);
    signal(SIGTERM, quitHandler);

    int ret = app.exec();

    // Teardown order matters: the IPC server must stop writing before the
    // session goes away, and the session releases suppression on shutdown.
    ipcServer->stop();
    sessionManager->shutdown();

    return ret;
}
