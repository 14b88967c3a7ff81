// Copyright (c) 2025 VAM Spatial Live
// Spatial Live - Qt Quick front end

#include <QCoreApplication>
#include <QGuiApplication>
#include <QQmlApplicationEngine>
#include <QStringList>

#include "core/logging.hpp"
#include "session_bridge.hpp"

int main(int argc, char* argv[]) {
    QGuiApplication app(argc, argv);
    QCoreApplication::setApplicationName("Spatial Live");
    QCoreApplication::setOrganizationName("VAM");

    const QStringList args = QCoreApplication::arguments();
    core::set_log_level(args.contains("--verbose") ? core::LogLevel::DEBUG : core::LogLevel::INFO);

    qmlRegisterType<SessionBridge>("App", 1, 0, "SessionBridge");

    QQmlApplicationEngine engine;
    QObject::connect(&engine, &QQmlApplicationEngine::objectCreationFailed, &app,
                     []() { QCoreApplication::exit(1); }, Qt::QueuedConnection);
    engine.loadFromModule("App", "Main");

    if (engine.rootObjects().isEmpty()) {
        core::log_error("Failed to load App/Main.qml");
        return 1;
    }

    core::log_info("Spatial Live UI ready");
    return app.exec();
}
