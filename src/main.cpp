#include "core/Logger.hpp"
#include "core/Notifier.hpp"
#include "gui/SystemTrayBackend.hpp"
#include "utils/ConfigManager.hpp"
#include <tray-notifier/Constants.hpp>
#include <tray-notifier/Errors.hpp>
#include <QApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDir>
#include <QFile>
#include <iostream>

using namespace tray_notifier;

namespace {

constexpr int EXIT_STARTUP_FAILURE = -1;

void printUsage() {
    std::cout << "Usage:" << std::endl;
    std::cout << "$tray-notifier [port [defaultIcon [soundDesktopProperty]]]" << std::endl;
    std::cout << std::endl;
}

void setupCommandLineParser(QCommandLineParser& parser) {
    parser.setApplicationDescription("Shows HTTP requests as system tray notifications");
    parser.addHelpOption();
    parser.addVersionOption();

    parser.addPositionalArgument("port", "HTTP port to listen on (default 8811).", "[port]");
    parser.addPositionalArgument("defaultIcon", "Default icon name (default \"sun\").", "[defaultIcon]");
    parser.addPositionalArgument("soundDesktopProperty",
        "Desktop property with the notification sound (default \"win.sound.asterisk\").",
        "[soundDesktopProperty]");

    parser.addOption(QCommandLineOption(
        QStringList() << "c" << "config",
        "Specify configuration file path.",
        "config"
    ));
    parser.addOption(QCommandLineOption(
        QStringList() << "l" << "log-file",
        "Specify log file path.",
        "log-file"
    ));
    parser.addOption(QCommandLineOption(
        QStringList() << "v" << "verbosity",
        "Set log level (0-4: debug, info, warning, error, critical).",
        "level",
        "1"
    ));
    parser.addOption(QCommandLineOption(
        QStringList() << "b" << "bind",
        "Address the HTTP listener binds to.",
        "address"
    ));
}

void initializeLogger(const QCommandLineParser& parser) {
    auto& logger = Logger::instance();

    if (parser.isSet("log-file")) {
        logger.setLogFile(parser.value("log-file").toStdString());
        logger.setLogDestination(LogDestination::All);
    }

    if (parser.isSet("verbosity")) {
        logger.setLogLevel(Logger::levelFromInt(parser.value("verbosity").toInt()));
    }
}

bool loadConfiguration(ConfigManager& config, const QCommandLineParser& parser) {
    QString configPath;

    if (parser.isSet("config")) {
        configPath = parser.value("config");
    } else {
        QStringList configLocations = {
            QDir::currentPath() + "/tray-notifier.json",
            QDir::homePath() + "/.config/tray-notifier/config.json",
            "/etc/tray-notifier/config.json"
        };

        for (const auto& path : configLocations) {
            if (QFile::exists(path)) {
                configPath = path;
                break;
            }
        }
    }

    if (!configPath.isEmpty()) {
        if (!config.loadFromFile(configPath.toStdString())) {
            LOG_WARNING("Failed to load configuration from " + configPath.toStdString());
            return false;
        }
        LOG_INFO("Loaded configuration from " + configPath.toStdString());
        return true;
    }

    LOG_DEBUG("No configuration file found, using defaults");
    return true;
}

// Positional arguments win over the configuration file
void applyArguments(ConfigManager& config, const QCommandLineParser& parser) {
    const QStringList args = parser.positionalArguments();

    if (args.size() > 0) {
        bool ok = false;
        int port = args.at(0).toInt(&ok);
        if (ok) {
            config.setInt("port", port);
        } else {
            std::cerr << "Wrong port number provided. Default will be used." << std::endl;
            config.setInt("port", 0);
        }
    }
    if (args.size() > 1) {
        config.setString("defaultIcon", args.at(1).toStdString());
    }
    if (args.size() > 2) {
        config.setString("soundProperty", args.at(2).toStdString());
    }
    if (parser.isSet("bind")) {
        config.setString("bindAddress", parser.value("bind").toStdString());
    }
}

}

int main(int argc, char *argv[]) {
    printUsage();

    try {
        QApplication app(argc, argv);
        app.setApplicationName("tray-notifier");
        app.setApplicationVersion("1.0.0");
        app.setQuitOnLastWindowClosed(false);

        QCommandLineParser parser;
        setupCommandLineParser(parser);
        parser.process(app);

        initializeLogger(parser);

        ConfigManager configManager;
        if (!loadConfiguration(configManager, parser)) {
            return EXIT_STARTUP_FAILURE;
        }
        // Verbosity given on the command line wins over the file
        if (!parser.isSet("verbosity")) {
            Logger::instance().setLogLevel(
                Logger::levelFromInt(configManager.getInt("logLevel", 1)));
        }
        const int maxLogSize = configManager.getInt("logMaxFileSize", DEFAULT_LOG_MAX_FILE_SIZE);
        if (maxLogSize > 0) {
            Logger::instance().setMaxFileSize(static_cast<size_t>(maxLogSize));
        }
        applyArguments(configManager, parser);

        Notifier notifier(configManager.notifierConfig(),
                          std::make_unique<SystemTrayBackend>());
        notifier.start();

        return app.exec();

    } catch (const NotifierError& e) {
        std::cerr << e.what() << std::endl;
        LOG_CRITICAL(std::string("Startup failed: ") + e.what());
        return EXIT_STARTUP_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        LOG_CRITICAL("Fatal error: " + std::string(e.what()));
        return EXIT_STARTUP_FAILURE;
    }
}
