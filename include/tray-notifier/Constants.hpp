#pragma once

namespace tray_notifier {

constexpr int DEFAULT_PORT = 8811;
constexpr const char* DEFAULT_ICON = "sun";
constexpr const char* DEFAULT_SOUND_PROPERTY = "win.sound.asterisk";
constexpr const char* DEFAULT_BIND_ADDRESS = "0.0.0.0";
constexpr const char* DEFAULT_ICON_ROOT = ":/icons";

constexpr const char* ICON_SUFFIX = ".png";
constexpr const char* PLACEHOLDER_MESSAGE = "New notification arrived.";

constexpr int DEFAULT_WORKER_THREADS = 8;
constexpr int STOP_GRACE_PERIOD = 1000;   // ms
constexpr int DEFAULT_LOG_MAX_FILE_SIZE = 10 * 1024 * 1024;
constexpr int KEEP_ALIVE_TIMEOUT = 1;     // s
constexpr int MESSAGE_TIMEOUT = 10000;    // ms

namespace StatusCodes {
    constexpr int OK = 200;
    constexpr int NOT_FOUND = 404;
    constexpr int SERVICE_UNAVAILABLE = 503;
}

}
