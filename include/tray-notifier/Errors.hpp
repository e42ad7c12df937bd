#pragma once
#include <stdexcept>
#include <string>

namespace tray_notifier {

class NotifierError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Tray unsupported on the host or default icon missing
class ConfigurationError : public NotifierError {
public:
    using NotifierError::NotifierError;
};

// Listener could not bind the configured address/port
class BindError : public NotifierError {
public:
    using NotifierError::NotifierError;
};

// Platform rejected the tray icon registration
class TraySetupError : public NotifierError {
public:
    using NotifierError::NotifierError;
};

}
