#pragma once
#include <QString>
#include <iostream>
#include <mutex>
#include <string>

namespace tray_notifier {

class AssetResolver;
class NotificationSurface;
class SoundTrigger;

// The single HTTP endpoint: "/<iconName>" with the message as body.
// Re-entrant; one instance serves all listener workers.
class RequestHandler {
public:
    RequestHandler(const AssetResolver& resolver,
                   NotificationSurface& surface,
                   SoundTrigger& sound,
                   std::ostream& out = std::cout);

    // Returns the HTTP status code (200 or 404)
    int handle(const std::string& path, const std::string& body);

    // UTF-8 body -> lines joined with '\n', placeholder when empty
    static QString decodeMessage(const std::string& body);

private:
    const AssetResolver& resolver_;
    NotificationSurface& surface_;
    SoundTrigger& sound_;

    std::mutex outMutex_;
    std::ostream& out_;
};

}
