#include "LifecycleController.hpp"
#include "Logger.hpp"
#include "RequestHandler.hpp"
#include "../gui/NotificationSurface.hpp"
#include <tray-notifier/Constants.hpp>
#include <tray-notifier/Errors.hpp>
#include <httplib.h>
#include <atomic>
#include <future>
#include <mutex>
#include <shared_mutex>
#include <thread>

namespace tray_notifier {

namespace {

// Routes listener workers to the handler until closed. Workers abandoned
// after the grace period outlive the controller and only see a closed gate.
class HandlerGate {
public:
    explicit HandlerGate(RequestHandler* handler)
        : handler_(handler) {}

    int dispatch(const std::string& path, const std::string& body) {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (!handler_) {
            return StatusCodes::SERVICE_UNAVAILABLE;
        }
        return handler_->handle(path, body);
    }

    // Blocks until running dispatches have returned
    void close() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        handler_ = nullptr;
    }

private:
    std::shared_mutex mutex_;
    RequestHandler* handler_;
};

}

class LifecycleController::Private {
public:
    Private(const NotifierConfig& cfg, RequestHandler& h, NotificationSurface& s)
        : config(cfg), handler(h), surface(s) {}

    const NotifierConfig config;
    RequestHandler& handler;
    NotificationSurface& surface;

    std::mutex lifecycleMutex;
    std::atomic<LifecycleState> state{LifecycleState::Stopped};

    std::shared_ptr<httplib::Server> server;
    std::shared_ptr<HandlerGate> gate;
    std::thread listener;
    std::future<void> listenerDone;

    std::string endpoint() const {
        return config.bindAddress + ":" + std::to_string(config.port);
    }

    std::shared_ptr<httplib::Server> createServer(const std::shared_ptr<HandlerGate>& gate) {
        auto server = std::make_shared<httplib::Server>();

        const int workers = config.workerThreads;
        server->new_task_queue = [workers] {
            return new httplib::ThreadPool(static_cast<size_t>(workers));
        };
        server->set_keep_alive_timeout(KEEP_ALIVE_TIMEOUT);

        // Every method on every path ends up in the same handler
        httplib::Server::Handler route = [gate](const httplib::Request& req,
                                                httplib::Response& res) {
            res.status = gate->dispatch(req.path, req.body);
        };
        server->Get(".*", route);
        server->Post(".*", route);
        server->Put(".*", route);
        server->Patch(".*", route);
        server->Delete(".*", route);
        server->Options(".*", route);

        server->set_logger([](const httplib::Request& req, const httplib::Response& res) {
            LOG_DEBUG(req.method + " " + req.path + " -> " + std::to_string(res.status));
        });

        return server;
    }
};

LifecycleController::LifecycleController(const NotifierConfig& config,
                                         RequestHandler& handler,
                                         NotificationSurface& surface)
    : d(std::make_unique<Private>(config, handler, surface)) {
}

LifecycleController::~LifecycleController() {
    try {
        stop();
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Failed to stop notifier: ") + e.what());
    }
}

void LifecycleController::start() {
    std::lock_guard<std::mutex> lock(d->lifecycleMutex);

    if (d->state != LifecycleState::Stopped) {
        LOG_INFO("Notifier already running, restarting");
        stopLocked();
    }

    d->state = LifecycleState::Starting;

    std::shared_ptr<httplib::Server> server;
    auto gate = std::make_shared<HandlerGate>(&d->handler);
    try {
        server = d->createServer(gate);
        if (!server->bind_to_port(d->config.bindAddress, d->config.port)) {
            throw BindError("Cannot bind HTTP listener to " + d->endpoint());
        }
    } catch (const std::exception&) {
        d->state = LifecycleState::Stopped;
        throw;
    }

    auto done = std::make_shared<std::promise<void>>();
    d->listenerDone = done->get_future();
    d->server = server;
    d->gate = gate;
    d->listener = std::thread([server, done]() {
        try {
            if (!server->listen_after_bind()) {
                LOG_DEBUG("HTTP listener loop ended with an error");
            }
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("HTTP listener failed: ") + e.what());
        }
        done->set_value();
    });

    // stop() is ignored until the accept loop runs
    server->wait_until_ready();
    if (!server->is_running()) {
        closeListenerLocked();
        d->state = LifecycleState::Stopped;
        throw BindError("HTTP listener on " + d->endpoint() + " failed to start");
    }

    try {
        d->surface.attach();
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Cannot add tray icon: ") + e.what());
        closeListenerLocked();
        d->state = LifecycleState::Stopped;
        throw;
    }

    d->state = LifecycleState::Running;
    LOG_INFO("Notifier listening on " + d->endpoint());
}

void LifecycleController::stop() {
    std::lock_guard<std::mutex> lock(d->lifecycleMutex);
    stopLocked();
}

void LifecycleController::stopLocked() {
    if (d->state == LifecycleState::Stopped) {
        return;
    }

    d->state = LifecycleState::Stopping;
    closeListenerLocked();
    d->surface.detach();
    d->state = LifecycleState::Stopped;

    LOG_INFO("Notifier on " + d->endpoint() + " stopped");
}

void LifecycleController::closeListenerLocked() {
    if (!d->server) {
        return;
    }

    d->server->stop();

    // In-flight requests get a bounded grace period
    if (d->listenerDone.wait_for(d->config.stopGracePeriod) == std::future_status::ready) {
        d->listener.join();
    } else {
        LOG_WARNING("HTTP listener did not finish within " +
                    std::to_string(d->config.stopGracePeriod.count()) +
                    " ms, abandoning in-flight requests");
        d->listener.detach();
    }

    d->gate->close();
    d->gate.reset();
    d->server.reset();
}

LifecycleState LifecycleController::state() const {
    return d->state;
}

bool LifecycleController::isRunning() const {
    return d->state == LifecycleState::Running;
}

const char* toString(LifecycleState state) {
    switch (state) {
        case LifecycleState::Stopped:  return "Stopped";
        case LifecycleState::Starting: return "Starting";
        case LifecycleState::Running:  return "Running";
        case LifecycleState::Stopping: return "Stopping";
    }
    return "Unknown";
}

}
