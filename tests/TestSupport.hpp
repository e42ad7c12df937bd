// tests/TestSupport.hpp
#pragma once
#include <gtest/gtest.h>
#include "core/SoundTrigger.hpp"
#include "gui/TrayBackend.hpp"
#include <tray-notifier/Errors.hpp>
#include <QCoreApplication>
#include <QImage>
#include <QTemporaryDir>
#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace tray_notifier {
namespace testing {

class FakeTrayBackend : public TrayBackend {
public:
    struct Message {
        QString title;
        QString text;
    };

    bool isAvailable() const override { return available; }
    bool supportsMessages() const override { return true; }

    void show() override {
        std::lock_guard<std::mutex> lock(mutex);
        if (rejectShow) {
            throw TraySetupError("tray rejected the icon");
        }
        ++showCount;
        visible = true;
    }

    void hide() override {
        std::lock_guard<std::mutex> lock(mutex);
        ++hideCount;
        visible = false;
    }

    void setImage(const QImage& image) override {
        std::lock_guard<std::mutex> lock(mutex);
        images.push_back(image);
    }

    void setToolTip(const QString& text) override {
        std::lock_guard<std::mutex> lock(mutex);
        toolTip = text;
    }

    void showMessage(const QString& title, const QString& text) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (failMessages) {
            throw std::runtime_error("balloon failed");
        }
        messages.push_back({title, text});
    }

    void setClickHandler(ClickHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex);
        clickHandler = std::move(handler);
    }

    // Simulates the toolkit reporting a click with the given count
    void click(int count) {
        ClickHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex);
            handler = clickHandler;
        }
        if (handler) {
            handler(count);
        }
    }

    std::vector<Message> messagesSnapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return messages;
    }

    size_t imageCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return images.size();
    }

    std::mutex mutex;
    bool available{true};
    bool rejectShow{false};
    bool failMessages{false};
    bool visible{false};
    int showCount{0};
    int hideCount{0};
    QString toolTip;
    std::vector<QImage> images;
    std::vector<Message> messages;
    ClickHandler clickHandler;
};

class RecordingSoundTrigger : public SoundTrigger {
public:
    void play() override {
        ++plays;
        if (fail) {
            throw std::runtime_error("sound device busy");
        }
    }
    std::string name() const override { return "recording"; }

    std::atomic<int> plays{0};
    bool fail{false};
};

// Writes solid-colour PNG icons into a temporary directory
class IconDirectory {
public:
    IconDirectory() {
        for (const char* name : {"sun", "rain", "cloud"}) {
            add(name, Qt::yellow);
        }
    }

    void add(const QString& name, Qt::GlobalColor color) {
        QImage image(16, 16, QImage::Format_ARGB32);
        image.fill(color);
        ASSERT_TRUE(image.save(dir.filePath(name + ".png"), "PNG"));
    }

    QString path() const { return dir.path(); }

    QTemporaryDir dir;
};

// Owns the QCoreApplication needed by Qt's image and locale code
class QtAppTest : public ::testing::Test {
protected:
    void SetUp() override {
        app = std::make_unique<QCoreApplication>(argc, argv);
    }

    void TearDown() override {
        app.reset();
    }

    int argc{1};
    char arg0[8]{"test"};
    char* argv[2]{arg0, nullptr};
    std::unique_ptr<QCoreApplication> app;
};

} // namespace testing
} // namespace tray_notifier
