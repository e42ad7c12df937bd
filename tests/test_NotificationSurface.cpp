// tests/test_NotificationSurface.cpp
#include "TestSupport.hpp"
#include "core/AssetResolver.hpp"
#include "gui/NotificationSurface.hpp"
#include <thread>

namespace tray_notifier {
namespace testing {

class NotificationSurfaceTest : public QtAppTest {
protected:
    void SetUp() override {
        QtAppTest::SetUp();
        resolver = std::make_unique<AssetResolver>(icons.path());
        auto backendPtr = std::make_unique<FakeTrayBackend>();
        backend = backendPtr.get();
        surface = std::make_unique<NotificationSurface>(
            std::move(backendPtr), *resolver->resolve("sun"), "tooltip");
    }

    void TearDown() override {
        surface.reset();
        QtAppTest::TearDown();
    }

    IconDirectory icons;
    std::unique_ptr<AssetResolver> resolver;
    FakeTrayBackend* backend{nullptr};
    std::unique_ptr<NotificationSurface> surface;
};

TEST_F(NotificationSurfaceTest, StartsDetachedWithDefaultImage) {
    EXPECT_FALSE(surface->isAttached());
    EXPECT_EQ(surface->currentImage(), surface->defaultImage());
    EXPECT_EQ(backend->toolTip, QString("tooltip"));
    EXPECT_EQ(backend->imageCount(), 1u);
}

TEST_F(NotificationSurfaceTest, AttachAndDetachAreIdempotent) {
    surface->attach();
    surface->attach();
    EXPECT_TRUE(surface->isAttached());
    EXPECT_EQ(backend->showCount, 1);

    surface->detach();
    surface->detach();
    EXPECT_FALSE(surface->isAttached());
    EXPECT_EQ(backend->hideCount, 1);
}

TEST_F(NotificationSurfaceTest, AttachFailureLeavesSurfaceDetached) {
    backend->rejectShow = true;
    EXPECT_THROW(surface->attach(), TraySetupError);
    EXPECT_FALSE(surface->isAttached());
}

TEST_F(NotificationSurfaceTest, SingleClickResetsToDefaultImage) {
    surface->setImage(*resolver->resolve("rain"));
    EXPECT_EQ(surface->currentImage(), *resolver->resolve("rain"));

    backend->click(1);
    EXPECT_EQ(surface->currentImage(), surface->defaultImage());
}

TEST_F(NotificationSurfaceTest, DoubleClickRunsShutdownHandler) {
    int shutdowns = 0;
    surface->setShutdownHandler([&shutdowns]() { ++shutdowns; });
    surface->setImage(*resolver->resolve("rain"));

    backend->click(2);
    EXPECT_EQ(shutdowns, 1);
    EXPECT_EQ(surface->currentImage(), *resolver->resolve("rain"));
}

TEST_F(NotificationSurfaceTest, ClickCountMapping) {
    EXPECT_EQ(NotificationSurface::actionForClickCount(0), ClickAction::None);
    EXPECT_EQ(NotificationSurface::actionForClickCount(1), ClickAction::Reset);
    EXPECT_EQ(NotificationSurface::actionForClickCount(2), ClickAction::Shutdown);
    EXPECT_EQ(NotificationSurface::actionForClickCount(3), ClickAction::Reset);
}

TEST_F(NotificationSurfaceTest, NotifySurvivesPopupAndSoundFailures) {
    backend->failMessages = true;
    RecordingSoundTrigger sound;
    sound.fail = true;

    auto rain = *resolver->resolve("rain");
    EXPECT_NO_THROW(surface->notify("title", "body", rain, sound));
    EXPECT_EQ(surface->currentImage(), rain);
    EXPECT_EQ(sound.plays.load(), 1);
}

TEST_F(NotificationSurfaceTest, ConcurrentNotificationsKeepStateConsistent) {
    NullSoundTrigger sound;
    auto rain = *resolver->resolve("rain");
    auto cloud = *resolver->resolve("cloud");

    std::vector<std::thread> workers;
    for (int i = 0; i < 8; ++i) {
        workers.emplace_back([&, i]() {
            for (int n = 0; n < 50; ++n) {
                surface->notify("t", "m", (i % 2) ? rain : cloud, sound);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    auto current = surface->currentImage();
    EXPECT_TRUE(current == rain || current == cloud);
    EXPECT_EQ(backend->messagesSnapshot().size(), 400u);
    EXPECT_EQ(backend->imageCount(), 401u);
}

} // namespace testing
} // namespace tray_notifier
