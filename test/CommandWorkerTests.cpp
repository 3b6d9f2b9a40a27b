#include <gtest/gtest.h>
#include "BTR/CommandWorker.h"
#include "Mocks.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <thread>

using namespace BTR;
using namespace BTR::Testing;
using namespace std::chrono_literals;

namespace {

const Device kSpeakerA{"Speaker-A", "AA:AA:AA:AA:AA:AA"};
const Device kSpeakerB{"Speaker-B", "BB:BB:BB:BB:BB:BB"};

} // namespace

class CommandWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.heartbeat.interval = 10s;
        platform_ = std::make_shared<RecordingPlatform>();
        channels_ = std::make_shared<WorkerChannels>(10, 10);
    }

    std::unique_ptr<CommandWorker> makeWorker(std::vector<Device> devices, bool scanOnStart = false) {
        directory_ = std::make_shared<StaticDirectory>(std::move(devices));
        PlatformServices services{directory_,
                                  platform_,
                                  std::make_shared<SilentAnchorFactory>(),
                                  std::make_shared<RefusingBooster>()};
        auto manager = std::make_unique<ConnectionManager>(services, config_, spdlog::default_logger());
        return std::make_unique<CommandWorker>(std::move(manager), channels_, scanOnStart,
                                               spdlog::default_logger());
    }

    // Events are only readable after the worker has produced them; stop()
    // drops anything published after the queues close.
    static void waitForProcessed(const CommandWorker& worker, std::uint64_t count) {
        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (worker.processedCount() < count && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(1ms);
        }
        ASSERT_GE(worker.processedCount(), count);
    }

    std::vector<std::optional<std::string>> drainStatuses() {
        std::vector<std::optional<std::string>> statuses;
        while (auto event = channels_->statuses.tryPop()) {
            statuses.push_back(event->displayName);
        }
        return statuses;
    }

    Config config_;
    std::shared_ptr<RecordingPlatform> platform_;
    std::shared_ptr<StaticDirectory> directory_;
    std::shared_ptr<WorkerChannels> channels_;
};

TEST_F(CommandWorkerTest, ConnectReconnectDisconnectSequence) {
    auto worker = makeWorker({kSpeakerA, kSpeakerB});
    ASSERT_TRUE(worker->start());

    ASSERT_TRUE(worker->submit(ConnectCommand{"Speaker-A", std::nullopt}));
    ASSERT_TRUE(worker->submit(ReconnectCommand{"Speaker-A", std::nullopt}));
    ASSERT_TRUE(worker->submit(DisconnectCommand{}));
    ASSERT_TRUE(worker->submit(ConnectCommand{"Speaker-Z", std::nullopt}));
    waitForProcessed(*worker, 4);
    worker->stop();

    auto statuses = drainStatuses();
    ASSERT_EQ(statuses.size(), 3u);
    EXPECT_EQ(statuses[0], "Speaker-A");
    EXPECT_EQ(statuses[1], "Speaker-A");
    EXPECT_FALSE(statuses[2].has_value());

    std::vector<std::string> expected{
        "open:" + kSpeakerA.identifier,
        "close:" + kSpeakerA.identifier,
        "open:" + kSpeakerA.identifier,
        "close:" + kSpeakerA.identifier,
    };
    EXPECT_EQ(platform_->journal(), expected);
    EXPECT_EQ(worker->manager().phase(), ConnectionPhase::Disconnected);
}

TEST_F(CommandWorkerTest, IdentifierWinsOverDuplicateNames) {
    Device first{"Speaker", "11:11:11:11:11:11"};
    Device second{"Speaker", "22:22:22:22:22:22"};
    auto worker = makeWorker({first, second});
    ASSERT_TRUE(worker->start());

    worker->submit(ConnectCommand{"Speaker", second.identifier});
    waitForProcessed(*worker, 1);
    worker->stop();

    auto journal = platform_->journal();
    ASSERT_FALSE(journal.empty());
    EXPECT_EQ(journal.front(), "open:" + second.identifier);
}

TEST_F(CommandWorkerTest, NameResolutionPicksFirstMatch) {
    Device first{"Speaker", "11:11:11:11:11:11"};
    Device second{"Speaker", "22:22:22:22:22:22"};
    auto worker = makeWorker({first, second});
    ASSERT_TRUE(worker->start());

    worker->submit(ConnectCommand{"Speaker", std::nullopt});
    waitForProcessed(*worker, 1);
    worker->stop();

    ASSERT_FALSE(platform_->journal().empty());
    EXPECT_EQ(platform_->journal().front(), "open:" + first.identifier);
}

TEST_F(CommandWorkerTest, FailedConnectFromDisconnectedPublishesNothing) {
    platform_->openFailures[kSpeakerA.identifier] = OpenStatus::DeviceNotAvailable;
    auto worker = makeWorker({kSpeakerA});
    ASSERT_TRUE(worker->start());

    worker->submit(ConnectCommand{"Speaker-A", std::nullopt});
    waitForProcessed(*worker, 1);
    worker->stop();

    EXPECT_TRUE(drainStatuses().empty());
}

TEST_F(CommandWorkerTest, FailedConnectAfterTeardownPublishesDisconnected) {
    platform_->openFailures[kSpeakerB.identifier] = OpenStatus::DeniedBySystem;
    auto worker = makeWorker({kSpeakerA, kSpeakerB});
    ASSERT_TRUE(worker->start());

    worker->submit(ConnectCommand{"Speaker-A", std::nullopt});
    worker->submit(ConnectCommand{"Speaker-B", std::nullopt});
    waitForProcessed(*worker, 2);
    worker->stop();

    auto statuses = drainStatuses();
    ASSERT_EQ(statuses.size(), 2u);
    EXPECT_EQ(statuses[0], "Speaker-A");
    EXPECT_FALSE(statuses[1].has_value());
}

TEST_F(CommandWorkerTest, FailedReconnectPublishesDisconnected) {
    auto worker = makeWorker({kSpeakerA});
    ASSERT_TRUE(worker->start());

    worker->submit(ConnectCommand{"Speaker-A", std::nullopt});
    waitForProcessed(*worker, 1);
    platform_->openFailures[kSpeakerA.identifier] = OpenStatus::RequestTimedOut;
    worker->submit(ReconnectCommand{"Speaker-A", std::nullopt});
    waitForProcessed(*worker, 2);
    worker->stop();

    auto statuses = drainStatuses();
    ASSERT_EQ(statuses.size(), 2u);
    EXPECT_EQ(statuses[0], "Speaker-A");
    EXPECT_FALSE(statuses[1].has_value());
}

TEST_F(CommandWorkerTest, ScanPublishesDeviceList) {
    auto worker = makeWorker({kSpeakerA, kSpeakerB});
    ASSERT_TRUE(worker->start());

    worker->submit(ScanCommand{});
    waitForProcessed(*worker, 1);
    directory_->setUnavailable(true);
    worker->submit(ScanCommand{});
    waitForProcessed(*worker, 2);
    worker->stop();

    auto event = channels_->deviceLists.tryPop();
    ASSERT_TRUE(event.has_value());
    ASSERT_EQ(event->devices.size(), 2u);
    EXPECT_EQ(event->devices[0], kSpeakerA);
    EXPECT_EQ(event->devices[1], kSpeakerB);
    // A failed scan publishes nothing.
    EXPECT_FALSE(channels_->deviceLists.tryPop().has_value());
}

TEST_F(CommandWorkerTest, InitialScanRunsOnStart) {
    auto worker = makeWorker({kSpeakerA}, true);
    ASSERT_TRUE(worker->start());
    worker->submit(DisconnectCommand{});
    waitForProcessed(*worker, 1);
    worker->stop();

    auto event = channels_->deviceLists.tryPop();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->devices.size(), 1u);
}

TEST_F(CommandWorkerTest, SubmitDropsWhenQueueIsFull) {
    channels_ = std::make_shared<WorkerChannels>(2, 10);
    auto worker = makeWorker({kSpeakerA});

    EXPECT_TRUE(worker->submit(ScanCommand{}));
    EXPECT_TRUE(worker->submit(ScanCommand{}));
    EXPECT_FALSE(worker->submit(ScanCommand{}));
    EXPECT_EQ(channels_->commands.size(), 2u);
}

TEST_F(CommandWorkerTest, StopDisconnectsAndJoins) {
    auto worker = makeWorker({kSpeakerA});
    ASSERT_TRUE(worker->start());
    EXPECT_FALSE(worker->start());

    worker->submit(ConnectCommand{"Speaker-A", std::nullopt});
    waitForProcessed(*worker, 1);
    const int before = HeartbeatMonitor::activeCount();
    worker->stop();

    EXPECT_FALSE(worker->isRunning());
    EXPECT_EQ(worker->manager().phase(), ConnectionPhase::Disconnected);
    EXPECT_EQ(HeartbeatMonitor::activeCount(), before - 1);
    EXPECT_EQ(platform_->journal().back(), "close:" + kSpeakerA.identifier);
    EXPECT_FALSE(worker->submit(ScanCommand{}));
}

TEST_F(CommandWorkerTest, QueuedConnectsAreSkippedAfterStop) {
    auto worker = makeWorker({kSpeakerA, kSpeakerB});
    ASSERT_TRUE(worker->submit(ConnectCommand{"Speaker-A", std::nullopt}));
    ASSERT_TRUE(worker->submit(ScanCommand{}));
    ASSERT_TRUE(worker->submit(ReconnectCommand{"Speaker-B", std::nullopt}));
    // Same state stop() leaves behind: closed, with commands still queued.
    channels_->commands.close();

    ASSERT_TRUE(worker->start());
    waitForProcessed(*worker, 3);
    worker->stop();

    EXPECT_TRUE(platform_->journal().empty());
    EXPECT_TRUE(channels_->deviceLists.tryPop().has_value());
    EXPECT_FALSE(channels_->statuses.tryPop().has_value());
    EXPECT_EQ(worker->manager().phase(), ConnectionPhase::Disconnected);
}

TEST(CommandNameTest, NamesEveryCommand) {
    EXPECT_STREQ(commandName(ConnectCommand{"x", std::nullopt}), "Connect");
    EXPECT_STREQ(commandName(ReconnectCommand{"x", std::nullopt}), "Reconnect");
    EXPECT_STREQ(commandName(DisconnectCommand{}), "Disconnect");
    EXPECT_STREQ(commandName(ScanCommand{}), "Scan");
}
