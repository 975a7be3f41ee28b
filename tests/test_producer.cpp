#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include "frame_codec.hpp"
#include "memory_channel.hpp"
#include "producer.hpp"
#include "test_doubles.hpp"

using namespace std::chrono_literals;
using C = MetricsRegistry::Counter;

// Stays connected but takes `delay` to confirm each publish.
class SlowPublishClient : public MemoryChannelClient {
public:
    SlowPublishClient(MemoryBroker& broker, std::chrono::milliseconds delay)
        : MemoryChannelClient(broker, fast_backoff()), delay_(delay) {}

    uint64_t publish(const std::string& channel, const Bytes& body) override {
        std::this_thread::sleep_for(delay_);
        return MemoryChannelClient::publish(channel, body);
    }

private:
    std::chrono::milliseconds delay_;
};

class ProducerTest : public ::testing::Test {
protected:
    void SetUp() override {
        client = std::make_unique<MemoryChannelClient>(broker, fast_backoff());
        cfg.source_id = "cam0";
        cfg.channel = "frames";
        cfg.queue_capacity = 8;
        cfg.max_publish_retries = 3;
        cfg.drain_timeout = 500ms;
        cfg.publish_backoff = fast_backoff();
        cfg.capture_backoff = fast_backoff();
    }

    void TearDown() override {
        if (producer) producer->stop();
    }

    ProducerPipeline& make() {
        producer = std::make_unique<ProducerPipeline>(cfg, src, *client, metrics);
        producer->set_failure_handler([this](const std::string& c, const std::string& m) {
            std::lock_guard<std::mutex> g(failures_mu);
            failures.push_back(c + ": " + m);
        });
        return *producer;
    }

    std::vector<uint64_t> published_sequences() const {
        std::vector<uint64_t> seqs;
        for (const auto& b : broker.ready_messages("frames")) {
            Frame f = decode_frame(b);
            EXPECT_EQ(f.source_id, "cam0");
            seqs.push_back(f.sequence_number);
        }
        return seqs;
    }

    size_t failure_count() {
        std::lock_guard<std::mutex> g(failures_mu);
        return failures.size();
    }

    MemoryBroker broker;
    std::unique_ptr<MemoryChannelClient> client;
    MetricsRegistry metrics;
    ScriptedFrameSource src;
    ProducerConfig cfg;
    std::unique_ptr<ProducerPipeline> producer;
    std::mutex failures_mu;
    std::vector<std::string> failures;
};

TEST_F(ProducerTest, StartsIdle) {
    auto& p = make();
    EXPECT_EQ(p.state(), ProducerState::Idle);
    EXPECT_FALSE(p.running());
    EXPECT_FALSE(p.finished());
}

TEST_F(ProducerTest, PublishesFramesInCaptureOrder) {
    src.add_frames(5);
    auto& p = make();
    p.start();
    ASSERT_TRUE(p.wait_finished(3000ms));

    EXPECT_EQ(published_sequences(), (std::vector<uint64_t>{1, 2, 3, 4, 5}));
    EXPECT_EQ(p.state(), ProducerState::Stopped);
    EXPECT_EQ(metrics.get(C::FramesCaptured), 5u);
    EXPECT_EQ(metrics.get(C::FramesPublished), 5u);
    EXPECT_EQ(metrics.get(C::FramesDroppedBackpressure), 0u);
    EXPECT_EQ(src.opens.load(), 1);
    EXPECT_GE(src.closes.load(), 1);
}

TEST_F(ProducerTest, StalledPublisherKeepsMostRecentFrames) {
    cfg.queue_capacity = 2;
    broker.set_available(false);
    src.add_frames(5);
    auto& p = make();
    p.start();

    // Capture runs to end of stream while the broker is unreachable.
    ASSERT_TRUE(wait_until([&] { return p.state() == ProducerState::Draining; }));
    EXPECT_EQ(p.frames_captured(), 5u);
    EXPECT_EQ(p.buffered(), 2u);
    EXPECT_LE(p.high_water(), 2u);
    EXPECT_EQ(metrics.get(C::FramesDroppedBackpressure), 3u);
    EXPECT_EQ(broker.published_total(), 0u);

    broker.set_available(true);
    ASSERT_TRUE(p.wait_finished(3000ms));
    EXPECT_EQ(published_sequences(), (std::vector<uint64_t>{4, 5}));
}

TEST_F(ProducerTest, SlowPublishCountsInFlightFrameAgainstCapacity) {
    cfg.queue_capacity = 2;
    src.add_frames(5);
    src.period = 5ms;
    SlowPublishClient slow(broker, 200ms);
    producer = std::make_unique<ProducerPipeline>(cfg, src, slow, metrics);
    producer->start();

    ASSERT_TRUE(wait_until([&] { return producer->state() == ProducerState::Draining ||
                                        producer->finished(); }));
    EXPECT_LE(producer->high_water(), 2u);
    EXPECT_EQ(metrics.get(C::FramesDroppedBackpressure), 3u);

    ASSERT_TRUE(producer->wait_finished(3000ms));
    // The frame whose publish was already under way could not be recalled, but
    // it counts as dropped; only the two most recent frames count as published.
    EXPECT_EQ(metrics.get(C::FramesPublished), 2u);
    EXPECT_EQ(metrics.get(C::FramesSuperseded), 1u);
    auto seqs = published_sequences();
    ASSERT_EQ(seqs.size(), 3u);
    EXPECT_LT(seqs[0], 4u);
    EXPECT_EQ(seqs[1], 4u);
    EXPECT_EQ(seqs[2], 5u);
    EXPECT_EQ(metrics.get(C::FramesPublished) + metrics.get(C::FramesDroppedBackpressure),
              metrics.get(C::FramesCaptured));
    producer.reset();
}

TEST_F(ProducerTest, RetriesRejectedPublishes) {
    broker.fail_next_publishes(2);
    src.add_frames(3);
    auto& p = make();
    p.start();
    ASSERT_TRUE(p.wait_finished(3000ms));

    EXPECT_EQ(published_sequences(), (std::vector<uint64_t>{1, 2, 3}));
    EXPECT_EQ(metrics.get(C::PublishRetries), 2u);
    EXPECT_EQ(metrics.get(C::FramesPublishFailed), 0u);
}

TEST_F(ProducerTest, DropsFrameAfterRetriesExhausted) {
    cfg.max_publish_retries = 1;
    broker.fail_next_publishes(2);  // both attempts for frame 1
    src.add_frames(3);
    auto& p = make();
    p.start();
    ASSERT_TRUE(p.wait_finished(3000ms));

    EXPECT_EQ(published_sequences(), (std::vector<uint64_t>{2, 3}));
    EXPECT_EQ(metrics.get(C::FramesPublishFailed), 1u);
    EXPECT_EQ(failure_count(), 1u);
}

TEST_F(ProducerTest, CaptureErrorReopensSourceWithoutRenumbering) {
    src.push(ScriptedFrameSource::Step::Frame);
    src.push(ScriptedFrameSource::Step::Error);
    src.push(ScriptedFrameSource::Step::Frame);
    src.push(ScriptedFrameSource::Step::End);
    auto& p = make();
    p.start();
    ASSERT_TRUE(p.wait_finished(3000ms));

    EXPECT_EQ(published_sequences(), (std::vector<uint64_t>{1, 2}));
    EXPECT_EQ(src.opens.load(), 2);
    EXPECT_EQ(metrics.get(C::CaptureErrors), 1u);
    EXPECT_GE(failure_count(), 1u);
}

TEST_F(ProducerTest, FailedOpenIsRetried) {
    src.add_frames(2);
    src.fail_opens = 2;
    auto& p = make();
    p.start();
    ASSERT_TRUE(p.wait_finished(3000ms));

    EXPECT_EQ(src.opens.load(), 3);
    EXPECT_EQ(metrics.get(C::CaptureErrors), 2u);
    EXPECT_EQ(published_sequences(), (std::vector<uint64_t>{1, 2}));
}

TEST_F(ProducerTest, CaptureRestartLimitEndsCapture) {
    cfg.max_capture_restarts = 0;
    src.push(ScriptedFrameSource::Step::Frame);
    src.push(ScriptedFrameSource::Step::Error);
    src.push(ScriptedFrameSource::Step::Frame);
    auto& p = make();
    p.start();
    ASSERT_TRUE(p.wait_finished(3000ms));

    EXPECT_EQ(published_sequences(), (std::vector<uint64_t>{1}));
    EXPECT_EQ(src.opens.load(), 1);
}

TEST_F(ProducerTest, StopDrainsBufferedFrames) {
    src.endless = true;
    src.period = 1ms;
    auto& p = make();
    p.start();
    ASSERT_TRUE(wait_until([&] { return metrics.get(C::FramesPublished) >= 10; }));
    p.stop();

    EXPECT_TRUE(p.finished());
    EXPECT_EQ(p.state(), ProducerState::Stopped);
    EXPECT_EQ(p.buffered(), 0u);
    const uint64_t accounted = metrics.get(C::FramesPublished) +
                               metrics.get(C::FramesDroppedBackpressure) +
                               metrics.get(C::FramesPublishFailed) +
                               metrics.get(C::FramesDiscardedOnShutdown);
    EXPECT_EQ(accounted, metrics.get(C::FramesCaptured));
}

TEST_F(ProducerTest, StopDiscardsWhatCannotBePublishedInTime) {
    cfg.drain_timeout = 50ms;
    cfg.queue_capacity = 4;
    broker.set_available(false);
    src.add_frames(3);
    auto& p = make();
    p.start();
    ASSERT_TRUE(wait_until([&] { return p.state() == ProducerState::Draining; }));

    p.stop();
    EXPECT_TRUE(p.finished());
    EXPECT_EQ(metrics.get(C::FramesDiscardedOnShutdown), 3u);
    EXPECT_EQ(broker.published_total(), 0u);
}

TEST_F(ProducerTest, RecoversFromBrokerRestart) {
    src.endless = true;
    src.period = 1ms;
    auto& p = make();
    p.start();
    ASSERT_TRUE(wait_until([&] { return metrics.get(C::FramesPublished) >= 3; }));

    broker.drop_connections();
    const auto before = metrics.get(C::FramesPublished);
    ASSERT_TRUE(wait_until([&] { return metrics.get(C::FramesPublished) >= before + 3; }));
    EXPECT_TRUE(p.connected());
    p.stop();

    // Sequence numbers stay strictly increasing across the reconnect.
    auto seqs = published_sequences();
    for (size_t i = 1; i < seqs.size(); ++i) EXPECT_LT(seqs[i - 1], seqs[i]);
}
