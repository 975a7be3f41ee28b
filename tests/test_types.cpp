#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <thread>
#include "types.hpp"

class FrameTest : public ::testing::Test {
protected:
    void SetUp() override {
        frame = Frame{};
        frame.source_id = "cam0";
        frame.sequence_number = 7;
        frame.captured_at = WallTime{} + std::chrono::milliseconds(1500);
        frame.payload = {0xFF, 0xD8, 0xFF};
    }

    Frame frame;
};

TEST_F(FrameTest, DefaultConstruction) {
    Frame empty;
    EXPECT_TRUE(empty.source_id.empty());
    EXPECT_EQ(empty.sequence_number, 0u);
    EXPECT_EQ(empty.captured_at, WallTime{});
    EXPECT_TRUE(empty.payload.empty());
}

TEST_F(FrameTest, EqualityComparesEveryField) {
    Frame copy = frame;
    EXPECT_EQ(copy, frame);

    copy.sequence_number = 8;
    EXPECT_NE(copy, frame);

    copy = frame;
    copy.payload.push_back(0xD9);
    EXPECT_NE(copy, frame);

    copy = frame;
    copy.source_id = "cam1";
    EXPECT_NE(copy, frame);

    copy = frame;
    copy.captured_at += std::chrono::nanoseconds(1);
    EXPECT_NE(copy, frame);
}

TEST(EnvelopeTest, FirstDeliveryIsAttemptOne) {
    Envelope e;
    EXPECT_EQ(e.attempt_count, 1u);
    EXPECT_EQ(e.delivery_id, 0u);
}

TEST(DetectionTest, DefaultsToNothingFound) {
    Detection d;
    EXPECT_TRUE(d.boxes.empty());
    EXPECT_EQ(d.attempt_count, 1u);
    EXPECT_EQ(d.frame_sequence_number, 0u);
}

TEST(BoundingBoxTest, Equality) {
    BoundingBox a{"person", 0, 0.9f, 1, 2, 3, 4};
    BoundingBox b = a;
    EXPECT_EQ(a, b);
    b.width = 5;
    EXPECT_FALSE(a == b);
    EXPECT_EQ(BoundingBox{}.class_id, -1);
}

TEST(StateNamesTest, ProducerStates) {
    EXPECT_STREQ(to_string(ProducerState::Idle), "idle");
    EXPECT_STREQ(to_string(ProducerState::Capturing), "capturing");
    EXPECT_STREQ(to_string(ProducerState::Publishing), "publishing");
    EXPECT_STREQ(to_string(ProducerState::Draining), "draining");
    EXPECT_STREQ(to_string(ProducerState::Stopped), "stopped");
}

TEST(StateNamesTest, DeliveryOutcomes) {
    EXPECT_STREQ(to_string(DeliveryOutcome::Acked), "acked");
    EXPECT_STREQ(to_string(DeliveryOutcome::Requeued), "requeued");
    EXPECT_STREQ(to_string(DeliveryOutcome::DeadLettered), "dead-lettered");
    EXPECT_STREQ(to_string(DeliveryOutcome::Abandoned), "abandoned");
}

TEST(ClockTest, TimePointBasics) {
    auto t1 = Clock::now();
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    auto t2 = Clock::now();

    EXPECT_LT(t1, t2);
    EXPECT_GE((t2 - t1).count(), 0);
}
