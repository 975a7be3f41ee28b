#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

#include "capture.hpp"
#include "detector.hpp"
#include "result_sink.hpp"
#include "types.hpp"

// Polls pred until it holds or the timeout expires.
template <class Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

inline Frame make_frame(const std::string& source, uint64_t seq, Bytes payload = {1, 2, 3}) {
    Frame f;
    f.source_id = source;
    f.sequence_number = seq;
    f.captured_at = WallClock::now();
    f.payload = std::move(payload);
    return f;
}

// Backoff small enough that retry paths finish within a test.
inline BackoffConfig fast_backoff() {
    BackoffConfig b;
    b.base_ms = 1;
    b.max_ms = 5;
    b.multiplier = 2.0;
    b.jitter = 0.0;
    return b;
}

// Plays back a fixed script of frames, capture errors and end-of-stream.
// With endless set, keeps producing frames once the script runs out.
class ScriptedFrameSource : public FrameSource {
public:
    enum class Step { Frame, Error, End };

    void add_frames(int n) {
        std::lock_guard<std::mutex> g(mu_);
        for (int i = 0; i < n; ++i) steps_.push_back(Step::Frame);
    }

    void push(Step s) {
        std::lock_guard<std::mutex> g(mu_);
        steps_.push_back(s);
    }

    void open() override {
        opens++;
        if (fail_opens.load() > 0) {
            fail_opens--;
            throw CaptureError("scripted open failure");
        }
    }

    std::optional<RawFrame> next_frame() override {
        if (period.count() > 0) std::this_thread::sleep_for(period);
        Step s;
        {
            std::lock_guard<std::mutex> g(mu_);
            if (steps_.empty()) {
                if (!endless) return std::nullopt;
                s = Step::Frame;
            } else {
                s = steps_.front();
                steps_.pop_front();
            }
        }
        if (s == Step::Error) throw CaptureError("scripted read failure");
        if (s == Step::End) return std::nullopt;
        RawFrame f;
        f.payload = Bytes{static_cast<uint8_t>(++produced & 0xff), 0xAB, 0xCD};
        f.captured_at = WallClock::now();
        return f;
    }

    void close() override { closes++; }

    std::atomic<int> opens{0};
    std::atomic<int> closes{0};
    std::atomic<int> fail_opens{0};
    std::atomic<int> produced{0};
    bool endless{false};
    std::chrono::milliseconds period{0};

private:
    std::mutex mu_;
    std::deque<Step> steps_;
};

// Returns one fixed box per frame unless failures were scheduled for its
// sequence number; scheduled failures are raised in order, one per call.
class ScriptedDetector : public Detector {
public:
    void fail(uint64_t seq, DetectionError::Kind kind, int times = 1) {
        std::lock_guard<std::mutex> g(mu_);
        for (int i = 0; i < times; ++i) failures_[seq].push_back(kind);
    }

    std::vector<BoundingBox> detect(const Frame& frame) override {
        calls++;
        int now_active = ++active;
        int prev = max_active.load();
        while (now_active > prev && !max_active.compare_exchange_weak(prev, now_active)) {
        }
        struct Leave {
            std::atomic<int>& n;
            ~Leave() { n--; }
        } leave{active};

        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        {
            std::lock_guard<std::mutex> g(mu_);
            auto it = failures_.find(frame.sequence_number);
            if (it != failures_.end() && !it->second.empty()) {
                auto kind = it->second.front();
                it->second.pop_front();
                throw DetectionError(kind, "scripted failure for #" +
                                               std::to_string(frame.sequence_number));
            }
        }
        return {BoundingBox{"person", 0, 0.9f, 10, 20, 30, 40}};
    }

    std::atomic<int> calls{0};
    std::atomic<int> active{0};
    std::atomic<int> max_active{0};
    std::chrono::milliseconds delay{0};

private:
    std::mutex mu_;
    std::map<uint64_t, std::deque<DetectionError::Kind>> failures_;
};

// Records every Detection it accepts. fail_next makes the next emits throw;
// on_emit runs before a Detection is recorded.
class CollectingSink : public ResultSink {
public:
    void emit(const Detection& d) override {
        if (on_emit) on_emit(d);
        if (fail_next.load() > 0) {
            fail_next--;
            throw std::runtime_error("sink unavailable");
        }
        std::lock_guard<std::mutex> g(mu_);
        detections_.push_back(d);
    }

    std::vector<Detection> detections() const {
        std::lock_guard<std::mutex> g(mu_);
        return detections_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> g(mu_);
        return detections_.size();
    }

    std::atomic<int> fail_next{0};
    std::function<void(const Detection&)> on_emit;

private:
    mutable std::mutex mu_;
    std::vector<Detection> detections_;
};
