#include "fixcap_rt/camera/frame_buffer.hpp"
#include <cassert>
#include <chrono>
#include <iostream>
#include <system_error>
#include <thread>

using namespace fixcap_rt::camera;
using namespace std::chrono;
using namespace std::chrono_literals;

namespace {

StampedFrame makeFrame(steady_clock::time_point acquired, float value) {
    return StampedFrame{acquired, cv::Mat(2, 2, CV_32FC3, cv::Scalar::all(value))};
}

float valueOf(const cv::Mat &image) { return image.at<cv::Vec3f>(0, 0)[0]; }

} // namespace

int main() {
    std::cout << "=== Testing FrameBuffer ===" << std::endl;

    // Test 1: Nothing queued
    std::cout << "\n[Test 1] Empty buffer..." << std::endl;
    {
        FrameBuffer buffer(4);
        auto start = steady_clock::now();
        auto frame = buffer.next(20ms);
        assert(!frame.has_value());
        assert(frame.error() == std::make_error_code(std::errc::timed_out));
        assert(steady_clock::now() - start >= 20ms);
    }
    std::cout << "  ✓ Times out" << std::endl;

    // Test 2: FIFO order
    std::cout << "\n[Test 2] Frames in order..." << std::endl;
    {
        FrameBuffer buffer(4);
        buffer.push(makeFrame(steady_clock::now(), 1.0f));
        buffer.push(makeFrame(steady_clock::now(), 2.0f));
        auto first = buffer.next(10ms);
        auto second = buffer.next(10ms);
        assert(first && valueOf(*first) == 1.0f);
        assert(second && valueOf(*second) == 2.0f);
    }
    std::cout << "  ✓ Oldest first" << std::endl;

    // Test 3: A read that began before the clear lands after it
    std::cout << "\n[Test 3] Stale frame pushed after clear..." << std::endl;
    {
        FrameBuffer buffer(4);
        auto readStarted = steady_clock::now();
        std::this_thread::sleep_for(1ms);
        buffer.clear();
        buffer.push(makeFrame(readStarted, 1.0f));
        buffer.push(makeFrame(steady_clock::now(), 2.0f));

        auto frame = buffer.next(50ms);
        assert(frame.has_value());
        assert(valueOf(*frame) == 2.0f && "Stale frame skipped");
        assert(!buffer.next(10ms).has_value());
    }
    std::cout << "  ✓ Only frames acquired after the clear are returned"
              << std::endl;

    // Test 4: Only stale frames available
    std::cout << "\n[Test 4] Stale frames only..." << std::endl;
    {
        FrameBuffer buffer(4);
        auto readStarted = steady_clock::now();
        std::this_thread::sleep_for(1ms);
        buffer.clear();
        buffer.push(makeFrame(readStarted, 1.0f));
        auto frame = buffer.next(20ms);
        assert(!frame.has_value());
        assert(frame.error() == std::make_error_code(std::errc::timed_out));
    }
    std::cout << "  ✓ Times out instead of returning a stale frame"
              << std::endl;

    // Test 5: Clear discards what is queued
    std::cout << "\n[Test 5] Clear drops queued frames..." << std::endl;
    {
        FrameBuffer buffer(4);
        buffer.push(makeFrame(steady_clock::now(), 1.0f));
        buffer.push(makeFrame(steady_clock::now(), 2.0f));
        buffer.clear();
        assert(!buffer.next(10ms).has_value());
    }
    std::cout << "  ✓ Buffer empty after clear" << std::endl;

    // Test 6: A fresh frame arriving from another thread
    std::cout << "\n[Test 6] Frame pushed while waiting..." << std::endl;
    {
        FrameBuffer buffer(4);
        buffer.clear();
        std::jthread reader([&buffer] {
            std::this_thread::sleep_for(10ms);
            buffer.push(makeFrame(steady_clock::now(), 3.0f));
        });
        auto frame = buffer.next(1000ms);
        assert(frame && valueOf(*frame) == 3.0f);
    }
    std::cout << "  ✓ Waiting caller wakes up" << std::endl;

    // Test 7: Capacity
    std::cout << "\n[Test 7] Full buffer..." << std::endl;
    {
        FrameBuffer buffer(2);
        for (int i = 1; i <= 5; ++i) {
            buffer.push(makeFrame(steady_clock::now(), static_cast<float>(i)));
        }
        assert(buffer.dropped() == 3);
        auto frame = buffer.next(10ms);
        assert(frame && valueOf(*frame) == 4.0f && "Oldest frames dropped");
    }
    std::cout << "  ✓ Oldest dropped and counted" << std::endl;

    std::cout << "\n=== All tests passed! ===" << std::endl;
    return 0;
}
