#pragma once
#include "fixcap/core/core.hpp"
#include <chrono>
#include <expected>
#include <optional>
#include <system_error>

namespace fixcap::core {

struct IClock {
    using time_point = std::chrono::steady_clock::time_point;
    virtual time_point now() const = 0;
    virtual ~IClock() = default;
};

class SteadyClock : public IClock {
  public:
    time_point now() const override { return std::chrono::steady_clock::now(); }
};

// Continuously acquiring frame producer. clearBuffer() discards everything
// acquired so far; the next nextFrame() only yields frames acquired after it.
template <typename TFrame> struct IFrameSource {
    virtual void clearBuffer() = 0;
    virtual std::expected<TFrame, std::error_code>
    nextFrame(std::chrono::milliseconds timeout) = 0;
    virtual ~IFrameSource() = default;
};

template <typename TFrame> struct IDisplay {
    virtual void present(const TFrame &frame) = 0;
    // Keeps the last frame on screen for up to timeout. Returns the first key
    // pressed during the wait, or nullopt once the timeout elapses.
    virtual std::optional<int> waitKey(std::chrono::milliseconds timeout) = 0;
    virtual ~IDisplay() = default;
};

template <typename T> struct ISink {
    virtual void consume(const T &data) = 0;
    virtual ~ISink() = default;
};

using ISampleSink = ISink<Sample>;

} // namespace fixcap::core
