#pragma once

#include <cstdint>
#include <optional>
#include <random>

namespace fixcap::core {

struct IRandomSource {
    // Uniform real in [lo, hi)
    virtual double uniform(double lo, double hi) = 0;
    // Uniform integer in [lo, hi]
    virtual int uniformInt(int lo, int hi) = 0;
    virtual ~IRandomSource() = default;
};

class EngineRandomSource : public IRandomSource {
  public:
    explicit EngineRandomSource(std::optional<uint64_t> seed = std::nullopt)
        : engine_(seed ? *seed : std::random_device{}()) {}

    double uniform(double lo, double hi) override {
        return std::uniform_real_distribution<double>(lo, hi)(engine_);
    }

    int uniformInt(int lo, int hi) override {
        return std::uniform_int_distribution<int>(lo, hi)(engine_);
    }

  private:
    std::mt19937_64 engine_;
};

} // namespace fixcap::core
