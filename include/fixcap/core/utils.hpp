#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <random>
#include <string>

namespace fixcap::core {

// Second-granularity capture name, e.g. "2024_03_01-14_05_09"
inline std::string timestamp_name(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);

    char buffer[32];
    auto n = std::strftime(buffer, sizeof(buffer), "%Y_%m_%d-%H_%M_%S", &local);
    return std::string(buffer, n);
}

template <typename Rep, typename Period>
double to_seconds(std::chrono::duration<Rep, Period> d) {
    return std::chrono::duration<double>(d).count();
}

inline uint64_t steady_micros() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

// RFC 4122 version 4 id naming a session. Drawn from the OS entropy source
// so a seeded trial sequence never repeats a session group.
inline std::string session_uuid() {
    std::random_device rd;
    auto word = [&rd] {
        return (static_cast<uint64_t>(rd()) << 32) | rd();
    };
    uint64_t hi = (word() & ~0xF000ull) | 0x4000ull;
    uint64_t lo = (word() & ~(0x3ull << 62)) | (0x2ull << 62);

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFull));
    return buffer;
}

} // namespace fixcap::core
