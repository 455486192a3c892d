#include "fixcap_rt/config/session_config.hpp"
#include <charconv>
#include <fstream>
#include <glaze/glaze.hpp>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fixcap_rt::config {

namespace {

int parseInt_(std::string_view text, std::string_view what) {
    int value = 0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw std::runtime_error("Invalid " + std::string(what) + ": \"" +
                                 std::string(text) + "\"");
    }
    return value;
}

void requirePositive_(int value, const char *name) {
    if (value <= 0) {
        throw std::runtime_error(std::string(name) + " must be positive");
    }
}

} // namespace

SessionConfig ReadSessionConfig(const std::string &json) {
    SessionConfig config{};
    if (auto ec = glz::read_json(config, json)) {
        throw std::runtime_error("Failed to parse configuration: " +
                                 glz::format_error(ec, json));
    }
    return config;
}

SessionConfig LoadSessionConfig(const std::filesystem::path &path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open configuration file " +
                                 path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return ReadSessionConfig(buffer.str());
}

std::array<int, 2> ParsePair(std::string_view text) {
    auto comma = text.find(',');
    if (comma == std::string_view::npos) {
        throw std::runtime_error("Expected W,H but got \"" + std::string(text) +
                                 "\"");
    }
    return {parseInt_(text.substr(0, comma), "width"),
            parseInt_(text.substr(comma + 1), "height")};
}

SessionConfig ParseCommandLine(int argc, char **argv) {
    std::vector<std::string_view> args(argv + 1, argv + argc);

    auto valueOf = [&](size_t &i) -> std::string_view {
        if (i + 1 >= args.size()) {
            throw std::runtime_error("Missing value for " +
                                     std::string(args[i]));
        }
        return args[++i];
    };

    // The config file is the base, every other flag overrides it
    SessionConfig config{};
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            config = LoadSessionConfig(std::filesystem::path(valueOf(i)));
        }
    }

    for (size_t i = 0; i < args.size(); ++i) {
        auto arg = args[i];
        if (arg == "--config") {
            ++i;
        } else if (arg == "--base_path") {
            config.base_path = valueOf(i);
        } else if (arg == "--monitor_mm") {
            config.monitor_mm = ParsePair(valueOf(i));
        } else if (arg == "--monitor_pixels") {
            config.monitor_pixels = ParsePair(valueOf(i));
        } else if (arg == "--seed") {
            auto text = valueOf(i);
            uint64_t seed = 0;
            auto [ptr, ec] =
                std::from_chars(text.data(), text.data() + text.size(), seed);
            if (ec != std::errc{} || ptr != text.data() + text.size()) {
                throw std::runtime_error("Invalid seed: \"" +
                                         std::string(text) + "\"");
            }
            config.seed = seed;
        } else if (arg == "--log_level") {
            config.log_level = valueOf(i);
        } else {
            throw std::runtime_error("Unknown argument: " + std::string(arg));
        }
    }

    ValidateSessionConfig(config);
    return config;
}

void ValidateSessionConfig(const SessionConfig &config) {
    if (config.base_path.empty()) {
        throw std::runtime_error("base_path must not be empty");
    }
    if (config.monitor_mm) {
        requirePositive_((*config.monitor_mm)[0], "monitor_mm width");
        requirePositive_((*config.monitor_mm)[1], "monitor_mm height");
    }
    if (config.monitor_pixels) {
        requirePositive_((*config.monitor_pixels)[0], "monitor_pixels width");
        requirePositive_((*config.monitor_pixels)[1], "monitor_pixels height");
    }
    if (spdlog::level::from_str(config.log_level) == spdlog::level::off &&
        config.log_level != "off") {
        throw std::runtime_error("Unknown log_level \"" + config.log_level +
                                 "\"");
    }
    if (config.outputs.empty()) {
        throw std::runtime_error("At least one output is required");
    }
    for (const auto &output : config.outputs) {
        if (output != "csv" && output != "h5") {
            throw std::runtime_error("Unknown output \"" + output +
                                     "\", expected \"csv\" or \"h5\"");
        }
    }
    if (config.stimulus.glyph.empty()) {
        throw std::runtime_error("stimulus.glyph must not be empty");
    }
    if (config.stimulus.text_scale <= 0.0) {
        throw std::runtime_error("stimulus.text_scale must be positive");
    }
    requirePositive_(config.stimulus.text_thickness, "stimulus.text_thickness");
    requirePositive_(config.camera.queue_capacity, "camera.queue_capacity");
    requirePositive_(config.camera.frame_timeout_ms, "camera.frame_timeout_ms");

    const auto &t = config.timing;
    requirePositive_(t.frame_interval_ms, "timing.frame_interval_ms");
    requirePositive_(t.animation_tick_ms, "timing.animation_tick_ms");
    requirePositive_(t.capture_window_ms, "timing.capture_window_ms");
    requirePositive_(t.capture_tick_ms, "timing.capture_tick_ms");
    if (t.settle_delay_ms < 0 || t.inter_trial_delay_ms < 0) {
        throw std::runtime_error("timing delays must not be negative");
    }
}

} // namespace fixcap_rt::config
