#include "fixcap_rt/config/session_config.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fixcap_rt::config;

namespace {

// Builds a mutable argv from string literals
SessionConfig parse(std::vector<std::string> args) {
    args.insert(args.begin(), "fixcap_rt");
    std::vector<char *> argv;
    for (auto &arg : args)
        argv.push_back(arg.data());
    return ParseCommandLine(static_cast<int>(argv.size()), argv.data());
}

bool throws(const std::function<void()> &fn) {
    try {
        fn();
    } catch (const std::runtime_error &) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "=== Testing Session Config ===" << std::endl;

    // Test 1: Defaults
    std::cout << "\n[Test 1] Defaults..." << std::endl;
    {
        auto config = parse({});
        assert(config.base_path == "./data/p00");
        assert(!config.monitor_mm && !config.monitor_pixels);
        assert(config.outputs == std::vector<std::string>{"csv"});
        assert(!config.seed);
        assert(config.log_level == "info");
        assert(config.quit_key == 81);
        assert(config.timing.frame_interval_ms == 500);
        assert(config.timing.capture_window_ms == 500);
        assert(config.timing.settle_delay_ms == 500);
        assert(config.timing.inter_trial_delay_ms == 500);
        assert(config.stimulus.glyph == "E");
        assert(config.stimulus.text_scale == 0.5);
        assert(config.stimulus.text_thickness == 2);
    }
    std::cout << "  ✓ No arguments gives a runnable session" << std::endl;

    // Test 2: JSON document
    std::cout << "\n[Test 2] Reading JSON..." << std::endl;
    {
        auto config = ReadSessionConfig(R"({
            "base_path": "/tmp/p07",
            "monitor_mm": [597, 336],
            "outputs": ["csv", "h5"],
            "seed": 42,
            "camera": {"device_index": 2, "width": 1280, "height": 720},
            "timing": {"capture_window_ms": 750}
        })");
        assert(config.base_path == "/tmp/p07");
        assert(config.monitor_mm && (*config.monitor_mm)[0] == 597 &&
               (*config.monitor_mm)[1] == 336);
        assert(!config.monitor_pixels);
        assert(config.outputs.size() == 2 && config.outputs[1] == "h5");
        assert(config.seed && *config.seed == 42);
        assert(config.camera.device_index == 2);
        assert(config.camera.width == 1280 && config.camera.height == 720);
        assert(config.camera.fps == 0 && "Missing keys keep their defaults");
        assert(config.timing.capture_window_ms == 750);
        assert(config.timing.frame_interval_ms == 500);
        ValidateSessionConfig(config);
    }
    std::cout << "  ✓ Nested sections and optionals" << std::endl;

    // Test 3: Malformed JSON
    std::cout << "\n[Test 3] Malformed JSON..." << std::endl;
    assert(throws([] { ReadSessionConfig("{\"base_path\": "); }));
    assert(throws([] { ReadSessionConfig("{\"monitor_mm\": [1, 2, 3]}"); }));
    assert(throws([] { LoadSessionConfig("/nonexistent/fixcap.json"); }));
    std::cout << "  ✓ Parse failures are reported" << std::endl;

    // Test 4: Command line flags
    std::cout << "\n[Test 4] Command line..." << std::endl;
    {
        auto config = parse({"--base_path", "./data/p03", "--monitor_mm",
                             "600,340", "--monitor_pixels", "1920,1080",
                             "--seed", "7", "--log_level", "debug"});
        assert(config.base_path == "./data/p03");
        assert(config.monitor_mm == (std::array<int, 2>{600, 340}));
        assert(config.monitor_pixels == (std::array<int, 2>{1920, 1080}));
        assert(config.seed == 7u);
        assert(config.log_level == "debug");
    }
    std::cout << "  ✓ Flags populate the config" << std::endl;

    // Test 5: Flags override the config file regardless of order
    std::cout << "\n[Test 5] Config file with overrides..." << std::endl;
    {
        std::random_device rd;
        auto path = std::filesystem::temp_directory_path() /
                    ("fixcap_config_" + std::to_string(rd()) + ".json");
        {
            std::ofstream out(path);
            out << R"({"base_path": "/from/file", "outputs": ["h5"],
                      "monitor_pixels": [2560, 1440]})";
        }
        auto config =
            parse({"--base_path", "/from/flag", "--config", path.string()});
        assert(config.base_path == "/from/flag");
        assert(config.outputs == std::vector<std::string>{"h5"});
        assert(config.monitor_pixels == (std::array<int, 2>{2560, 1440}));
        std::filesystem::remove(path);
    }
    std::cout << "  ✓ File is the base, flags win" << std::endl;

    // Test 6: Invalid input
    std::cout << "\n[Test 6] Rejected input..." << std::endl;
    assert(throws([] { parse({"--frobnicate"}); }));
    assert(throws([] { parse({"--base_path"}); }));
    assert(throws([] { parse({"--monitor_mm", "600"}); }));
    assert(throws([] { parse({"--monitor_mm", "600,abc"}); }));
    assert(throws([] { parse({"--monitor_pixels", "0,1080"}); }));
    assert(throws([] { parse({"--seed", "-1"}); }));
    assert(throws([] { parse({"--log_level", "chatty"}); }));
    assert(!throws([] { parse({"--log_level", "off"}); }));
    assert(throws([] {
        auto config = ReadSessionConfig(R"({"outputs": ["csv", "parquet"]})");
        ValidateSessionConfig(config);
    }));
    assert(throws([] {
        auto config = ReadSessionConfig(R"({"outputs": []})");
        ValidateSessionConfig(config);
    }));
    assert(throws([] {
        auto config = ReadSessionConfig(R"({"timing": {"capture_tick_ms": 0}})");
        ValidateSessionConfig(config);
    }));
    std::cout << "  ✓ Unknown flags, bad pairs and bad values throw"
              << std::endl;

    // Test 7: Pair parsing
    std::cout << "\n[Test 7] W,H pairs..." << std::endl;
    assert(ParsePair("1920,1080") == (std::array<int, 2>{1920, 1080}));
    assert(throws([] { ParsePair("1920x1080"); }));
    assert(throws([] { ParsePair(",1080"); }));
    std::cout << "  ✓ Comma separated integers" << std::endl;

    std::cout << "\n=== All tests passed! ===" << std::endl;
    return 0;
}
