#pragma once

#include <cstdint>
#include <filesystem>
#include <fixcap/core/core.hpp>
#include <fixcap/core/interfaces.hpp>
#include <fstream>
#include <string>
#include <string_view>

namespace fixcap_rt::stages {

// Appends one row per captured sample to a pandas-style CSV:
//   ,file_name,point_on_screen,time_till_capture,monitor_mm,monitor_pixels
//   0,2024_03_01-14_05_09.jpg,"(960, 540)",0.2,"(597, 336)","(1920, 1080)"
class CsvSampleWriter : public fixcap::core::ISampleSink {
  public:
    static constexpr std::string_view kHeader =
        ",file_name,point_on_screen,time_till_capture,monitor_mm,"
        "monitor_pixels";

    // Throws std::runtime_error if the file cannot be opened
    explicit CsvSampleWriter(const std::filesystem::path &path);

    void consume(const fixcap::core::Sample &sample) override;

    uint64_t GetRowCount() const { return rows_; }

  private:
    static uint64_t countRows_(const std::filesystem::path &path);
    static bool endsWithNewline_(const std::filesystem::path &path);

    std::filesystem::path path_;
    std::ofstream out_;
    uint64_t rows_{0};
};

// "(a, b)"
std::string FormatTuple(const fixcap::vec2<int> &value);

// Quotes a field when it holds a separator, quote or line break
std::string QuoteCsvField(std::string_view field);

} // namespace fixcap_rt::stages
