#include "fixcap_rt/stages/csv_sample_writer.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace fixcap_rt::stages {

std::string FormatTuple(const fixcap::vec2<int> &value) {
    return fmt::format("({}, {})", value.x, value.y);
}

std::string QuoteCsvField(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"')
            quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

CsvSampleWriter::CsvSampleWriter(const std::filesystem::path &path)
    : path_(path), rows_(countRows_(path)) {
    const bool fresh = !std::filesystem::exists(path_) ||
                       std::filesystem::file_size(path_) == 0;

    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_) {
        throw std::runtime_error("Failed to open " + path_.string());
    }
    if (fresh) {
        out_ << kHeader << '\n';
        out_.flush();
    } else if (!endsWithNewline_(path_)) {
        // Terminate a partial last line so the next row starts on its own
        spdlog::warn("{} does not end with a newline, terminating last line",
                     path_.string());
        out_ << '\n';
        out_.flush();
    }
    if (!out_) {
        throw std::runtime_error("Failed to write to " + path_.string());
    }
    spdlog::info("Writing samples to {} ({} existing rows)", path_.string(),
                 rows_);
}

void CsvSampleWriter::consume(const fixcap::core::Sample &sample) {
    out_ << rows_ << ',' << QuoteCsvField(sample.file_name) << ','
         << QuoteCsvField(FormatTuple(sample.point_on_screen)) << ','
         << fmt::format("{}", sample.time_till_capture) << ','
         << QuoteCsvField(FormatTuple(sample.monitor_mm)) << ','
         << QuoteCsvField(FormatTuple(sample.monitor_pixels)) << '\n';
    out_.flush();
    if (!out_) {
        throw std::runtime_error("Failed to write sample to " +
                                 path_.string());
    }
    ++rows_;
}

uint64_t CsvSampleWriter::countRows_(const std::filesystem::path &path) {
    std::ifstream in(path);
    if (!in) {
        return 0;
    }
    uint64_t lines = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty())
            ++lines;
    }
    // First line is the header
    return lines > 0 ? lines - 1 : 0;
}

bool CsvSampleWriter::endsWithNewline_(const std::filesystem::path &path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in || in.tellg() <= 0) {
        return true;
    }
    in.seekg(-1, std::ios::end);
    char last = '\0';
    in.get(last);
    return last == '\n';
}

} // namespace fixcap_rt::stages
