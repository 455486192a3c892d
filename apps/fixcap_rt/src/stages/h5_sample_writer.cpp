#include "fixcap_rt/stages/h5_sample_writer.hpp"
#include <chrono>
#include <cstring>
#include <fixcap/core/utils.hpp>
#include <spdlog/spdlog.h>

namespace fixcap_rt::stages {

SampleRecord ToRecord(const fixcap::core::Sample &sample) {
    SampleRecord record{};
    // Null padded; longer names are truncated
    std::strncpy(record.file_name, sample.file_name.c_str(),
                 sizeof(record.file_name));
    record.point_on_screen = sample.point_on_screen;
    record.time_till_capture = sample.time_till_capture;
    record.monitor_mm = sample.monitor_mm;
    record.monitor_pixels = sample.monitor_pixels;
    return record;
}

H5SampleWriter::H5SampleWriter(const std::filesystem::path &path,
                               const std::string &session_uuid,
                               const fixcap::core::MonitorGeometry &geometry)
    : file_(path.string(), fixcap::h5::File::Mode::APPEND),
      group_(file_.get(), "session_" + session_uuid),
      dataset_(group_.get(), "samples", 16) {
    auto started = fixcap::core::timestamp_name(std::chrono::system_clock::now());
    dataset_.set_attr("session_uuid", session_uuid);
    dataset_.set_attr("started_at", started);
    dataset_.set_attr("monitor_mm", geometry.mm());
    dataset_.set_attr("monitor_pixels", geometry.pixels());
    file_.flush();

    spdlog::info("Writing samples to {}:/session_{}", path.string(),
                 session_uuid);
}

void H5SampleWriter::consume(const fixcap::core::Sample &sample) {
    dataset_.append(ToRecord(sample));
    file_.flush();
}

} // namespace fixcap_rt::stages
