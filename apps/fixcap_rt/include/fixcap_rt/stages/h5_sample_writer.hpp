#pragma once

#include <filesystem>
#include <fixcap/core/core.hpp>
#include <fixcap/core/h5.hpp>
#include <fixcap/core/interfaces.hpp>
#include <string>

namespace fixcap_rt::stages {

struct SampleRecord {
    char file_name[32];
    fixcap::vec2<int> point_on_screen;
    double time_till_capture;
    fixcap::vec2<int> monitor_mm;
    fixcap::vec2<int> monitor_pixels;
};

SampleRecord ToRecord(const fixcap::core::Sample &sample);

// Appends samples to <file>/session_<uuid>/samples. Every sample is flushed
// to disk before consume() returns.
class H5SampleWriter : public fixcap::core::ISampleSink {
  public:
    H5SampleWriter(const std::filesystem::path &path,
                   const std::string &session_uuid,
                   const fixcap::core::MonitorGeometry &geometry);

    void consume(const fixcap::core::Sample &sample) override;

    hsize_t size() const { return dataset_.size(); }

  private:
    fixcap::h5::File file_;
    fixcap::h5::Group group_;
    fixcap::h5::Dataset<SampleRecord> dataset_;
};

} // namespace fixcap_rt::stages

H5_DEFINE_TYPE(fixcap_rt::stages::SampleRecord,
    H5_AUTO_FIELD(file_name)
    H5_AUTO_FIELD(point_on_screen)
    H5_AUTO_FIELD(time_till_capture)
    H5_AUTO_FIELD(monitor_mm)
    H5_AUTO_FIELD(monitor_pixels)
)
