#include "fixcap_rt/stages/csv_sample_writer.hpp"
#include "fixcap_rt/stages/h5_sample_writer.hpp"
#include <cassert>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <hdf5.h>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace fixcap_rt::stages;
using fixcap::core::Sample;

namespace {

std::vector<std::string> readLines(const std::filesystem::path &path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line))
        lines.push_back(line);
    return lines;
}

const fixcap::core::MonitorGeometry kGeometry{
    .width_mm = 600, .height_mm = 340, .width_px = 1920, .height_px = 1080};

Sample makeSample(std::string name, int x, int y, double latency) {
    return Sample{
        .file_name = std::move(name),
        .point_on_screen = {x, y},
        .time_till_capture = latency,
        .monitor_mm = kGeometry.mm(),
        .monitor_pixels = kGeometry.pixels(),
    };
}

hsize_t datasetLength(hid_t file, const std::string &path) {
    hid_t dataset = H5Dopen2(file, path.c_str(), H5P_DEFAULT);
    assert(dataset >= 0);
    hid_t space = H5Dget_space(dataset);
    hsize_t dims[1] = {0};
    H5Sget_simple_extent_dims(space, dims, nullptr);
    H5Sclose(space);
    H5Dclose(dataset);
    return dims[0];
}

} // namespace

int main() {
    std::cout << "=== Testing Sample Writers ===" << std::endl;

    std::random_device rd;
    auto dir = std::filesystem::temp_directory_path() /
               ("fixcap_writers_" + std::to_string(rd()));
    std::filesystem::create_directories(dir);

    // Test 1: Field formatting
    std::cout << "\n[Test 1] Field formatting..." << std::endl;
    assert(FormatTuple({960, 540}) == "(960, 540)");
    assert(FormatTuple({-3, 0}) == "(-3, 0)");
    assert(QuoteCsvField("plain.jpg") == "plain.jpg");
    assert(QuoteCsvField("(1, 2)") == "\"(1, 2)\"");
    assert(QuoteCsvField("say \"hi\"") == "\"say \"\"hi\"\"\"");
    std::cout << "  ✓ Tuples and quoting" << std::endl;

    // Test 2: CSV layout
    std::cout << "\n[Test 2] CSV rows..." << std::endl;
    const auto csvPath = dir / "data.csv";
    {
        CsvSampleWriter writer(csvPath);
        assert(writer.GetRowCount() == 0);
        writer.consume(makeSample("2024_01_01-00_00_00.jpg", 960, 540, 0.2));
        writer.consume(makeSample("2024_01_01-00_00_03.jpg", 0, 1079, 0.125));
        assert(writer.GetRowCount() == 2);

        // Rows are on disk before the writer goes away
        auto lines = readLines(csvPath);
        assert(lines.size() == 3);
        assert(lines[0] == std::string(CsvSampleWriter::kHeader));
        assert(lines[1] == "0,2024_01_01-00_00_00.jpg,\"(960, 540)\",0.2,"
                           "\"(600, 340)\",\"(1920, 1080)\"");
        assert(lines[2] == "1,2024_01_01-00_00_03.jpg,\"(0, 1079)\",0.125,"
                           "\"(600, 340)\",\"(1920, 1080)\"");
    }
    std::cout << "  ✓ Header plus one indexed row per sample" << std::endl;

    // Test 3: Reopening continues the index
    std::cout << "\n[Test 3] CSV append..." << std::endl;
    {
        CsvSampleWriter writer(csvPath);
        assert(writer.GetRowCount() == 2);
        writer.consume(makeSample("2024_01_01-00_01_00.jpg", 5, 6, 0.3));
        auto lines = readLines(csvPath);
        assert(lines.size() == 4);
        assert(lines[3].starts_with("2,2024_01_01-00_01_00.jpg,"));
        int headers = 0;
        for (const auto &line : lines)
            if (line == std::string(CsvSampleWriter::kHeader))
                ++headers;
        assert(headers == 1);
    }
    std::cout << "  ✓ Existing rows kept, no second header" << std::endl;

    // Test 4: Unwritable location
    std::cout << "\n[Test 4] CSV open failure..." << std::endl;
    {
        bool threw = false;
        try {
            CsvSampleWriter writer(dir / "missing" / "data.csv");
        } catch (const std::runtime_error &) {
            threw = true;
        }
        assert(threw);
    }
    std::cout << "  ✓ Throws when the file cannot be created" << std::endl;

    // Test 5: HDF5 records
    std::cout << "\n[Test 5] HDF5 samples..." << std::endl;
    const auto h5Path = dir / "data.h5";
    {
        H5SampleWriter writer(h5Path, "aaaa", kGeometry);
        writer.consume(makeSample("2024_01_01-00_00_00.jpg", 960, 540, 0.2));
        writer.consume(makeSample("2024_01_01-00_00_03.jpg", 10, 20, 0.35));
        assert(writer.size() == 2);
    }
    {
        hid_t file = H5Fopen(h5Path.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
        assert(file >= 0);
        assert(datasetLength(file, "/session_aaaa/samples") == 2);

        hid_t dataset =
            H5Dopen2(file, "/session_aaaa/samples", H5P_DEFAULT);
        fixcap::h5::TypeId type(
            fixcap::h5::hdf5_type_traits<SampleRecord>::get());
        std::vector<SampleRecord> records(2);
        herr_t err = H5Dread(dataset, type.get(), H5S_ALL, H5S_ALL,
                             H5P_DEFAULT, records.data());
        assert(err >= 0);
        assert(std::strncmp(records[0].file_name, "2024_01_01-00_00_00.jpg",
                            sizeof(records[0].file_name)) == 0);
        assert(records[0].point_on_screen == (fixcap::vec2<int>{960, 540}));
        assert(records[0].time_till_capture == 0.2);
        assert(records[1].point_on_screen == (fixcap::vec2<int>{10, 20}));
        assert(records[1].monitor_mm == (fixcap::vec2<int>{600, 340}));
        assert(records[1].monitor_pixels == (fixcap::vec2<int>{1920, 1080}));

        assert(H5Aexists(dataset, "session_uuid") > 0);
        assert(H5Aexists(dataset, "started_at") > 0);
        assert(H5Aexists(dataset, "monitor_mm") > 0);
        H5Dclose(dataset);
        H5Fclose(file);
    }
    std::cout << "  ✓ Compound records and session attributes" << std::endl;

    // Test 6: A second session adds its own group
    std::cout << "\n[Test 6] HDF5 append..." << std::endl;
    {
        H5SampleWriter writer(h5Path, "bbbb", kGeometry);
        writer.consume(makeSample("2024_01_02-00_00_00.jpg", 1, 2, 0.1));
    }
    {
        hid_t file = H5Fopen(h5Path.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
        assert(file >= 0);
        assert(datasetLength(file, "/session_aaaa/samples") == 2);
        assert(datasetLength(file, "/session_bbbb/samples") == 1);
        H5Fclose(file);
    }
    std::cout << "  ✓ Earlier sessions left untouched" << std::endl;

    // Test 7: Long names are truncated, not overflowed
    std::cout << "\n[Test 7] Record conversion..." << std::endl;
    {
        auto record = ToRecord(
            makeSample(std::string(40, 'x') + ".jpg", 1, 1, 0.0));
        assert(std::string(record.file_name, sizeof(record.file_name)) ==
               std::string(32, 'x'));
    }
    std::cout << "  ✓ File names clipped to 32 bytes" << std::endl;

    // Test 8: A file cut off mid-line gets its line terminated first
    std::cout << "\n[Test 8] CSV without trailing newline..." << std::endl;
    {
        const auto path = dir / "truncated.csv";
        const std::string firstRow =
            "0,2024_01_01-00_00_00.jpg,\"(1, 2)\",0.2,\"(600, 340)\","
            "\"(1920, 1080)\"";
        {
            std::ofstream out(path, std::ios::binary);
            out << CsvSampleWriter::kHeader << '\n' << firstRow;
        }
        CsvSampleWriter writer(path);
        assert(writer.GetRowCount() == 1);
        writer.consume(makeSample("2024_01_01-00_00_05.jpg", 3, 4, 0.3));

        auto lines = readLines(path);
        assert(lines.size() == 3);
        assert(lines[0] == std::string(CsvSampleWriter::kHeader));
        assert(lines[1] == firstRow);
        assert(lines[2].starts_with("1,2024_01_01-00_00_05.jpg,"));
    }
    std::cout << "  ✓ Existing row kept intact, new row on its own line"
              << std::endl;

    std::filesystem::remove_all(dir);

    std::cout << "\n=== All tests passed! ===" << std::endl;
    return 0;
}
