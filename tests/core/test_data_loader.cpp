/// @file tests/core/test_data_loader.cpp
/// @brief Unit tests for TraceLoader and CurveWriter.

#include "bmsd/data_loader.hpp"
#include "bmsd/curve_writer.hpp"
#include "bmsd/errors.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <sstream>
#include <string>

using namespace bmsd;

namespace {

std::size_t count_lines(const std::string& text) {
    std::size_t n = 0;
    for (char c : text) {
        if (c == '\n') ++n;
    }
    return n;
}

std::string temp_path(const char* name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

}  // namespace

// ─── TraceLoader ──────────────────────────────────────────────────────────────

TEST(TraceLoader_Parse, BasicTrace) {
    const auto traj = TraceLoader::parse_csv_string(
        "t,x,y\n"
        "0.0,0.0,0.0\n"
        "0.1,1e-9,-2e-9\n"
        "0.2,3e-9,-1e-9\n");
    ASSERT_EQ(traj.size(), 3u);
    EXPECT_DOUBLE_EQ(traj.time(1), 0.1);
    EXPECT_DOUBLE_EQ(traj.position(1).x(), 1e-9);
    EXPECT_DOUBLE_EQ(traj.position(2).y(), -1e-9);
    EXPECT_TRUE(traj.grid().uniform_step().has_value());
}

TEST(TraceLoader_Parse, HeaderIsCaseInsensitiveAndReorderable) {
    const auto traj = TraceLoader::parse_csv_string(
        "frame, Y, Time, X\n"
        "0, 5, 1.0, 7\n"
        "1, 6, 2.0, 8\n");
    ASSERT_EQ(traj.size(), 2u);
    EXPECT_DOUBLE_EQ(traj.time(0), 1.0);
    EXPECT_EQ(traj.position(0), Vec2(7.0, 5.0));
    EXPECT_EQ(traj.position(1), Vec2(8.0, 6.0));
}

TEST(TraceLoader_Parse, SkipsCommentsAndBlankLines) {
    const auto traj = TraceLoader::parse_csv_string(
        "# tracked bead\n"
        "\n"
        "t,x,y\n"
        "0,0,0\n"
        "\n"
        "# dropped frame\n"
        "1,+1,1\n");
    EXPECT_EQ(traj.size(), 2u);
    EXPECT_DOUBLE_EQ(traj.position(1).x(), 1.0);
}

TEST(TraceLoader_Parse, NonIncreasingTimeIsMalformed) {
    EXPECT_THROW((void)TraceLoader::parse_csv_string(
                     "t,x,y\n0,0,0\n2,1,1\n1,2,2\n"),
                 MalformedInput);
    EXPECT_THROW((void)TraceLoader::parse_csv_string(
                     "t,x,y\n0,0,0\n0,1,1\n"),
                 MalformedInput);
}

TEST(TraceLoader_Parse, MissingColumnIsMalformed) {
    try {
        (void)TraceLoader::parse_csv_string("t,x\n0,0\n");
        FAIL() << "expected MalformedInput";
    } catch (const MalformedInput& e) {
        EXPECT_NE(std::string(e.what()).find("y"), std::string::npos);
    }
}

TEST(TraceLoader_Parse, NonNumericCellIsMalformed) {
    EXPECT_THROW((void)TraceLoader::parse_csv_string("t,x,y\n0,abc,0\n"), MalformedInput);
    EXPECT_THROW((void)TraceLoader::parse_csv_string("t,x,y\n0,1.5m,0\n"), MalformedInput);
    EXPECT_THROW((void)TraceLoader::parse_csv_string("t,x,y\n0,,0\n"), MalformedInput);
}

TEST(TraceLoader_Parse, NonFiniteCellIsMalformed) {
    EXPECT_THROW((void)TraceLoader::parse_csv_string("t,x,y\n0,nan,0\n"), MalformedInput);
    EXPECT_THROW((void)TraceLoader::parse_csv_string("t,x,y\n0,0,inf\n"), MalformedInput);
}

TEST(TraceLoader_Parse, ShortRowIsMalformed) {
    EXPECT_THROW((void)TraceLoader::parse_csv_string("t,x,y\n0,1\n"), MalformedInput);
}

TEST(TraceLoader_Parse, EmptyInputIsMalformed) {
    EXPECT_THROW((void)TraceLoader::parse_csv_string(""), MalformedInput);
    EXPECT_THROW((void)TraceLoader::parse_csv_string("t,x,y\n"), MalformedInput);
}

TEST(TraceLoader_Load, MissingFileIsMalformed) {
    EXPECT_THROW((void)TraceLoader::load_csv("/nonexistent/dir/trace.csv"), MalformedInput);
}

// ─── CurveWriter ──────────────────────────────────────────────────────────────

TEST(CurveWriter_Csv, OneRowPerLagWithFitInsideWindow) {
    MSDCurve curve{.lag = {0.0, 1.0, 2.0, 4.0}, .msd = {0.0, 1.0, 4.0, 16.0}, .pairs = {4, 3, 2, 1}};
    const RegimeReport report{
        .slope = 2.0, .intercept = 0.0, .r_squared = 1.0, .points = 2,
        .lag_min = 1.0, .lag_max = 2.0, .regime = Regime::Ballistic,
    };
    const std::string csv = CurveWriter::to_csv(curve, report);

    std::istringstream in(csv);
    std::string header, row0, row1, row2, row3;
    std::getline(in, header);
    std::getline(in, row0);
    std::getline(in, row1);
    std::getline(in, row2);
    std::getline(in, row3);

    EXPECT_EQ(header, "lag,msd,log10_lag,log10_msd,fit");
    EXPECT_EQ(count_lines(csv), 5u);
    // Lag 0 has no logarithm and lies outside the fit window.
    EXPECT_NE(row0.find(",,,"), std::string::npos);
    EXPECT_NE(row1.find("0.00000000,0.00000000,"), std::string::npos);
    EXPECT_NE(row2.back(), ',');
    // Lag 4 is outside [1, 2]: empty fit cell.
    EXPECT_EQ(row3.back(), ',');
}

TEST(CurveWriter_Trajectory, RoundTripsThroughLoader) {
    const std::vector<double> x{0.0, 1.25e-9, -3.5e-9};
    const std::vector<double> y{0.0, 2e-10, 7e-10};
    const auto written = TrajectoryBuilder::from_samples({0.0, 1e-3, 2e-3}, x, y);

    const std::string path = temp_path("bmsd_trajectory_roundtrip.csv");
    CurveWriter::write_file(path, CurveWriter::trajectory_csv(written));
    const auto loaded = TraceLoader::load_csv(path);
    std::remove(path.c_str());

    ASSERT_EQ(loaded.size(), written.size());
    for (std::size_t i = 0; i < loaded.size(); ++i) {
        EXPECT_EQ(loaded.time(i), written.time(i));
        EXPECT_EQ(loaded.position(i), written.position(i));
    }
}

TEST(CurveWriter_File, UnwritablePathThrows) {
    EXPECT_THROW(CurveWriter::write_file("/nonexistent/dir/out.csv", "x"), std::runtime_error);
}
