#include <gtest/gtest.h>
#include "geosurf/path_writer.hpp"
#include "geosurf/surface.hpp"

#include <filesystem>
#include <fstream>
#include <numbers>
#include <sstream>
#include <string>
#include <vector>

using namespace geosurf;
using namespace geosurf::io;

namespace {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    for (std::string line; std::getline(in, line);) lines.push_back(line);
    return lines;
}

} // namespace

// ─── format_csv ───────────────────────────────────────────────────────────────

TEST(PathWriter_Format, EmptyPath_HeaderOnly) {
    auto plane = Surface::make_plane();
    EXPECT_EQ(PathWriter::format_csv(plane, Path{}), "step,u,v,x,y,z\n");
}

TEST(PathWriter_Format, OneRowPerPoint) {
    auto plane = Surface::make_plane(2.0);
    Path path{ParameterPoint(1.0, 3.0), ParameterPoint(1.5, -0.25)};

    auto lines = split_lines(PathWriter::format_csv(plane, path));

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], PathWriter::HEADER);
    EXPECT_EQ(lines[1], "0,1,3,1,2,3");
    EXPECT_EQ(lines[2], "1,1.5,-0.25,1.5,2,-0.25");
}

TEST(PathWriter_Format, TenSignificantDigits) {
    auto sphere = Surface::make_sphere(5.0);
    Path path{ParameterPoint(std::numbers::pi / 2.0, 0.0)};

    auto lines = split_lines(PathWriter::format_csv(sphere, path));

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1].rfind("0,1.570796327,0,5,", 0), 0u) << lines[1];
}

TEST(PathWriter_Format, UndefinedPoint_WrittenAsNaN) {
    Surface partial([](double u, double v) {
        return u < 0.0 ? invalid_position() : Position3D(u, 0.0, v);
    });
    Path path{ParameterPoint(1.0, 1.0), ParameterPoint(-1.0, 1.0)};

    auto lines = split_lines(PathWriter::format_csv(partial, path));

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[2], "1,-1,1,nan,nan,nan");
}

// ─── write_csv ────────────────────────────────────────────────────────────────

TEST(PathWriter_File, WritesSameTextAsFormat) {
    auto torus = Surface::make_torus(5.0, 1.0);
    Path path{ParameterPoint(0.0, 0.0), ParameterPoint(0.1, 0.2), ParameterPoint(0.2, 0.4)};

    const auto file = std::filesystem::temp_directory_path() / "geosurf_path_writer_test.csv";
    ASSERT_TRUE(PathWriter::write_csv(file.string(), torus, path));

    std::ifstream in(file);
    std::stringstream buffer;
    buffer << in.rdbuf();
    EXPECT_EQ(buffer.str(), PathWriter::format_csv(torus, path));

    std::filesystem::remove(file);
}

TEST(PathWriter_File, UnwritablePath_ReturnsFalse) {
    auto plane = Surface::make_plane();
    EXPECT_FALSE(PathWriter::write_csv("/nonexistent_dir_geosurf/out.csv", plane,
                                       Path{ParameterPoint(0.0, 0.0)}));
}
