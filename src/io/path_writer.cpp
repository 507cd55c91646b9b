/// @file src/io/path_writer.cpp
/// @brief CSV PathWriter.

#include "geosurf/path_writer.hpp"

#include <fmt/format.h>

#include <fstream>
#include <iterator>

namespace geosurf::io {

std::string PathWriter::format_csv(const Surface& surface, const Path& path) {
    std::string out;
    out.reserve(64 * (path.size() + 1));
    out += HEADER;
    out += '\n';

    auto it = std::back_inserter(out);
    for (std::size_t i = 0; i < path.size(); ++i) {
        const ParameterPoint& p = path[i];
        const Position3D      r = surface.evaluate(p);
        fmt::format_to(it, "{},{:.10g},{:.10g},{:.10g},{:.10g},{:.10g}\n",
                       i, p(0), p(1), r(0), r(1), r(2));
    }
    return out;
}

bool PathWriter::write_csv(const std::string& filepath,
                           const Surface&     surface,
                           const Path&        path) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    file << format_csv(surface, path);
    file.flush();
    return static_cast<bool>(file);
}

} // namespace geosurf::io
