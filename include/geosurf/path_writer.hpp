#pragma once

/// @file include/geosurf/path_writer.hpp
/// @brief CSV export of geodesic paths.
///
/// # Module: PathWriter
///
/// ## Responsibility
/// Map each parameter point of a path through its surface and serialise the
/// result as CSV for plotting tools:
/// ```
/// step,u,v,x,y,z
/// 0,0.7853981634,0,3.535533906,3.535533906,0
/// ```
/// Undefined surface points are written as `nan`; rows are never dropped.
///
/// ## Guarantees
/// - Does not modify any state other than the target file
/// - Reports I/O failure through the return value, never by throwing

#include "geosurf/surface.hpp"
#include "geosurf/types.hpp"

#include <string>

namespace geosurf::io {

/// Serialises paths to CSV.
class PathWriter {
public:
    /// CSV header line, without the trailing newline.
    static constexpr const char* HEADER = "step,u,v,x,y,z";

    /// Format `path` as CSV text, header included.
    [[nodiscard]] static std::string format_csv(const Surface& surface,
                                                const Path&    path);

    /// Write `path` as CSV to `filepath`.
    ///
    /// # Returns
    /// `false` if the file cannot be opened or written.
    [[nodiscard]] static bool write_csv(const std::string& filepath,
                                        const Surface&     surface,
                                        const Path&        path);
};

} // namespace geosurf::io
