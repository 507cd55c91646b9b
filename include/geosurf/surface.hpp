#pragma once

/// @file include/geosurf/surface.hpp
/// @brief Parametric surfaces and the built-in surface catalogue.
///
/// # Module: Surface
///
/// ## Responsibility
/// Wraps the surface function capability `(u, v) → Position3D` consumed by
/// every differential-geometry routine, and provides factories for the
/// analytic surfaces shipped with GeoSurf.
///
/// ## Guarantees
/// - `evaluate` is total: any non-finite coordinate is reported as
///   `invalid_position()` (all three components NaN)
/// - Surfaces are immutable values; const members are safe to call
///   concurrently
///
/// ## NOT Responsible For
/// - Compiling user formulas into callables (see geosurf/formula_surface.hpp)
/// - Tessellation or rendering (ranges are display hints only)

#include "geosurf/formula.hpp"
#include "geosurf/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace geosurf {

// ─── Surface ──────────────────────────────────────────────────────────────────

/// A parametric surface r(u, v) embedded in 3D space.
///
/// # Example
/// ```cpp
/// auto sphere = geosurf::Surface::make_sphere(5.0);
/// auto p = sphere.evaluate(M_PI / 2, 0.0);  // (5, 0, 0)
/// ```
class Surface {
public:
    /// Construct from an arbitrary surface function.
    explicit Surface(SurfaceFunction fn);

    /// Evaluate r(u, v). Returns invalid_position() if the function
    /// produces any non-finite coordinate.
    Position3D evaluate(double u, double v) const;

    Position3D evaluate(const ParameterPoint& p) const {
        return evaluate(p(0), p(1));
    }

    /// True if r(u, v) is finite.
    bool is_defined(double u, double v) const;

    // ── Factories ────────────────────────────────────────────────────────────

    /// Horizontal plane: (u, height, v). Flat; identity metric.
    static Surface make_plane(double height = 0.0);

    /// Sphere of radius r, u the polar angle from +y, v the azimuth:
    /// (r sin u cos v, r cos u, r sin u sin v).
    static Surface make_sphere(double r);

    /// Cylinder of radius r around the y axis: (r cos v, u, −r sin v).
    static Surface make_cylinder(double r);

    /// Cone with apex at height h: (u cos v, h − u, u sin v).
    static Surface make_cone(double h);

    /// Ellipsoid with semi-axes a, b, c along x, y, z.
    static Surface make_ellipsoid(double a, double b, double c);

    /// Torus with major radius R and minor radius r around the y axis.
    static Surface make_torus(double major_r, double minor_r);

    /// Hyperbolic paraboloid: (u, (u² − v²) / s, v).
    static Surface make_saddle(double s);

    /// Hyperboloid of one sheet: (a cosh u cos v, b sinh u, c cosh u sin v).
    static Surface make_hyperboloid_one_sheet(double a, double b, double c);

    /// Upper hyperboloid of two sheets: (a sinh u cos v, b cosh u, c sinh u sin v).
    static Surface make_hyperboloid_two_sheets(double a, double b, double c);

    /// Paraboloid of revolution: (u cos v, u², u sin v).
    static Surface make_paraboloid();

    /// Two parabolic troughs crossing at the origin: (u, u² v² / s, v).
    static Surface make_crossed_through(double s);

private:
    SurfaceFunction fn_;
};

// ─── Catalogue ────────────────────────────────────────────────────────────────

/// A catalogue surface together with its display ranges and parameters.
struct SurfacePreset {
    std::string     name;
    Surface         surface;
    Range           u_range;
    Range           v_range;
    Parameters      parameters;  ///< Effective values after overrides
    SurfaceFormulas formulas;    ///< The same surface in `%`-syntax
};

/// Names of every catalogue surface, in display order.
std::vector<std::string> preset_names();

/// Build the catalogue surface `name` with `overrides` applied on top of its
/// default parameters.
///
/// # Returns
/// - `nullopt` if `name` is unknown
/// - `nullopt` if an override names a parameter the surface does not have
[[nodiscard]] std::optional<SurfacePreset>
find_preset(std::string_view name, const Parameters& overrides = {});

} // namespace geosurf
