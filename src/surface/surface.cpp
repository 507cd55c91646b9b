/// @file src/surface/surface.cpp
/// @brief Surface wrapper and the built-in surface catalogue.

#include "geosurf/surface.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <utility>

namespace geosurf {

// ─── Construction ─────────────────────────────────────────────────────────────

Surface::Surface(SurfaceFunction fn)
    : fn_(std::move(fn)) {}

// ─── Evaluation ───────────────────────────────────────────────────────────────

Position3D Surface::evaluate(double u, double v) const {
    Position3D p = fn_(u, v);
    if (!p.allFinite()) {
        return invalid_position();
    }
    return p;
}

bool Surface::is_defined(double u, double v) const {
    return evaluate(u, v).allFinite();
}

// ─── Factories ────────────────────────────────────────────────────────────────

Surface Surface::make_plane(double height) {
    return Surface([height](double u, double v) {
        return Position3D(u, height, v);
    });
}

Surface Surface::make_sphere(double r) {
    return Surface([r](double u, double v) {
        return Position3D(r * std::sin(u) * std::cos(v),
                          r * std::cos(u),
                          r * std::sin(u) * std::sin(v));
    });
}

Surface Surface::make_cylinder(double r) {
    return Surface([r](double u, double v) {
        return Position3D(r * std::cos(v), u, -r * std::sin(v));
    });
}

Surface Surface::make_cone(double h) {
    return Surface([h](double u, double v) {
        return Position3D(u * std::cos(v), h - u, u * std::sin(v));
    });
}

Surface Surface::make_ellipsoid(double a, double b, double c) {
    return Surface([a, b, c](double u, double v) {
        return Position3D(a * std::sin(u) * std::cos(v),
                          b * std::cos(u),
                          c * std::sin(u) * std::sin(v));
    });
}

Surface Surface::make_torus(double major_r, double minor_r) {
    return Surface([major_r, minor_r](double u, double v) {
        const double ring = major_r + minor_r * std::cos(u);
        return Position3D(ring * std::cos(v),
                          minor_r * std::sin(u),
                          ring * std::sin(v));
    });
}

Surface Surface::make_saddle(double s) {
    return Surface([s](double u, double v) {
        return Position3D(u, (u * u - v * v) / s, v);
    });
}

Surface Surface::make_hyperboloid_one_sheet(double a, double b, double c) {
    return Surface([a, b, c](double u, double v) {
        return Position3D(a * std::cosh(u) * std::cos(v),
                          b * std::sinh(u),
                          c * std::cosh(u) * std::sin(v));
    });
}

Surface Surface::make_hyperboloid_two_sheets(double a, double b, double c) {
    return Surface([a, b, c](double u, double v) {
        return Position3D(a * std::sinh(u) * std::cos(v),
                          b * std::cosh(u),
                          c * std::sinh(u) * std::sin(v));
    });
}

Surface Surface::make_paraboloid() {
    return Surface([](double u, double v) {
        return Position3D(u * std::cos(v), u * u, u * std::sin(v));
    });
}

Surface Surface::make_crossed_through(double s) {
    return Surface([s](double u, double v) {
        return Position3D(u, u * u * v * v / s, v);
    });
}

// ─── Catalogue ────────────────────────────────────────────────────────────────

namespace {

using Builder = Surface (*)(const Parameters&);

struct CatalogueEntry {
    const char*     name;
    Parameters      defaults;
    Range           u_range;
    Range           v_range;
    Builder         build;
    SurfaceFormulas formulas;
};

constexpr double PI     = std::numbers::pi;
constexpr double TWO_PI = 2.0 * std::numbers::pi;

// Lower bound of polar ranges; u = 0 makes the mesh overlap itself.
constexpr double POLE_OFFSET = 1e-20;

const std::vector<CatalogueEntry>& catalogue() {
    static const std::vector<CatalogueEntry> entries = {
        {"plane", {{"y", 0.0}}, {-10.0, 10.0}, {-10.0, 10.0},
         [](const Parameters& p) { return Surface::make_plane(p.at("y")); },
         {"%u",
          "%y",
          "%v"}},
        {"sphere", {{"r", 5.0}}, {POLE_OFFSET, PI}, {0.0, TWO_PI},
         [](const Parameters& p) { return Surface::make_sphere(p.at("r")); },
         {"%r * sin(%u) * cos(%v)",
          "%r * cos(%u)",
          "%r * sin(%u) * sin(%v)"}},
        {"cylinder", {{"r", 5.0}}, {-10.0, 10.0}, {0.0, TWO_PI},
         [](const Parameters& p) { return Surface::make_cylinder(p.at("r")); },
         {"%r * cos(%v)",
          "%u",
          "-%r * sin(%v)"}},
        {"cone", {{"h", 5.0}}, {POLE_OFFSET, 5.0}, {0.0, TWO_PI},
         [](const Parameters& p) { return Surface::make_cone(p.at("h")); },
         {"%u * cos(%v)",
          "%h - %u",
          "%u * sin(%v)"}},
        {"ellipsoid", {{"a", 2.0}, {"b", 3.0}, {"c", 4.0}},
         {POLE_OFFSET, PI}, {0.0, TWO_PI},
         [](const Parameters& p) {
             return Surface::make_ellipsoid(p.at("a"), p.at("b"), p.at("c"));
         },
         {"%a * sin(%u) * cos(%v)",
          "%b * cos(%u)",
          "%c * sin(%u) * sin(%v)"}},
        {"torus", {{"R", 5.0}, {"r", 1.0}}, {0.0, TWO_PI}, {0.0, TWO_PI},
         [](const Parameters& p) {
             return Surface::make_torus(p.at("R"), p.at("r"));
         },
         {"(%R + %r * cos(%u)) * cos(%v)",
          "%r * sin(%u)",
          "(%R + %r * cos(%u)) * sin(%v)"}},
        {"saddle", {{"s", 10.0}}, {-10.0, 10.0}, {-10.0, 10.0},
         [](const Parameters& p) { return Surface::make_saddle(p.at("s")); },
         {"%u",
          "(%u^2 - %v^2) / %s",
          "%v"}},
        {"hyperboloid1", {{"a", 1.0}, {"b", 1.0}, {"c", 1.0}},
         {-2.0, 2.0}, {0.0, TWO_PI},
         [](const Parameters& p) {
             return Surface::make_hyperboloid_one_sheet(p.at("a"), p.at("b"), p.at("c"));
         },
         {"%a * cosh(%u) * cos(%v)",
          "%b * sinh(%u)",
          "%c * cosh(%u) * sin(%v)"}},
        {"hyperboloid2", {{"a", 1.0}, {"b", 1.0}, {"c", 1.0}},
         {0.0, 2.5}, {0.0, TWO_PI},
         [](const Parameters& p) {
             return Surface::make_hyperboloid_two_sheets(p.at("a"), p.at("b"), p.at("c"));
         },
         {"%a * sinh(%u) * cos(%v)",
          "%b * cosh(%u)",
          "%c * sinh(%u) * sin(%v)"}},
        {"paraboloid", {}, {POLE_OFFSET, 2.5}, {0.0, TWO_PI},
         [](const Parameters&) { return Surface::make_paraboloid(); },
         {"%u * cos(%v)",
          "%u^2",
          "%u * sin(%v)"}},
        {"crossed-through", {{"s", 1000.0}}, {-20.0, 20.0}, {-20.0, 20.0},
         [](const Parameters& p) { return Surface::make_crossed_through(p.at("s")); },
         {"%u",
          "%u^2 * %v^2 / %s",
          "%v"}},
    };
    return entries;
}

} // namespace

std::vector<std::string> preset_names() {
    std::vector<std::string> names;
    names.reserve(catalogue().size());
    for (const auto& entry : catalogue()) {
        names.emplace_back(entry.name);
    }
    return names;
}

std::optional<SurfacePreset>
find_preset(std::string_view name, const Parameters& overrides) {
    const auto& entries = catalogue();
    const auto it = std::find_if(entries.begin(), entries.end(),
        [name](const CatalogueEntry& e) { return name == e.name; });
    if (it == entries.end()) {
        return std::nullopt;
    }

    Parameters params = it->defaults;
    for (const auto& [key, value] : overrides) {
        auto slot = params.find(key);
        if (slot == params.end()) {
            return std::nullopt;
        }
        slot->second = value;
    }

    return SurfacePreset{
        .name       = it->name,
        .surface    = it->build(params),
        .u_range    = it->u_range,
        .v_range    = it->v_range,
        .parameters = params,
        .formulas   = it->formulas,
    };
}

} // namespace geosurf
