#pragma once

/// @file include/geosurf/formula.hpp
/// @brief Text form of user-defined surfaces: `%`-syntax translation and
///        parameter discovery.
///
/// # Module: Surface Formulas
///
/// ## Responsibility
/// A user surface is three coordinate formulas in u and v, written with a
/// `%` prefix on every symbol:
///
///   x = "%r * sin(%u) * cos(%v)"
///   y = "%r * cos(%u)"
///   z = "%r * sin(%u) * sin(%v)"
///
/// - `%u`, `%v`   the surface coordinates
/// - `%pi`, `%e`  the constants π and e (reserved, never parameters)
/// - `%<c>`       a one-letter parameter, c ∈ [a-t w-z A-Z]
/// - `^`          exponentiation; sin, cos, tan, asin, acos, atan and their
///                hyperbolic forms are available without prefix
///
/// This module rewrites that syntax into the identifier form bound by the
/// expression compiler and discovers which parameters a formula uses.
///
/// ## Guarantees
/// - Pure string processing; never throws on malformed text (errors surface
///   when the translated formula is compiled)
///
/// ## NOT Responsible For
/// - Compiling or evaluating formulas (see geosurf/formula_surface.hpp)

#include "geosurf/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace geosurf {

/// The three coordinate formulas of a user surface.
struct SurfaceFormulas {
    std::string x;
    std::string y;
    std::string z;
};

/// Identifier bound to the u coordinate in translated formulas.
inline constexpr const char* FORMULA_U = "u_";

/// Identifier bound to the v coordinate in translated formulas.
inline constexpr const char* FORMULA_V = "v_";

/// True if `c` may name a one-letter parameter (`%c`).
[[nodiscard]] bool is_parameter_letter(char c) noexcept;

/// Identifier bound to parameter `c` in translated formulas, e.g. 'R' → "p82".
/// Lower- and upper-case letters map to distinct identifiers.
[[nodiscard]] std::string parameter_identifier(char c);

/// Rewrite `%`-syntax into compiler identifiers:
///   %pi → (pi), %e → (e), %u → (u_), %v → (v_), %c → (p<code>).
/// Every substitution is parenthesised. Any other text is copied verbatim.
[[nodiscard]] std::string translate_formula(std::string_view text);

/// Parameters referenced by `text`, each once, in order of first use.
/// `%u`, `%v`, `%pi` and `%e` are not parameters.
[[nodiscard]] std::vector<std::string> find_parameters(std::string_view text);

/// Union of the parameters of all three formulas, x first, then y, then z.
[[nodiscard]] std::vector<std::string> find_parameters(const SurfaceFormulas& formulas);

/// Parameter values for `formulas`: every discovered parameter defaults to 0
/// and is replaced by its entry in `overrides`.
///
/// # Returns
/// `nullopt` if an override names a parameter the formulas do not use.
[[nodiscard]] std::optional<Parameters>
resolve_parameters(const SurfaceFormulas& formulas, const Parameters& overrides);

} // namespace geosurf
