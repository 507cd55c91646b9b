#pragma once

/// @file include/geosurf/formula_surface.hpp
/// @brief Surfaces defined by user formulas, compiled with tinyexpr.
///
/// # Module: Formula Surface
///
/// ## Responsibility
/// Compile the three `%`-syntax coordinate formulas of a user surface once,
/// with u, v and every parameter bound by name, and evaluate them many times
/// behind the ordinary `Surface` capability.
///
/// ## Guarantees
/// - Compilation failure is reported, never thrown
/// - A surface from `make_formula_surface` is total: a formula that failed to
///   compile, a parameter without a value, or a non-finite result all
///   evaluate to `invalid_position()`
/// - Evaluation is serialised internally, so a formula surface may be shared
///   between threads like any other `Surface`
///
/// ## NOT Responsible For
/// - `%`-syntax rules and parameter discovery (see geosurf/formula.hpp)

#include "geosurf/formula.hpp"
#include "geosurf/surface.hpp"
#include "geosurf/types.hpp"

#include <optional>
#include <span>
#include <string>

struct te_expr;

namespace geosurf {

// ─── FormulaExpression ────────────────────────────────────────────────────────

/// A variable name bound to the storage it is read from at evaluation time.
struct FormulaBinding {
    std::string   name;
    const double* address;
};

/// One compiled tinyexpr expression. Move-only owner of the `te_expr`.
class FormulaExpression {
public:
    FormulaExpression() = default;
    ~FormulaExpression();

    FormulaExpression(const FormulaExpression&)            = delete;
    FormulaExpression& operator=(const FormulaExpression&) = delete;

    FormulaExpression(FormulaExpression&& other) noexcept;
    FormulaExpression& operator=(FormulaExpression&& other) noexcept;

    /// Compile `text` (already translated) with `bindings` as its variables,
    /// plus asinh, acosh and atanh. The bound addresses must outlive this
    /// expression.
    ///
    /// # Returns
    /// `false` on a parse error; `error` then holds the 1-based position.
    bool compile(const std::string&               text,
                 std::span<const FormulaBinding> bindings,
                 std::string&                     error);

    /// Evaluate with the current values behind the bound addresses.
    /// NaN if nothing is compiled.
    [[nodiscard]] double evaluate() const;

    [[nodiscard]] bool is_valid() const noexcept { return expr_ != nullptr; }

private:
    void release() noexcept;

    te_expr* expr_ = nullptr;
};

// ─── Formula surfaces ─────────────────────────────────────────────────────────

/// Compile `formulas` into a surface with parameter values `parameters`.
///
/// # Returns
/// - The surface on success
/// - `nullopt` if any formula fails to compile; `error` names the axis and
///   the position, e.g. "y: parse error at position 7"
[[nodiscard]] std::optional<Surface>
compile_formula_surface(const SurfaceFormulas& formulas,
                        const Parameters&      parameters,
                        std::string&           error);

/// As compile_formula_surface, but a failed compilation yields a surface that
/// is undefined everywhere.
///
/// # Example
/// ```cpp
/// auto sphere = geosurf::make_formula_surface(
///     {"%r * sin(%u) * cos(%v)", "%r * cos(%u)", "%r * sin(%u) * sin(%v)"},
///     {{"r", 5.0}});
/// ```
[[nodiscard]] Surface make_formula_surface(const SurfaceFormulas& formulas,
                                           const Parameters&      parameters);

} // namespace geosurf
