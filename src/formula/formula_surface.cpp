/// @file src/formula/formula_surface.cpp
/// @brief tinyexpr-backed user surfaces.

#include "geosurf/formula_surface.hpp"

#include <tinyexpr.h>

#include <array>
#include <cmath>
#include <limits>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace geosurf {

namespace {

// tinyexpr ships only the circular and forward hyperbolic functions.
double inverse_sinh(double x) { return std::asinh(x); }
double inverse_cosh(double x) { return std::acosh(x); }
double inverse_tanh(double x) { return std::atanh(x); }

/// Three compiled coordinate formulas and the storage their variables read.
class CompiledFormulas {
public:
    /// Bound variables: u, v, then one slot per parameter.
    explicit CompiledFormulas(const std::vector<std::string>& parameter_names)
        : values_(2 + parameter_names.size(), std::numeric_limits<double>::quiet_NaN()) {
        bindings_.push_back({FORMULA_U, &values_[0]});
        bindings_.push_back({FORMULA_V, &values_[1]});
        for (std::size_t i = 0; i < parameter_names.size(); ++i) {
            bindings_.push_back({parameter_identifier(parameter_names[i].front()),
                                 &values_[2 + i]});
        }
    }

    CompiledFormulas(const CompiledFormulas&)            = delete;
    CompiledFormulas& operator=(const CompiledFormulas&) = delete;

    void set_parameter(std::size_t index, double value) { values_[2 + index] = value; }

    bool compile(const SurfaceFormulas& formulas, std::string& error) {
        const std::array<std::pair<const char*, const std::string*>, 3> axes{{
            {"x", &formulas.x}, {"y", &formulas.y}, {"z", &formulas.z},
        }};
        for (std::size_t i = 0; i < axes.size(); ++i) {
            std::string message;
            if (!expressions_[i].compile(translate_formula(*axes[i].second),
                                         bindings_, message)) {
                error = std::string(axes[i].first) + ": " + message;
                return false;
            }
        }
        return true;
    }

    Position3D evaluate(double u, double v) {
        const std::lock_guard<std::mutex> lock(mutex_);
        values_[0] = u;
        values_[1] = v;
        return Position3D(expressions_[0].evaluate(),
                          expressions_[1].evaluate(),
                          expressions_[2].evaluate());
    }

private:
    std::vector<double>              values_;  // never resized after construction
    std::vector<FormulaBinding>      bindings_;
    std::array<FormulaExpression, 3> expressions_;
    std::mutex                       mutex_;
};

} // namespace

// ─── FormulaExpression ────────────────────────────────────────────────────────

FormulaExpression::~FormulaExpression() {
    release();
}

FormulaExpression::FormulaExpression(FormulaExpression&& other) noexcept
    : expr_(std::exchange(other.expr_, nullptr)) {}

FormulaExpression& FormulaExpression::operator=(FormulaExpression&& other) noexcept {
    if (this != &other) {
        release();
        expr_ = std::exchange(other.expr_, nullptr);
    }
    return *this;
}

void FormulaExpression::release() noexcept {
    if (expr_) {
        te_free(expr_);
        expr_ = nullptr;
    }
}

bool FormulaExpression::compile(const std::string&               text,
                                std::span<const FormulaBinding> bindings,
                                std::string&                     error) {
    release();

    std::vector<te_variable> variables;
    variables.reserve(bindings.size() + 3);
    for (const auto& binding : bindings) {
        variables.push_back({binding.name.c_str(), binding.address, TE_VARIABLE, nullptr});
    }
    variables.push_back({"asinh", reinterpret_cast<const void*>(&inverse_sinh),
                         TE_FUNCTION1 | TE_FLAG_PURE, nullptr});
    variables.push_back({"acosh", reinterpret_cast<const void*>(&inverse_cosh),
                         TE_FUNCTION1 | TE_FLAG_PURE, nullptr});
    variables.push_back({"atanh", reinterpret_cast<const void*>(&inverse_tanh),
                         TE_FUNCTION1 | TE_FLAG_PURE, nullptr});

    int position = 0;
    expr_ = te_compile(text.c_str(), variables.data(),
                       static_cast<int>(variables.size()), &position);
    if (!expr_) {
        error = "parse error at position " + std::to_string(position);
        return false;
    }

    error.clear();
    return true;
}

double FormulaExpression::evaluate() const {
    if (!expr_) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return te_eval(expr_);
}

// ─── Formula surfaces ─────────────────────────────────────────────────────────

std::optional<Surface>
compile_formula_surface(const SurfaceFormulas& formulas,
                        const Parameters&      parameters,
                        std::string&           error) {
    const std::vector<std::string> names = find_parameters(formulas);

    auto compiled = std::make_shared<CompiledFormulas>(names);
    for (std::size_t i = 0; i < names.size(); ++i) {
        const auto it = parameters.find(names[i]);
        if (it != parameters.end()) {
            compiled->set_parameter(i, it->second);
        }
    }

    if (!compiled->compile(formulas, error)) {
        return std::nullopt;
    }

    return Surface([compiled](double u, double v) {
        return compiled->evaluate(u, v);
    });
}

Surface make_formula_surface(const SurfaceFormulas& formulas,
                             const Parameters&      parameters) {
    std::string error;
    if (auto surface = compile_formula_surface(formulas, parameters, error)) {
        return *std::move(surface);
    }
    return Surface([](double, double) { return invalid_position(); });
}

} // namespace geosurf
