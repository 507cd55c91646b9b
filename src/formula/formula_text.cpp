/// @file src/formula/formula_text.cpp
/// @brief `%`-syntax translation and parameter discovery.

#include "geosurf/formula.hpp"

#include <algorithm>
#include <utility>

namespace geosurf {

namespace {

/// The token following a '%' at text[pos].
enum class Token { Pi, E, U, V, Parameter, Other };

Token classify(std::string_view text, std::size_t pos) noexcept {
    const std::string_view rest = text.substr(pos + 1);
    if (rest.starts_with("pi")) return Token::Pi;
    if (rest.empty())           return Token::Other;
    switch (rest.front()) {
        case 'e': return Token::E;
        case 'u': return Token::U;
        case 'v': return Token::V;
        default:
            return is_parameter_letter(rest.front()) ? Token::Parameter : Token::Other;
    }
}

void add_unique(std::vector<std::string>& names, std::string name) {
    if (std::find(names.begin(), names.end(), name) == names.end()) {
        names.push_back(std::move(name));
    }
}

} // namespace

bool is_parameter_letter(char c) noexcept {
    const bool lower = c >= 'a' && c <= 'z' && c != 'u' && c != 'v';
    const bool upper = c >= 'A' && c <= 'Z';
    return lower || upper;
}

std::string parameter_identifier(char c) {
    return "p" + std::to_string(static_cast<int>(static_cast<unsigned char>(c)));
}

std::string translate_formula(std::string_view text) {
    std::string out;
    out.reserve(text.size() * 2);

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '%') {
            out += text[i];
            continue;
        }
        switch (classify(text, i)) {
            case Token::Pi:
                out += "(pi)";
                i += 2;
                break;
            case Token::E:
                out += "(e)";
                i += 1;
                break;
            case Token::U:
                out += '(';
                out += FORMULA_U;
                out += ')';
                i += 1;
                break;
            case Token::V:
                out += '(';
                out += FORMULA_V;
                out += ')';
                i += 1;
                break;
            case Token::Parameter:
                out += '(' + parameter_identifier(text[i + 1]) + ')';
                i += 1;
                break;
            case Token::Other:
                out += '%';
                break;
        }
    }
    return out;
}

std::vector<std::string> find_parameters(std::string_view text) {
    std::vector<std::string> names;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '%') {
            continue;
        }
        switch (classify(text, i)) {
            case Token::Pi:
                i += 2;
                break;
            case Token::Parameter:
                add_unique(names, std::string(1, text[i + 1]));
                i += 1;
                break;
            case Token::E:
            case Token::U:
            case Token::V:
                i += 1;
                break;
            case Token::Other:
                break;
        }
    }
    return names;
}

std::vector<std::string> find_parameters(const SurfaceFormulas& formulas) {
    std::vector<std::string> names;
    for (const std::string* text : {&formulas.x, &formulas.y, &formulas.z}) {
        for (auto& name : find_parameters(*text)) {
            add_unique(names, std::move(name));
        }
    }
    return names;
}

std::optional<Parameters>
resolve_parameters(const SurfaceFormulas& formulas, const Parameters& overrides) {
    Parameters params;
    for (const auto& name : find_parameters(formulas)) {
        params[name] = 0.0;
    }
    for (const auto& [key, value] : overrides) {
        auto slot = params.find(key);
        if (slot == params.end()) {
            return std::nullopt;
        }
        slot->second = value;
    }
    return params;
}

} // namespace geosurf
