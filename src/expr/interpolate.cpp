/// @file interpolate.cpp
/// @brief `${{ }}` interpolation over strings and documents

#include <manifold/expr/interpolate.hpp>

#include <regex>

namespace manifold_expr {

using json = nlohmann::json;

namespace {

const std::regex& interpolation_regex() {
    static const std::regex re(R"(\$\{\{\s*([^}]+?)\s*\}\})");
    return re;
}

const std::regex& exact_regex() {
    static const std::regex re(R"(^\$\{\{\s*([^}]+?)\s*\}\}$)");
    return re;
}

} // anonymous namespace

std::vector<Interpolation> find_interpolations(const std::string& text) {
    std::vector<Interpolation> out;
    if (text.find("${{") == std::string::npos) {
        return out;
    }

    for (std::sregex_iterator it(text.begin(), text.end(), interpolation_regex()), end; it != end; ++it) {
        const std::smatch& m = *it;
        out.push_back(Interpolation{
            static_cast<std::size_t>(m.position(0)),
            static_cast<std::size_t>(m.length(0)),
            m[1].str()});
    }
    return out;
}

bool has_interpolation(const std::string& text) {
    return !find_interpolations(text).empty();
}

std::optional<std::string> exact_interpolation(const std::string& text) {
    std::smatch m;
    if (text.size() >= 5 && std::regex_match(text, m, exact_regex())) {
        return m[1].str();
    }
    return std::nullopt;
}

EvalOutcome expand_string(const std::string& text, const json& context, const Evaluator& evaluator) {
    if (auto expr = exact_interpolation(text)) {
        return evaluator.evaluate(*expr, context);
    }

    auto parts = find_interpolations(text);
    if (parts.empty()) {
        return Resolved{text};
    }

    std::string out;
    std::size_t cursor = 0;
    for (const auto& part : parts) {
        out.append(text, cursor, part.begin - cursor);

        EvalOutcome value = evaluator.evaluate(part.expression, context);
        if (value.is_error()) {
            return value;
        }
        if (value.is_deferred()) {
            out.append(text, part.begin, part.length);
        } else {
            out += stringify(value.value());
        }

        cursor = part.begin + part.length;
    }
    out.append(text, cursor, std::string::npos);

    return Resolved{std::move(out)};
}

EvalOutcome expand_value(const json& value, const json& context, const Evaluator& evaluator) {
    if (value.is_string()) {
        EvalOutcome expanded = expand_string(value.get_ref<const std::string&>(), context, evaluator);
        if (expanded.is_deferred()) {
            return Resolved{value};
        }
        return expanded;
    }

    if (value.is_array()) {
        json out = json::array();
        for (const auto& item : value) {
            EvalOutcome expanded = expand_value(item, context, evaluator);
            if (expanded.is_error()) return expanded;
            out.push_back(expanded.take_value());
        }
        return Resolved{std::move(out)};
    }

    if (value.is_object()) {
        json out = json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            EvalOutcome expanded = expand_value(it.value(), context, evaluator);
            if (expanded.is_error()) return expanded;
            out[it.key()] = expanded.take_value();
        }
        return Resolved{std::move(out)};
    }

    return Resolved{value};
}

bool contains_interpolation(const json& value) {
    if (value.is_string()) {
        return has_interpolation(value.get_ref<const std::string&>());
    }
    if (value.is_array() || value.is_object()) {
        for (const auto& item : value) {
            if (contains_interpolation(item)) return true;
        }
    }
    return false;
}

} // namespace manifold_expr
