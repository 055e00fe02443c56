/// @file evaluator.cpp
/// @brief Tree-walking expression evaluator

#include <manifold/expr/evaluator.hpp>
#include <manifold/expr/parser.hpp>

#include <manifold/core/resource.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

namespace manifold_expr {

using json = nlohmann::json;

// =============================================================================
// EvalOutcome
// =============================================================================

manifold_core::Result<json> EvalOutcome::to_result(const std::string& expression,
                                                   const std::string& resource) const {
    using manifold_core::ExpressionError;
    if (is_resolved()) {
        return manifold_core::Ok(value());
    }
    if (is_deferred()) {
        return manifold_core::Err<json>(manifold_core::Error(ExpressionError::failed(
            expression, "'" + identifier() + "' is not available in this context", resource)));
    }
    return manifold_core::Err<json>(manifold_core::Error(ExpressionError::failed(expression, message(), resource)));
}

// =============================================================================
// Value Helpers
// =============================================================================

bool is_truthy(const json& value) {
    switch (value.type()) {
        case json::value_t::null: return false;
        case json::value_t::boolean: return value.get<bool>();
        case json::value_t::number_integer: return value.get<std::int64_t>() != 0;
        case json::value_t::number_unsigned: return value.get<std::uint64_t>() != 0;
        case json::value_t::number_float: {
            double d = value.get<double>();
            return d != 0.0 && !std::isnan(d);
        }
        case json::value_t::string: return !value.get_ref<const std::string&>().empty();
        default: return true;
    }
}

std::string stringify(const json& value) {
    switch (value.type()) {
        case json::value_t::null: return "";
        case json::value_t::string: return value.get<std::string>();
        case json::value_t::boolean: return value.get<bool>() ? "true" : "false";
        case json::value_t::number_float: {
            double d = value.get<double>();
            if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 1e15) {
                return std::to_string(static_cast<std::int64_t>(d));
            }
            return value.dump();
        }
        default: return value.dump();
    }
}

namespace {

// =============================================================================
// Interpreter
// =============================================================================

/// Walks one expression tree. Locals shadow the context.
class Interpreter {
public:
    Interpreter(const json& context, const EvalOptions& options)
        : context_(context), options_(options) {}

    EvalOutcome eval(const Expression& expr) {
        if (auto* lit = dynamic_cast<const LiteralExpr*>(&expr)) {
            return Resolved{lit->value};
        } else if (auto* ident = dynamic_cast<const IdentifierExpr*>(&expr)) {
            return eval_identifier(*ident);
        } else if (auto* member = dynamic_cast<const MemberExpr*>(&expr)) {
            return eval_member(*member);
        } else if (auto* index = dynamic_cast<const IndexExpr*>(&expr)) {
            return eval_index(*index);
        } else if (auto* unary = dynamic_cast<const UnaryExpr*>(&expr)) {
            return eval_unary(*unary);
        } else if (auto* binary = dynamic_cast<const BinaryExpr*>(&expr)) {
            return eval_binary(*binary);
        } else if (auto* ternary = dynamic_cast<const TernaryExpr*>(&expr)) {
            return eval_ternary(*ternary);
        } else if (auto* list = dynamic_cast<const ListExpr*>(&expr)) {
            return eval_list(*list);
        } else if (auto* map = dynamic_cast<const MapExpr*>(&expr)) {
            return eval_map(*map);
        } else if (auto* call = dynamic_cast<const CallExpr*>(&expr)) {
            return eval_call(*call);
        }
        return EvalFailure{"Unsupported expression node"};
    }

private:
    static EvalOutcome fail(std::string message) {
        return EvalFailure{std::move(message)};
    }

    // Unsigned values past the int64 range take the double path
    static bool is_int(const json& v) {
        return v.is_number_integer() &&
               !(v.is_number_unsigned() &&
                 v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()));
    }
    static std::int64_t as_int(const json& v) { return v.get<std::int64_t>(); }
    static double as_double(const json& v) { return v.get<double>(); }

    EvalOutcome eval_identifier(const IdentifierExpr& ident) {
        for (auto it = locals_.rbegin(); it != locals_.rend(); ++it) {
            if (it->first == ident.name) {
                return Resolved{it->second};
            }
        }

        if (context_.is_object()) {
            auto found = context_.find(ident.name);
            if (found != context_.end()) {
                return Resolved{*found};
            }
        }

        if (options_.deferred_roots.count(ident.name) > 0) {
            return Deferred{ident.name};
        }

        return fail("undeclared reference to '" + ident.name + "'");
    }

    EvalOutcome eval_member(const MemberExpr& member) {
        EvalOutcome object = eval(*member.object);
        if (!object.is_resolved()) return object;

        const json& value = object.value();
        if (!value.is_object()) {
            return fail("cannot select field '" + member.member + "' from " +
                        manifold_core::json_type_name(value));
        }

        auto it = value.find(member.member);
        if (it == value.end()) {
            return fail("no such key: '" + member.member + "'");
        }
        return Resolved{*it};
    }

    EvalOutcome eval_index(const IndexExpr& index) {
        EvalOutcome object = eval(*index.object);
        if (!object.is_resolved()) return object;
        EvalOutcome key = eval(*index.index);
        if (!key.is_resolved()) return key;

        const json& container = object.value();
        const json& k = key.value();

        if (container.is_array()) {
            if (!is_int(k)) {
                return fail(std::string("list index must be int, got ") + manifold_core::json_type_name(k));
            }
            std::int64_t i = as_int(k);
            if (i < 0 || static_cast<std::size_t>(i) >= container.size()) {
                return fail("index out of range: " + std::to_string(i));
            }
            return Resolved{container[static_cast<std::size_t>(i)]};
        }

        if (container.is_object()) {
            if (!k.is_string()) {
                return fail(std::string("map key must be string, got ") + manifold_core::json_type_name(k));
            }
            auto it = container.find(k.get<std::string>());
            if (it == container.end()) {
                return fail("no such key: '" + k.get<std::string>() + "'");
            }
            return Resolved{*it};
        }

        return fail(std::string("cannot index into ") + manifold_core::json_type_name(container));
    }

    EvalOutcome eval_unary(const UnaryExpr& unary) {
        EvalOutcome operand = eval(*unary.operand);
        if (!operand.is_resolved()) return operand;
        const json& v = operand.value();

        if (unary.op == TokenType::Not) {
            return Resolved{!is_truthy(v)};
        }

        // Minus
        if (is_int(v)) {
            std::int64_t i = as_int(v);
            if (i == std::numeric_limits<std::int64_t>::min()) return fail("integer overflow");
            return Resolved{-i};
        }
        if (v.is_number()) return Resolved{-as_double(v)};
        return fail(std::string("cannot negate ") + manifold_core::json_type_name(v));
    }

    EvalOutcome eval_binary(const BinaryExpr& binary) {
        // Short-circuit logical operators
        if (binary.op == TokenType::And || binary.op == TokenType::Or) {
            EvalOutcome left = eval(*binary.left);
            if (!left.is_resolved()) return left;
            bool l = is_truthy(left.value());
            if (binary.op == TokenType::And && !l) return Resolved{false};
            if (binary.op == TokenType::Or && l) return Resolved{true};
            EvalOutcome right = eval(*binary.right);
            if (!right.is_resolved()) return right;
            return Resolved{is_truthy(right.value())};
        }

        EvalOutcome left = eval(*binary.left);
        if (!left.is_resolved()) return left;
        EvalOutcome right = eval(*binary.right);
        if (!right.is_resolved()) return right;

        const json& l = left.value();
        const json& r = right.value();

        switch (binary.op) {
            case TokenType::Equal: return Resolved{l == r};
            case TokenType::NotEqual: return Resolved{l != r};

            case TokenType::Less:
            case TokenType::LessEqual:
            case TokenType::Greater:
            case TokenType::GreaterEqual:
                return compare(binary.op, l, r);

            case TokenType::In:
                return contains(l, r);

            case TokenType::Plus:
                if (l.is_string() && r.is_string()) {
                    return Resolved{l.get<std::string>() + r.get<std::string>()};
                }
                if (l.is_array() && r.is_array()) {
                    json out = l;
                    for (const auto& item : r) out.push_back(item);
                    return Resolved{std::move(out)};
                }
                return arithmetic(binary.op, l, r);

            case TokenType::Minus:
            case TokenType::Star:
            case TokenType::Slash:
            case TokenType::Percent:
                return arithmetic(binary.op, l, r);

            default:
                return fail(std::string("unsupported operator '") + token_type_name(binary.op) + "'");
        }
    }

    static EvalOutcome arithmetic(TokenType op, const json& l, const json& r) {
        if (!l.is_number() || !r.is_number()) {
            return fail(std::string("no such overload: ") + manifold_core::json_type_name(l) + " " +
                        token_type_name(op) + " " + manifold_core::json_type_name(r));
        }

        if (is_int(l) && is_int(r)) {
            std::int64_t a = as_int(l);
            std::int64_t b = as_int(r);
            std::int64_t out = 0;
            switch (op) {
                case TokenType::Plus:
                    if (__builtin_add_overflow(a, b, &out)) return fail("integer overflow");
                    return Resolved{out};
                case TokenType::Minus:
                    if (__builtin_sub_overflow(a, b, &out)) return fail("integer overflow");
                    return Resolved{out};
                case TokenType::Star:
                    if (__builtin_mul_overflow(a, b, &out)) return fail("integer overflow");
                    return Resolved{out};
                case TokenType::Slash:
                    if (b == 0) return fail("division by zero");
                    if (a == std::numeric_limits<std::int64_t>::min() && b == -1) return fail("integer overflow");
                    return Resolved{a / b};
                case TokenType::Percent:
                    if (b == 0) return fail("modulus by zero");
                    if (a == std::numeric_limits<std::int64_t>::min() && b == -1) return fail("integer overflow");
                    return Resolved{a % b};
                default: break;
            }
        } else {
            double a = as_double(l);
            double b = as_double(r);
            switch (op) {
                case TokenType::Plus: return Resolved{a + b};
                case TokenType::Minus: return Resolved{a - b};
                case TokenType::Star: return Resolved{a * b};
                case TokenType::Slash: return Resolved{a / b};
                case TokenType::Percent: return Resolved{std::fmod(a, b)};
                default: break;
            }
        }
        return fail("unsupported arithmetic operator");
    }

    static EvalOutcome compare(TokenType op, const json& l, const json& r) {
        int cmp = 0;
        if (l.is_number() && r.is_number()) {
            if (is_int(l) && is_int(r)) {
                std::int64_t a = as_int(l), b = as_int(r);
                cmp = a < b ? -1 : (a > b ? 1 : 0);
            } else {
                double a = as_double(l), b = as_double(r);
                cmp = a < b ? -1 : (a > b ? 1 : 0);
            }
        } else if (l.is_string() && r.is_string()) {
            cmp = l.get_ref<const std::string&>().compare(r.get_ref<const std::string&>());
        } else {
            return fail(std::string("cannot compare ") + manifold_core::json_type_name(l) + " with " +
                        manifold_core::json_type_name(r));
        }

        switch (op) {
            case TokenType::Less: return Resolved{cmp < 0};
            case TokenType::LessEqual: return Resolved{cmp <= 0};
            case TokenType::Greater: return Resolved{cmp > 0};
            default: return Resolved{cmp >= 0};
        }
    }

    static EvalOutcome contains(const json& needle, const json& haystack) {
        if (haystack.is_array()) {
            return Resolved{std::find(haystack.begin(), haystack.end(), needle) != haystack.end()};
        }
        if (haystack.is_object()) {
            if (!needle.is_string()) return Resolved{false};
            return Resolved{haystack.contains(needle.get<std::string>())};
        }
        return fail(std::string("'in' requires a list or map, got ") + manifold_core::json_type_name(haystack));
    }

    EvalOutcome eval_ternary(const TernaryExpr& ternary) {
        EvalOutcome cond = eval(*ternary.condition);
        if (!cond.is_resolved()) return cond;
        return is_truthy(cond.value()) ? eval(*ternary.then_expr) : eval(*ternary.else_expr);
    }

    EvalOutcome eval_list(const ListExpr& list) {
        json out = json::array();
        for (const auto& element : list.elements) {
            EvalOutcome v = eval(*element);
            if (!v.is_resolved()) return v;
            out.push_back(v.take_value());
        }
        return Resolved{std::move(out)};
    }

    EvalOutcome eval_map(const MapExpr& map) {
        json out = json::object();
        for (const auto& entry : map.entries) {
            EvalOutcome k = eval(*entry.key);
            if (!k.is_resolved()) return k;
            if (!k.value().is_string()) {
                return fail(std::string("map literal keys must be strings, got ") +
                            manifold_core::json_type_name(k.value()));
            }
            EvalOutcome v = eval(*entry.value);
            if (!v.is_resolved()) return v;
            out[k.value().get<std::string>()] = v.take_value();
        }
        return Resolved{std::move(out)};
    }

    // =========================================================================
    // Calls
    // =========================================================================

    EvalOutcome eval_call(const CallExpr& call) {
        if (call.target && (call.function == "map" || call.function == "filter" ||
                            call.function == "exists" || call.function == "all")) {
            return eval_macro(call);
        }

        if (!call.target && call.function == "has") {
            return eval_has(call);
        }

        std::vector<json> args;
        args.reserve(call.arguments.size());
        for (const auto& arg : call.arguments) {
            EvalOutcome v = eval(*arg);
            if (!v.is_resolved()) return v;
            args.push_back(v.take_value());
        }

        if (!call.target) {
            return call_function(call.function, args);
        }

        EvalOutcome target = eval(*call.target);
        if (!target.is_resolved()) return target;
        return call_method(target.value(), call.function, args);
    }

    EvalOutcome eval_has(const CallExpr& call) {
        if (call.arguments.size() != 1) {
            return fail("has() takes exactly one argument");
        }
        auto* member = dynamic_cast<const MemberExpr*>(call.arguments[0].get());
        if (!member) {
            return fail("has() argument must be a field selection");
        }
        EvalOutcome object = eval(*member->object);
        if (!object.is_resolved()) return object;
        const json& value = object.value();
        if (!value.is_object()) {
            return fail(std::string("has() cannot test a field of ") + manifold_core::json_type_name(value));
        }
        return Resolved{value.contains(member->member)};
    }

    EvalOutcome eval_macro(const CallExpr& call) {
        if (call.arguments.size() != 2) {
            return fail(call.function + "() takes exactly two arguments");
        }
        auto* var = dynamic_cast<const IdentifierExpr*>(call.arguments[0].get());
        if (!var) {
            return fail(call.function + "() first argument must be an identifier");
        }

        EvalOutcome target = eval(*call.target);
        if (!target.is_resolved()) return target;
        const json& range = target.value();

        std::vector<json> items;
        if (range.is_array()) {
            items.assign(range.begin(), range.end());
        } else if (range.is_object()) {
            for (auto it = range.begin(); it != range.end(); ++it) {
                items.emplace_back(it.key());
            }
        } else {
            return fail(call.function + "() requires a list or map, got " + manifold_core::json_type_name(range));
        }

        json mapped = json::array();
        for (const auto& item : items) {
            locals_.emplace_back(var->name, item);
            EvalOutcome v = eval(*call.arguments[1]);
            locals_.pop_back();
            if (!v.is_resolved()) return v;

            bool truthy = is_truthy(v.value());
            if (call.function == "map") {
                mapped.push_back(v.take_value());
            } else if (call.function == "filter") {
                if (truthy) mapped.push_back(item);
            } else if (call.function == "exists") {
                if (truthy) return Resolved{true};
            } else if (!truthy) {  // all
                return Resolved{false};
            }
        }

        if (call.function == "exists") return Resolved{false};
        if (call.function == "all") return Resolved{true};
        return Resolved{std::move(mapped)};
    }

    static EvalOutcome size_of(const json& v) {
        if (v.is_string()) return Resolved{static_cast<std::int64_t>(v.get_ref<const std::string&>().size())};
        if (v.is_array() || v.is_object()) return Resolved{static_cast<std::int64_t>(v.size())};
        return fail(std::string("size() is not defined for ") + manifold_core::json_type_name(v));
    }

    static EvalOutcome call_function(const std::string& name, const std::vector<json>& args) {
        if (args.size() != 1) {
            return fail(name + "() takes exactly one argument");
        }
        const json& v = args[0];

        if (name == "size") {
            return size_of(v);
        }
        if (name == "string") {
            return Resolved{stringify(v)};
        }
        if (name == "type") {
            return Resolved{manifold_core::json_type_name(v)};
        }
        if (name == "int") {
            if (is_int(v)) return Resolved{as_int(v)};
            if (v.is_number_unsigned()) return fail("int() value out of range");
            if (v.is_number_float()) {
                double d = as_double(v);
                if (!std::isfinite(d) || std::fabs(d) > 9.2e18) {
                    return fail("int() value out of range");
                }
                return Resolved{static_cast<std::int64_t>(d)};
            }
            if (v.is_string()) {
                const auto& s = v.get_ref<const std::string&>();
                try {
                    std::size_t consumed = 0;
                    long long parsed = std::stoll(s, &consumed);
                    if (consumed == s.size()) return Resolved{static_cast<std::int64_t>(parsed)};
                } catch (const std::exception&) {
                    // reported below
                }
                return fail("cannot convert \"" + s + "\" to int");
            }
            if (v.is_boolean()) return Resolved{static_cast<std::int64_t>(v.get<bool>() ? 1 : 0)};
            return fail(std::string("int() is not defined for ") + manifold_core::json_type_name(v));
        }
        if (name == "double") {
            if (v.is_number()) return Resolved{as_double(v)};
            if (v.is_string()) {
                const auto& s = v.get_ref<const std::string&>();
                try {
                    std::size_t consumed = 0;
                    double parsed = std::stod(s, &consumed);
                    if (consumed == s.size()) return Resolved{parsed};
                } catch (const std::exception&) {
                    // reported below
                }
                return fail("cannot convert \"" + s + "\" to double");
            }
            return fail(std::string("double() is not defined for ") + manifold_core::json_type_name(v));
        }

        return fail("unknown function '" + name + "'");
    }

    static EvalOutcome call_method(const json& target, const std::string& name, const std::vector<json>& args) {
        if (name == "size") {
            if (!args.empty()) return fail("size() takes no arguments");
            return size_of(target);
        }

        if (!target.is_string()) {
            return fail("no such method '" + name + "' on " + manifold_core::json_type_name(target));
        }
        const auto& s = target.get_ref<const std::string&>();

        if (name == "lowerAscii" || name == "upperAscii") {
            if (!args.empty()) return fail(name + "() takes no arguments");
            std::string out = s;
            bool lower = name == "lowerAscii";
            for (auto& c : out) {
                auto uc = static_cast<unsigned char>(c);
                c = static_cast<char>(lower ? std::tolower(uc) : std::toupper(uc));
            }
            return Resolved{std::move(out)};
        }

        if (name == "startsWith" || name == "endsWith" || name == "contains") {
            if (args.size() != 1 || !args[0].is_string()) {
                return fail(name + "() takes one string argument");
            }
            const auto& p = args[0].get_ref<const std::string&>();
            if (name == "startsWith") {
                return Resolved{s.size() >= p.size() && s.compare(0, p.size(), p) == 0};
            }
            if (name == "endsWith") {
                return Resolved{s.size() >= p.size() && s.compare(s.size() - p.size(), p.size(), p) == 0};
            }
            return Resolved{s.find(p) != std::string::npos};
        }

        return fail("no such method '" + name + "' on string");
    }

    const json& context_;
    const EvalOptions& options_;
    std::vector<std::pair<std::string, json>> locals_;
};

} // anonymous namespace

// =============================================================================
// Evaluator
// =============================================================================

Evaluator::Evaluator(EvalOptions options)
    : m_options(std::move(options)) {}

std::shared_ptr<const Expression> Evaluator::parse(std::string_view expression, std::string& error) const {
    std::string key(expression);
    {
        std::lock_guard<std::mutex> lock(m_cache_mutex);
        auto it = m_cache.find(key);
        if (it != m_cache.end()) {
            return it->second;
        }
    }

    Parser parser(expression);
    ExprPtr tree = parser.parse();
    if (!tree) {
        error = parser.error() ? parser.error()->to_string() : "invalid expression";
        return nullptr;
    }

    std::shared_ptr<const Expression> shared(std::move(tree));
    std::lock_guard<std::mutex> lock(m_cache_mutex);
    m_cache.emplace(std::move(key), shared);
    return shared;
}

EvalOutcome Evaluator::evaluate(std::string_view expression, const json& context) const {
    std::string error;
    auto tree = parse(expression, error);
    if (!tree) {
        return EvalFailure{"syntax error: " + error};
    }

    Interpreter interpreter(context, m_options);
    return interpreter.eval(*tree);
}

manifold_core::Result<void> Evaluator::check_syntax(std::string_view expression) const {
    std::string error;
    if (!parse(expression, error)) {
        return manifold_core::Err(manifold_core::Error(manifold_core::ExpressionError::failed(
            std::string(expression), "syntax error: " + error)));
    }
    return manifold_core::Ok();
}

std::size_t Evaluator::cache_size() const {
    std::lock_guard<std::mutex> lock(m_cache_mutex);
    return m_cache.size();
}

void Evaluator::clear_cache() {
    std::lock_guard<std::mutex> lock(m_cache_mutex);
    m_cache.clear();
}

EvalOutcome evaluate(std::string_view expression, const json& context, const EvalOptions& options) {
    Parser parser(expression);
    ExprPtr tree = parser.parse();
    if (!tree) {
        return EvalFailure{"syntax error: " +
                           (parser.error() ? parser.error()->to_string() : std::string("invalid expression"))};
    }

    Interpreter interpreter(context, options);
    return interpreter.eval(*tree);
}

} // namespace manifold_expr
