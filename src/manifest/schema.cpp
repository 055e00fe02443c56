/// @file schema.cpp
/// @brief SchemaValidator implementation

#include <manifold/manifest/schema.hpp>

#include <sstream>

namespace manifold_manifest {

using nlohmann::json;

namespace {

std::string child_path(const std::string& path, const std::string& key) {
    return path.empty() ? key : path + "." + key;
}

std::string index_path(const std::string& path, std::size_t index) {
    return (path.empty() ? std::string("$") : path) + "[" + std::to_string(index) + "]";
}

std::string display_path(const std::string& path) {
    return path.empty() ? std::string("$") : path;
}

} // anonymous namespace

bool SchemaValidator::has_type(const json& schema) {
    if (!schema.is_object()) {
        return false;
    }
    auto it = schema.find("type");
    return it != schema.end() && (it->is_string() || it->is_array());
}

bool SchemaValidator::matches_type(const json& value, const std::string& type) {
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    if (type == "string") return value.is_string();
    if (type == "boolean") return value.is_boolean();
    if (type == "null") return value.is_null();
    if (type == "number") return value.is_number();
    if (type == "integer") {
        if (value.is_number_integer()) return true;
        if (value.is_number_float()) {
            double d = value.get<double>();
            return d == static_cast<double>(static_cast<long long>(d));
        }
        return false;
    }
    return false;
}

void SchemaValidator::check(const json& value, const json& schema,
                            const std::string& path, std::vector<std::string>& errors) {
    if (!schema.is_object()) {
        return;
    }

    if (auto type = schema.find("type"); type != schema.end()) {
        bool ok = false;
        std::string expected;
        if (type->is_string()) {
            expected = type->get<std::string>();
            ok = matches_type(value, expected);
        } else if (type->is_array()) {
            for (const auto& t : *type) {
                if (!t.is_string()) continue;
                if (!expected.empty()) expected += "|";
                expected += t.get<std::string>();
                ok = ok || matches_type(value, t.get<std::string>());
            }
        } else {
            ok = true;
        }
        if (!ok) {
            errors.push_back(display_path(path) + ": expected " + expected + ", got " + value.type_name());
            return;
        }
    }

    if (auto allowed = schema.find("enum"); allowed != schema.end() && allowed->is_array()) {
        bool found = false;
        for (const auto& candidate : *allowed) {
            if (candidate == value) {
                found = true;
                break;
            }
        }
        if (!found) {
            errors.push_back(display_path(path) + ": " + value.dump() + " is not one of " + allowed->dump());
        }
    }

    if (value.is_number()) {
        if (auto min = schema.find("minimum"); min != schema.end() && min->is_number()) {
            if (value.get<double>() < min->get<double>()) {
                errors.push_back(display_path(path) + ": must be >= " + min->dump());
            }
        }
        if (auto max = schema.find("maximum"); max != schema.end() && max->is_number()) {
            if (value.get<double>() > max->get<double>()) {
                errors.push_back(display_path(path) + ": must be <= " + max->dump());
            }
        }
    }

    if (value.is_object()) {
        const json* properties = nullptr;
        if (auto props = schema.find("properties"); props != schema.end() && props->is_object()) {
            properties = &*props;
        }

        if (auto required = schema.find("required"); required != schema.end() && required->is_array()) {
            for (const auto& key : *required) {
                if (key.is_string() && !value.contains(key.get<std::string>())) {
                    errors.push_back(display_path(path) + ": missing required property '" +
                                     key.get<std::string>() + "'");
                }
            }
        }

        auto additional = schema.find("additionalProperties");
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (properties && properties->contains(it.key())) {
                check(it.value(), properties->at(it.key()), child_path(path, it.key()), errors);
                continue;
            }
            if (additional == schema.end()) continue;
            if (additional->is_boolean() && !additional->get<bool>()) {
                errors.push_back(display_path(path) + ": unexpected property '" + it.key() + "'");
            } else if (additional->is_object()) {
                check(it.value(), *additional, child_path(path, it.key()), errors);
            }
        }
    }

    if (value.is_array()) {
        if (auto min = schema.find("minItems"); min != schema.end() && min->is_number_integer()) {
            if (value.size() < min->get<std::size_t>()) {
                errors.push_back(display_path(path) + ": expected at least " + min->dump() + " item(s)");
            }
        }
        if (auto items = schema.find("items"); items != schema.end() && items->is_object()) {
            for (std::size_t i = 0; i < value.size(); ++i) {
                check(value[i], *items, index_path(path, i), errors);
            }
        }
    }
}

std::vector<std::string> SchemaValidator::violations(const json& value, const json& schema) {
    std::vector<std::string> errors;
    check(value, schema, "", errors);
    return errors;
}

manifold_core::Result<void> SchemaValidator::validate(const json& value, const json& schema) {
    auto errors = violations(value, schema);
    if (errors.empty()) {
        return manifold_core::Ok();
    }

    std::ostringstream oss;
    oss << "Invalid value passed: ";
    for (std::size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) oss << "; ";
        oss << errors[i];
    }
    return manifold_core::Err(manifold_core::Error(manifold_core::ErrorCode::SchemaValidation, oss.str()));
}

void SchemaValidator::apply_defaults(json& value, const json& schema) {
    if (!value.is_object() || !schema.is_object()) {
        return;
    }
    auto props = schema.find("properties");
    if (props == schema.end() || !props->is_object()) {
        return;
    }
    for (auto it = props->begin(); it != props->end(); ++it) {
        if (!it->is_object()) continue;
        if (!value.contains(it.key())) {
            if (auto def = it->find("default"); def != it->end()) {
                value[it.key()] = *def;
            }
        }
        if (value.contains(it.key())) {
            apply_defaults(value[it.key()], *it);
        }
    }
}

} // namespace manifold_manifest
