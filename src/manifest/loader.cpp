/// @file loader.cpp
/// @brief JSON manifest loading

#include <manifold/manifest/loader.hpp>
#include <manifold/manifest/resource_uri.hpp>
#include <manifold/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace manifold_manifest {

using manifold_core::Err;
using manifold_core::Error;
using manifold_core::ErrorCode;
using manifold_core::Ok;
using manifold_core::Resource;
using manifold_core::Result;
using nlohmann::json;

Loader::Loader(LoaderConfig config)
    : m_config(std::move(config)) {}

Result<std::vector<Resource>> Loader::load_file(const std::filesystem::path& path) const {
    std::ifstream file(path);
    if (!file) {
        return Err<std::vector<Resource>>(Error(ErrorCode::IOError,
            "Failed to open manifest: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        absolute = path;
    }

    auto result = parse(buffer.str(), absolute.lexically_normal());
    if (result) {
        manifold_core::manifest_logger()->debug("Loaded {} resource(s) from {}", result->size(), path.string());
    }
    return result;
}

Result<std::vector<Resource>> Loader::load_directory(const std::filesystem::path& dir) const {
    std::error_code ec;
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        return Err<std::vector<Resource>>(Error(ErrorCode::IOError,
            "Failed to read manifest directory " + dir.string() + ": " + ec.message()));
    }

    std::sort(files.begin(), files.end());

    std::vector<Resource> resources;
    for (const auto& file : files) {
        auto loaded = load_file(file);
        if (!loaded) {
            return loaded;
        }
        for (auto& resource : *loaded) {
            resources.push_back(std::move(resource));
        }
    }
    return Ok(std::move(resources));
}

Result<std::vector<Resource>> Loader::load(const std::filesystem::path& path) const {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return load_directory(path);
    }
    return load_file(path);
}

Result<std::vector<Resource>> Loader::parse(const std::string& text, const std::filesystem::path& source) const {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        return Err<std::vector<Resource>>(Error(ErrorCode::InvalidManifest,
            "JSON parse error in " + source.string() + ": " + e.what()));
    }

    json documents;
    if (document.is_array()) {
        documents = std::move(document);
    } else if (document.is_object() && !document.contains("kind") && document.contains("resources")) {
        documents = document["resources"];
        if (!documents.is_array()) {
            return Err<std::vector<Resource>>(Error(ErrorCode::InvalidManifest,
                "'resources' must be a list in " + source.string()));
        }
    } else if (document.is_object()) {
        documents = json::array({std::move(document)});
    } else {
        return Err<std::vector<Resource>>(Error(ErrorCode::InvalidManifest,
            std::string("Manifest must be an object or a list, got ") + manifold_core::json_type_name(document) +
            " in " + source.string()));
    }

    std::vector<std::string> template_names;
    for (const auto& doc : documents) {
        if (manifold_core::is_template_definition(doc)) {
            auto name = manifold_core::resource_name(doc);
            if (!name.empty()) {
                template_names.push_back(std::move(name));
            }
        }
    }

    const std::string path = source.string();
    std::vector<Resource> resources;
    resources.reserve(documents.size());

    for (auto& doc : documents) {
        auto id = manifold_core::validate_resource_shape(doc);
        if (!id) {
            auto error = std::move(id.error());
            error.with_context("source", path);
            return Err<std::vector<Resource>>(std::move(error));
        }

        normalize_kind(doc, template_names);

        auto& meta = manifold_core::ensure_metadata(doc);
        meta["source"] = path;
        meta["uri"] = ResourceUri::from_file(path, manifold_core::resource_kind(doc), id->name).to_string();
        meta["generationDepth"] = 0;
        if (!m_config.module_name.empty() && !meta.contains("module")) {
            meta["module"] = m_config.module_name;
        }

        resources.push_back(std::move(doc));
    }

    return Ok(std::move(resources));
}

void Loader::normalize_kind(Resource& resource, const std::vector<std::string>& template_names) const {
    if (m_config.module_name.empty()) {
        return;
    }

    auto kind = manifold_core::resource_kind(resource);
    if (kind.rfind("Self.", 0) == 0) {
        resource["kind"] = m_config.module_name + "." + kind.substr(5);
        return;
    }

    if (kind.find('.') == std::string::npos &&
        std::find(template_names.begin(), template_names.end(), kind) != template_names.end()) {
        resource["kind"] = m_config.module_name + "." + kind;
    }
}

Result<std::string> Loader::expand_env_path(const std::string& path) {
    std::string out;
    std::size_t pos = 0;
    while (pos < path.size()) {
        auto start = path.find("${", pos);
        if (start == std::string::npos) {
            out.append(path, pos, std::string::npos);
            break;
        }
        auto end = path.find('}', start + 2);
        if (end == std::string::npos) {
            out.append(path, pos, std::string::npos);
            break;
        }
        out.append(path, pos, start - pos);

        std::string name = path.substr(start + 2, end - start - 2);
        const char* value = std::getenv(name.c_str());
        if (!value) {
            return Err<std::string>(Error(ErrorCode::InvalidArgument,
                "Environment variable " + name + " referenced by " + path + " is not set"));
        }
        out += value;
        pos = end + 1;
    }
    return Ok(std::move(out));
}

std::filesystem::path Loader::resolve_path(const std::filesystem::path& base, const std::string& relative) {
    std::filesystem::path target(relative);
    if (target.is_absolute()) {
        return target.lexically_normal();
    }
    return (base / target).lexically_normal();
}

} // namespace manifold_manifest
