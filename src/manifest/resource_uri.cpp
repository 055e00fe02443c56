/// @file resource_uri.cpp
/// @brief ResourceUri formatting and parsing

#include <manifold/manifest/resource_uri.hpp>

namespace manifold_manifest {

namespace {

constexpr const char* k_file_prefix = "file://localhost";
constexpr const char* k_template_prefix = "template://";

bool starts_with(const std::string& text, const char* prefix) {
    return text.rfind(prefix, 0) == 0;
}

} // anonymous namespace

ResourceUri ResourceUri::from_file(const std::string& path, const std::string& kind, const std::string& name) {
    ResourceUri uri;
    uri.m_scheme = Scheme::File;
    uri.m_path = path;
    uri.m_lineage.emplace_back(kind, name);
    return uri;
}

ResourceUri ResourceUri::from_template(const std::string& template_name, const std::string& kind,
                                       const std::string& name) {
    ResourceUri uri;
    uri.m_scheme = Scheme::Template;
    uri.m_path = template_name;
    uri.m_lineage.emplace_back(kind, name);
    return uri;
}

manifold_core::Result<ResourceUri> ResourceUri::parse(const std::string& text) {
    using manifold_core::Error;
    using manifold_core::ErrorCode;

    ResourceUri uri;
    std::string rest;

    if (starts_with(text, k_file_prefix)) {
        uri.m_scheme = Scheme::File;
        rest = text.substr(std::char_traits<char>::length(k_file_prefix));
    } else if (starts_with(text, k_template_prefix)) {
        uri.m_scheme = Scheme::Template;
        rest = text.substr(std::char_traits<char>::length(k_template_prefix));
    } else {
        return manifold_core::Err<ResourceUri>(Error(ErrorCode::InvalidArgument,
            "Unsupported resource URI scheme: " + text));
    }

    auto hash = rest.find('#');
    if (hash == std::string::npos) {
        return manifold_core::Err<ResourceUri>(Error(ErrorCode::InvalidArgument,
            "Resource URI has no fragment: " + text));
    }

    uri.m_path = rest.substr(0, hash);
    std::string fragment = rest.substr(hash + 1);

    std::size_t start = 0;
    while (start <= fragment.size()) {
        auto slash = fragment.find('/', start);
        std::string segment = fragment.substr(start, slash == std::string::npos ? std::string::npos : slash - start);

        auto id = manifold_core::ResourceId::parse(segment);
        if (!id) {
            return manifold_core::Err<ResourceUri>(Error(ErrorCode::InvalidArgument,
                "Invalid resource URI segment \"" + segment + "\" in " + text));
        }
        uri.m_lineage.push_back(std::move(id).value());

        if (slash == std::string::npos) break;
        start = slash + 1;
    }

    return manifold_core::Ok(std::move(uri));
}

ResourceUri ResourceUri::with_child(const std::string& kind, const std::string& name) const {
    ResourceUri child = *this;
    child.m_lineage.emplace_back(kind, name);
    return child;
}

manifold_core::ResourceId ResourceUri::leaf() const {
    return m_lineage.empty() ? manifold_core::ResourceId{} : m_lineage.back();
}

std::string ResourceUri::to_string() const {
    std::string out = m_scheme == Scheme::File ? k_file_prefix : k_template_prefix;
    out += m_path;
    out += '#';
    for (std::size_t i = 0; i < m_lineage.size(); ++i) {
        if (i > 0) out += '/';
        out += m_lineage[i].to_string();
    }
    return out;
}

} // namespace manifold_manifest
