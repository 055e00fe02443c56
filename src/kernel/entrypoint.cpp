/// @file entrypoint.cpp
/// @brief Static and native entrypoint resolvers

#include <manifold/kernel/entrypoint.hpp>
#include <manifold/core/log.hpp>

namespace manifold_kernel {

using manifold_core::ControllerError;
using manifold_core::Err;
using manifold_core::Error;
using manifold_core::Ok;
using manifold_core::Result;

namespace {

constexpr const char* k_static_scheme = "static:";
constexpr const char* k_native_scheme = "native:";

bool starts_with(const std::string& text, const char* prefix) {
    return text.rfind(prefix, 0) == 0;
}

} // anonymous namespace

// =============================================================================
// StaticEntrypointResolver
// =============================================================================

std::string StaticEntrypointResolver::strip_scheme(const std::string& entrypoint) {
    if (starts_with(entrypoint, k_static_scheme)) {
        return entrypoint.substr(std::char_traits<char>::length(k_static_scheme));
    }
    return entrypoint;
}

void StaticEntrypointResolver::add(const std::string& name, Factory factory) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_factories[name] = std::move(factory);
}

bool StaticEntrypointResolver::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_factories.count(name) > 0;
}

bool StaticEntrypointResolver::can_resolve(const std::string& entrypoint) const {
    return contains(strip_scheme(entrypoint));
}

Result<Controller> StaticEntrypointResolver::resolve(const std::string& entrypoint,
                                                     const ResourceDefinition& definition) {
    Factory factory;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_factories.find(strip_scheme(entrypoint));
        if (it == m_factories.end()) {
            return Err<Controller>(Error(ControllerError::load_failed(definition.kind,
                "no static controller named \"" + entrypoint + "\"")));
        }
        factory = it->second;
    }
    return Ok(factory());
}

// =============================================================================
// NativeEntrypointResolver
// =============================================================================

bool NativeEntrypointResolver::can_resolve(const std::string& entrypoint) const {
    if (starts_with(entrypoint, k_native_scheme)) {
        return true;
    }
    auto hash = entrypoint.find('#');
    if (hash == std::string::npos) {
        return false;
    }
    return has_library_extension(std::filesystem::path(entrypoint.substr(0, hash)));
}

Result<Controller> NativeEntrypointResolver::resolve(const std::string& entrypoint,
                                                     const ResourceDefinition& definition) {
    std::string target = entrypoint;
    if (starts_with(target, k_native_scheme)) {
        target = target.substr(std::char_traits<char>::length(k_native_scheme));
    }

    auto hash = target.find('#');
    if (hash == std::string::npos || hash + 1 == target.size()) {
        return Err<Controller>(Error(ControllerError::load_failed(definition.kind,
            "native entrypoint \"" + entrypoint + "\" must be <library>#<symbol>")));
    }

    std::filesystem::path library(target.substr(0, hash));
    const std::string symbol = target.substr(hash + 1);
    if (library.is_relative() && !definition.source.empty()) {
        library = std::filesystem::path(definition.source).parent_path() / library;
    }

    auto lib = m_libraries.get_or_load(library);
    if (!lib) {
        return Err<Controller>(Error(ControllerError::load_failed(definition.kind, lib.error().message())));
    }

    auto entry = (*lib)->get_function<NativeControllerEntry>(symbol);
    if (!entry) {
        return Err<Controller>(Error(ControllerError::load_failed(definition.kind, entry.error().message())));
    }

    Controller controller;
    int status = (*entry)(&controller);
    if (status != 0) {
        return Err<Controller>(Error(ControllerError::load_failed(definition.kind,
            symbol + " returned status " + std::to_string(status))));
    }

    manifold_core::controller_logger()->info("Loaded native controller {} for {} from {}",
                                             symbol, definition.kind, library.string());
    return Ok(std::move(controller));
}

} // namespace manifold_kernel
