/// @file entrypoint.hpp
/// @brief Resolution of controller entrypoints declared on resource definitions
///
/// Entrypoint strings:
/// - `static:<name>` (or a bare name) - a factory registered in code
/// - `native:<path>#<symbol>` (or any `<lib>.so#<symbol>`) - an `extern "C"`
///   NativeControllerEntry exported by a shared library; relative paths are
///   taken from the defining manifest's directory

#pragma once

#include "controller.hpp"
#include "dynamic_library.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace manifold_kernel {

/// Signature of a native controller export; fills `out`, returns 0 on success
using NativeControllerEntry = int (*)(Controller* out);

// =============================================================================
// EntrypointResolver
// =============================================================================

class EntrypointResolver {
public:
    virtual ~EntrypointResolver() = default;

    /// Whether this resolver understands `entrypoint`
    [[nodiscard]] virtual bool can_resolve(const std::string& entrypoint) const = 0;

    /// Produce the controller for `definition`
    [[nodiscard]] virtual manifold_core::Result<Controller> resolve(const std::string& entrypoint,
                                                                  const ResourceDefinition& definition) = 0;

    [[nodiscard]] virtual const char* name() const = 0;
};

// =============================================================================
// StaticEntrypointResolver
// =============================================================================

/// Factories registered in code
class StaticEntrypointResolver : public EntrypointResolver {
public:
    using Factory = std::function<Controller()>;

    void add(const std::string& name, Factory factory);
    [[nodiscard]] bool contains(const std::string& name) const;

    [[nodiscard]] bool can_resolve(const std::string& entrypoint) const override;
    [[nodiscard]] manifold_core::Result<Controller> resolve(const std::string& entrypoint,
                                                          const ResourceDefinition& definition) override;
    [[nodiscard]] const char* name() const override { return "static"; }

private:
    static std::string strip_scheme(const std::string& entrypoint);

    mutable std::mutex m_mutex;
    std::map<std::string, Factory> m_factories;
};

// =============================================================================
// NativeEntrypointResolver
// =============================================================================

/// Shared-library exports, loaded once per library
class NativeEntrypointResolver : public EntrypointResolver {
public:
    [[nodiscard]] bool can_resolve(const std::string& entrypoint) const override;
    [[nodiscard]] manifold_core::Result<Controller> resolve(const std::string& entrypoint,
                                                          const ResourceDefinition& definition) override;
    [[nodiscard]] const char* name() const override { return "native"; }

    [[nodiscard]] const DynamicLibraryCache& libraries() const noexcept { return m_libraries; }

private:
    DynamicLibraryCache m_libraries;
};

} // namespace manifold_kernel
