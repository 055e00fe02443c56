#pragma once

/// @file dynamic_library.hpp
/// @brief Cross-platform dynamic library loading with RAII
///
/// Wraps the platform loader used for native controller entrypoints:
/// - Windows: LoadLibrary/GetProcAddress/FreeLibrary
/// - Linux/macOS: dlopen/dlsym/dlclose

#include "fwd.hpp"

#include <manifold/core/error.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

#ifdef _WIN32
#define NOMINMAX
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace manifold_kernel {

#ifdef _WIN32
using NativeLibraryHandle = HMODULE;
#else
using NativeLibraryHandle = void*;
#endif

// =============================================================================
// DynamicLibrary
// =============================================================================

/// RAII wrapper for a dynamically loaded library
///
/// ```cpp
/// auto lib = DynamicLibrary::load("controllers/libhttp.so");
/// if (!lib) { /* handle error */ }
/// auto entry = lib->get_function<NativeControllerEntry>("manifold_http_server");
/// ```
class DynamicLibrary {
public:
    DynamicLibrary() = default;
    ~DynamicLibrary();

    // Non-copyable
    DynamicLibrary(const DynamicLibrary&) = delete;
    DynamicLibrary& operator=(const DynamicLibrary&) = delete;

    // Movable
    DynamicLibrary(DynamicLibrary&& other) noexcept;
    DynamicLibrary& operator=(DynamicLibrary&& other) noexcept;

    /// Load a dynamic library from path
    [[nodiscard]] static manifold_core::Result<DynamicLibrary> load(const std::filesystem::path& path);

    [[nodiscard]] bool is_loaded() const noexcept { return m_handle != nullptr; }
    [[nodiscard]] explicit operator bool() const noexcept { return is_loaded(); }

    void unload() noexcept;

    /// Raw symbol, nullptr if absent
    [[nodiscard]] void* get_symbol(const std::string& name) const noexcept;

    /// Typed function pointer
    template<typename F>
    [[nodiscard]] manifold_core::Result<F> get_function(const std::string& name) const {
        static_assert(std::is_pointer_v<F> && std::is_function_v<std::remove_pointer_t<F>>,
            "F must be a function pointer type");

        void* sym = get_symbol(name);
        if (!sym) {
            return manifold_core::Err<F>(manifold_core::Error(manifold_core::ErrorCode::ControllerNotFound,
                "Symbol not found: " + name + " in " + m_path.string()));
        }
        return manifold_core::Ok(reinterpret_cast<F>(sym));
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

    /// Last error message from the platform loader
    [[nodiscard]] static std::string get_last_error();

private:
    explicit DynamicLibrary(NativeLibraryHandle handle, std::filesystem::path path);

    NativeLibraryHandle m_handle = nullptr;
    std::filesystem::path m_path;
};

// =============================================================================
// DynamicLibraryCache
// =============================================================================

/// Libraries stay loaded until the cache is destroyed or unloaded explicitly
///
/// Not thread-safe.
class DynamicLibraryCache {
public:
    DynamicLibraryCache() = default;

    DynamicLibraryCache(const DynamicLibraryCache&) = delete;
    DynamicLibraryCache& operator=(const DynamicLibraryCache&) = delete;

    /// Get or load a library, keyed by canonical path
    [[nodiscard]] manifold_core::Result<DynamicLibrary*> get_or_load(const std::filesystem::path& path);

    [[nodiscard]] bool is_loaded(const std::filesystem::path& path) const;

    void unload_all();

    [[nodiscard]] std::size_t size() const noexcept { return m_libraries.size(); }
    [[nodiscard]] std::vector<std::filesystem::path> loaded_paths() const;

private:
    static std::filesystem::path canonical(const std::filesystem::path& path);

    std::map<std::filesystem::path, std::unique_ptr<DynamicLibrary>> m_libraries;
};

/// Platform library extension
[[nodiscard]] constexpr const char* library_extension() noexcept {
#ifdef _WIN32
    return ".dll";
#elif defined(__APPLE__)
    return ".dylib";
#else
    return ".so";
#endif
}

/// Whether `path` ends in .dll, .so or .dylib
[[nodiscard]] bool has_library_extension(const std::filesystem::path& path) noexcept;

} // namespace manifold_kernel
