/// @file dynamic_library.cpp
/// @brief Cross-platform dynamic library loading implementation

#include <manifold/kernel/dynamic_library.hpp>

#include <algorithm>
#include <cctype>

namespace manifold_kernel {

using manifold_core::Err;
using manifold_core::Error;
using manifold_core::ErrorCode;
using manifold_core::Ok;

// =============================================================================
// DynamicLibrary - Destructor and Move Operations
// =============================================================================

DynamicLibrary::~DynamicLibrary() {
    unload();
}

DynamicLibrary::DynamicLibrary(DynamicLibrary&& other) noexcept
    : m_handle(other.m_handle)
    , m_path(std::move(other.m_path))
{
    other.m_handle = nullptr;
}

DynamicLibrary& DynamicLibrary::operator=(DynamicLibrary&& other) noexcept {
    if (this != &other) {
        unload();
        m_handle = other.m_handle;
        m_path = std::move(other.m_path);
        other.m_handle = nullptr;
    }
    return *this;
}

DynamicLibrary::DynamicLibrary(NativeLibraryHandle handle, std::filesystem::path path)
    : m_handle(handle)
    , m_path(std::move(path))
{}

// =============================================================================
// DynamicLibrary - Platform-Specific Loading
// =============================================================================

#ifdef _WIN32

manifold_core::Result<DynamicLibrary> DynamicLibrary::load(const std::filesystem::path& path) {
    HMODULE handle = LoadLibraryW(path.wstring().c_str());
    if (!handle) {
        return Err<DynamicLibrary>(Error(ErrorCode::ControllerNotFound,
            "Failed to load library '" + path.string() + "': " + get_last_error()));
    }
    return Ok(DynamicLibrary(handle, path));
}

void DynamicLibrary::unload() noexcept {
    if (m_handle) {
        FreeLibrary(m_handle);
        m_handle = nullptr;
    }
    m_path.clear();
}

void* DynamicLibrary::get_symbol(const std::string& name) const noexcept {
    if (!m_handle) {
        return nullptr;
    }
    return reinterpret_cast<void*>(GetProcAddress(m_handle, name.c_str()));
}

std::string DynamicLibrary::get_last_error() {
    DWORD error_code = GetLastError();
    if (error_code == 0) {
        return "No error";
    }
    return "error " + std::to_string(error_code);
}

#else // Unix (Linux, macOS)

manifold_core::Result<DynamicLibrary> DynamicLibrary::load(const std::filesystem::path& path) {
    dlerror();

    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        return Err<DynamicLibrary>(Error(ErrorCode::ControllerNotFound,
            "Failed to load library '" + path.string() + "': " + get_last_error()));
    }
    return Ok(DynamicLibrary(handle, path));
}

void DynamicLibrary::unload() noexcept {
    if (m_handle) {
        dlclose(m_handle);
        m_handle = nullptr;
    }
    m_path.clear();
}

void* DynamicLibrary::get_symbol(const std::string& name) const noexcept {
    if (!m_handle) {
        return nullptr;
    }
    dlerror();
    return dlsym(m_handle, name.c_str());
}

std::string DynamicLibrary::get_last_error() {
    const char* error = dlerror();
    return error ? std::string(error) : "No error";
}

#endif

// =============================================================================
// DynamicLibraryCache
// =============================================================================

std::filesystem::path DynamicLibraryCache::canonical(const std::filesystem::path& path) {
    std::error_code ec;
    auto canonical_path = std::filesystem::weakly_canonical(path, ec);
    return ec ? path : canonical_path;
}

manifold_core::Result<DynamicLibrary*> DynamicLibraryCache::get_or_load(const std::filesystem::path& path) {
    auto key = canonical(path);

    auto it = m_libraries.find(key);
    if (it != m_libraries.end()) {
        return Ok(it->second.get());
    }

    auto lib_result = DynamicLibrary::load(key);
    if (!lib_result) {
        return Err<DynamicLibrary*>(std::move(lib_result.error()));
    }

    auto lib_ptr = std::make_unique<DynamicLibrary>(std::move(lib_result).value());
    DynamicLibrary* raw_ptr = lib_ptr.get();
    m_libraries[key] = std::move(lib_ptr);
    return Ok(raw_ptr);
}

bool DynamicLibraryCache::is_loaded(const std::filesystem::path& path) const {
    return m_libraries.find(canonical(path)) != m_libraries.end();
}

void DynamicLibraryCache::unload_all() {
    m_libraries.clear();
}

std::vector<std::filesystem::path> DynamicLibraryCache::loaded_paths() const {
    std::vector<std::filesystem::path> paths;
    paths.reserve(m_libraries.size());
    for (const auto& [path, _] : m_libraries) {
        paths.push_back(path);
    }
    return paths;
}

bool has_library_extension(const std::filesystem::path& path) noexcept {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".dll" || ext == ".so" || ext == ".dylib";
}

} // namespace manifold_kernel
