#include <netfetch/common/platform.hpp>

#include <cstdlib>
#include <string>

#if defined(NETFETCH_OS_WINDOWS)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#elif defined(NETFETCH_OS_POSIX)
#include <pthread.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace netfetch::common::platform {

// ============================================================================
// Build Description
// ============================================================================

std::string build_summary() {
    constexpr auto info = get_platform_info();

    std::string out(info.os_name);
    out += ", ";
    out += info.compiler_name;
    if (info.compiler_version >= 10000) {
        out += " " + std::to_string(info.compiler_version / 10000) + "." +
               std::to_string(info.compiler_version / 100 % 100) + "." +
               std::to_string(info.compiler_version % 100);
    } else if (info.compiler_version > 0) {
        out += " " + std::to_string(info.compiler_version);
    }
    out += ", C++" + std::to_string(info.cpp_version);
    out += info.is_debug ? ", debug" : ", release";
    return out;
}

// ============================================================================
// Thread IDs
// ============================================================================

uint64_t get_thread_id() noexcept {
#if defined(NETFETCH_OS_WINDOWS)
    return static_cast<uint64_t>(GetCurrentThreadId());
#elif defined(NETFETCH_OS_MACOS)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(NETFETCH_OS_POSIX)
    return static_cast<uint64_t>(pthread_self());
#else
    return 0;
#endif
}

// ============================================================================
// Environment Variables
// ============================================================================

std::optional<std::string> get_env_opt(std::string_view name) {
    std::string name_str(name);
#if defined(NETFETCH_OS_WINDOWS)
    char buffer[32767];
    SetLastError(0);
    DWORD result = GetEnvironmentVariableA(name_str.c_str(), buffer, sizeof(buffer));
    if (result == 0) {
        if (GetLastError() == ERROR_ENVVAR_NOT_FOUND) {
            return std::nullopt;
        }
        return std::string{};
    }
    if (result < sizeof(buffer)) {
        return std::string(buffer, result);
    }
    return std::nullopt;
#else
    const char* value = std::getenv(name_str.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
#endif
}

std::string get_env(std::string_view name) {
    return get_env_opt(name).value_or(std::string{});
}

bool set_env(std::string_view name, std::string_view value) {
    std::string name_str(name);
    std::string value_str(value);
#if defined(NETFETCH_OS_WINDOWS)
    return SetEnvironmentVariableA(name_str.c_str(), value_str.c_str()) != 0;
#elif defined(NETFETCH_OS_POSIX)
    return setenv(name_str.c_str(), value_str.c_str(), 1) == 0;
#else
    return false;
#endif
}

bool unset_env(std::string_view name) {
    std::string name_str(name);
#if defined(NETFETCH_OS_WINDOWS)
    return SetEnvironmentVariableA(name_str.c_str(), nullptr) != 0 ||
           GetLastError() == ERROR_ENVVAR_NOT_FOUND;
#elif defined(NETFETCH_OS_POSIX)
    return unsetenv(name_str.c_str()) == 0;
#else
    return false;
#endif
}

}  // namespace netfetch::common::platform
