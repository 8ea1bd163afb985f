#pragma once

/**
 * @file platform.hpp
 * @brief Centralized platform detection and OS abstraction
 *
 * This header provides:
 * - Compile-time platform detection
 * - Compiler and language feature detection
 * - Runtime environment queries (process, thread, environment variables)
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ============================================================================
// COMPILER DETECTION
// ============================================================================

#if defined(__clang__)
    #define NETFETCH_COMPILER_CLANG 1
    #define NETFETCH_COMPILER_NAME "Clang"
    #define NETFETCH_COMPILER_VERSION (__clang_major__ * 10000 + __clang_minor__ * 100 + __clang_patchlevel__)
#elif defined(__GNUC__) || defined(__GNUG__)
    #define NETFETCH_COMPILER_GCC 1
    #define NETFETCH_COMPILER_NAME "GCC"
    #define NETFETCH_COMPILER_VERSION (__GNUC__ * 10000 + __GNUC_MINOR__ * 100 + __GNUC_PATCHLEVEL__)
#elif defined(_MSC_VER)
    #define NETFETCH_COMPILER_MSVC 1
    #define NETFETCH_COMPILER_NAME "MSVC"
    #define NETFETCH_COMPILER_VERSION _MSC_VER
#else
    #define NETFETCH_COMPILER_UNKNOWN 1
    #define NETFETCH_COMPILER_NAME "Unknown"
    #define NETFETCH_COMPILER_VERSION 0
#endif

// ============================================================================
// OPERATING SYSTEM DETECTION
// ============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define NETFETCH_OS_WINDOWS 1
    #define NETFETCH_OS_NAME "Windows"
#elif defined(__APPLE__) && defined(__MACH__)
    #define NETFETCH_OS_APPLE 1
    #define NETFETCH_OS_MACOS 1
    #define NETFETCH_OS_NAME "macOS"
#elif defined(__linux__)
    #define NETFETCH_OS_LINUX 1
    #define NETFETCH_OS_NAME "Linux"
#elif defined(__FreeBSD__)
    #define NETFETCH_OS_FREEBSD 1
    #define NETFETCH_OS_NAME "FreeBSD"
#elif defined(__unix__)
    #define NETFETCH_OS_UNIX 1
    #define NETFETCH_OS_NAME "Unix"
#else
    #define NETFETCH_OS_UNKNOWN 1
    #define NETFETCH_OS_NAME "Unknown"
#endif

#if defined(NETFETCH_OS_LINUX) || defined(NETFETCH_OS_MACOS) || \
    defined(NETFETCH_OS_FREEBSD) || defined(NETFETCH_OS_UNIX)
    #define NETFETCH_OS_POSIX 1
#endif

// ============================================================================
// BUILD CONFIGURATION
// ============================================================================

#if defined(NDEBUG) || defined(NETFETCH_RELEASE)
    #define NETFETCH_BUILD_RELEASE 1
    #define NETFETCH_BUILD_TYPE "Release"
#else
    #define NETFETCH_BUILD_DEBUG 1
    #define NETFETCH_BUILD_TYPE "Debug"
#endif

// ============================================================================
// C++ STANDARD DETECTION
// ============================================================================

#if __cplusplus >= 202302L
    #define NETFETCH_CPP_VERSION 23
#elif __cplusplus >= 202002L
    #define NETFETCH_CPP_VERSION 20
#elif __cplusplus >= 201703L
    #define NETFETCH_CPP_VERSION 17
#else
    #define NETFETCH_CPP_VERSION 0
#endif

#if defined(__cpp_lib_source_location) || (NETFETCH_CPP_VERSION >= 20 && !defined(NETFETCH_COMPILER_MSVC))
    #define NETFETCH_HAS_SOURCE_LOCATION 1
#endif

// ============================================================================
// COMPILER ATTRIBUTES
// ============================================================================

#if defined(NETFETCH_COMPILER_GCC) || defined(NETFETCH_COMPILER_CLANG)
    #define NETFETCH_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define NETFETCH_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define NETFETCH_LIKELY(x)   (x)
    #define NETFETCH_UNLIKELY(x) (x)
#endif

#if defined(NETFETCH_COMPILER_MSVC)
    #define NETFETCH_FUNCTION_SIGNATURE __FUNCSIG__
#elif defined(NETFETCH_COMPILER_GCC) || defined(NETFETCH_COMPILER_CLANG)
    #define NETFETCH_FUNCTION_SIGNATURE __PRETTY_FUNCTION__
#else
    #define NETFETCH_FUNCTION_SIGNATURE __func__
#endif

#define NETFETCH_NODISCARD [[nodiscard]]
#define NETFETCH_MAYBE_UNUSED [[maybe_unused]]

// Export/Import for shared libraries
#if defined(NETFETCH_OS_WINDOWS)
    #if defined(NETFETCH_BUILDING_SHARED)
        #define NETFETCH_API __declspec(dllexport)
    #elif defined(NETFETCH_USING_SHARED)
        #define NETFETCH_API __declspec(dllimport)
    #else
        #define NETFETCH_API
    #endif
#elif defined(NETFETCH_COMPILER_GCC) || defined(NETFETCH_COMPILER_CLANG)
    #if defined(NETFETCH_BUILDING_SHARED)
        #define NETFETCH_API __attribute__((visibility("default")))
    #else
        #define NETFETCH_API
    #endif
#else
    #define NETFETCH_API
#endif

#define NETFETCH_THREAD_LOCAL thread_local

// ============================================================================
// VERSION
// ============================================================================

// Normally injected by the build from the project version
#ifndef NETFETCH_VERSION_STRING
    #define NETFETCH_VERSION_STRING "0.1.0"
#endif

namespace netfetch::common::platform {

// ============================================================================
// Runtime Platform Information
// ============================================================================

/**
 * @brief Platform identification structure
 */
struct PlatformInfo {
    std::string_view os_name;
    std::string_view compiler_name;
    uint32_t compiler_version;
    bool is_debug;
    uint32_t cpp_version;
};

/**
 * @brief Get compile-time platform information
 */
constexpr PlatformInfo get_platform_info() noexcept {
    return PlatformInfo{
        .os_name = NETFETCH_OS_NAME,
        .compiler_name = NETFETCH_COMPILER_NAME,
        .compiler_version = NETFETCH_COMPILER_VERSION,
#ifdef NETFETCH_BUILD_DEBUG
        .is_debug = true,
#else
        .is_debug = false,
#endif
        .cpp_version = NETFETCH_CPP_VERSION
    };
}

// ============================================================================
// Runtime Environment Queries
// ============================================================================

/**
 * @brief One-line build description, e.g. "Linux, GCC 13.2.0, C++20, release"
 */
NETFETCH_API std::string build_summary();

/**
 * @brief Get current thread ID
 */
NETFETCH_API uint64_t get_thread_id() noexcept;

/**
 * @brief Get environment variable value
 * @return Empty string if not found
 */
NETFETCH_API std::string get_env(std::string_view name);

/**
 * @brief Get environment variable value, distinguishing unset from empty
 * @return std::nullopt if the variable is not set at all
 */
NETFETCH_API std::optional<std::string> get_env_opt(std::string_view name);

/**
 * @brief Set environment variable
 * @return true on success
 */
NETFETCH_API bool set_env(std::string_view name, std::string_view value);

/**
 * @brief Remove environment variable
 * @return true on success (including when it was not set)
 */
NETFETCH_API bool unset_env(std::string_view name);

} // namespace netfetch::common::platform
