/**
 * @file    path_formatter.hpp
 * @brief   fmt formatter and string helpers for std::filesystem::path
 * @license MIT
 *
 * @details
 * spdlog/fmt expect UTF-8, but path.string() is in the local codepage on
 * Windows. Paths are therefore always formatted through u8string():
 *
 *   spdlog::info("Processing: {}", some_path);
 *
 * C++20 u8string() returns std::u8string (char8_t) and needs a
 * reinterpret_cast to become a plain std::string.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace pwm {

/**
 * Convert filesystem path to UTF-8 encoded std::string
 */
inline std::string to_utf8(const std::filesystem::path& path) {
    auto u8str = path.u8string();
    return std::string(
        reinterpret_cast<const char*>(u8str.data()),
        u8str.size()
    );
}

/**
 * Lower-case extension including the dot (".jpg"), empty if none
 */
inline std::string lower_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

}  // namespace pwm

// =============================================================================
// fmt formatter specialization for std::filesystem::path
// =============================================================================

template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string_view> {
    auto format(const std::filesystem::path& p, format_context& ctx) const {
        auto u8 = p.u8string();
        std::string_view sv{
            reinterpret_cast<const char*>(u8.data()),
            u8.size()
        };
        return fmt::formatter<std::string_view>::format(sv, ctx);
    }
};
