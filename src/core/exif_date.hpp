/**
 * @file    exif_date.hpp
 * @brief   Capture-date extraction from EXIF metadata
 * @license MIT
 *
 * @details
 * Tags are checked in priority order:
 *   Exif.Photo.DateTimeOriginal, Exif.Photo.DateTimeDigitized, Exif.Image.DateTime
 *
 * The first non-empty value is reduced to its date token and the EXIF colon
 * separators are replaced with hyphens: "2023:11:05 14:22:10" -> "2023-11-05".
 * A token that is not a valid calendar date is still returned (logged as
 * unverified); the result is only ever used as display text.
 */

#pragma once

#include <exiv2/exiv2.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace pwm {

/**
 * Normalize one EXIF date/time value
 *
 * @return  "YYYY-MM-DD" (best effort), or std::nullopt for a blank value
 */
[[nodiscard]] std::optional<std::string> normalize_exif_date(std::string_view value);

/**
 * Extract the capture date from parsed EXIF data
 */
[[nodiscard]] std::optional<std::string> extract_exif_date(const Exiv2::ExifData& exif);

/**
 * Read EXIF metadata from an image file and extract the capture date
 * Unreadable files and metadata blocks yield std::nullopt.
 */
[[nodiscard]] std::optional<std::string> read_exif_date(const std::filesystem::path& path);

}  // namespace pwm
