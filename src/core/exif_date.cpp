/**
 * @file    exif_date.cpp
 * @brief   Capture-date extraction from EXIF metadata
 * @license MIT
 */

#include "core/exif_date.hpp"
#include "utils/path_formatter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <chrono>

namespace pwm {

namespace {

constexpr std::array<const char*, 3> kDateTags = {
    "Exif.Photo.DateTimeOriginal",
    "Exif.Photo.DateTimeDigitized",
    "Exif.Image.DateTime",
};

// Strict YYYY-MM-DD check
bool is_calendar_date(std::string_view date) {
    if (date.size() != 10 || date[4] != '-' || date[7] != '-') return false;

    auto field = [&](size_t pos, size_t len, int& out) {
        auto [ptr, ec] = std::from_chars(date.data() + pos, date.data() + pos + len, out);
        return ec == std::errc{} && ptr == date.data() + pos + len;
    };

    int y = 0, m = 0, d = 0;
    if (!field(0, 4, y) || !field(5, 2, m) || !field(8, 2, d)) return false;

    const std::chrono::year_month_day ymd{
        std::chrono::year{y},
        std::chrono::month{static_cast<unsigned>(m)},
        std::chrono::day{static_cast<unsigned>(d)}
    };
    return ymd.ok();
}

}  // anonymous namespace

std::optional<std::string> normalize_exif_date(std::string_view value) {
    // EXIF ASCII values are NUL padded
    while (!value.empty() && (value.back() == '\0' ||
                              std::isspace(static_cast<unsigned char>(value.back())))) {
        value.remove_suffix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
    }
    if (value.empty()) {
        return std::nullopt;
    }

    const size_t space = value.find_first_of(" \t");
    std::string date(value.substr(0, space));
    std::replace(date.begin(), date.end(), ':', '-');

    if (!is_calendar_date(date)) {
        spdlog::debug("Unverified EXIF date '{}' (from '{}')", date, value);
    }
    return date;
}

std::optional<std::string> extract_exif_date(const Exiv2::ExifData& exif) {
    if (exif.empty()) {
        return std::nullopt;
    }

    for (const char* tag : kDateTags) {
        auto it = exif.findKey(Exiv2::ExifKey(tag));
        if (it == exif.end()) continue;

        if (auto date = normalize_exif_date(it->toString())) {
            spdlog::debug("Capture date {} from {}", *date, tag);
            return date;
        }
    }
    return std::nullopt;
}

std::optional<std::string> read_exif_date(const std::filesystem::path& path) {
    try {
        auto image = Exiv2::ImageFactory::open(path.string());
        if (!image.get()) {
            return std::nullopt;
        }
        image->readMetadata();
        return extract_exif_date(image->exifData());
    } catch (const Exiv2::Error& e) {
        spdlog::debug("Cannot read EXIF from {}: {}", path, e.what());
        return std::nullopt;
    }
}

}  // namespace pwm
