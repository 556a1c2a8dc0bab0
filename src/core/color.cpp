/**
 * @file    color.cpp
 * @brief   Color string parsing
 * @license MIT
 */

#include "core/color.hpp"
#include "core/types.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <string>

namespace pwm {

namespace {

struct NamedColor {
    std::string_view name;
    int r, g, b;
};

constexpr std::array<NamedColor, 22> kNamedColors{{
    {"white",   255, 255, 255},
    {"black",     0,   0,   0},
    {"red",     255,   0,   0},
    {"lime",      0, 255,   0},
    {"green",     0, 128,   0},
    {"blue",      0,   0, 255},
    {"yellow",  255, 255,   0},
    {"cyan",      0, 255, 255},
    {"aqua",      0, 255, 255},
    {"magenta", 255,   0, 255},
    {"fuchsia", 255,   0, 255},
    {"gray",    128, 128, 128},
    {"grey",    128, 128, 128},
    {"silver",  192, 192, 192},
    {"maroon",  128,   0,   0},
    {"olive",   128, 128,   0},
    {"navy",      0,   0, 128},
    {"purple",  128,   0, 128},
    {"teal",      0, 128, 128},
    {"orange",  255, 165,   0},
    {"pink",    255, 192, 203},
    {"gold",    255, 215,   0},
}};

std::string normalize(std::string_view text) {
    std::string s;
    s.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return s;
}

std::optional<int> parse_int(std::string_view digits, int base) {
    if (digits.empty()) return std::nullopt;
    // from_chars accepts a leading '-' for signed targets
    const auto lead = static_cast<unsigned char>(digits.front());
    if (base == 16 ? !std::isxdigit(lead) : !std::isdigit(lead)) return std::nullopt;
    int value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, base);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) return std::nullopt;
    return value;
}

cv::Scalar bgr(int r, int g, int b) {
    return cv::Scalar(b, g, r);
}

std::optional<cv::Scalar> parse_hex(std::string_view hex) {
    if (hex.size() == 3) {
        std::array<int, 3> ch{};
        for (size_t i = 0; i < 3; ++i) {
            auto v = parse_int(hex.substr(i, 1), 16);
            if (!v) return std::nullopt;
            ch[i] = *v * 17;
        }
        return bgr(ch[0], ch[1], ch[2]);
    }
    if (hex.size() == 6) {
        std::array<int, 3> ch{};
        for (size_t i = 0; i < 3; ++i) {
            auto v = parse_int(hex.substr(i * 2, 2), 16);
            if (!v) return std::nullopt;
            ch[i] = *v;
        }
        return bgr(ch[0], ch[1], ch[2]);
    }
    return std::nullopt;
}

std::optional<cv::Scalar> parse_rgb_function(std::string_view body) {
    std::array<int, 3> ch{};
    for (size_t i = 0; i < 3; ++i) {
        const size_t comma = body.find(',');
        const std::string_view part = (i < 2) ? body.substr(0, comma) : body;
        if (i < 2 && comma == std::string_view::npos) return std::nullopt;

        auto v = parse_int(part, 10);
        if (!v || *v < 0 || *v > 255) return std::nullopt;
        ch[i] = *v;

        if (i < 2) body.remove_prefix(comma + 1);
    }
    return bgr(ch[0], ch[1], ch[2]);
}

}  // anonymous namespace

std::optional<cv::Scalar> parse_color(std::string_view text) {
    const std::string s = normalize(text);
    if (s.empty()) return std::nullopt;

    if (s.front() == '#') {
        return parse_hex(std::string_view(s).substr(1));
    }

    constexpr std::string_view kRgbPrefix = "rgb(";
    if (s.size() > kRgbPrefix.size() + 1 && s.compare(0, kRgbPrefix.size(), kRgbPrefix) == 0 &&
        s.back() == ')') {
        return parse_rgb_function(
            std::string_view(s).substr(kRgbPrefix.size(), s.size() - kRgbPrefix.size() - 1));
    }

    auto it = std::find_if(kNamedColors.begin(), kNamedColors.end(),
                           [&](const NamedColor& c) { return c.name == s; });
    if (it != kNamedColors.end()) {
        return bgr(it->r, it->g, it->b);
    }
    return std::nullopt;
}

cv::Scalar parse_color_or_white(std::string_view text) {
    if (auto color = parse_color(text)) {
        return *color;
    }
    spdlog::warn("{}: '{}', defaulting to white", to_string(ErrorCode::InvalidColor), text);
    return cv::Scalar(255, 255, 255);
}

}  // namespace pwm
