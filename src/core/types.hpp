/**
 * @file    types.hpp
 * @brief   Shared type definitions for Photo Watermark
 * @license MIT
 */

#pragma once

#include <stdexcept>
#include <string>

namespace pwm {

// Error taxonomy shared by the engine and the CLI front ends
enum class [[nodiscard]] ErrorCode {
    Success,
    InvalidTransform,
    FontResolutionFailure,
    InvalidColor,
    MissingOverlayAsset,
    MissingMetadataDate,
    DecodeFailure,
    RenderFailure,
    EncodeFailure,
    WriteFailure,
    DuplicateOutput,
    Cancelled
};

// Convert error code to string
[[nodiscard]] constexpr const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:               return "Success";
        case ErrorCode::InvalidTransform:      return "Invalid transform";
        case ErrorCode::FontResolutionFailure: return "Font resolution failure";
        case ErrorCode::InvalidColor:          return "Invalid color";
        case ErrorCode::MissingOverlayAsset:   return "Missing overlay asset";
        case ErrorCode::MissingMetadataDate:   return "Missing metadata date";
        case ErrorCode::DecodeFailure:         return "Decode failure";
        case ErrorCode::RenderFailure:         return "Render failure";
        case ErrorCode::EncodeFailure:         return "Encode failure";
        case ErrorCode::WriteFailure:          return "Write failure";
        case ErrorCode::DuplicateOutput:       return "Duplicate output";
        case ErrorCode::Cancelled:             return "Cancelled";
        default:                               return "Unknown";
    }
}

/**
 * Exception raised by engine operations that cannot complete.
 * Callers at the batch boundary convert it into a per-file failure record.
 */
class WatermarkError : public std::runtime_error {
public:
    WatermarkError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

}  // namespace pwm
