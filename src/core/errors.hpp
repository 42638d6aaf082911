/**
 * @file    errors.hpp
 * @brief   Watermarker - Error Kinds
 * @license MIT
 *
 * @details
 * Every failure raised by the core is a WatermarkError carrying the
 * ErrorKind that was violated, so callers can tell a batch-wide
 * validation failure from a per-file one.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace wmk {

enum class ErrorKind {
    InvalidProportion,
    InvalidOpacity,
    InvalidMode,
    InvalidPosition,
    InvalidPadding,
    OutOfBounds,
    SizeMismatch,
    DecodeError,
    EncodeError,
    PathNotFound,
};

constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidProportion: return "InvalidProportion";
        case ErrorKind::InvalidOpacity:    return "InvalidOpacity";
        case ErrorKind::InvalidMode:       return "InvalidMode";
        case ErrorKind::InvalidPosition:   return "InvalidPosition";
        case ErrorKind::InvalidPadding:    return "InvalidPadding";
        case ErrorKind::OutOfBounds:       return "OutOfBounds";
        case ErrorKind::SizeMismatch:      return "SizeMismatch";
        case ErrorKind::DecodeError:       return "DecodeError";
        case ErrorKind::EncodeError:       return "EncodeError";
        case ErrorKind::PathNotFound:      return "PathNotFound";
    }
    return "Unknown";
}

class WatermarkError : public std::runtime_error {
public:
    WatermarkError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace wmk
