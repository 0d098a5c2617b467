// ==============================================================================
// error.cpp - Реализация ошибок и аномалий декодирования
// ==============================================================================

#include <winstructs/error.hpp>

namespace winstructs {

namespace {

std::string format_issue(DecodeErrorKind kind, std::size_t offset, const std::string& message) {
    std::string result = decode_error_kind_to_string(kind);
    result += " at offset ";
    result += std::to_string(offset);
    if (!message.empty()) {
        result += ": ";
        result += message;
    }
    return result;
}

}  // namespace

const char* decode_error_kind_to_string(DecodeErrorKind kind) {
    switch (kind) {
        case DecodeErrorKind::OutOfBounds:
            return "OutOfBounds";
        case DecodeErrorKind::AceBodyOverrun:
            return "AceBodyOverrun";
        case DecodeErrorKind::SizeMismatch:
            return "SizeMismatch";
        case DecodeErrorKind::OffsetControlMismatch:
            return "OffsetControlMismatch";
        case DecodeErrorKind::InvalidRevision:
            return "InvalidRevision";
        case DecodeErrorKind::InvalidSubAuthorityCount:
            return "InvalidSubAuthorityCount";
    }
    return "Unknown";
}

std::string DecodeError::format() const {
    return format_issue(kind, offset, message);
}

std::string Anomaly::format() const {
    return format_issue(kind, offset, message);
}

DecodeError Anomaly::to_error() const {
    return DecodeError{kind, message, offset};
}

}  // namespace winstructs
