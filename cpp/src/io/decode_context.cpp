// ==============================================================================
// decode_context.cpp - Политика декодирования и сбор аномалий
// ==============================================================================

#include <utility>
#include <winstructs/decode_context.hpp>
#include <winstructs/output.hpp>

namespace winstructs {

bool DecodeOptions::is_fatal(DecodeErrorKind kind) const {
    switch (kind) {
        case DecodeErrorKind::SizeMismatch:
        case DecodeErrorKind::OffsetControlMismatch:
        case DecodeErrorKind::InvalidSubAuthorityCount:
            return strict;
        case DecodeErrorKind::InvalidRevision:
            return enforce_revision;
        case DecodeErrorKind::OutOfBounds:
        case DecodeErrorKind::AceBodyOverrun:
            return true;
    }
    return true;
}

DecodeContext::DecodeContext(const DecodeOptions& options, std::vector<Anomaly>* anomalies)
    : options_(options), anomalies_(anomalies) {}

std::optional<DecodeError> DecodeContext::flag(Anomaly anomaly) {
    ++anomaly_count_;

    if (options_.is_fatal(anomaly.kind)) {
        if (options_.log != nullptr) {
            options_.log->error(anomaly.format());
        }
        return anomaly.to_error();
    }

    if (options_.log != nullptr) {
        options_.log->warn(anomaly.format());
    }
    if (anomalies_ != nullptr) {
        anomalies_->push_back(std::move(anomaly));
    }
    return std::nullopt;
}

void DecodeContext::debug(std::string_view message) const {
    if (options_.log != nullptr) {
        options_.log->debug(message);
    }
}

void DecodeContext::trace(std::string_view message) const {
    if (options_.log != nullptr) {
        options_.log->trace(message);
    }
}

bool DecodeContext::tracing() const {
    return options_.log != nullptr && options_.log->trace_enabled();
}

}  // namespace winstructs
