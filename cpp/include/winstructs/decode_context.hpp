// ==============================================================================
// winstructs/decode_context.hpp - Decode options and per-call context
// ==============================================================================
//
// Назначение:
// - DecodeOptions: политика lenient/strict и контроль ревизий
// - DecodeContext: сбор аномалий и диагностика одного вызова decode
//
// Lenient (default): size and offset/control disagreements are recorded as
// anomalies and decoding continues, since partial forensic data is still
// useful. Strict: the same findings abort decoding with a DecodeError.
//
// ==============================================================================

#ifndef WINSTRUCTS_DECODE_CONTEXT_HPP
#define WINSTRUCTS_DECODE_CONTEXT_HPP

#include <optional>
#include <string_view>
#include <vector>
#include <winstructs/error.hpp>

namespace winstructs {

namespace output {
class Writer;
}  // namespace output

// ----------------------------------------------------------------------------
// DecodeOptions
// ----------------------------------------------------------------------------

/// Options for every decode_* / read_* call
struct DecodeOptions {
    /// Escalate SizeMismatch, OffsetControlMismatch and
    /// InvalidSubAuthorityCount anomalies to errors
    bool strict = false;

    /// Fail with InvalidRevision on unknown SID/ACL/SD revisions
    bool enforce_revision = false;

    /// Diagnostic writer (caller-owned, may be nullptr)
    output::Writer* log = nullptr;

    /// true if an anomaly of this kind aborts decoding
    bool is_fatal(DecodeErrorKind kind) const;
};

// ----------------------------------------------------------------------------
// DecodeContext
// ----------------------------------------------------------------------------

/// State of one decode call: options plus the caller's anomaly list.
/// Not shared between calls.
class DecodeContext {
public:
    /// @param options Decode policy (copied)
    /// @param anomalies Where to append anomalies (may be nullptr)
    explicit DecodeContext(const DecodeOptions& options = DecodeOptions{},
                           std::vector<Anomaly>* anomalies = nullptr);

    const DecodeOptions& options() const { return options_; }

    /// Record an anomaly and log it as a warning.
    /// @return the error to propagate if the options make it fatal
    std::optional<DecodeError> flag(Anomaly anomaly);

    /// Number of anomalies recorded through this context
    std::size_t anomaly_count() const { return anomaly_count_; }

    void debug(std::string_view message) const;
    void trace(std::string_view message) const;

    /// true if trace() output is enabled (to skip building messages)
    bool tracing() const;

private:
    DecodeOptions options_;
    std::vector<Anomaly>* anomalies_ = nullptr;
    std::size_t anomaly_count_ = 0;
};

}  // namespace winstructs

#endif  // WINSTRUCTS_DECODE_CONTEXT_HPP
