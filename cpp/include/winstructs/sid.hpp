// ==============================================================================
// winstructs/sid.hpp - Security Identifier (SID) codec
// ==============================================================================
//
// Назначение:
// - Декодирование/кодирование SID из/в бинарное представление
// - Каноническая строковая форма S-R-A-S1-S2-...
// - Разбор строковой формы
//
// Binary layout:
//   revision:u8, sub_count:u8, authority:u48 (big-endian),
//   sub_authorities:[u32 LE; sub_count]
//
// References:
// - https://github.com/libyal/libfwnt/wiki/Security-Descriptor#security-identifier
// - https://learn.microsoft.com/en-us/windows/win32/secauthz/security-identifiers
//
// ==============================================================================

#ifndef WINSTRUCTS_SID_HPP
#define WINSTRUCTS_SID_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <winstructs/cursor.hpp>
#include <winstructs/decode_context.hpp>
#include <winstructs/error.hpp>

namespace winstructs::security {

/// The only defined SID revision
constexpr std::uint8_t SID_REVISION = 1;

/// SID_MAX_SUB_AUTHORITIES from winnt.h
constexpr std::size_t SID_MAX_SUB_AUTHORITIES = 15;

/// Largest value of the 48-bit identifier authority
constexpr std::uint64_t SID_MAX_AUTHORITY = 0xFFFFFFFFFFFFULL;

/// revision + count + authority
constexpr std::size_t SID_HEADER_SIZE = 8;

// ----------------------------------------------------------------------------
// Sid
// ----------------------------------------------------------------------------

/// Security identifier. Immutable once built; the sub-authority count is
/// always the length of the sub-authority list.
class Sid {
public:
    /// S-1-0 (null authority, no sub-authorities)
    Sid() = default;

    /// Build a SID from validated fields
    /// @return nullopt if authority exceeds 48 bits or more than 15 sub-authorities
    static std::optional<Sid> from_parts(std::uint8_t revision, std::uint64_t authority,
                                         std::vector<std::uint32_t> sub_authorities);

    /// Parse "S-1-5-21-..." (authority decimal or 0x-prefixed hex)
    static std::optional<Sid> parse(std::string_view text);

    std::uint8_t revision() const { return revision_; }
    std::uint64_t authority() const { return authority_; }
    const std::vector<std::uint32_t>& sub_authorities() const { return sub_authorities_; }
    std::size_t sub_authority_count() const { return sub_authorities_.size(); }

    /// Last sub-authority (RID), if any
    std::optional<std::uint32_t> rid() const;

    /// Encoded size: 8 + 4 * sub_authority_count()
    std::size_t encoded_size() const { return SID_HEADER_SIZE + 4 * sub_authorities_.size(); }

    /// Canonical form. Authorities of 2^32 and above print as 0x + 12 hex digits.
    std::string to_string() const;

    bool operator==(const Sid& other) const;
    bool operator!=(const Sid& other) const { return !(*this == other); }

    /// Orders by revision, sub-authority count, authority, then sub-authorities
    bool operator<(const Sid& other) const;

private:
    friend DecodeResult<Sid> read_sid(io::ByteCursor& cursor, DecodeContext& context);

    Sid(std::uint8_t revision, std::uint64_t authority, std::vector<std::uint32_t> sub_authorities);

    std::uint8_t revision_ = SID_REVISION;
    std::uint64_t authority_ = 0;
    std::vector<std::uint32_t> sub_authorities_;
};

// ----------------------------------------------------------------------------
// Decode / encode
// ----------------------------------------------------------------------------

/// Decode a SID at the cursor position
DecodeResult<Sid> read_sid(io::ByteCursor& cursor, DecodeContext& context);

/// Decode a SID from the start of a buffer
/// @param anomalies Receives non-fatal findings (may be nullptr)
DecodeResult<Sid> decode_sid(const std::uint8_t* data, std::size_t size,
                             const DecodeOptions& options = DecodeOptions{},
                             std::vector<Anomaly>* anomalies = nullptr);

DecodeResult<Sid> decode_sid(const std::vector<std::uint8_t>& buffer,
                             const DecodeOptions& options = DecodeOptions{},
                             std::vector<Anomaly>* anomalies = nullptr);

void write_sid(io::ByteWriter& writer, const Sid& sid);

std::vector<std::uint8_t> encode_sid(const Sid& sid);

}  // namespace winstructs::security

#endif  // WINSTRUCTS_SID_HPP
