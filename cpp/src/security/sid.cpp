// ==============================================================================
// sid.cpp - Security Identifier (SID) codec
// ==============================================================================
//
// SID layout (libfwnt):
//   0x00  u8    revision (1)
//   0x01  u8    number of sub-authorities (<= 15)
//   0x02  u48   identifier authority, big-endian
//   0x08  u32[] sub-authorities, little-endian
//
// ==============================================================================

#include <cinttypes>
#include <cstdio>
#include <utility>
#include <winstructs/sid.hpp>

namespace winstructs::security {

namespace {

/// Разобрать беззнаковое десятичное число (без знака, без пробелов)
std::optional<std::uint64_t> parse_decimal(std::string_view text, std::uint64_t max) {
    if (text.empty() || text.size() > 20) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (value > (max - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

/// Разобрать "0x..." hex число
std::optional<std::uint64_t> parse_prefixed_hex(std::string_view text, std::uint64_t max) {
    if (text.size() < 3 || text[0] != '0' || (text[1] != 'x' && text[1] != 'X')) {
        return std::nullopt;
    }
    text.remove_prefix(2);
    if (text.size() > 16) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (char c : text) {
        std::uint64_t digit = 0;
        if (c >= '0' && c <= '9') {
            digit = static_cast<std::uint64_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            digit = static_cast<std::uint64_t>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            digit = static_cast<std::uint64_t>(c - 'A' + 10);
        } else {
            return std::nullopt;
        }
        value = (value << 4) | digit;
    }
    if (value > max) {
        return std::nullopt;
    }
    return value;
}

/// Разбить строку по '-'
std::vector<std::string_view> split_dash(std::string_view text) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = text.find('-', start);
        if (pos == std::string_view::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

}  // namespace

// ============================================================================
// Sid
// ============================================================================

Sid::Sid(std::uint8_t revision, std::uint64_t authority,
         std::vector<std::uint32_t> sub_authorities)
    : revision_(revision), authority_(authority), sub_authorities_(std::move(sub_authorities)) {}

std::optional<Sid> Sid::from_parts(std::uint8_t revision, std::uint64_t authority,
                                   std::vector<std::uint32_t> sub_authorities) {
    if (authority > SID_MAX_AUTHORITY || sub_authorities.size() > SID_MAX_SUB_AUTHORITIES) {
        return std::nullopt;
    }
    return Sid(revision, authority, std::move(sub_authorities));
}

std::optional<Sid> Sid::parse(std::string_view text) {
    if (text.size() < 2 || (text[0] != 'S' && text[0] != 's') || text[1] != '-') {
        return std::nullopt;
    }

    auto parts = split_dash(text.substr(2));
    // revision + authority обязательны
    if (parts.size() < 2) {
        return std::nullopt;
    }

    auto revision = parse_decimal(parts[0], 0xFF);
    if (!revision) {
        return std::nullopt;
    }

    auto authority = parse_prefixed_hex(parts[1], SID_MAX_AUTHORITY);
    if (!authority) {
        authority = parse_decimal(parts[1], SID_MAX_AUTHORITY);
    }
    if (!authority) {
        return std::nullopt;
    }

    std::vector<std::uint32_t> subs;
    subs.reserve(parts.size() - 2);
    for (std::size_t i = 2; i < parts.size(); ++i) {
        auto sub = parse_decimal(parts[i], 0xFFFFFFFFULL);
        if (!sub) {
            return std::nullopt;
        }
        subs.push_back(static_cast<std::uint32_t>(*sub));
    }

    return from_parts(static_cast<std::uint8_t>(*revision), *authority, std::move(subs));
}

std::optional<std::uint32_t> Sid::rid() const {
    if (sub_authorities_.empty()) {
        return std::nullopt;
    }
    return sub_authorities_.back();
}

std::string Sid::to_string() const {
    std::string result = "S-";
    result += std::to_string(revision_);
    result += '-';

    if (authority_ >= (1ULL << 32)) {
        char buf[24];
        std::snprintf(buf, sizeof(buf), "0x%012" PRIX64, authority_);
        result += buf;
    } else {
        result += std::to_string(authority_);
    }

    for (std::uint32_t sub : sub_authorities_) {
        result += '-';
        result += std::to_string(sub);
    }
    return result;
}

bool Sid::operator==(const Sid& other) const {
    return revision_ == other.revision_ && authority_ == other.authority_ &&
           sub_authorities_ == other.sub_authorities_;
}

bool Sid::operator<(const Sid& other) const {
    if (revision_ != other.revision_) {
        return revision_ < other.revision_;
    }
    if (sub_authorities_.size() != other.sub_authorities_.size()) {
        return sub_authorities_.size() < other.sub_authorities_.size();
    }
    if (authority_ != other.authority_) {
        return authority_ < other.authority_;
    }
    return sub_authorities_ < other.sub_authorities_;
}

// ============================================================================
// Decode
// ============================================================================

DecodeResult<Sid> read_sid(io::ByteCursor& cursor, DecodeContext& context) {
    const std::size_t start = cursor.absolute_position();

    if (cursor.remaining() < SID_HEADER_SIZE) {
        return cursor.overrun(SID_HEADER_SIZE, "SID header");
    }
    std::uint8_t revision = *cursor.read_u8();
    std::uint8_t count = *cursor.read_u8();
    std::uint64_t authority = *cursor.read_u48_be();

    if (revision != SID_REVISION) {
        auto error = context.flag(Anomaly{DecodeErrorKind::InvalidRevision,
                                          "unknown SID revision " + std::to_string(revision),
                                          start});
        if (error) {
            return *error;
        }
    }

    if (count > SID_MAX_SUB_AUTHORITIES) {
        auto error = context.flag(Anomaly{DecodeErrorKind::InvalidSubAuthorityCount,
                                          "SID declares " + std::to_string(count) +
                                              " sub-authorities (max 15)",
                                          start + 1});
        if (error) {
            return *error;
        }
    }

    const std::size_t needed = 4 * static_cast<std::size_t>(count);
    if (cursor.remaining() < needed) {
        return cursor.overrun(needed, "SID sub-authorities");
    }

    std::vector<std::uint32_t> subs;
    subs.reserve(count);
    for (std::uint8_t i = 0; i < count; ++i) {
        subs.push_back(*cursor.read_u32_le());
    }

    Sid sid(revision, authority, std::move(subs));
    if (context.tracing()) {
        context.trace("SID " + sid.to_string() + " at offset " + std::to_string(start));
    }
    return sid;
}

DecodeResult<Sid> decode_sid(const std::uint8_t* data, std::size_t size,
                             const DecodeOptions& options, std::vector<Anomaly>* anomalies) {
    io::ByteCursor cursor(data, size);
    DecodeContext context(options, anomalies);
    return read_sid(cursor, context);
}

DecodeResult<Sid> decode_sid(const std::vector<std::uint8_t>& buffer,
                             const DecodeOptions& options, std::vector<Anomaly>* anomalies) {
    return decode_sid(buffer.data(), buffer.size(), options, anomalies);
}

// ============================================================================
// Encode
// ============================================================================

void write_sid(io::ByteWriter& writer, const Sid& sid) {
    writer.write_u8(sid.revision());
    // Количество берётся из фактической длины списка
    writer.write_u8(static_cast<std::uint8_t>(sid.sub_authority_count()));
    writer.write_u48_be(sid.authority());
    for (std::uint32_t sub : sid.sub_authorities()) {
        writer.write_u32_le(sub);
    }
}

std::vector<std::uint8_t> encode_sid(const Sid& sid) {
    io::ByteWriter writer;
    writer.reserve(sid.encoded_size());
    write_sid(writer, sid);
    return writer.take();
}

}  // namespace winstructs::security
