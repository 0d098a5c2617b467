// ==============================================================================
// guid.cpp - GUID value type
// ==============================================================================

#include <cstdio>
#include <winstructs/guid.hpp>

namespace winstructs {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

/// Parse exactly `digits` hex characters starting at `text[pos]`
std::optional<std::uint64_t> parse_hex(std::string_view text, std::size_t pos, std::size_t digits) {
    if (pos + digits > text.size()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < digits; ++i) {
        int d = hex_digit(text[pos + i]);
        if (d < 0) {
            return std::nullopt;
        }
        value = (value << 4) | static_cast<std::uint64_t>(d);
    }
    return value;
}

}  // namespace

std::string Guid::to_string() const {
    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08X-%04X-%04X-%02X%02X-%02X%02X%02X%02X%02X%02X",
                  static_cast<unsigned>(data1), static_cast<unsigned>(data2),
                  static_cast<unsigned>(data3), data4[0], data4[1], data4[2], data4[3], data4[4],
                  data4[5], data4[6], data4[7]);
    return std::string(buf);
}

std::optional<Guid> Guid::parse(std::string_view text) {
    if (text.size() == 38 && text.front() == '{' && text.back() == '}') {
        text = text.substr(1, 36);
    }
    if (text.size() != 36 || text[8] != '-' || text[13] != '-' || text[18] != '-' ||
        text[23] != '-') {
        return std::nullopt;
    }

    auto d1 = parse_hex(text, 0, 8);
    auto d2 = parse_hex(text, 9, 4);
    auto d3 = parse_hex(text, 14, 4);
    if (!d1 || !d2 || !d3) {
        return std::nullopt;
    }

    Guid guid;
    guid.data1 = static_cast<std::uint32_t>(*d1);
    guid.data2 = static_cast<std::uint16_t>(*d2);
    guid.data3 = static_cast<std::uint16_t>(*d3);

    // data4: "XXXX-XXXXXXXXXXXX"
    constexpr std::size_t positions[8] = {19, 21, 24, 26, 28, 30, 32, 34};
    for (std::size_t i = 0; i < 8; ++i) {
        auto byte = parse_hex(text, positions[i], 2);
        if (!byte) {
            return std::nullopt;
        }
        guid.data4[i] = static_cast<std::uint8_t>(*byte);
    }
    return guid;
}

DecodeResult<Guid> read_guid(io::ByteCursor& cursor) {
    if (cursor.remaining() < GUID_SIZE) {
        return cursor.overrun(GUID_SIZE, "GUID");
    }

    Guid guid;
    guid.data1 = *cursor.read_u32_le();
    guid.data2 = *cursor.read_u16_le();
    guid.data3 = *cursor.read_u16_le();
    for (auto& b : guid.data4) {
        b = *cursor.read_u8();
    }
    return guid;
}

void write_guid(io::ByteWriter& writer, const Guid& guid) {
    writer.write_u32_le(guid.data1);
    writer.write_u16_le(guid.data2);
    writer.write_u16_le(guid.data3);
    writer.write_bytes(guid.data4.data(), guid.data4.size());
}

}  // namespace winstructs
