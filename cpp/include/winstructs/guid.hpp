// ==============================================================================
// winstructs/guid.hpp - GUID value type
// ==============================================================================
//
// 16 bytes: data1 (u32 LE), data2 (u16 LE), data3 (u16 LE), data4 (8 bytes).
// Used by object ACEs (object type / inherited object type).
//
// ==============================================================================

#ifndef WINSTRUCTS_GUID_HPP
#define WINSTRUCTS_GUID_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <winstructs/cursor.hpp>
#include <winstructs/error.hpp>

namespace winstructs {

/// Encoded GUID size in bytes
constexpr std::size_t GUID_SIZE = 16;

struct Guid {
    std::uint32_t data1 = 0;
    std::uint16_t data2 = 0;
    std::uint16_t data3 = 0;
    std::array<std::uint8_t, 8> data4{};

    /// "54849625-5478-4994-A5BA-3E3B0328C30D"
    std::string to_string() const;

    /// Parse the canonical form (braces optional, case-insensitive)
    static std::optional<Guid> parse(std::string_view text);

    bool operator==(const Guid& other) const {
        return data1 == other.data1 && data2 == other.data2 && data3 == other.data3 &&
               data4 == other.data4;
    }
    bool operator!=(const Guid& other) const { return !(*this == other); }
};

/// Read 16 bytes; fails with the cursor's overrun kind
DecodeResult<Guid> read_guid(io::ByteCursor& cursor);

void write_guid(io::ByteWriter& writer, const Guid& guid);

}  // namespace winstructs

#endif  // WINSTRUCTS_GUID_HPP
