// ==============================================================================
// winstructs/acl.hpp - Access Control List (ACL) codec
// ==============================================================================
//
// Назначение:
// - Декодирование ACL: заголовок + ровно ace_count записей ACE
// - Сверка объявленного размера с фактически прочитанным
// - Кодирование с фактическими size/count
//
// Binary layout:
//   0x00  u8   revision (2, or 4 for ACLs with object ACEs)
//   0x01  u8   reserved
//   0x02  u16  acl size (header + all ACEs)
//   0x04  u16  ace count
//   0x06  u16  reserved
//   0x08  ACE[ace count]
//
// References:
// - https://github.com/libyal/libfwnt/wiki/Security-Descriptor#access-control-list-acl
//
// ==============================================================================

#ifndef WINSTRUCTS_ACL_HPP
#define WINSTRUCTS_ACL_HPP

#include <cstdint>
#include <vector>
#include <winstructs/ace.hpp>
#include <winstructs/cursor.hpp>
#include <winstructs/decode_context.hpp>
#include <winstructs/error.hpp>

namespace winstructs::security {

constexpr std::uint8_t ACL_REVISION = 2;
constexpr std::uint8_t ACL_REVISION_DS = 4;
constexpr std::size_t ACL_HEADER_SIZE = 8;

struct Acl {
    std::uint8_t revision = ACL_REVISION;

    // Зарезервированные поля сохраняются для точного повторного кодирования
    std::uint8_t sbz1 = 0;
    std::uint16_t sbz2 = 0;

    std::vector<Ace> entries;

    /// Header + sum of the ACE sizes
    std::size_t encoded_size() const;

    std::size_t ace_count() const { return entries.size(); }

    bool operator==(const Acl& other) const {
        return revision == other.revision && sbz1 == other.sbz1 && sbz2 == other.sbz2 &&
               entries == other.entries;
    }
    bool operator!=(const Acl& other) const { return !(*this == other); }
};

/// Decode an ACL at the cursor position. Reads exactly ace_count entries;
/// on success the cursor is past the last ACE.
DecodeResult<Acl> read_acl(io::ByteCursor& cursor, DecodeContext& context);

DecodeResult<Acl> decode_acl(const std::uint8_t* data, std::size_t size,
                             const DecodeOptions& options = DecodeOptions{},
                             std::vector<Anomaly>* anomalies = nullptr);

DecodeResult<Acl> decode_acl(const std::vector<std::uint8_t>& buffer,
                             const DecodeOptions& options = DecodeOptions{},
                             std::vector<Anomaly>* anomalies = nullptr);

/// Throws std::length_error if the size or the entry count exceeds 16 bits
void write_acl(io::ByteWriter& writer, const Acl& acl);

std::vector<std::uint8_t> encode_acl(const Acl& acl);

}  // namespace winstructs::security

#endif  // WINSTRUCTS_ACL_HPP
