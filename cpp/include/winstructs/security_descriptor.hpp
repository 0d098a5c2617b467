// ==============================================================================
// winstructs/security_descriptor.hpp - Self-relative Security Descriptor codec
// ==============================================================================
//
// Назначение:
// - Декодирование заголовка и компонентов по относительным смещениям
// - Сверка флагов SE_SACL_PRESENT/SE_DACL_PRESENT со смещениями
// - Кодирование: header, owner, group, SACL, DACL (смещения пересчитываются)
//
// Header layout (20 bytes):
//   0x00  u8   revision (1)
//   0x01  u8   reserved
//   0x02  u16  control flags
//   0x04  u32  owner SID offset   (0 = absent)
//   0x08  u32  group SID offset   (0 = absent)
//   0x0C  u32  SACL offset        (0 = absent)
//   0x10  u32  DACL offset        (0 = absent)
//
// Offsets are relative to the first byte of the header.
//
// References:
// - https://github.com/libyal/libfwnt/wiki/Security-Descriptor
// - [MS-DTYP] 2.4.6 SECURITY_DESCRIPTOR
//
// ==============================================================================

#ifndef WINSTRUCTS_SECURITY_DESCRIPTOR_HPP
#define WINSTRUCTS_SECURITY_DESCRIPTOR_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <winstructs/acl.hpp>
#include <winstructs/cursor.hpp>
#include <winstructs/decode_context.hpp>
#include <winstructs/error.hpp>
#include <winstructs/sid.hpp>

namespace winstructs::security {

constexpr std::uint8_t SD_REVISION = 1;
constexpr std::size_t SD_HEADER_SIZE = 20;

// ----------------------------------------------------------------------------
// Control flags
// ----------------------------------------------------------------------------

enum class SdControlFlags : std::uint16_t {
    OwnerDefaulted = 0x0001,
    GroupDefaulted = 0x0002,
    DaclPresent = 0x0004,
    DaclDefaulted = 0x0008,
    SaclPresent = 0x0010,
    SaclDefaulted = 0x0020,
    DaclAutoInheritReq = 0x0100,
    SaclAutoInheritReq = 0x0200,
    DaclAutoInherited = 0x0400,
    SaclAutoInherited = 0x0800,
    DaclProtected = 0x1000,
    SaclProtected = 0x2000,
    RmControlValid = 0x4000,
    SelfRelative = 0x8000,
};

/// "SE_DACL_PRESENT | SE_SELF_RELATIVE", "NONE" for zero.
/// Undefined bits are rendered as 0xNNNN.
std::string sd_control_flags_to_string(std::uint16_t control);

// ----------------------------------------------------------------------------
// Header
// ----------------------------------------------------------------------------

struct SecurityDescriptorHeader {
    std::uint8_t revision = SD_REVISION;
    std::uint8_t sbz1 = 0;
    std::uint16_t control = 0;
    std::uint32_t owner_offset = 0;
    std::uint32_t group_offset = 0;
    std::uint32_t sacl_offset = 0;
    std::uint32_t dacl_offset = 0;

    bool has_control(SdControlFlags flag) const {
        return (control & static_cast<std::uint16_t>(flag)) != 0;
    }
};

/// Read the 20-byte header only (no validation of offsets or revision)
DecodeResult<SecurityDescriptorHeader> read_security_descriptor_header(io::ByteCursor& cursor);

DecodeResult<SecurityDescriptorHeader> decode_security_descriptor_header(const std::uint8_t* data,
                                                                         std::size_t size);

DecodeResult<SecurityDescriptorHeader> decode_security_descriptor_header(
    const std::vector<std::uint8_t>& buffer);

// ----------------------------------------------------------------------------
// SecurityDescriptor
// ----------------------------------------------------------------------------

struct SecurityDescriptor {
    std::uint8_t revision = SD_REVISION;
    std::uint8_t sbz1 = 0;

    /// Control as decoded; the two presence bits are rewritten on encode
    std::uint16_t control = static_cast<std::uint16_t>(SdControlFlags::SelfRelative);

    std::optional<Sid> owner;
    std::optional<Sid> group;
    std::optional<Acl> sacl;
    std::optional<Acl> dacl;

    /// control with SE_SACL_PRESENT/SE_DACL_PRESENT matching the ACLs
    std::uint16_t effective_control() const;

    std::size_t encoded_size() const;

    /// Сравнение по закодированному виду: биты присутствия берутся из ACL
    bool operator==(const SecurityDescriptor& other) const {
        return revision == other.revision && sbz1 == other.sbz1 &&
               effective_control() == other.effective_control() &&
               owner == other.owner && group == other.group && sacl == other.sacl &&
               dacl == other.dacl;
    }
    bool operator!=(const SecurityDescriptor& other) const { return !(*this == other); }
};

/// Decode a descriptor whose header starts at the cursor position.
/// Offsets are relative to that position and must stay inside the cursor's
/// window. On success the cursor is past the furthest decoded component.
DecodeResult<SecurityDescriptor> read_security_descriptor(io::ByteCursor& cursor,
                                                          DecodeContext& context);

DecodeResult<SecurityDescriptor> decode_security_descriptor(
    const std::uint8_t* data, std::size_t size, const DecodeOptions& options = DecodeOptions{},
    std::vector<Anomaly>* anomalies = nullptr);

DecodeResult<SecurityDescriptor> decode_security_descriptor(
    const std::vector<std::uint8_t>& buffer, const DecodeOptions& options = DecodeOptions{},
    std::vector<Anomaly>* anomalies = nullptr);

/// Components are laid out owner, group, SACL, DACL after the header.
/// Throws std::length_error if an ACL does not fit its 16-bit fields.
void write_security_descriptor(io::ByteWriter& writer, const SecurityDescriptor& sd);

std::vector<std::uint8_t> encode_security_descriptor(const SecurityDescriptor& sd);

}  // namespace winstructs::security

#endif  // WINSTRUCTS_SECURITY_DESCRIPTOR_HPP
