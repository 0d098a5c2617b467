// ==============================================================================
// winstructs/ace.hpp - Access Control Entry (ACE) codec
// ==============================================================================
//
// Назначение:
// - Декодирование ACE: общий заголовок + тело, выбираемое по type tag
// - Тело читается через курсор, ограниченный объявленным размером
// - Неизвестные типы сохраняются как непрозрачные байты
// - Кодирование с пересчётом поля size
//
// Binary layout:
//   header: type:u8, flags:u8, size:u16 (LE), body of exactly size - 4 bytes
//   basic body:  access_mask:u32, SID, [application data]
//   object body: access_mask:u32, object_flags:u32,
//                [object_type GUID], [inherited_object_type GUID], SID,
//                [application data]
//
// References:
// - https://github.com/libyal/libfwnt/wiki/Security-Descriptor#access-control-entry-ace
// - [MS-DTYP] 2.4.4 ACE
//
// ==============================================================================

#ifndef WINSTRUCTS_ACE_HPP
#define WINSTRUCTS_ACE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <winstructs/cursor.hpp>
#include <winstructs/decode_context.hpp>
#include <winstructs/error.hpp>
#include <winstructs/guid.hpp>
#include <winstructs/sid.hpp>

namespace winstructs::security {

/// type + flags + size
constexpr std::size_t ACE_HEADER_SIZE = 4;

// ----------------------------------------------------------------------------
// ACE type tags
// ----------------------------------------------------------------------------

/// ACE type tag. Values outside the enumerators are legal (unknown kinds).
enum class AceType : std::uint8_t {
    AccessAllowed = 0x00,
    AccessDenied = 0x01,
    SystemAudit = 0x02,
    SystemAlarm = 0x03,
    AccessAllowedCompound = 0x04,
    AccessAllowedObject = 0x05,
    AccessDeniedObject = 0x06,
    SystemAuditObject = 0x07,
    SystemAlarmObject = 0x08,
    AccessAllowedCallback = 0x09,
    AccessDeniedCallback = 0x0A,
    AccessAllowedCallbackObject = 0x0B,
    AccessDeniedCallbackObject = 0x0C,
    SystemAuditCallback = 0x0D,
    SystemAlarmCallback = 0x0E,
    SystemAuditCallbackObject = 0x0F,
    SystemAlarmCallbackObject = 0x10,
    SystemMandatoryLabel = 0x11,
    SystemResourceAttribute = 0x12,
    SystemScopedPolicyId = 0x13,
};

/// "ACCESS_ALLOWED", ..., "UNKNOWN_TYPE: 0x2A" for unknown tags
std::string ace_type_to_string(AceType type);

/// Body layout selected by the type tag
enum class AceBodyShape {
    Basic,   // mask + SID
    Object,  // mask + object flags + optional GUIDs + SID
    Raw,     // opaque bytes (compound and unknown types)
};

AceBodyShape ace_body_shape(AceType type);

/// true for types whose body carries application data after the SID
/// (callback ACEs and SYSTEM_RESOURCE_ATTRIBUTE)
bool ace_has_application_data(AceType type);

// ----------------------------------------------------------------------------
// ACE flags
// ----------------------------------------------------------------------------

enum class AceFlags : std::uint8_t {
    ObjectInherit = 0x01,
    ContainerInherit = 0x02,
    NoPropagateInherit = 0x04,
    InheritOnly = 0x08,
    Inherited = 0x10,
    Critical = 0x20,
    SuccessfulAccess = 0x40,
    FailedAccess = 0x80,
};

/// "OBJECT_INHERIT_ACE | CONTAINER_INHERIT_ACE", "NONE" for zero.
std::string ace_flags_to_string(std::uint8_t flags);

/// Object ACE flags (presence bits of the two GUIDs)
enum class AceObjectFlags : std::uint32_t {
    ObjectTypePresent = 0x00000001,
    InheritedObjectTypePresent = 0x00000002,
};

// ----------------------------------------------------------------------------
// ACE bodies
// ----------------------------------------------------------------------------

/// access-allowed/denied, system-audit/alarm, callback, mandatory label, ...
struct AceBasic {
    std::uint32_t access_mask = 0;
    Sid sid;

    /// Bytes after the SID inside the declared size
    std::vector<std::uint8_t> application_data;

    bool operator==(const AceBasic& other) const {
        return access_mask == other.access_mask && sid == other.sid &&
               application_data == other.application_data;
    }
    bool operator!=(const AceBasic& other) const { return !(*this == other); }
};

/// Object ACE variants (directory service objects)
struct AceObject {
    std::uint32_t access_mask = 0;

    /// Raw object flags; the two presence bits are rewritten on encode
    std::uint32_t object_flags = 0;

    std::optional<Guid> object_type;
    std::optional<Guid> inherited_object_type;
    Sid sid;
    std::vector<std::uint8_t> application_data;

    /// object_flags with presence bits matching the GUIDs
    std::uint32_t effective_object_flags() const;

    /// Сравнение по закодированному виду: биты присутствия берутся из GUID
    bool operator==(const AceObject& other) const {
        return access_mask == other.access_mask &&
               effective_object_flags() == other.effective_object_flags() &&
               object_type == other.object_type &&
               inherited_object_type == other.inherited_object_type && sid == other.sid &&
               application_data == other.application_data;
    }
    bool operator!=(const AceObject& other) const { return !(*this == other); }
};

/// Body kept verbatim (unknown or unsupported type tags)
struct AceRaw {
    std::vector<std::uint8_t> data;

    bool operator==(const AceRaw& other) const { return data == other.data; }
    bool operator!=(const AceRaw& other) const { return !(*this == other); }
};

using AceBody = std::variant<AceBasic, AceObject, AceRaw>;

// ----------------------------------------------------------------------------
// Ace
// ----------------------------------------------------------------------------

struct Ace {
    AceType type = AceType::AccessAllowed;
    std::uint8_t flags = 0;
    AceBody body;

    /// Encoded body length (without the 4-byte header)
    std::size_t body_size() const;

    /// Encoded length including the header (the value of the size field)
    std::size_t encoded_size() const { return ACE_HEADER_SIZE + body_size(); }

    /// true if the body alternative matches ace_body_shape(type)
    bool is_well_formed() const;

    const AceBasic* as_basic() const { return std::get_if<AceBasic>(&body); }
    const AceObject* as_object() const { return std::get_if<AceObject>(&body); }
    const AceRaw* as_raw() const { return std::get_if<AceRaw>(&body); }

    /// SID of a basic/object body, nullptr for raw bodies
    const Sid* sid() const;

    /// Access mask of a basic/object body
    std::optional<std::uint32_t> access_mask() const;

    bool operator==(const Ace& other) const {
        return type == other.type && flags == other.flags && body == other.body;
    }
    bool operator!=(const Ace& other) const { return !(*this == other); }
};

// ----------------------------------------------------------------------------
// Decode / encode
// ----------------------------------------------------------------------------

/// Decode one ACE at the cursor position. On success the cursor has
/// advanced by exactly the declared size.
DecodeResult<Ace> read_ace(io::ByteCursor& cursor, DecodeContext& context);

DecodeResult<Ace> decode_ace(const std::uint8_t* data, std::size_t size,
                             const DecodeOptions& options = DecodeOptions{},
                             std::vector<Anomaly>* anomalies = nullptr);

DecodeResult<Ace> decode_ace(const std::vector<std::uint8_t>& buffer,
                             const DecodeOptions& options = DecodeOptions{},
                             std::vector<Anomaly>* anomalies = nullptr);

/// Append the encoded ACE. Throws std::length_error if the ACE does not fit
/// the 16-bit size field.
void write_ace(io::ByteWriter& writer, const Ace& ace);

std::vector<std::uint8_t> encode_ace(const Ace& ace);

}  // namespace winstructs::security

#endif  // WINSTRUCTS_ACE_HPP
