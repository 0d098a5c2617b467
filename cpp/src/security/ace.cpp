// ==============================================================================
// ace.cpp - Access Control Entry (ACE) codec
// ==============================================================================
//
// ACE header (4 bytes):
//   0x00  u8   type
//   0x01  u8   flags
//   0x02  u16  size (header + body)
//
// The body is decoded through a cursor bounded to size - 4 bytes, so a body
// decoder fails with AceBodyOverrun instead of reading into the next ACE.
//
// ==============================================================================

#include <cstdio>
#include <stdexcept>
#include <utility>
#include <winstructs/ace.hpp>

namespace winstructs::security {

namespace {

constexpr std::uint32_t OBJECT_PRESENCE_MASK =
    static_cast<std::uint32_t>(AceObjectFlags::ObjectTypePresent) |
    static_cast<std::uint32_t>(AceObjectFlags::InheritedObjectTypePresent);

std::string hex_byte(std::uint8_t value) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02X", value);
    return std::string(buf);
}

/// Остаток тела после SID: application data или мусор
DecodeResult<std::vector<std::uint8_t>> read_trailing(io::ByteCursor& body, AceType type,
                                                      DecodeContext& context) {
    const std::size_t offset = body.absolute_position();
    std::vector<std::uint8_t> trailing = *body.read_bytes(body.remaining());

    if (!trailing.empty() && !ace_has_application_data(type)) {
        auto error = context.flag(Anomaly{
            DecodeErrorKind::SizeMismatch,
            std::to_string(trailing.size()) + " bytes after the SID of a " +
                ace_type_to_string(type) + " ACE",
            offset});
        if (error) {
            return *error;
        }
    }
    return trailing;
}

DecodeResult<AceBasic> read_basic_body(io::ByteCursor& body, AceType type,
                                       DecodeContext& context) {
    AceBasic basic;

    auto mask = body.read_u32_le();
    if (!mask) {
        return body.overrun(4, "ACE access mask");
    }
    basic.access_mask = *mask;

    auto sid = read_sid(body, context);
    if (auto* error = std::get_if<DecodeError>(&sid)) {
        return std::move(*error);
    }
    basic.sid = std::move(std::get<Sid>(sid));

    auto trailing = read_trailing(body, type, context);
    if (auto* error = std::get_if<DecodeError>(&trailing)) {
        return std::move(*error);
    }
    basic.application_data = std::move(std::get<std::vector<std::uint8_t>>(trailing));
    return basic;
}

DecodeResult<AceObject> read_object_body(io::ByteCursor& body, AceType type,
                                         DecodeContext& context) {
    AceObject object;

    auto mask = body.read_u32_le();
    if (!mask) {
        return body.overrun(4, "ACE access mask");
    }
    object.access_mask = *mask;

    auto flags = body.read_u32_le();
    if (!flags) {
        return body.overrun(4, "object ACE flags");
    }
    object.object_flags = *flags;

    // GUID присутствуют только при установленных битах
    if (object.object_flags & static_cast<std::uint32_t>(AceObjectFlags::ObjectTypePresent)) {
        auto guid = read_guid(body);
        if (auto* error = std::get_if<DecodeError>(&guid)) {
            return std::move(*error);
        }
        object.object_type = std::get<Guid>(guid);
    }
    if (object.object_flags &
        static_cast<std::uint32_t>(AceObjectFlags::InheritedObjectTypePresent)) {
        auto guid = read_guid(body);
        if (auto* error = std::get_if<DecodeError>(&guid)) {
            return std::move(*error);
        }
        object.inherited_object_type = std::get<Guid>(guid);
    }

    auto sid = read_sid(body, context);
    if (auto* error = std::get_if<DecodeError>(&sid)) {
        return std::move(*error);
    }
    object.sid = std::move(std::get<Sid>(sid));

    auto trailing = read_trailing(body, type, context);
    if (auto* error = std::get_if<DecodeError>(&trailing)) {
        return std::move(*error);
    }
    object.application_data = std::move(std::get<std::vector<std::uint8_t>>(trailing));
    return object;
}

}  // namespace

// ============================================================================
// Type / flag helpers
// ============================================================================

std::string ace_type_to_string(AceType type) {
    switch (type) {
        case AceType::AccessAllowed:
            return "ACCESS_ALLOWED";
        case AceType::AccessDenied:
            return "ACCESS_DENIED";
        case AceType::SystemAudit:
            return "SYSTEM_AUDIT";
        case AceType::SystemAlarm:
            return "SYSTEM_ALARM";
        case AceType::AccessAllowedCompound:
            return "ACCESS_ALLOWED_COMPOUND";
        case AceType::AccessAllowedObject:
            return "ACCESS_ALLOWED_OBJECT";
        case AceType::AccessDeniedObject:
            return "ACCESS_DENIED_OBJECT";
        case AceType::SystemAuditObject:
            return "SYSTEM_AUDIT_OBJECT";
        case AceType::SystemAlarmObject:
            return "SYSTEM_ALARM_OBJECT";
        case AceType::AccessAllowedCallback:
            return "ACCESS_ALLOWED_CALLBACK";
        case AceType::AccessDeniedCallback:
            return "ACCESS_DENIED_CALLBACK";
        case AceType::AccessAllowedCallbackObject:
            return "ACCESS_ALLOWED_CALLBACK_OBJECT";
        case AceType::AccessDeniedCallbackObject:
            return "ACCESS_DENIED_CALLBACK_OBJECT";
        case AceType::SystemAuditCallback:
            return "SYSTEM_AUDIT_CALLBACK";
        case AceType::SystemAlarmCallback:
            return "SYSTEM_ALARM_CALLBACK";
        case AceType::SystemAuditCallbackObject:
            return "SYSTEM_AUDIT_CALLBACK_OBJECT";
        case AceType::SystemAlarmCallbackObject:
            return "SYSTEM_ALARM_CALLBACK_OBJECT";
        case AceType::SystemMandatoryLabel:
            return "SYSTEM_MANDATORY_LABEL";
        case AceType::SystemResourceAttribute:
            return "SYSTEM_RESOURCE_ATTRIBUTE";
        case AceType::SystemScopedPolicyId:
            return "SYSTEM_SCOPED_POLICY_ID";
    }
    return "UNKNOWN_TYPE: " + hex_byte(static_cast<std::uint8_t>(type));
}

AceBodyShape ace_body_shape(AceType type) {
    switch (type) {
        case AceType::AccessAllowed:
        case AceType::AccessDenied:
        case AceType::SystemAudit:
        case AceType::SystemAlarm:
        case AceType::AccessAllowedCallback:
        case AceType::AccessDeniedCallback:
        case AceType::SystemAuditCallback:
        case AceType::SystemAlarmCallback:
        case AceType::SystemMandatoryLabel:
        case AceType::SystemResourceAttribute:
        case AceType::SystemScopedPolicyId:
            return AceBodyShape::Basic;
        case AceType::AccessAllowedObject:
        case AceType::AccessDeniedObject:
        case AceType::SystemAuditObject:
        case AceType::SystemAlarmObject:
        case AceType::AccessAllowedCallbackObject:
        case AceType::AccessDeniedCallbackObject:
        case AceType::SystemAuditCallbackObject:
        case AceType::SystemAlarmCallbackObject:
            return AceBodyShape::Object;
        case AceType::AccessAllowedCompound:
            return AceBodyShape::Raw;
    }
    return AceBodyShape::Raw;
}

bool ace_has_application_data(AceType type) {
    switch (type) {
        case AceType::AccessAllowedCallback:
        case AceType::AccessDeniedCallback:
        case AceType::AccessAllowedCallbackObject:
        case AceType::AccessDeniedCallbackObject:
        case AceType::SystemAuditCallback:
        case AceType::SystemAlarmCallback:
        case AceType::SystemAuditCallbackObject:
        case AceType::SystemAlarmCallbackObject:
        case AceType::SystemResourceAttribute:
            return true;
        default:
            return false;
    }
}

std::string ace_flags_to_string(std::uint8_t flags) {
    if (flags == 0) {
        return "NONE";
    }

    struct FlagName {
        AceFlags flag;
        const char* name;
    };
    static constexpr FlagName names[] = {
        {AceFlags::ObjectInherit, "OBJECT_INHERIT_ACE"},
        {AceFlags::ContainerInherit, "CONTAINER_INHERIT_ACE"},
        {AceFlags::NoPropagateInherit, "NO_PROPAGATE_INHERIT_ACE"},
        {AceFlags::InheritOnly, "INHERIT_ONLY_ACE"},
        {AceFlags::Inherited, "INHERITED_ACE"},
        {AceFlags::Critical, "CRITICAL_ACE_FLAG"},
        {AceFlags::SuccessfulAccess, "SUCCESSFUL_ACCESS_ACE_FLAG"},
        {AceFlags::FailedAccess, "FAILED_ACCESS_ACE_FLAG"},
    };

    // Все восемь бит имеют имена
    std::string result;
    for (const auto& entry : names) {
        if (flags & static_cast<std::uint8_t>(entry.flag)) {
            if (!result.empty()) {
                result += " | ";
            }
            result += entry.name;
        }
    }
    return result;
}

// ============================================================================
// AceObject / Ace
// ============================================================================

std::uint32_t AceObject::effective_object_flags() const {
    std::uint32_t flags = object_flags & ~OBJECT_PRESENCE_MASK;
    if (object_type) {
        flags |= static_cast<std::uint32_t>(AceObjectFlags::ObjectTypePresent);
    }
    if (inherited_object_type) {
        flags |= static_cast<std::uint32_t>(AceObjectFlags::InheritedObjectTypePresent);
    }
    return flags;
}

std::size_t Ace::body_size() const {
    if (const auto* basic = as_basic()) {
        return 4 + basic->sid.encoded_size() + basic->application_data.size();
    }
    if (const auto* object = as_object()) {
        std::size_t size = 8 + object->sid.encoded_size() + object->application_data.size();
        if (object->object_type) {
            size += GUID_SIZE;
        }
        if (object->inherited_object_type) {
            size += GUID_SIZE;
        }
        return size;
    }
    return as_raw()->data.size();
}

bool Ace::is_well_formed() const {
    switch (ace_body_shape(type)) {
        case AceBodyShape::Basic:
            return as_basic() != nullptr;
        case AceBodyShape::Object:
            return as_object() != nullptr;
        case AceBodyShape::Raw:
            return as_raw() != nullptr;
    }
    return false;
}

const Sid* Ace::sid() const {
    if (const auto* basic = as_basic()) {
        return &basic->sid;
    }
    if (const auto* object = as_object()) {
        return &object->sid;
    }
    return nullptr;
}

std::optional<std::uint32_t> Ace::access_mask() const {
    if (const auto* basic = as_basic()) {
        return basic->access_mask;
    }
    if (const auto* object = as_object()) {
        return object->access_mask;
    }
    return std::nullopt;
}

// ============================================================================
// Decode
// ============================================================================

DecodeResult<Ace> read_ace(io::ByteCursor& cursor, DecodeContext& context) {
    const std::size_t start = cursor.absolute_position();

    if (cursor.remaining() < ACE_HEADER_SIZE) {
        return cursor.overrun(ACE_HEADER_SIZE, "ACE header");
    }
    Ace ace;
    ace.type = static_cast<AceType>(*cursor.read_u8());
    ace.flags = *cursor.read_u8();
    std::uint16_t size = *cursor.read_u16_le();

    if (size < ACE_HEADER_SIZE) {
        return DecodeError{DecodeErrorKind::SizeMismatch,
                           "ACE declares size " + std::to_string(size) +
                               ", smaller than its 4-byte header",
                           start + 2};
    }

    const std::size_t body_size = size - ACE_HEADER_SIZE;
    auto body = cursor.bounded(body_size, DecodeErrorKind::AceBodyOverrun);
    if (!body) {
        return cursor.overrun(body_size, "ACE body");
    }

    switch (ace_body_shape(ace.type)) {
        case AceBodyShape::Basic: {
            auto basic = read_basic_body(*body, ace.type, context);
            if (auto* error = std::get_if<DecodeError>(&basic)) {
                return std::move(*error);
            }
            ace.body = std::move(std::get<AceBasic>(basic));
            break;
        }
        case AceBodyShape::Object: {
            auto object = read_object_body(*body, ace.type, context);
            if (auto* error = std::get_if<DecodeError>(&object)) {
                return std::move(*error);
            }
            ace.body = std::move(std::get<AceObject>(object));
            break;
        }
        case AceBodyShape::Raw:
            ace.body = AceRaw{*body->read_bytes(body_size)};
            break;
    }

    // Курсор сдвигается на объявленный размер, а не на прочитанный
    cursor.skip(body_size);

    if (context.tracing()) {
        context.trace("ACE " + ace_type_to_string(ace.type) + " size " + std::to_string(size) +
                      " at offset " + std::to_string(start));
    }
    return ace;
}

DecodeResult<Ace> decode_ace(const std::uint8_t* data, std::size_t size,
                             const DecodeOptions& options, std::vector<Anomaly>* anomalies) {
    io::ByteCursor cursor(data, size);
    DecodeContext context(options, anomalies);
    return read_ace(cursor, context);
}

DecodeResult<Ace> decode_ace(const std::vector<std::uint8_t>& buffer,
                             const DecodeOptions& options, std::vector<Anomaly>* anomalies) {
    return decode_ace(buffer.data(), buffer.size(), options, anomalies);
}

// ============================================================================
// Encode
// ============================================================================

void write_ace(io::ByteWriter& writer, const Ace& ace) {
    const std::size_t size = ace.encoded_size();
    if (size > 0xFFFF) {
        throw std::length_error("ACE of " + std::to_string(size) +
                                " bytes does not fit the 16-bit size field");
    }

    writer.write_u8(static_cast<std::uint8_t>(ace.type));
    writer.write_u8(ace.flags);
    writer.write_u16_le(static_cast<std::uint16_t>(size));

    if (const auto* basic = ace.as_basic()) {
        writer.write_u32_le(basic->access_mask);
        write_sid(writer, basic->sid);
        writer.write_bytes(basic->application_data);
    } else if (const auto* object = ace.as_object()) {
        writer.write_u32_le(object->access_mask);
        writer.write_u32_le(object->effective_object_flags());
        if (object->object_type) {
            write_guid(writer, *object->object_type);
        }
        if (object->inherited_object_type) {
            write_guid(writer, *object->inherited_object_type);
        }
        write_sid(writer, object->sid);
        writer.write_bytes(object->application_data);
    } else {
        writer.write_bytes(ace.as_raw()->data);
    }
}

std::vector<std::uint8_t> encode_ace(const Ace& ace) {
    io::ByteWriter writer;
    writer.reserve(ace.encoded_size());
    write_ace(writer, ace);
    return writer.take();
}

}  // namespace winstructs::security
