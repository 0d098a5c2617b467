// ==============================================================================
// security_descriptor.cpp - Self-relative Security Descriptor codec
// ==============================================================================

#include <algorithm>
#include <cstdio>
#include <utility>
#include <winstructs/security_descriptor.hpp>

namespace winstructs::security {

namespace {

constexpr std::uint16_t PRESENCE_MASK =
    static_cast<std::uint16_t>(SdControlFlags::DaclPresent) |
    static_cast<std::uint16_t>(SdControlFlags::SaclPresent);

/// Проверить смещение компонента и переместить курсор.
/// nullopt - смещение в пределах буфера, курсор на компоненте.
std::optional<DecodeError> seek_component(io::ByteCursor& cursor, std::size_t base,
                                          std::uint32_t offset, const char* what) {
    if (offset >= cursor.size() - base) {
        return DecodeError{DecodeErrorKind::OutOfBounds,
                           std::string(what) + " offset " + std::to_string(offset) +
                               " points outside the " + std::to_string(cursor.size() - base) +
                               "-byte descriptor",
                           cursor.origin() + base};
    }
    cursor.seek(base + offset);
    return std::nullopt;
}

/// Флаг присутствия ACL против ненулевого смещения
std::optional<DecodeError> check_presence(DecodeContext& context,
                                          const SecurityDescriptorHeader& header,
                                          SdControlFlags flag, std::uint32_t offset,
                                          const char* flag_name, std::size_t header_offset) {
    const bool flagged = header.has_control(flag);
    const bool present = offset != 0;
    if (flagged == present) {
        return std::nullopt;
    }
    std::string message = flagged ? std::string(flag_name) + " is set but the offset is zero"
                                   : std::string(flag_name) + " is clear but the offset is " +
                                         std::to_string(offset);
    return context.flag(
        Anomaly{DecodeErrorKind::OffsetControlMismatch, std::move(message), header_offset + 2});
}

}  // namespace

// ============================================================================
// Control flags
// ============================================================================

std::string sd_control_flags_to_string(std::uint16_t control) {
    if (control == 0) {
        return "NONE";
    }

    struct FlagName {
        SdControlFlags flag;
        const char* name;
    };
    static constexpr FlagName names[] = {
        {SdControlFlags::OwnerDefaulted, "SE_OWNER_DEFAULTED"},
        {SdControlFlags::GroupDefaulted, "SE_GROUP_DEFAULTED"},
        {SdControlFlags::DaclPresent, "SE_DACL_PRESENT"},
        {SdControlFlags::DaclDefaulted, "SE_DACL_DEFAULTED"},
        {SdControlFlags::SaclPresent, "SE_SACL_PRESENT"},
        {SdControlFlags::SaclDefaulted, "SE_SACL_DEFAULTED"},
        {SdControlFlags::DaclAutoInheritReq, "SE_DACL_AUTO_INHERIT_REQ"},
        {SdControlFlags::SaclAutoInheritReq, "SE_SACL_AUTO_INHERIT_REQ"},
        {SdControlFlags::DaclAutoInherited, "SE_DACL_AUTO_INHERITED"},
        {SdControlFlags::SaclAutoInherited, "SE_SACL_AUTO_INHERITED"},
        {SdControlFlags::DaclProtected, "SE_DACL_PROTECTED"},
        {SdControlFlags::SaclProtected, "SE_SACL_PROTECTED"},
        {SdControlFlags::RmControlValid, "SE_RM_CONTROL_VALID"},
        {SdControlFlags::SelfRelative, "SE_SELF_RELATIVE"},
    };

    std::string result;
    std::uint16_t known = 0;
    for (const auto& entry : names) {
        auto bit = static_cast<std::uint16_t>(entry.flag);
        known |= bit;
        if (control & bit) {
            if (!result.empty()) {
                result += " | ";
            }
            result += entry.name;
        }
    }

    std::uint16_t unknown = control & static_cast<std::uint16_t>(~known);
    if (unknown != 0) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "0x%04X", static_cast<unsigned>(unknown));
        if (!result.empty()) {
            result += " | ";
        }
        result += buf;
    }
    return result;
}

// ============================================================================
// Header
// ============================================================================

DecodeResult<SecurityDescriptorHeader> read_security_descriptor_header(io::ByteCursor& cursor) {
    if (cursor.remaining() < SD_HEADER_SIZE) {
        return cursor.overrun(SD_HEADER_SIZE, "security descriptor header");
    }

    SecurityDescriptorHeader header;
    header.revision = *cursor.read_u8();
    header.sbz1 = *cursor.read_u8();
    header.control = *cursor.read_u16_le();
    header.owner_offset = *cursor.read_u32_le();
    header.group_offset = *cursor.read_u32_le();
    header.sacl_offset = *cursor.read_u32_le();
    header.dacl_offset = *cursor.read_u32_le();
    return header;
}

DecodeResult<SecurityDescriptorHeader> decode_security_descriptor_header(const std::uint8_t* data,
                                                                         std::size_t size) {
    io::ByteCursor cursor(data, size);
    return read_security_descriptor_header(cursor);
}

DecodeResult<SecurityDescriptorHeader> decode_security_descriptor_header(
    const std::vector<std::uint8_t>& buffer) {
    return decode_security_descriptor_header(buffer.data(), buffer.size());
}

// ============================================================================
// SecurityDescriptor
// ============================================================================

std::uint16_t SecurityDescriptor::effective_control() const {
    std::uint16_t result = control & static_cast<std::uint16_t>(~PRESENCE_MASK);
    if (dacl) {
        result |= static_cast<std::uint16_t>(SdControlFlags::DaclPresent);
    }
    if (sacl) {
        result |= static_cast<std::uint16_t>(SdControlFlags::SaclPresent);
    }
    return result;
}

std::size_t SecurityDescriptor::encoded_size() const {
    std::size_t size = SD_HEADER_SIZE;
    if (owner) {
        size += owner->encoded_size();
    }
    if (group) {
        size += group->encoded_size();
    }
    if (sacl) {
        size += sacl->encoded_size();
    }
    if (dacl) {
        size += dacl->encoded_size();
    }
    return size;
}

// ============================================================================
// Decode
// ============================================================================

DecodeResult<SecurityDescriptor> read_security_descriptor(io::ByteCursor& cursor,
                                                          DecodeContext& context) {
    const std::size_t base = cursor.position();
    const std::size_t start = cursor.absolute_position();

    auto header_result = read_security_descriptor_header(cursor);
    if (auto* error = std::get_if<DecodeError>(&header_result)) {
        return std::move(*error);
    }
    const auto& header = std::get<SecurityDescriptorHeader>(header_result);

    context.debug("security descriptor at offset " + std::to_string(start) + ": control " +
                  sd_control_flags_to_string(header.control) + ", owner " +
                  std::to_string(header.owner_offset) + ", group " +
                  std::to_string(header.group_offset) + ", SACL " +
                  std::to_string(header.sacl_offset) + ", DACL " +
                  std::to_string(header.dacl_offset));

    SecurityDescriptor sd;
    sd.revision = header.revision;
    sd.sbz1 = header.sbz1;
    sd.control = header.control;

    if (header.revision != SD_REVISION) {
        auto error = context.flag(Anomaly{DecodeErrorKind::InvalidRevision,
                                          "unknown security descriptor revision " +
                                              std::to_string(header.revision),
                                          start});
        if (error) {
            return *error;
        }
    }

    if (auto error = check_presence(context, header, SdControlFlags::SaclPresent,
                                    header.sacl_offset, "SE_SACL_PRESENT", start)) {
        return *error;
    }
    if (auto error = check_presence(context, header, SdControlFlags::DaclPresent,
                                    header.dacl_offset, "SE_DACL_PRESENT", start)) {
        return *error;
    }

    // Курсор после заголовка или после самого дальнего компонента
    std::size_t end = cursor.position();

    if (header.owner_offset != 0) {
        if (auto error = seek_component(cursor, base, header.owner_offset, "owner SID")) {
            return *error;
        }
        auto owner = read_sid(cursor, context);
        if (auto* error = std::get_if<DecodeError>(&owner)) {
            return std::move(*error);
        }
        sd.owner = std::move(std::get<Sid>(owner));
        end = std::max(end, cursor.position());
    }

    if (header.group_offset != 0) {
        if (auto error = seek_component(cursor, base, header.group_offset, "group SID")) {
            return *error;
        }
        auto group = read_sid(cursor, context);
        if (auto* error = std::get_if<DecodeError>(&group)) {
            return std::move(*error);
        }
        sd.group = std::move(std::get<Sid>(group));
        end = std::max(end, cursor.position());
    }

    if (header.sacl_offset != 0) {
        if (auto error = seek_component(cursor, base, header.sacl_offset, "SACL")) {
            return *error;
        }
        auto sacl = read_acl(cursor, context);
        if (auto* error = std::get_if<DecodeError>(&sacl)) {
            return std::move(*error);
        }
        sd.sacl = std::move(std::get<Acl>(sacl));
        end = std::max(end, cursor.position());
    }

    if (header.dacl_offset != 0) {
        if (auto error = seek_component(cursor, base, header.dacl_offset, "DACL")) {
            return *error;
        }
        auto dacl = read_acl(cursor, context);
        if (auto* error = std::get_if<DecodeError>(&dacl)) {
            return std::move(*error);
        }
        sd.dacl = std::move(std::get<Acl>(dacl));
        end = std::max(end, cursor.position());
    }

    cursor.seek(end);
    return sd;
}

DecodeResult<SecurityDescriptor> decode_security_descriptor(const std::uint8_t* data,
                                                            std::size_t size,
                                                            const DecodeOptions& options,
                                                            std::vector<Anomaly>* anomalies) {
    io::ByteCursor cursor(data, size);
    DecodeContext context(options, anomalies);
    return read_security_descriptor(cursor, context);
}

DecodeResult<SecurityDescriptor> decode_security_descriptor(
    const std::vector<std::uint8_t>& buffer, const DecodeOptions& options,
    std::vector<Anomaly>* anomalies) {
    return decode_security_descriptor(buffer.data(), buffer.size(), options, anomalies);
}

// ============================================================================
// Encode
// ============================================================================

void write_security_descriptor(io::ByteWriter& writer, const SecurityDescriptor& sd) {
    const std::size_t base = writer.size();

    writer.write_u8(sd.revision);
    writer.write_u8(sd.sbz1);
    writer.write_u16_le(sd.effective_control());
    // Смещения заполняются после записи компонентов
    writer.write_u32_le(0);
    writer.write_u32_le(0);
    writer.write_u32_le(0);
    writer.write_u32_le(0);

    auto current_offset = [&writer, base]() {
        return static_cast<std::uint32_t>(writer.size() - base);
    };

    if (sd.owner) {
        writer.patch_u32_le(base + 4, current_offset());
        write_sid(writer, *sd.owner);
    }
    if (sd.group) {
        writer.patch_u32_le(base + 8, current_offset());
        write_sid(writer, *sd.group);
    }
    if (sd.sacl) {
        writer.patch_u32_le(base + 12, current_offset());
        write_acl(writer, *sd.sacl);
    }
    if (sd.dacl) {
        writer.patch_u32_le(base + 16, current_offset());
        write_acl(writer, *sd.dacl);
    }
}

std::vector<std::uint8_t> encode_security_descriptor(const SecurityDescriptor& sd) {
    io::ByteWriter writer;
    writer.reserve(sd.encoded_size());
    write_security_descriptor(writer, sd);
    return writer.take();
}

}  // namespace winstructs::security
