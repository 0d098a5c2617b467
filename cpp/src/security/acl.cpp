// ==============================================================================
// acl.cpp - Access Control List (ACL) codec
// ==============================================================================

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <winstructs/acl.hpp>

namespace winstructs::security {

std::size_t Acl::encoded_size() const {
    std::size_t size = ACL_HEADER_SIZE;
    for (const auto& ace : entries) {
        size += ace.encoded_size();
    }
    return size;
}

// ============================================================================
// Decode
// ============================================================================

DecodeResult<Acl> read_acl(io::ByteCursor& cursor, DecodeContext& context) {
    const std::size_t start = cursor.absolute_position();
    const std::size_t start_pos = cursor.position();

    if (cursor.remaining() < ACL_HEADER_SIZE) {
        return cursor.overrun(ACL_HEADER_SIZE, "ACL header");
    }

    Acl acl;
    acl.revision = *cursor.read_u8();
    acl.sbz1 = *cursor.read_u8();
    std::uint16_t declared_size = *cursor.read_u16_le();
    std::uint16_t count = *cursor.read_u16_le();
    acl.sbz2 = *cursor.read_u16_le();

    if (acl.revision != ACL_REVISION && acl.revision != ACL_REVISION_DS) {
        auto error = context.flag(Anomaly{DecodeErrorKind::InvalidRevision,
                                          "unknown ACL revision " + std::to_string(acl.revision),
                                          start});
        if (error) {
            return *error;
        }
    }

    context.debug("ACL at offset " + std::to_string(start) + ": size " +
                  std::to_string(declared_size) + ", " + std::to_string(count) + " entries");

    // Итерация строго по счётчику, хвост после последнего ACE не читается.
    // Резерв ограничен числом заголовков ACE, помещающихся в остаток буфера.
    acl.entries.reserve(
        std::min<std::size_t>(count, cursor.remaining() / ACE_HEADER_SIZE));
    for (std::uint16_t i = 0; i < count; ++i) {
        auto ace = read_ace(cursor, context);
        if (auto* error = std::get_if<DecodeError>(&ace)) {
            return std::move(*error);
        }
        acl.entries.push_back(std::move(std::get<Ace>(ace)));
    }

    const std::size_t consumed = cursor.position() - start_pos;
    if (consumed != declared_size) {
        auto error = context.flag(Anomaly{DecodeErrorKind::SizeMismatch,
                                          "ACL declares size " + std::to_string(declared_size) +
                                              " but its header and entries take " +
                                              std::to_string(consumed) + " bytes",
                                          start + 2});
        if (error) {
            return *error;
        }
    }
    return acl;
}

DecodeResult<Acl> decode_acl(const std::uint8_t* data, std::size_t size,
                             const DecodeOptions& options, std::vector<Anomaly>* anomalies) {
    io::ByteCursor cursor(data, size);
    DecodeContext context(options, anomalies);
    return read_acl(cursor, context);
}

DecodeResult<Acl> decode_acl(const std::vector<std::uint8_t>& buffer,
                             const DecodeOptions& options, std::vector<Anomaly>* anomalies) {
    return decode_acl(buffer.data(), buffer.size(), options, anomalies);
}

// ============================================================================
// Encode
// ============================================================================

void write_acl(io::ByteWriter& writer, const Acl& acl) {
    const std::size_t size = acl.encoded_size();
    if (size > 0xFFFF) {
        throw std::length_error("ACL of " + std::to_string(size) +
                                " bytes does not fit the 16-bit size field");
    }
    if (acl.entries.size() > 0xFFFF) {
        throw std::length_error("ACL with " + std::to_string(acl.entries.size()) +
                                " entries does not fit the 16-bit count field");
    }

    writer.write_u8(acl.revision);
    writer.write_u8(acl.sbz1);
    writer.write_u16_le(static_cast<std::uint16_t>(size));
    writer.write_u16_le(static_cast<std::uint16_t>(acl.entries.size()));
    writer.write_u16_le(acl.sbz2);
    for (const auto& ace : acl.entries) {
        write_ace(writer, ace);
    }
}

std::vector<std::uint8_t> encode_acl(const Acl& acl) {
    io::ByteWriter writer;
    writer.reserve(acl.encoded_size());
    write_acl(writer, acl);
    return writer.take();
}

}  // namespace winstructs::security
