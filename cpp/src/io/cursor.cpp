// ==============================================================================
// cursor.cpp - Реализация ByteCursor и ByteWriter
// ==============================================================================

#include <stdexcept>
#include <string>
#include <utility>
#include <winstructs/cursor.hpp>

namespace winstructs::io {

// ============================================================================
// ByteCursor
// ============================================================================

ByteCursor::ByteCursor(const std::uint8_t* data, std::size_t size)
    : ByteCursor(data, size, 0, DecodeErrorKind::OutOfBounds) {}

ByteCursor::ByteCursor(const std::vector<std::uint8_t>& buffer)
    : ByteCursor(buffer.data(), buffer.size()) {}

ByteCursor::ByteCursor(const std::uint8_t* data, std::size_t size, std::size_t origin,
                       DecodeErrorKind overrun_kind)
    : data_(data), size_(data != nullptr ? size : 0), origin_(origin), overrun_kind_(overrun_kind) {}

std::optional<std::uint8_t> ByteCursor::read_u8() {
    if (!has(1)) {
        return std::nullopt;
    }
    return data_[pos_++];
}

std::optional<std::uint16_t> ByteCursor::read_u16_le() {
    if (!has(2)) {
        return std::nullopt;
    }
    const std::uint8_t* p = data_ + pos_;
    pos_ += 2;
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::optional<std::uint32_t> ByteCursor::read_u32_le() {
    if (!has(4)) {
        return std::nullopt;
    }
    const std::uint8_t* p = data_ + pos_;
    pos_ += 4;
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

std::optional<std::uint64_t> ByteCursor::read_u48_be() {
    if (!has(6)) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < 6; ++i) {
        value = (value << 8) | data_[pos_ + i];
    }
    pos_ += 6;
    return value;
}

std::optional<std::vector<std::uint8_t>> ByteCursor::read_bytes(std::size_t n) {
    if (!has(n)) {
        return std::nullopt;
    }
    std::vector<std::uint8_t> out(data_ + pos_, data_ + pos_ + n);
    pos_ += n;
    return out;
}

bool ByteCursor::skip(std::size_t n) {
    if (!has(n)) {
        return false;
    }
    pos_ += n;
    return true;
}

bool ByteCursor::seek(std::size_t offset) {
    if (offset > size_) {
        return false;
    }
    pos_ = offset;
    return true;
}

std::optional<ByteCursor> ByteCursor::bounded(std::size_t length,
                                              DecodeErrorKind overrun_kind) const {
    if (!has(length)) {
        return std::nullopt;
    }
    return ByteCursor(data_ + pos_, length, origin_ + pos_, overrun_kind);
}

DecodeError ByteCursor::overrun(std::size_t wanted, std::string_view what) const {
    std::string message = "need ";
    message += std::to_string(wanted);
    message += " bytes for ";
    message += what;
    message += ", ";
    message += std::to_string(remaining());
    message += " left";
    return DecodeError{overrun_kind_, std::move(message), absolute_position()};
}

// ============================================================================
// ByteWriter
// ============================================================================

void ByteWriter::write_u8(std::uint8_t value) {
    bytes_.push_back(value);
}

void ByteWriter::write_u16_le(std::uint16_t value) {
    bytes_.push_back(static_cast<std::uint8_t>(value & 0xFF));
    bytes_.push_back(static_cast<std::uint8_t>(value >> 8));
}

void ByteWriter::write_u32_le(std::uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        bytes_.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
    }
}

void ByteWriter::write_u48_be(std::uint64_t value) {
    for (int shift = 40; shift >= 0; shift -= 8) {
        bytes_.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
    }
}

void ByteWriter::write_bytes(const std::uint8_t* data, std::size_t size) {
    if (size == 0) {
        return;
    }
    bytes_.insert(bytes_.end(), data, data + size);
}

void ByteWriter::write_bytes(const std::vector<std::uint8_t>& data) {
    bytes_.insert(bytes_.end(), data.begin(), data.end());
}

void ByteWriter::patch_u16_le(std::size_t pos, std::uint16_t value) {
    if (pos + 2 > bytes_.size()) {
        throw std::out_of_range("patch_u16_le past end of buffer");
    }
    bytes_[pos] = static_cast<std::uint8_t>(value & 0xFF);
    bytes_[pos + 1] = static_cast<std::uint8_t>(value >> 8);
}

void ByteWriter::patch_u32_le(std::size_t pos, std::uint32_t value) {
    if (pos + 4 > bytes_.size()) {
        throw std::out_of_range("patch_u32_le past end of buffer");
    }
    for (std::size_t i = 0; i < 4; ++i) {
        bytes_[pos + i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF);
    }
}

std::vector<std::uint8_t> ByteWriter::take() {
    std::vector<std::uint8_t> out = std::move(bytes_);
    bytes_.clear();
    return out;
}

}  // namespace winstructs::io
