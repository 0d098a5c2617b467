// ==============================================================================
// winstructs/cursor.hpp - Bounded byte cursor and byte writer
// ==============================================================================
//
// Назначение:
// - Последовательное чтение примитивов (LE/BE) из неизменяемого буфера
// - Проверка границ на каждом чтении, без UB на усечённых данных
// - Абсолютный seek для структур со смещениями (Security Descriptor)
// - Вложенные курсоры с собственной границей (тело ACE)
// - ByteWriter: сериализация примитивов для всех кодировщиков
//
// Endianness is explicit per field: Windows structures are little-endian,
// except the SID identifier authority (48-bit big-endian).
//
// ==============================================================================

#ifndef WINSTRUCTS_CURSOR_HPP
#define WINSTRUCTS_CURSOR_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>
#include <winstructs/error.hpp>

namespace winstructs::io {

// ----------------------------------------------------------------------------
// ByteCursor - чтение с проверкой границ
// ----------------------------------------------------------------------------

/// Read-only cursor over a caller-owned buffer.
/// The buffer must outlive the cursor; the cursor never writes to it.
class ByteCursor {
public:
    /// Cursor over [data, data + size)
    ByteCursor(const std::uint8_t* data, std::size_t size);

    /// Cursor over the whole vector
    explicit ByteCursor(const std::vector<std::uint8_t>& buffer);

    // -------------------------------------------------------------------------
    // Position
    // -------------------------------------------------------------------------

    /// Length of the window this cursor reads from
    std::size_t size() const { return size_; }

    /// Read position, relative to the start of this cursor's window
    std::size_t position() const { return pos_; }

    /// Bytes left before the window end
    std::size_t remaining() const { return size_ - pos_; }

    /// Offset of this cursor's window inside the root buffer
    std::size_t origin() const { return origin_; }

    /// Read position inside the root buffer (used in error offsets)
    std::size_t absolute_position() const { return origin_ + pos_; }

    // -------------------------------------------------------------------------
    // Reads (advance on success, leave the position untouched on failure)
    // -------------------------------------------------------------------------

    std::optional<std::uint8_t> read_u8();
    std::optional<std::uint16_t> read_u16_le();
    std::optional<std::uint32_t> read_u32_le();

    /// 6-byte big-endian value (SID identifier authority)
    std::optional<std::uint64_t> read_u48_be();

    /// Copy of the next n bytes
    std::optional<std::vector<std::uint8_t>> read_bytes(std::size_t n);

    /// Advance by n bytes without copying
    bool skip(std::size_t n);

    /// Reposition to an offset relative to the window start.
    /// Seeking exactly to the end is allowed; beyond it fails.
    bool seek(std::size_t offset);

    // -------------------------------------------------------------------------
    // Sub-cursors
    // -------------------------------------------------------------------------

    /// Cursor over the next `length` bytes (this cursor does not move).
    /// Reads past its end are reported with `overrun_kind`.
    /// @return nullopt if fewer than `length` bytes remain
    std::optional<ByteCursor> bounded(std::size_t length, DecodeErrorKind overrun_kind) const;

    // -------------------------------------------------------------------------
    // Errors
    // -------------------------------------------------------------------------

    /// Kind reported when a read on this cursor runs out of bytes
    DecodeErrorKind overrun_kind() const { return overrun_kind_; }

    /// Error for a failed read of `wanted` bytes of `what` at the current position
    DecodeError overrun(std::size_t wanted, std::string_view what) const;

private:
    ByteCursor(const std::uint8_t* data, std::size_t size, std::size_t origin,
               DecodeErrorKind overrun_kind);

    bool has(std::size_t n) const { return n <= remaining(); }

    const std::uint8_t* data_ = nullptr;
    std::size_t size_ = 0;
    std::size_t pos_ = 0;
    std::size_t origin_ = 0;
    DecodeErrorKind overrun_kind_ = DecodeErrorKind::OutOfBounds;
};

// ----------------------------------------------------------------------------
// ByteWriter - сериализация примитивов
// ----------------------------------------------------------------------------

/// Growable output buffer for encoders
class ByteWriter {
public:
    ByteWriter() = default;

    void reserve(std::size_t n) { bytes_.reserve(n); }

    void write_u8(std::uint8_t value);
    void write_u16_le(std::uint16_t value);
    void write_u32_le(std::uint32_t value);

    /// Low 48 bits of `value`, big-endian
    void write_u48_be(std::uint64_t value);

    void write_bytes(const std::uint8_t* data, std::size_t size);
    void write_bytes(const std::vector<std::uint8_t>& data);

    /// Overwrite a previously written field (position must be inside the buffer)
    void patch_u16_le(std::size_t pos, std::uint16_t value);
    void patch_u32_le(std::size_t pos, std::uint32_t value);

    std::size_t size() const { return bytes_.size(); }
    const std::vector<std::uint8_t>& bytes() const { return bytes_; }

    /// Move the buffer out; the writer is empty afterwards
    std::vector<std::uint8_t> take();

private:
    std::vector<std::uint8_t> bytes_;
};

}  // namespace winstructs::io

#endif  // WINSTRUCTS_CURSOR_HPP
