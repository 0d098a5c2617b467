// ==============================================================================
// winstructs/error.hpp - Ошибки и аномалии декодирования
// ==============================================================================
//
// Назначение:
// - Единый набор видов ошибок для всех кодеков (SID, ACE, ACL, SD)
// - DecodeError: жёсткая ошибка, прерывает декодирование структуры
// - Anomaly: нефатальное несоответствие, декодирование продолжается
// - DecodeResult<T>: результат декодирования (значение или ошибка)
//
// Источники повреждённых данных (образы дисков, hive, $Secure) ожидаемы,
// поэтому декодеры никогда не бросают исключений.
//
// ==============================================================================

#ifndef WINSTRUCTS_ERROR_HPP
#define WINSTRUCTS_ERROR_HPP

#include <cstddef>
#include <string>
#include <variant>

namespace winstructs {

// ----------------------------------------------------------------------------
// DecodeErrorKind
// ----------------------------------------------------------------------------

/// Виды ошибок декодирования
enum class DecodeErrorKind {
    OutOfBounds,               // Чтение/seek за пределами буфера
    AceBodyOverrun,            // Тело ACE выходит за объявленный размер
    SizeMismatch,              // Объявленный размер ACL/ACE не совпадает с фактическим
    OffsetControlMismatch,     // Control flags SD не согласуются со смещениями
    InvalidRevision,           // Неизвестная ревизия структуры
    InvalidSubAuthorityCount,  // SID содержит больше 15 sub-authorities
};

/// Преобразовать DecodeErrorKind в строку ("OutOfBounds", ...)
const char* decode_error_kind_to_string(DecodeErrorKind kind);

// ----------------------------------------------------------------------------
// DecodeError - жёсткая ошибка
// ----------------------------------------------------------------------------

/// Ошибка декодирования
struct DecodeError {
    DecodeErrorKind kind = DecodeErrorKind::OutOfBounds;
    std::string message;

    /// Абсолютное смещение в исходном буфере, где обнаружена ошибка
    std::size_t offset = 0;

    /// Форматировать ошибку: "<Kind> at offset <n>: <message>"
    std::string format() const;
};

// ----------------------------------------------------------------------------
// Anomaly - нефатальное несоответствие
// ----------------------------------------------------------------------------

/// Anomaly found while decoding. The structure is still decoded; strict
/// callers may escalate it to a DecodeError (see DecodeOptions).
struct Anomaly {
    DecodeErrorKind kind = DecodeErrorKind::SizeMismatch;
    std::string message;
    std::size_t offset = 0;

    std::string format() const;

    /// Same kind, message and offset as a hard error
    DecodeError to_error() const;
};

// ----------------------------------------------------------------------------
// DecodeResult
// ----------------------------------------------------------------------------

/// Decoded value or the error that stopped decoding
template <typename T>
using DecodeResult = std::variant<T, DecodeError>;

/// true if the result holds a value
template <typename T>
bool succeeded(const DecodeResult<T>& result) {
    return std::holds_alternative<T>(result);
}

}  // namespace winstructs

#endif  // WINSTRUCTS_ERROR_HPP
