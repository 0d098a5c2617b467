// ==============================================================================
// winstructs/config.hpp - YAML профиль параметров декодирования и вывода
// ==============================================================================
//
// Назначение:
// - Загрузка DecodeOptions / OutputConfig / JsonOptions из YAML
// - Отсутствующие ключи оставляют значения по умолчанию
//
// Profile format:
//   decode:
//     strict: false
//     enforce_revision: false
//   output:
//     quiet: false
//     verbose: 0
//   json:
//     pretty: false
//     skip_empty_acls: false
//
// ==============================================================================

#ifndef WINSTRUCTS_CONFIG_HPP
#define WINSTRUCTS_CONFIG_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <winstructs/decode_context.hpp>
#include <winstructs/output.hpp>

namespace winstructs::config {

struct Config {
    DecodeOptions decode;             // decode.log не задаётся профилем
    output::OutputConfig output;
    output::JsonOptions json;
};

struct ConfigResult {
    bool ok = false;
    Config config;
    std::string error;
};

/// Загрузить профиль из YAML файла
/// @return Config или ошибка (файл не открыт, YAML некорректен, неверный тип значения)
ConfigResult load_config(const std::filesystem::path& path);

/// Разобрать профиль из YAML текста
ConfigResult parse_config(std::string_view text);

}  // namespace winstructs::config

#endif  // WINSTRUCTS_CONFIG_HPP
