// ==============================================================================
// winstructs/output.hpp - Диагностический вывод и параметры JSON
// ==============================================================================
//
// Назначение:
// - Единая точка записи диагностических сообщений библиотеки
// - Уровни: warn "[!]", error "[x]", debug "[*]", trace "[~]"
// - quiet подавляет warn, verbose включает debug (>=1) и trace (>=2)
// - Параметры JSON сериализации (JsonOptions)
//
// The library itself never writes to stdout/stderr on its own: decoders only
// log through a Writer the caller passes in DecodeOptions.
//
// ==============================================================================

#ifndef WINSTRUCTS_OUTPUT_HPP
#define WINSTRUCTS_OUTPUT_HPP

#include <cstdio>
#include <string>
#include <string_view>

namespace winstructs::output {

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;  // подавить warn
    int verbose = 0;     // уровень подробности (0..2+)

    /// Поток для сообщений (nullptr = stderr)
    std::FILE* sink = nullptr;
};

// ----------------------------------------------------------------------------
// Параметры JSON сериализации
// ----------------------------------------------------------------------------

struct JsonOptions {
    bool pretty = false;           // отступы и переводы строк
    bool skip_empty_acls = false;  // не выводить ACL без записей
};

// ----------------------------------------------------------------------------
// Writer - диагностический вывод
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /// "[!] <message>" (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" (всегда)
    void error(std::string_view message);

    /// "[*] <message>" (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" (только при verbose > 1)
    void trace(std::string_view message);

    /// true if debug() produces output
    bool debug_enabled() const { return config_.verbose > 0; }

    /// true if trace() produces output
    bool trace_enabled() const { return config_.verbose > 1; }

    void flush();

private:
    void write_prefixed(std::string_view prefix, std::string_view message);

    std::FILE* sink() const { return config_.sink != nullptr ? config_.sink : stderr; }

    OutputConfig config_;
};

}  // namespace winstructs::output

#endif  // WINSTRUCTS_OUTPUT_HPP
