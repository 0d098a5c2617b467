// ==============================================================================
// output.cpp - Диагностический вывод
// ==============================================================================
//
// Байты первичны: пишем через fwrite, без std::endl и iostream.
//
// ==============================================================================

#include <winstructs/output.hpp>

namespace winstructs::output {

namespace {

constexpr std::string_view PREFIX_WARN = "[!] ";
constexpr std::string_view PREFIX_ERROR = "[x] ";
constexpr std::string_view PREFIX_DEBUG = "[*] ";
constexpr std::string_view PREFIX_TRACE = "[~] ";

std::string format_with_prefix(std::string_view prefix, std::string_view message) {
    std::string result;
    result.reserve(prefix.size() + message.size() + 1);
    result.append(prefix);
    result.append(message);
    result.push_back('\n');
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {}

Writer::~Writer() {
    flush();
}

void Writer::write_prefixed(std::string_view prefix, std::string_view message) {
    std::string line = format_with_prefix(prefix, message);
    std::fwrite(line.data(), 1, line.size(), sink());
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed(PREFIX_WARN, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются всегда, даже при quiet
    write_prefixed(PREFIX_ERROR, message);
}

void Writer::debug(std::string_view message) {
    if (!debug_enabled()) {
        return;
    }
    write_prefixed(PREFIX_DEBUG, message);
}

void Writer::trace(std::string_view message) {
    if (!trace_enabled()) {
        return;
    }
    write_prefixed(PREFIX_TRACE, message);
}

void Writer::flush() {
    std::fflush(sink());
}

}  // namespace winstructs::output
