// ==============================================================================
// winstructs/serialize.hpp - JSON сериализация структур безопасности
// ==============================================================================
//
// Назначение:
// - Преобразование SID, GUID, ACE, ACL и Security Descriptor в RapidJSON
// - Строковый JSON (compact или pretty) для вывода
//
// Representation:
//   SID, GUID          -> string ("S-1-5-18", "54849625-5478-4994-A5BA-3E3B0328C30D")
//   ACE type           -> name ("ACCESS_ALLOWED")
//   ACE / SD flags     -> "NAME | NAME" or "NONE"
//   raw body, app data -> upper-case hex string
//   absent SID / ACL   -> key omitted
//
// ==============================================================================

#ifndef WINSTRUCTS_SERIALIZE_HPP
#define WINSTRUCTS_SERIALIZE_HPP

#include <cstdint>
#include <rapidjson/document.h>
#include <string>
#include <vector>
#include <winstructs/ace.hpp>
#include <winstructs/acl.hpp>
#include <winstructs/guid.hpp>
#include <winstructs/output.hpp>
#include <winstructs/security_descriptor.hpp>
#include <winstructs/sid.hpp>

namespace winstructs::output {

using JsonAllocator = rapidjson::Document::AllocatorType;

/// "0A1B..." (upper-case, no separators)
std::string to_hex(const std::vector<std::uint8_t>& bytes);

void to_json(const Guid& guid, rapidjson::Value& out, JsonAllocator& alloc);
void to_json(const security::Sid& sid, rapidjson::Value& out, JsonAllocator& alloc);
void to_json(const security::Ace& ace, rapidjson::Value& out, JsonAllocator& alloc);
void to_json(const security::Acl& acl, rapidjson::Value& out, JsonAllocator& alloc);

/// options.skip_empty_acls omits SACL/DACL without entries
void to_json(const security::SecurityDescriptor& sd, rapidjson::Value& out, JsonAllocator& alloc,
             const JsonOptions& options = JsonOptions{});

std::string to_json_string(const Guid& guid, const JsonOptions& options = JsonOptions{});
std::string to_json_string(const security::Sid& sid, const JsonOptions& options = JsonOptions{});
std::string to_json_string(const security::Ace& ace, const JsonOptions& options = JsonOptions{});
std::string to_json_string(const security::Acl& acl, const JsonOptions& options = JsonOptions{});
std::string to_json_string(const security::SecurityDescriptor& sd,
                           const JsonOptions& options = JsonOptions{});

}  // namespace winstructs::output

#endif  // WINSTRUCTS_SERIALIZE_HPP
