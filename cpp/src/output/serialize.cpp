// ==============================================================================
// serialize.cpp - JSON сериализация (RapidJSON)
// ==============================================================================

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <winstructs/serialize.hpp>

namespace winstructs::output {

namespace {

rapidjson::Value make_string(const std::string& text, JsonAllocator& alloc) {
    return rapidjson::Value(text.c_str(), static_cast<rapidjson::SizeType>(text.size()), alloc);
}

void add_string(rapidjson::Value& obj, const char* key, const std::string& text,
                JsonAllocator& alloc) {
    rapidjson::Value value = make_string(text, alloc);
    obj.AddMember(rapidjson::StringRef(key), value, alloc);
}

void add_sid(rapidjson::Value& obj, const char* key, const security::Sid& sid,
             JsonAllocator& alloc) {
    rapidjson::Value value;
    to_json(sid, value, alloc);
    obj.AddMember(rapidjson::StringRef(key), value, alloc);
}

void add_acl(rapidjson::Value& obj, const char* key, const security::Acl& acl,
             JsonAllocator& alloc) {
    rapidjson::Value value;
    to_json(acl, value, alloc);
    obj.AddMember(rapidjson::StringRef(key), value, alloc);
}

std::string render(const rapidjson::Document& doc, const JsonOptions& options) {
    rapidjson::StringBuffer buffer;
    if (options.pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        doc.Accept(writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);
    }
    return std::string(buffer.GetString(), buffer.GetSize());
}

template <typename T>
std::string render_value(const T& value, const JsonOptions& options) {
    rapidjson::Document doc;
    to_json(value, doc, doc.GetAllocator());
    return render(doc, options);
}

}  // namespace

std::string to_hex(const std::vector<std::uint8_t>& bytes) {
    static constexpr char digits[] = "0123456789ABCDEF";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (std::uint8_t b : bytes) {
        result += digits[b >> 4];
        result += digits[b & 0x0F];
    }
    return result;
}

// ============================================================================
// to_json
// ============================================================================

void to_json(const Guid& guid, rapidjson::Value& out, JsonAllocator& alloc) {
    out = make_string(guid.to_string(), alloc);
}

void to_json(const security::Sid& sid, rapidjson::Value& out, JsonAllocator& alloc) {
    out = make_string(sid.to_string(), alloc);
}

void to_json(const security::Ace& ace, rapidjson::Value& out, JsonAllocator& alloc) {
    out.SetObject();
    add_string(out, "type", security::ace_type_to_string(ace.type), alloc);
    add_string(out, "flags", security::ace_flags_to_string(ace.flags), alloc);

    if (const auto* basic = ace.as_basic()) {
        out.AddMember("access_mask", basic->access_mask, alloc);
        add_sid(out, "sid", basic->sid, alloc);
        if (!basic->application_data.empty()) {
            add_string(out, "application_data", to_hex(basic->application_data), alloc);
        }
    } else if (const auto* object = ace.as_object()) {
        out.AddMember("access_mask", object->access_mask, alloc);
        out.AddMember("object_flags", object->effective_object_flags(), alloc);
        if (object->object_type) {
            add_string(out, "object_type", object->object_type->to_string(), alloc);
        }
        if (object->inherited_object_type) {
            add_string(out, "inherited_object_type", object->inherited_object_type->to_string(),
                       alloc);
        }
        add_sid(out, "sid", object->sid, alloc);
        if (!object->application_data.empty()) {
            add_string(out, "application_data", to_hex(object->application_data), alloc);
        }
    } else {
        add_string(out, "data", to_hex(ace.as_raw()->data), alloc);
    }
}

void to_json(const security::Acl& acl, rapidjson::Value& out, JsonAllocator& alloc) {
    out.SetObject();
    out.AddMember("revision", static_cast<unsigned>(acl.revision), alloc);
    out.AddMember("count", static_cast<unsigned>(acl.ace_count()), alloc);

    rapidjson::Value entries(rapidjson::kArrayType);
    for (const auto& ace : acl.entries) {
        rapidjson::Value entry;
        to_json(ace, entry, alloc);
        entries.PushBack(entry, alloc);
    }
    out.AddMember("entries", entries, alloc);
}

void to_json(const security::SecurityDescriptor& sd, rapidjson::Value& out, JsonAllocator& alloc,
             const JsonOptions& options) {
    out.SetObject();
    out.AddMember("revision", static_cast<unsigned>(sd.revision), alloc);
    add_string(out, "control", security::sd_control_flags_to_string(sd.control), alloc);

    if (sd.owner) {
        add_sid(out, "owner", *sd.owner, alloc);
    }
    if (sd.group) {
        add_sid(out, "group", *sd.group, alloc);
    }
    if (sd.sacl && !(options.skip_empty_acls && sd.sacl->entries.empty())) {
        add_acl(out, "sacl", *sd.sacl, alloc);
    }
    if (sd.dacl && !(options.skip_empty_acls && sd.dacl->entries.empty())) {
        add_acl(out, "dacl", *sd.dacl, alloc);
    }
}

// ============================================================================
// to_json_string
// ============================================================================

std::string to_json_string(const Guid& guid, const JsonOptions& options) {
    return render_value(guid, options);
}

std::string to_json_string(const security::Sid& sid, const JsonOptions& options) {
    return render_value(sid, options);
}

std::string to_json_string(const security::Ace& ace, const JsonOptions& options) {
    return render_value(ace, options);
}

std::string to_json_string(const security::Acl& acl, const JsonOptions& options) {
    return render_value(acl, options);
}

std::string to_json_string(const security::SecurityDescriptor& sd, const JsonOptions& options) {
    rapidjson::Document doc;
    to_json(sd, doc, doc.GetAllocator(), options);
    return render(doc, options);
}

}  // namespace winstructs::output
