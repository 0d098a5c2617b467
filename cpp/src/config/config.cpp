// ==============================================================================
// config.cpp - Загрузка YAML профиля (yaml-cpp)
// ==============================================================================

#include <fstream>
#include <set>
#include <string>
#include <winstructs/config.hpp>
#include <yaml-cpp/yaml.h>

namespace winstructs::config {

namespace {

/// Проверить, что узел - mapping и содержит только известные ключи
bool check_section(const YAML::Node& node, const std::string& name,
                   const std::set<std::string>& keys, std::string& error) {
    if (!node.IsMap()) {
        error = "'" + name + "' must be a mapping";
        return false;
    }
    for (const auto& entry : node) {
        auto key = entry.first.as<std::string>();
        if (keys.count(key) == 0) {
            error = "unknown key '" + name + "." + key + "'";
            return false;
        }
    }
    return true;
}

void read_bool(const YAML::Node& section, const char* key, bool& value) {
    if (section[key]) {
        value = section[key].as<bool>();
    }
}

ConfigResult from_node(const YAML::Node& root) {
    ConfigResult result;
    result.ok = false;

    // Пустой документ - все значения по умолчанию
    if (root.IsNull()) {
        result.ok = true;
        return result;
    }
    if (!check_section(root, "profile", {"decode", "output", "json"}, result.error)) {
        return result;
    }

    if (auto decode = root["decode"]) {
        if (!check_section(decode, "decode", {"strict", "enforce_revision"}, result.error)) {
            return result;
        }
        read_bool(decode, "strict", result.config.decode.strict);
        read_bool(decode, "enforce_revision", result.config.decode.enforce_revision);
    }

    if (auto out = root["output"]) {
        if (!check_section(out, "output", {"quiet", "verbose"}, result.error)) {
            return result;
        }
        read_bool(out, "quiet", result.config.output.quiet);
        if (out["verbose"]) {
            int verbose = out["verbose"].as<int>();
            if (verbose < 0) {
                result.error = "'output.verbose' must not be negative";
                return result;
            }
            result.config.output.verbose = verbose;
        }
    }

    if (auto json = root["json"]) {
        if (!check_section(json, "json", {"pretty", "skip_empty_acls"}, result.error)) {
            return result;
        }
        read_bool(json, "pretty", result.config.json.pretty);
        read_bool(json, "skip_empty_acls", result.config.json.skip_empty_acls);
    }

    result.ok = true;
    return result;
}

}  // namespace

ConfigResult load_config(const std::filesystem::path& path) {
    ConfigResult result;
    result.ok = false;

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            result.error = "cannot open config file: " + path.string();
            return result;
        }
        return from_node(YAML::Load(file));

    } catch (const YAML::Exception& e) {
        result.error = std::string("YAML parse error: ") + e.what();
        return result;
    } catch (const std::exception& e) {
        result.error = std::string("error loading config: ") + e.what();
        return result;
    }
}

ConfigResult parse_config(std::string_view text) {
    ConfigResult result;
    result.ok = false;

    try {
        return from_node(YAML::Load(std::string(text)));

    } catch (const YAML::Exception& e) {
        result.error = std::string("YAML parse error: ") + e.what();
        return result;
    } catch (const std::exception& e) {
        result.error = std::string("error loading config: ") + e.what();
        return result;
    }
}

}  // namespace winstructs::config
