#include <shebang/config.hpp>

#include <fstream>
#include <limits>
#include <sstream>

namespace shebang {

namespace {

Error type_error(const std::string& key, const char* expected) {
    return Error(ErrorCode::CONFIG_ERROR,
                 "'" + key + "' must be " + expected);
}

}  // namespace

Result<HostConfig> parse_host_config(const std::string& json_text,
                                     const std::string& config_key) {
    nlohmann::json root;
    try {
        // Host configuration files are JSON with comments
        root = nlohmann::json::parse(json_text, nullptr, true, true);
    } catch (const nlohmann::json::parse_error& e) {
        return Error(ErrorCode::CONFIG_ERROR, std::string("Invalid JSON: ") + e.what());
    }

    if (!root.is_object()) {
        return Error(ErrorCode::CONFIG_ERROR, "Configuration must be a JSON object");
    }

    HostConfig config;

    if (root.contains("lineWidth")) {
        const auto& value = root["lineWidth"];
        if (!value.is_number_unsigned() ||
            value.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
            return type_error("lineWidth", "a non-negative integer");
        }
        config.global.line_width = value.get<uint32_t>();
    }

    if (root.contains("useTabs")) {
        const auto& value = root["useTabs"];
        if (!value.is_boolean()) {
            return type_error("useTabs", "a boolean");
        }
        config.global.use_tabs = value.get<bool>();
    }

    if (root.contains("indentWidth")) {
        const auto& value = root["indentWidth"];
        if (!value.is_number_unsigned() || value.get<uint64_t>() > 255) {
            return type_error("indentWidth", "an integer between 0 and 255");
        }
        config.global.indent_width = static_cast<uint8_t>(value.get<uint64_t>());
    }

    if (root.contains("newLineKind")) {
        const auto& value = root["newLineKind"];
        if (!value.is_string()) {
            return type_error("newLineKind", "a string");
        }
        config.global.new_line_kind = value.get<std::string>();
    }

    if (root.contains(config_key)) {
        config.plugin_config = root[config_key];
    }

    return config;
}

Result<HostConfig> load_host_config(const fs::path& path,
                                    const std::string& config_key) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error(ErrorCode::IO_ERROR, "Cannot open config file: " + path.string());
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.fail() && !file.eof()) {
        return Error(ErrorCode::IO_ERROR, "Cannot read config file: " + path.string());
    }

    auto result = parse_host_config(ss.str(), config_key);
    if (!result.ok()) {
        return Error(result.error().code(),
                     path.string() + ": " + result.error().message());
    }
    return result;
}

}  // namespace shebang
