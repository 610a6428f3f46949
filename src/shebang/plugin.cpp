#include <shebang/plugin.hpp>
#include <shebang/formatter.hpp>

namespace shebang {

namespace {

constexpr const char* PLUGIN_NAME = "shebang-fmt";
constexpr const char* CONFIG_KEY = "shebang";

std::optional<std::string> unchanged() {
    return std::nullopt;
}

}  // namespace

PluginHandler::PluginHandler(Logger* logger) : logger_(logger) {}

PluginInfo PluginHandler::plugin_info() const {
    PluginInfo info;
    info.name = PLUGIN_NAME;
    info.version = SHEBANG_VERSION;
    info.config_key = CONFIG_KEY;
    info.help_url = SHEBANG_HELP_URL;
    info.config_schema_url = "";
    // An empty build setting means the plugin has no update channel
    std::string update_url = SHEBANG_UPDATE_URL;
    if (!update_url.empty()) {
        info.update_url = update_url;
    }
    return info;
}

ResolveConfigurationResult PluginHandler::resolve_config(
    const nlohmann::json& config,
    const GlobalConfiguration& /* global */) const {

    ResolveConfigurationResult result;
    result.file_matching = FileMatchingInfo::defaults();

    if (!config.is_null() && !config.is_object()) {
        result.diagnostics.push_back({
            CONFIG_KEY,
            std::string("Expected an object, got ") + config.type_name()
        });
    }

    return result;
}

FormatResult PluginHandler::format(const FormatRequest& request) const {
    const std::string& text = request.file_text;
    const std::string path = request.file_path.string();

    if (request.range) {
        const TextRange& range = *request.range;
        if (range.start > range.end || range.end > text.size()) {
            return Error(ErrorCode::INVALID_ARGUMENT,
                         "Range [" + std::to_string(range.start) + ", " +
                         std::to_string(range.end) + ") is outside " +
                         std::to_string(text.size()) + " bytes of " + path);
        }
        if (range.start != 0) {
            log().debug(path + ": range does not cover the first line, skipping");
            return unchanged();
        }
    }

    auto line = ShebangFormatter::parse(text);
    if (!line) {
        log().debug(path + ": no shebang line");
        return unchanged();
    }

    // The whole shebang line must lie inside the range
    if (request.range && request.range->end < line->line_end) {
        log().debug(path + ": range ends inside the shebang line, skipping");
        return unchanged();
    }

    std::string formatted = line->to_string() + text.substr(line->line_end);
    if (formatted == text) {
        log().debug(path + ": already formatted");
        return unchanged();
    }

    log().debug(path + ": normalized shebang to '" + line->to_string() + "'");
    return std::optional<std::string>(std::move(formatted));
}

void to_json(nlohmann::json& j, const PluginInfo& info) {
    j = nlohmann::json{
        {"name", info.name},
        {"version", info.version},
        {"configKey", info.config_key},
        {"helpUrl", info.help_url},
        {"configSchemaUrl", info.config_schema_url},
    };
    if (info.update_url) {
        j["updateUrl"] = *info.update_url;
    } else {
        j["updateUrl"] = nullptr;
    }
}

void to_json(nlohmann::json& j, const Configuration& /* config */) {
    j = nlohmann::json::object();
}

void to_json(nlohmann::json& j, const ConfigurationDiagnostic& diagnostic) {
    j = nlohmann::json{
        {"propertyName", diagnostic.property_name},
        {"message", diagnostic.message},
    };
}

void to_json(nlohmann::json& j, const FileMatchingInfo& info) {
    j = nlohmann::json{
        {"fileExtensions", info.file_extensions},
        {"fileNames", info.file_names},
    };
}

void to_json(nlohmann::json& j, const ResolveConfigurationResult& result) {
    j = nlohmann::json{
        {"config", result.config},
        {"diagnostics", result.diagnostics},
        {"fileMatching", result.file_matching},
    };
}

}  // namespace shebang
