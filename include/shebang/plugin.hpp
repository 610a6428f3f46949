#pragma once

#include <shebang/config.hpp>
#include <shebang/file_matching.hpp>
#include <shebang/result.hpp>
#include <shebang/types.hpp>
#include <shebang/util/logger.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace shebang {

/**
 * Identity of the plugin as reported to a host.
 */
struct PluginInfo {
    std::string name;
    std::string version;
    std::string config_key;
    std::string help_url;
    std::string config_schema_url;
    std::optional<std::string> update_url;
};

// Resolved plugin configuration. There are no options.
struct Configuration {};

struct ConfigurationDiagnostic {
    std::string property_name;
    std::string message;
};

struct ResolveConfigurationResult {
    Configuration config;
    std::vector<ConfigurationDiagnostic> diagnostics;
    FileMatchingInfo file_matching;
};

/**
 * Host-facing entry point: plugin metadata, configuration resolution and
 * per-file formatting.
 *
 * Stateless apart from the logger, so a single handler may serve
 * concurrent requests if the logger tolerates it.
 */
class PluginHandler {
public:
    // logger may be null; the handler does not take ownership
    explicit PluginHandler(Logger* logger = nullptr);

    PluginInfo plugin_info() const;

    /**
     * Resolve the plugin's configuration.
     *
     * Every key is ignored. A configuration that is not a JSON object yields
     * a diagnostic and resolves to the default.
     */
    ResolveConfigurationResult resolve_config(const nlohmann::json& config,
                                              const GlobalConfiguration& global) const;

    /**
     * Format one file.
     *
     * @return New file text, nullopt if unchanged, or INVALID_ARGUMENT for a
     *         range outside the text
     */
    FormatResult format(const FormatRequest& request) const;

private:
    Logger* logger_;
    mutable NullLogger null_logger_;

    Logger& log() const { return logger_ ? *logger_ : null_logger_; }
};

void to_json(nlohmann::json& j, const PluginInfo& info);
void to_json(nlohmann::json& j, const Configuration& config);
void to_json(nlohmann::json& j, const ConfigurationDiagnostic& diagnostic);
void to_json(nlohmann::json& j, const FileMatchingInfo& info);
void to_json(nlohmann::json& j, const ResolveConfigurationResult& result);

}  // namespace shebang
