#pragma once

#include <shebang/result.hpp>
#include <shebang/types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace shebang {

/**
 * Host-wide formatting options. Accepted for compatibility; shebang
 * normalization has no use for any of them.
 */
struct GlobalConfiguration {
    std::optional<uint32_t> line_width;
    std::optional<bool> use_tabs;
    std::optional<uint8_t> indent_width;
    std::optional<std::string> new_line_kind;   // "auto", "lf", "crlf", "system"
};

/**
 * A host configuration file split into its global part and the object
 * under the plugin's config key.
 */
struct HostConfig {
    GlobalConfiguration global;
    nlohmann::json plugin_config = nlohmann::json::object();
};

/**
 * Parse host configuration JSON text.
 *
 * @param json_text Contents of the configuration file
 * @param config_key Key holding the plugin's own configuration
 * @return Parsed configuration, or CONFIG_ERROR
 */
Result<HostConfig> parse_host_config(const std::string& json_text,
                                     const std::string& config_key);

// Read and parse a configuration file (IO_ERROR if unreadable)
Result<HostConfig> load_host_config(const fs::path& path,
                                    const std::string& config_key);

}  // namespace shebang
