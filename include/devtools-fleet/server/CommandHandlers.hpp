#pragma once

#include <nlohmann/json.hpp>

namespace dtfleet {
namespace server {

/// Command handlers behind the CLI.
///
/// Each handler accepts a JSON `params` object (mirrors CLI args) and fills
/// `out` with a JSON response containing at least {"ok": true|false}.
/// Handlers return the process exit code.
///
/// Common params: "config_path" (YAML file, optional), "log_level",
/// "range" ("START-END", optional).
int handle_start(const nlohmann::json &params, nlohmann::json &out);
int handle_stop(const nlohmann::json &params, nlohmann::json &out);
int handle_stop_all(const nlohmann::json &params, nlohmann::json &out);
int handle_list(const nlohmann::json &params, nlohmann::json &out);
int handle_health(const nlohmann::json &params, nlohmann::json &out);
int handle_generate_config(const nlohmann::json &params, nlohmann::json &out);

} // namespace server
} // namespace dtfleet
