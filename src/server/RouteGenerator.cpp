#include "devtools-fleet/server/RouteGenerator.hpp"
#include "devtools-fleet/Logger.hpp"
#include "devtools-fleet/ipc/FileLock.hpp"
#include "devtools-fleet/server/ProxyEngine.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace dtfleet {

namespace {

const std::regex ROUTE_NAME(R"(chrome-proxy-(\d{1,5})\.conf)");

std::optional<std::string> read_file(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    return std::nullopt;
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

// Write through a hidden temporary so the proxy never includes a partial file
bool write_file_atomic(const std::string &path, const std::string &content) {
  fs::path target(path);
  fs::path tmp = target.parent_path() /
                 ("." + target.filename().string() + ".tmp." +
                  std::to_string(getpid()));
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out)
      return false;
    out << content;
    if (!out.good())
      return false;
  }
  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (ec) {
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

} // namespace

RouteGenerator::RouteGenerator(const FleetConfig &config,
                               std::shared_ptr<ProxyEngine> engine)
    : config_(config), engine_(std::move(engine)) {}

std::string RouteGenerator::render(
    const std::string &template_text,
    const std::map<std::string, std::string> &vars) {
  std::string out;
  out.reserve(template_text.size());

  size_t pos = 0;
  while (pos < template_text.size()) {
    auto open = template_text.find("{{", pos);
    if (open == std::string::npos) {
      out.append(template_text, pos, std::string::npos);
      break;
    }
    auto close = template_text.find("}}", open + 2);
    if (close == std::string::npos) {
      out.append(template_text, pos, std::string::npos);
      break;
    }

    out.append(template_text, pos, open - pos);
    std::string name = template_text.substr(open + 2, close - open - 2);
    auto it = vars.find(name);
    if (it != vars.end()) {
      out += it->second;
    } else {
      out.append(template_text, open, close + 2 - open);
    }
    pos = close + 2;
  }
  return out;
}

uint32_t RouteGenerator::proxy_port(uint16_t port) const {
  return uint32_t(port) +
         static_cast<uint32_t>(std::max(0, config_.proxy.listen_port_offset));
}

std::map<std::string, std::string>
RouteGenerator::variables_for(uint16_t port) const {
  return {{"PORT", std::to_string(port)},
          {"PROXY_PORT", std::to_string(proxy_port(port))},
          {"UPSTREAM_HOST", config_.proxy.upstream_host}};
}

std::string RouteGenerator::route_path(uint16_t port) const {
  return (fs::path(config_.proxy.conf_dir) /
          ("chrome-proxy-" + std::to_string(port) + ".conf"))
      .string();
}

std::string RouteGenerator::lock_path() const {
  return (fs::path(config_.paths.run_dir) / "routes.lock").string();
}

bool RouteGenerator::has_route(uint16_t port) const {
  std::error_code ec;
  return fs::exists(route_path(port), ec);
}

std::vector<RouteRecord> RouteGenerator::list_routes() const {
  std::vector<RouteRecord> routes;
  std::error_code ec;
  if (!fs::is_directory(config_.proxy.conf_dir, ec))
    return routes;

  for (const auto &entry : fs::directory_iterator(config_.proxy.conf_dir, ec)) {
    std::smatch match;
    std::string name = entry.path().filename().string();
    if (!std::regex_match(name, match, ROUTE_NAME))
      continue;
    int port = std::stoi(match[1].str());
    if (port < 1 || port > 65535)
      continue;
    routes.push_back({static_cast<uint16_t>(port), entry.path().string(), true});
  }
  std::sort(routes.begin(), routes.end(),
            [](const RouteRecord &a, const RouteRecord &b) {
              return a.port < b.port;
            });
  return routes;
}

OperationResult RouteGenerator::activate(uint16_t port) {
  try {
    config_.check_route_port(port);
  } catch (const ConfigError &ex) {
    auto result = OperationResult::failure(FleetError::InvalidArgument, ex.what());
    LOG_ERROR("ROUTE", "PORT", "{}", result.message);
    return result;
  }

  ipc::ScopedFileLock lock(lock_path(), config_.proxy.command_timeout * 2);
  if (!lock.locked()) {
    return OperationResult::failure(
        FleetError::ValidationFailed,
        fmt::format("Port {}: cannot lock route set", port));
  }

  auto template_text = read_file(config_.proxy.template_path);
  if (!template_text) {
    auto result = OperationResult::failure(
        FleetError::TemplateMissing,
        fmt::format("Port {}: template {} not readable", port,
                    config_.proxy.template_path));
    LOG_ERROR("ROUTE", "TEMPLATE", "{}", result.message);
    return result;
  }

  std::string rendered = render(*template_text, variables_for(port));
  if (rendered.find("{{") != std::string::npos) {
    LOG_WARN("ROUTE", "RENDER", "Unresolved placeholder in route for port {}",
             port);
  }

  std::error_code ec;
  fs::create_directories(config_.proxy.conf_dir, ec);

  const std::string path = route_path(port);
  std::optional<std::string> backup = read_file(path);
  if (backup) {
    LOG_INFO("ROUTE", "BACKUP", "Replacing existing route for port {}", port);
  }

  if (!write_file_atomic(path, rendered)) {
    auto result = OperationResult::failure(
        FleetError::ValidationFailed,
        fmt::format("Port {}: cannot write {}", port, path));
    LOG_ERROR("ROUTE", "WRITE", "{}", result.message);
    return result;
  }

  auto validation = engine_->validate();
  if (!validation.success) {
    if (backup) {
      if (!write_file_atomic(path, *backup)) {
        LOG_ERROR("ROUTE", "ROLLBACK", "Cannot restore previous route {}",
                  path);
      }
    } else {
      fs::remove(path, ec);
      if (ec) {
        LOG_ERROR("ROUTE", "ROLLBACK", "Cannot remove rejected route {}: {}",
                  path, ec.message());
      }
    }
    auto result = OperationResult::failure(
        FleetError::ValidationFailed,
        fmt::format("Port {}: proxy rejected route: {}", port,
                    validation.message));
    LOG_ERROR("ROUTE", "VALIDATE", "{}", result.message);
    return result;
  }

  auto reload = engine_->reload();
  if (!reload.success) {
    // The file is valid and stays for the next successful reload
    auto result = OperationResult::failure(
        FleetError::ReloadFailed,
        fmt::format("Port {}: route written but reload failed: {}", port,
                    reload.message));
    LOG_ERROR("ROUTE", "RELOAD", "{}", result.message);
    return result;
  }

  LOG_INFO("ROUTE", "ACTIVATE", "Route for port {} active on {}", port,
           proxy_port(port));
  return OperationResult::ok(
      fmt::format("Route {} active (listen {})", path, proxy_port(port)));
}

OperationResult RouteGenerator::deactivate(uint16_t port) {
  ipc::ScopedFileLock lock(lock_path(), config_.proxy.command_timeout * 2);
  if (!lock.locked()) {
    return OperationResult::failure(
        FleetError::ValidationFailed,
        fmt::format("Port {}: cannot lock route set", port));
  }

  const std::string path = route_path(port);
  auto removed = read_file(path);
  if (!removed) {
    LOG_DEBUG("ROUTE", "DEACTIVATE", "No route for port {}", port);
    return OperationResult::ok(fmt::format("No route for port {}", port));
  }

  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    return OperationResult::failure(
        FleetError::ValidationFailed,
        fmt::format("Port {}: cannot remove {}: {}", port, path, ec.message()));
  }

  auto validation = engine_->validate();
  if (!validation.success) {
    if (!write_file_atomic(path, *removed)) {
      LOG_ERROR("ROUTE", "ROLLBACK", "Cannot restore {}", path);
    }
    auto result = OperationResult::failure(
        FleetError::ValidationFailed,
        fmt::format("Port {}: configuration invalid without route, restored: "
                    "{}",
                    port, validation.message));
    LOG_ERROR("ROUTE", "DEACTIVATE", "{}", result.message);
    return result;
  }

  auto reload = engine_->reload();
  if (!reload.success) {
    auto result = OperationResult::failure(
        FleetError::ReloadFailed,
        fmt::format("Port {}: route removed but reload failed: {}", port,
                    reload.message));
    LOG_ERROR("ROUTE", "RELOAD", "{}", result.message);
    return result;
  }

  LOG_INFO("ROUTE", "DEACTIVATE", "Route for port {} removed", port);
  return OperationResult::ok(fmt::format("Route for port {} removed", port));
}

OperationResult RouteGenerator::deactivate_all() {
  ipc::ScopedFileLock lock(lock_path(), config_.proxy.command_timeout * 2);
  if (!lock.locked()) {
    return OperationResult::failure(FleetError::ValidationFailed,
                                    "Cannot lock route set");
  }

  std::vector<std::pair<std::string, std::string>> removed;
  for (const auto &route : list_routes()) {
    auto content = read_file(route.config_path);
    std::error_code ec;
    fs::remove(route.config_path, ec);
    if (ec || !content) {
      LOG_WARN("ROUTE", "DEACTIVATE_ALL", "Cannot remove {}",
               route.config_path);
      continue;
    }
    removed.emplace_back(route.config_path, *content);
  }

  if (removed.empty()) {
    return OperationResult::ok("No routes to remove");
  }

  auto validation = engine_->validate();
  if (!validation.success) {
    for (const auto &[path, content] : removed) {
      if (!write_file_atomic(path, content)) {
        LOG_ERROR("ROUTE", "ROLLBACK", "Cannot restore {}", path);
      }
    }
    auto result = OperationResult::failure(
        FleetError::ValidationFailed,
        fmt::format("Configuration invalid after removing {} routes, "
                    "restored: {}",
                    removed.size(), validation.message));
    LOG_ERROR("ROUTE", "DEACTIVATE_ALL", "{}", result.message);
    return result;
  }

  auto reload = engine_->reload();
  if (!reload.success) {
    auto result = OperationResult::failure(
        FleetError::ReloadFailed,
        fmt::format("Routes removed but reload failed: {}", reload.message));
    LOG_ERROR("ROUTE", "RELOAD", "{}", result.message);
    return result;
  }

  LOG_INFO("ROUTE", "DEACTIVATE_ALL", "Removed {} routes", removed.size());
  return OperationResult::ok(fmt::format("Removed {} routes", removed.size()));
}

OperationResult RouteGenerator::validate_current() {
  ipc::ScopedFileLock lock(lock_path(), config_.proxy.command_timeout * 2);
  if (!lock.locked()) {
    return OperationResult::failure(FleetError::ValidationFailed,
                                    "Cannot lock route set");
  }
  return engine_->validate();
}

} // namespace dtfleet
