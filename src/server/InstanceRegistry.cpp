#include "devtools-fleet/server/InstanceRegistry.hpp"
#include "devtools-fleet/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <regex>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace dtfleet {

namespace {
const std::regex RECORD_NAME(R"(chrome-(\d{1,5})\.json)");
}

json instance_to_json(const Instance &instance) {
  return json{{"port", instance.port},
              {"pid", instance.pid},
              {"dataDir", instance.data_dir},
              {"logPath", instance.log_path},
              {"browser", instance.browser},
              {"startedAt", instance.started_at},
              {"state", to_string(instance.state)}};
}

Instance instance_from_json(const json &j) {
  Instance instance;
  instance.port = j.at("port").get<uint16_t>();
  instance.pid = j.at("pid").get<ProcessId>();
  instance.data_dir = j.value("dataDir", "");
  instance.log_path = j.value("logPath", "");
  instance.browser = j.value("browser", "");
  instance.started_at = j.value("startedAt", "");
  instance.state = instance_state_from_string(j.value("state", "STARTING"));
  return instance;
}

InstanceRegistry::InstanceRegistry(std::string run_dir)
    : run_dir_(std::move(run_dir)) {}

std::string InstanceRegistry::instances_dir() const {
  return (fs::path(run_dir_) / "instances").string();
}

std::string InstanceRegistry::record_path(uint16_t port) const {
  return (fs::path(instances_dir()) /
          ("chrome-" + std::to_string(port) + ".json"))
      .string();
}

bool InstanceRegistry::save(const Instance &instance) {
  std::error_code ec;
  fs::create_directories(instances_dir(), ec);
  if (ec) {
    LOG_ERROR("REGISTRY", "SAVE", "Cannot create {}: {}", instances_dir(),
              ec.message());
    return false;
  }

  std::string path = record_path(instance.port);
  std::string tmp = path + ".tmp." + std::to_string(getpid());
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      LOG_ERROR("REGISTRY", "SAVE", "Cannot write {}", tmp);
      return false;
    }
    out << instance_to_json(instance).dump(2) << "\n";
    if (!out.good()) {
      LOG_ERROR("REGISTRY", "SAVE", "Short write to {}", tmp);
      out.close();
      fs::remove(tmp, ec);
      return false;
    }
  }

  fs::rename(tmp, path, ec);
  if (ec) {
    LOG_ERROR("REGISTRY", "SAVE", "Cannot rename {} -> {}: {}", tmp, path,
              ec.message());
    fs::remove(tmp, ec);
    return false;
  }

  LOG_DEBUG("REGISTRY", "SAVE", "Port {} PID={} state={}", instance.port,
            instance.pid, to_string(instance.state));
  return true;
}

std::optional<Instance> InstanceRegistry::load(uint16_t port) const {
  std::string path = record_path(port);
  std::ifstream in(path);
  if (!in)
    return std::nullopt;

  try {
    json j = json::parse(in);
    Instance instance = instance_from_json(j);
    if (instance.port != port) {
      LOG_WARN("REGISTRY", "LOAD", "{} records port {}, expected {}", path,
               instance.port, port);
      return std::nullopt;
    }
    return instance;
  } catch (const json::exception &ex) {
    LOG_WARN("REGISTRY", "LOAD", "Unreadable record {}: {}", path, ex.what());
    return std::nullopt;
  }
}

std::vector<Instance> InstanceRegistry::load_all() const {
  std::vector<Instance> instances;
  for (uint16_t port : ports()) {
    if (auto instance = load(port)) {
      instances.push_back(*instance);
    } else {
      LOG_WARN("REGISTRY", "LOAD", "Removing unreadable record for port {}",
               port);
      remove(port);
    }
  }
  return instances;
}

bool InstanceRegistry::remove(uint16_t port) const {
  std::error_code ec;
  fs::remove(record_path(port), ec);
  if (ec) {
    LOG_ERROR("REGISTRY", "REMOVE", "Cannot remove record for port {}: {}",
              port, ec.message());
    return false;
  }
  return true;
}

bool InstanceRegistry::contains(uint16_t port) const {
  std::error_code ec;
  return fs::exists(record_path(port), ec);
}

std::set<uint16_t> InstanceRegistry::ports() const {
  std::set<uint16_t> result;
  std::error_code ec;
  if (!fs::is_directory(instances_dir(), ec))
    return result;

  for (const auto &entry : fs::directory_iterator(instances_dir(), ec)) {
    std::smatch match;
    std::string name = entry.path().filename().string();
    if (!std::regex_match(name, match, RECORD_NAME))
      continue;
    int port = std::stoi(match[1].str());
    if (port > 0 && port <= 65535)
      result.insert(static_cast<uint16_t>(port));
  }
  return result;
}

} // namespace dtfleet
