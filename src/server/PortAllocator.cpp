#include "devtools-fleet/server/PortAllocator.hpp"
#include "devtools-fleet/Logger.hpp"
#include "devtools-fleet/ipc/FileLock.hpp"
#include "devtools-fleet/server/InstanceRegistry.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <netinet/in.h>
#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace dtfleet {

namespace {

bool owner_alive(ProcessId pid) {
  if (pid <= 0)
    return false;
  return kill(pid, 0) == 0 || errno == EPERM;
}

} // namespace

// ---------------------------------------------------------------------------
// ReservationTable
// ---------------------------------------------------------------------------

ReservationTable::ReservationTable(std::string run_dir)
    : run_dir_(std::move(run_dir)) {}

std::string ReservationTable::table_path() const {
  return (fs::path(run_dir_) / "reservations.json").string();
}

std::string ReservationTable::lock_path() const {
  return (fs::path(run_dir_) / "reservations.lock").string();
}

std::vector<ReservationEntry> ReservationTable::load_locked() const {
  std::vector<ReservationEntry> entries;
  std::ifstream in(table_path());
  if (!in)
    return entries;

  try {
    json j = json::parse(in);
    for (const auto &item : j.value("claims", json::array())) {
      ReservationEntry entry;
      entry.port = item.at("port").get<uint16_t>();
      entry.owner_pid = item.at("ownerPid").get<ProcessId>();
      entry.claimed_at = item.value("claimedAt", "");
      if (owner_alive(entry.owner_pid)) {
        entries.push_back(entry);
      } else {
        LOG_DEBUG("PORT", "STALE_CLAIM", "Dropping claim on {} (owner {} gone)",
                  entry.port, entry.owner_pid);
      }
    }
  } catch (const json::exception &ex) {
    LOG_WARN("PORT", "TABLE", "Discarding unreadable {}: {}", table_path(),
             ex.what());
    entries.clear();
  }
  return entries;
}

bool ReservationTable::save_locked(
    const std::vector<ReservationEntry> &entries) const {
  json claims = json::array();
  for (const auto &entry : entries) {
    claims.push_back({{"port", entry.port},
                      {"ownerPid", entry.owner_pid},
                      {"claimedAt", entry.claimed_at}});
  }

  std::string tmp = table_path() + ".tmp." + std::to_string(getpid());
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      LOG_ERROR("PORT", "TABLE", "Cannot write {}", tmp);
      return false;
    }
    out << json{{"claims", claims}}.dump(2) << "\n";
  }
  std::error_code ec;
  fs::rename(tmp, table_path(), ec);
  if (ec) {
    LOG_ERROR("PORT", "TABLE", "Cannot replace {}: {}", table_path(),
              ec.message());
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

std::set<uint16_t> ReservationTable::claimed_ports() const {
  std::set<uint16_t> ports;
  ipc::ScopedFileLock lock(lock_path());
  if (!lock.locked())
    return ports;
  for (const auto &entry : load_locked())
    ports.insert(entry.port);
  return ports;
}

bool ReservationTable::release(uint16_t port, ProcessId owner) const {
  ipc::ScopedFileLock lock(lock_path());
  if (!lock.locked()) {
    LOG_ERROR("PORT", "RELEASE", "Cannot lock table to release port {}", port);
    return false;
  }

  auto entries = load_locked();
  auto before = entries.size();
  entries.erase(std::remove_if(entries.begin(), entries.end(),
                               [&](const ReservationEntry &e) {
                                 return e.port == port && e.owner_pid == owner;
                               }),
                entries.end());
  if (entries.size() != before) {
    LOG_DEBUG("PORT", "RELEASE", "Released claim on port {}", port);
  }
  return save_locked(entries);
}

// ---------------------------------------------------------------------------
// PortClaim
// ---------------------------------------------------------------------------

PortClaim::PortClaim(std::shared_ptr<const ReservationTable> table,
                     uint16_t port, ProcessId owner)
    : table_(std::move(table)), port_(port), owner_(owner) {}

PortClaim::~PortClaim() { release(); }

void PortClaim::release() {
  if (released_)
    return;
  released_ = true;
  if (!table_->release(port_, owner_)) {
    LOG_WARN("PORT", "RELEASE",
             "Claim on port {} left in table; it expires with PID={}", port_,
             owner_);
  }
}

// ---------------------------------------------------------------------------
// PortAllocator
// ---------------------------------------------------------------------------

PortAllocator::PortAllocator(const std::string &run_dir,
                             std::shared_ptr<const InstanceRegistry> registry)
    : registry_(std::move(registry)),
      reservations_(std::make_shared<ReservationTable>(run_dir)) {}

bool PortAllocator::is_port_free(uint16_t port) {
  int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    LOG_ERROR("PORT", "SOCKET", "socket() failed: {}", std::strerror(errno));
    return false;
  }

  // SO_REUSEADDR so sockets in TIME_WAIT do not count as bound
  int opt = 1;
  setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(port);
  bool free = bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0;
  close(fd);
  return free;
}

std::optional<uint16_t> PortAllocator::allocate(uint16_t start,
                                                uint16_t end) const {
  for (uint32_t port = start; port <= end; ++port) {
    if (is_port_free(static_cast<uint16_t>(port))) {
      LOG_DEBUG("PORT", "ALLOCATE", "Port {} is free", port);
      return static_cast<uint16_t>(port);
    }
  }
  LOG_WARN("PORT", "EXHAUSTED", "No free port in {}-{}", start, end);
  return std::nullopt;
}

ClaimResult PortAllocator::allocate_and_claim(uint16_t start,
                                              uint16_t end) const {
  return claim_first_free(start, end, false);
}

ClaimResult PortAllocator::claim(uint16_t port) const {
  return claim_first_free(port, port, true);
}

ClaimResult PortAllocator::claim_first_free(uint16_t start, uint16_t end,
                                            bool explicit_port) const {
  ClaimResult result;
  if (start > end) {
    result.status = OperationResult::failure(
        FleetError::InvalidArgument,
        fmt::format("Invalid port range {}-{}", start, end));
    return result;
  }

  ipc::ScopedFileLock lock(reservations_->lock_path());
  if (!lock.locked()) {
    result.status = OperationResult::failure(
        FleetError::Exhausted,
        fmt::format("Cannot lock reservation table {}",
                    reservations_->lock_path()));
    return result;
  }

  auto entries = reservations_->load_locked();
  std::set<uint16_t> unavailable = registry_->ports();
  for (const auto &entry : entries)
    unavailable.insert(entry.port);

  for (uint32_t candidate = start; candidate <= end; ++candidate) {
    auto port = static_cast<uint16_t>(candidate);
    if (unavailable.count(port))
      continue;
    if (!is_port_free(port))
      continue;

    ReservationEntry entry{port, getpid(), utc_timestamp()};
    entries.push_back(entry);
    if (!reservations_->save_locked(entries)) {
      result.status = OperationResult::failure(
          FleetError::Exhausted,
          fmt::format("Cannot record claim for port {}", port));
      return result;
    }

    LOG_INFO("PORT", "CLAIM", "Claimed port {}", port);
    result.claim =
        std::make_unique<PortClaim>(reservations_, port, entry.owner_pid);
    result.status = OperationResult::ok();
    return result;
  }

  if (explicit_port) {
    result.status = OperationResult::failure(
        FleetError::PortInUse,
        fmt::format("Port {} is in use (bound, claimed or registered)",
                    start));
  } else {
    result.status = OperationResult::failure(
        FleetError::Exhausted,
        fmt::format("No free port in range {}-{}", start, end));
  }
  LOG_WARN("PORT", "CLAIM", "{}", result.status.message);
  return result;
}

} // namespace dtfleet
