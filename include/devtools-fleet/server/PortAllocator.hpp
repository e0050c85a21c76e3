#pragma once
#include "devtools-fleet/types.hpp"
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dtfleet {

class InstanceRegistry;

/// One entry of the reservation table.
struct ReservationEntry {
  uint16_t port{0};
  ProcessId owner_pid{0};
  std::string claimed_at;
};

/// Claim table mirrored to `<runDir>/reservations.json`. Every read-modify-
/// write happens under `<runDir>/reservations.lock`; entries whose owner
/// process is gone are purged as stale on each access.
class ReservationTable {
public:
  explicit ReservationTable(std::string run_dir);

  std::string table_path() const;
  std::string lock_path() const;

  /// Ports currently claimed by live owners.
  std::set<uint16_t> claimed_ports() const;

  /// Drop the claim on `port` held by `owner`.
  bool release(uint16_t port, ProcessId owner) const;

  // Callers must hold the reservation lock for the *_locked methods.
  std::vector<ReservationEntry> load_locked() const;
  bool save_locked(const std::vector<ReservationEntry> &entries) const;

private:
  std::string run_dir_;
};

/// A held reservation. Releases the claim when destroyed; callers release
/// early once the port is recorded in the registry.
class PortClaim {
public:
  PortClaim(std::shared_ptr<const ReservationTable> table, uint16_t port,
            ProcessId owner);
  ~PortClaim();

  PortClaim(const PortClaim &) = delete;
  PortClaim &operator=(const PortClaim &) = delete;

  uint16_t port() const { return port_; }

  /// Release now. Safe to call more than once.
  void release();

private:
  std::shared_ptr<const ReservationTable> table_;
  uint16_t port_;
  ProcessId owner_;
  bool released_{false};
};

struct ClaimResult {
  OperationResult status;
  std::unique_ptr<PortClaim> claim;
};

class PortAllocator {
public:
  PortAllocator(const std::string &run_dir,
                std::shared_ptr<const InstanceRegistry> registry);

  /// Bind test: a fresh TCP socket bound to the wildcard address on `port`.
  static bool is_port_free(uint16_t port);

  /// First port in [start, end] that no listener holds. Exhausted otherwise.
  std::optional<uint16_t> allocate(uint16_t start, uint16_t end) const;

  /// As allocate(), also skipping claimed and registered ports, and claiming
  /// the result before returning.
  ClaimResult allocate_and_claim(uint16_t start, uint16_t end) const;

  /// Claim an explicit port. PortInUse when bound, claimed or registered.
  ClaimResult claim(uint16_t port) const;

  std::shared_ptr<const ReservationTable> reservations() const {
    return reservations_;
  }

private:
  ClaimResult claim_first_free(uint16_t start, uint16_t end,
                               bool explicit_port) const;

  std::shared_ptr<const InstanceRegistry> registry_;
  std::shared_ptr<const ReservationTable> reservations_;
};

} // namespace dtfleet
