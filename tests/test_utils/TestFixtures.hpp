#pragma once
#include "devtools-fleet/FleetConfig.hpp"
#include "devtools-fleet/server/ProxyEngine.hpp"

#include <atomic>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

namespace dtfleet {
namespace test {

/// Proxy engine for tests. Validation fails when any route file in the
/// configuration directory contains INVALID_MARKER, or when forced.
class ScriptedProxyEngine : public ProxyEngine {
public:
  static constexpr const char *INVALID_MARKER = "INVALID_DIRECTIVE";

  explicit ScriptedProxyEngine(std::string conf_dir);

  OperationResult validate() override;
  OperationResult reload() override;

  std::atomic<bool> force_validation_failure{false};
  std::atomic<bool> fail_reload{false};
  std::atomic<int> validate_calls{0};
  std::atomic<int> reload_calls{0};

private:
  std::string conf_dir_;
};

/// Holds a listening TCP socket on the wildcard address.
class PortBinder {
public:
  explicit PortBinder(uint16_t port);
  ~PortBinder();

  PortBinder(const PortBinder &) = delete;
  PortBinder &operator=(const PortBinder &) = delete;

  bool bound() const { return fd_ >= 0; }
  uint16_t port() const { return port_; }

private:
  uint16_t port_;
  int fd_{-1};
};

/// First port of `count` consecutive free ports at or above `from`.
uint16_t find_free_port_block(int count, uint16_t from = 47000);

std::string read_text(const std::string &path);
void write_text(const std::string &path, const std::string &content);

/// Temporary fleet layout (data, logs, run dir, proxy conf dir, template)
/// with the fake instance as the browser and fast timings.
class FleetTest : public ::testing::Test {
protected:
  void SetUp() override;
  void TearDown() override;

  /// Configuration rooted in the temporary directory.
  FleetConfig make_config() const;

  void write_template(const std::string &content);

  std::string root_;
  std::string template_path_;
  std::string conf_dir_;
  FleetConfig config_;
  std::shared_ptr<ScriptedProxyEngine> engine_;
};

} // namespace test
} // namespace dtfleet
