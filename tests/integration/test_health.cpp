#include "TestFixtures.hpp"
#include "devtools-fleet/ipc/ProcessHandle.hpp"
#include "devtools-fleet/net/HttpProbe.hpp"
#include "devtools-fleet/server/FleetManager.hpp"
#include "devtools-fleet/server/HealthAggregator.hpp"
#include "devtools-fleet/server/InstanceRegistry.hpp"
#include "devtools-fleet/server/ProcessSupervisor.hpp"
#include "devtools-fleet/server/RouteGenerator.hpp"

#include <algorithm>
#include <filesystem>
#include <gmock/gmock.h>
#include <set>
#include <thread>

using namespace dtfleet;
using namespace dtfleet::test;
using namespace std::chrono_literals;
using ::testing::ElementsAre;
namespace fs = std::filesystem;

namespace {

const CheckResult *find_check(const std::vector<CheckResult> &checks,
                              const std::string &name) {
  auto it = std::find_if(checks.begin(), checks.end(),
                         [&](const CheckResult &c) { return c.name == name; });
  return it == checks.end() ? nullptr : &*it;
}

std::vector<std::string> names(const std::vector<CheckResult> &checks) {
  std::vector<std::string> out;
  for (const auto &check : checks)
    out.push_back(check.name);
  return out;
}

} // namespace

class HealthTest : public FleetTest {
protected:
  std::unique_ptr<FleetManager> make_manager() {
    return std::make_unique<FleetManager>(config_, engine_);
  }

  uint16_t start_instance(FleetManager &manager, uint16_t from = 47200) {
    uint16_t base = find_free_port_block(4, from);
    EXPECT_NE(base, 0);
    auto started = manager.start(std::nullopt, {},
                                 PortRange{base, uint16_t(base + 3)});
    EXPECT_TRUE(started.status.success) << started.status.message;
    return started.instance ? started.instance->port : 0;
  }

  // Fake instance that never opens its port, recorded in the registry as
  // the instance on `port`.
  ipc::ProcessHandle spawn_tracked_sleeper(FleetManager &manager,
                                           uint16_t port) {
    Instance record;
    record.port = port;
    record.data_dir = manager.supervisor().data_dir_for(port);
    record.log_path = manager.supervisor().log_path_for(port);
    record.browser = FAKE_INSTANCE_PATH;

    ipc::SpawnOptions options;
    options.argv = {FAKE_INSTANCE_PATH,
                    "--remote-debugging-port=" + std::to_string(port),
                    "--user-data-dir=" + record.data_dir,
                    "--fake-never-ready"};
    auto handle = ipc::ProcessHandle::spawn(options);
    record.pid = handle.pid();
    record.state = InstanceState::Ready;
    EXPECT_TRUE(manager.registry().save(record));
    return handle;
  }
};

TEST_F(HealthTest, StartedInstanceIsHealthy) {
  auto manager = make_manager();
  uint16_t port = start_instance(*manager);
  ASSERT_NE(port, 0);

  auto snapshot = manager->health(port);
  ASSERT_EQ(snapshot.ports.size(), 1u);
  const auto &ph = snapshot.ports[0];
  EXPECT_THAT(names(ph.checks),
              ElementsAre("process-alive", "port-reachable",
                          "protocol-endpoints-ok", "proxy-route-ok"));
  for (const auto &check : ph.checks)
    EXPECT_EQ(check.status, CheckStatus::Pass) << check.name << ": "
                                               << check.message;
  EXPECT_EQ(ph.browser_version.value_or(""), "FakeChrome/1.0");
  EXPECT_EQ(snapshot.overall, OverallHealth::Healthy);
  EXPECT_TRUE(snapshot.fleet_checks.empty());
}

TEST_F(HealthTest, MissingRouteDegrades) {
  auto manager = make_manager();
  uint16_t port = start_instance(*manager);
  ASSERT_NE(port, 0);
  ASSERT_TRUE(manager->routes().deactivate(port).success);

  auto snapshot = manager->health(port);
  const auto *route = find_check(snapshot.ports[0].checks, "proxy-route-ok");
  ASSERT_NE(route, nullptr);
  EXPECT_EQ(route->status, CheckStatus::Warn);
  EXPECT_EQ(snapshot.overall, OverallHealth::Degraded);
}

TEST_F(HealthTest, UnreachablePortIsUnhealthy) {
  auto manager = make_manager();
  uint16_t port = find_free_port_block(1, 47300);
  ASSERT_NE(port, 0);

  auto snapshot = manager->health(port);
  const auto &checks = snapshot.ports[0].checks;
  ASSERT_EQ(checks.size(), 1u);
  EXPECT_EQ(checks[0].name, "process-alive");
  EXPECT_EQ(checks[0].status, CheckStatus::Fail);
  EXPECT_EQ(snapshot.overall, OverallHealth::Unhealthy);
}

TEST_F(HealthTest, TrackedInstanceWithClosedPortFailsReachability) {
  auto manager = make_manager();
  uint16_t port = find_free_port_block(1, 47310);
  ASSERT_NE(port, 0);
  auto sleeper = spawn_tracked_sleeper(*manager, port);
  ASSERT_TRUE(sleeper.valid());

  auto health = manager->health_aggregator().probe(port);
  ASSERT_EQ(health.checks.size(), 2u);
  EXPECT_EQ(health.checks[0].status, CheckStatus::Pass);
  EXPECT_EQ(health.checks[1].name, "port-reachable");
  EXPECT_EQ(health.checks[1].status, CheckStatus::Fail);

  sleeper.signal(ipc::Signal::Force);
  sleeper.wait_for_exit(2000ms);
}

TEST_F(HealthTest, UntrackedDebuggerIsUnhealthy) {
  auto manager = make_manager();
  uint16_t port = find_free_port_block(1, 47320);
  ASSERT_NE(port, 0);

  // A debugger answering on the port that the fleet did not start
  ipc::SpawnOptions options;
  options.argv = {FAKE_INSTANCE_PATH,
                  "--remote-debugging-port=" + std::to_string(port),
                  "--remote-debugging-address=127.0.0.1"};
  auto stranger = ipc::ProcessHandle::spawn(options);
  ASSERT_TRUE(stranger.valid());
  bool answering = false;
  for (int i = 0; i < 50 && !answering; ++i) {
    answering =
        net::http_get("127.0.0.1", port, "/json/version", 200ms).success();
    if (!answering)
      std::this_thread::sleep_for(100ms);
  }
  ASSERT_TRUE(answering);

  auto snapshot = manager->health(port);
  const auto &checks = snapshot.ports[0].checks;
  ASSERT_EQ(checks.size(), 1u);
  EXPECT_EQ(checks[0].name, "process-alive");
  EXPECT_EQ(checks[0].status, CheckStatus::Fail);
  EXPECT_EQ(snapshot.overall, OverallHealth::Unhealthy);
  EXPECT_FALSE(manager->registry().contains(port));

  stranger.signal(ipc::Signal::Graceful);
  EXPECT_TRUE(stranger.wait_for_exit(5000ms));
}

TEST_F(HealthTest, DeadRecordFailsAndIsRemoved) {
  auto manager = make_manager();
  Instance record;
  record.port = 47399;
  record.pid = 0;
  record.data_dir = config_.paths.data_root + "/chrome-47399";
  ASSERT_TRUE(manager->registry().save(record));
  fs::create_directories(record.data_dir + "/Default");
  write_text(record.data_dir + "/Default/Preferences", "{}");

  auto health = manager->health_aggregator().probe(47399);
  ASSERT_EQ(health.checks.size(), 1u);
  EXPECT_EQ(health.checks[0].name, "process-alive");
  EXPECT_EQ(health.checks[0].status, CheckStatus::Fail);
  EXPECT_FALSE(manager->registry().contains(47399));
  EXPECT_FALSE(fs::exists(record.data_dir));
}

TEST_F(HealthTest, EmptyFleetIsDegraded) {
  auto manager = make_manager();
  uint16_t base = find_free_port_block(5, 47400);
  ASSERT_NE(base, 0);

  auto snapshot = manager->health(std::nullopt,
                                  PortRange{base, uint16_t(base + 4)});
  EXPECT_TRUE(snapshot.ports.empty());
  const auto *discovered =
      find_check(snapshot.fleet_checks, "instances-discovered");
  ASSERT_NE(discovered, nullptr);
  EXPECT_EQ(discovered->status, CheckStatus::Warn);
  EXPECT_EQ(snapshot.overall, OverallHealth::Degraded);
}

TEST_F(HealthTest, DiscoverFindsOnlyDebuggers) {
  auto manager = make_manager();
  uint16_t port = start_instance(*manager, 47500);
  ASSERT_NE(port, 0);
  uint16_t silent_port = find_free_port_block(1, port + 1);
  PortBinder silent(silent_port);
  ASSERT_TRUE(silent.bound());

  auto found =
      manager->health_aggregator().discover(port, uint16_t(silent_port + 1));
  EXPECT_EQ(found.count(port), 1u);
  EXPECT_EQ(found.count(silent_port), 0u);

  auto snapshot = manager->health(
      std::nullopt, PortRange{port, uint16_t(silent_port + 1)});
  const auto *discovered =
      find_check(snapshot.fleet_checks, "instances-discovered");
  ASSERT_NE(discovered, nullptr);
  EXPECT_EQ(discovered->status, CheckStatus::Pass);
  EXPECT_EQ(snapshot.overall, OverallHealth::Healthy);
}

TEST_F(HealthTest, ScanCandidatesSampleTheRange) {
  config_.health.full_scan_span = 5;
  config_.health.sparse_stride = 10;
  auto manager = make_manager();

  Instance record;
  record.port = 48057;
  record.pid = 0;
  ASSERT_TRUE(manager->registry().save(record));

  auto ports = manager->health_aggregator().scan_candidates(48000, 48100);
  for (uint16_t p = 48000; p <= 48005; ++p)
    EXPECT_EQ(ports.count(p), 1u) << p;
  EXPECT_EQ(ports.count(48006), 0u);
  EXPECT_EQ(ports.count(48010), 1u);
  EXPECT_EQ(ports.count(48011), 0u);
  EXPECT_EQ(ports.count(48057), 1u);
  EXPECT_EQ(ports.count(48100), 1u);
  EXPECT_EQ(ports.count(48101), 0u);
}

TEST_F(HealthTest, ProbeAllHonoursOverallDeadline) {
  config_.health.overall_deadline = 300ms;
  config_.health.http_timeout = 2000ms;
  auto manager = make_manager();

  // Tracked and alive; the port accepts connections (kernel backlog) but
  // never answers
  uint16_t port = find_free_port_block(1, 47600);
  ASSERT_NE(port, 0);
  auto sleeper = spawn_tracked_sleeper(*manager, port);
  ASSERT_TRUE(sleeper.valid());
  PortBinder silent(port);
  ASSERT_TRUE(silent.bound());

  auto started = std::chrono::steady_clock::now();
  auto results = manager->health_aggregator().probe_all({port});
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);

  ASSERT_EQ(results.size(), 1u);
  const auto *late = find_check(results[0].checks, "probe-deadline");
  ASSERT_NE(late, nullptr);
  EXPECT_EQ(late->status, CheckStatus::Fail);
  EXPECT_EQ(HealthAggregator::aggregate(results[0].checks),
            OverallHealth::Unhealthy);

  sleeper.signal(ipc::Signal::Force);
  sleeper.wait_for_exit(2000ms);
}

TEST_F(HealthTest, ProbeAllBatchesCoverEveryPort) {
  config_.health.max_concurrent_probes = 2;
  auto manager = make_manager();
  uint16_t base = find_free_port_block(5, 47620);
  ASSERT_NE(base, 0);

  std::set<uint16_t> ports;
  for (uint16_t p = base; p < base + 5; ++p)
    ports.insert(p);
  auto results = manager->health_aggregator().probe_all(ports);

  ASSERT_EQ(results.size(), 5u);
  for (size_t i = 0; i < results.size(); ++i) {
    EXPECT_EQ(results[i].port, static_cast<uint16_t>(base + i));
    ASSERT_FALSE(results[i].checks.empty());
    EXPECT_EQ(results[i].checks[0].name, "process-alive");
  }
}

TEST_F(HealthTest, FleetChecksWhenEnabled) {
  config_.health.fleet_checks = true;
  auto manager = make_manager();

  auto checks = manager->health_aggregator().fleet_checks(1);
  EXPECT_THAT(names(checks),
              ElementsAre("instances-discovered", "proxy-service",
                          "proxy-config-valid", "memory-usage", "disk-usage",
                          "system-load", "proxy-log-errors",
                          "instance-log-errors"));
  EXPECT_EQ(find_check(checks, "proxy-service")->status, CheckStatus::Pass);
  EXPECT_EQ(find_check(checks, "proxy-config-valid")->status,
            CheckStatus::Pass);
  EXPECT_EQ(find_check(checks, "proxy-log-errors")->status, CheckStatus::Pass);

  engine_->force_validation_failure = true;
  checks = manager->health_aggregator().fleet_checks(1);
  EXPECT_EQ(find_check(checks, "proxy-config-valid")->status,
            CheckStatus::Fail);
  engine_->force_validation_failure = false;
}

TEST_F(HealthTest, ProxyServiceDown) {
  config_.health.fleet_checks = true;
  config_.proxy.status_command = "echo inactive; exit 3";
  auto manager = make_manager();

  auto checks = manager->health_aggregator().fleet_checks(1);
  const auto *service = find_check(checks, "proxy-service");
  ASSERT_NE(service, nullptr);
  EXPECT_EQ(service->status, CheckStatus::Fail);
  EXPECT_THAT(service->message, ::testing::HasSubstr("inactive"));
  EXPECT_EQ(HealthAggregator::aggregate(checks), OverallHealth::Unhealthy);
}

TEST_F(HealthTest, ProxyServiceCheckSkippedWithoutCommand) {
  config_.health.fleet_checks = true;
  config_.proxy.status_command.clear();
  auto manager = make_manager();

  auto checks = manager->health_aggregator().fleet_checks(1);
  EXPECT_EQ(find_check(checks, "proxy-service"), nullptr);
}

TEST_F(HealthTest, ProxyErrorLogCountsRecentErrors) {
  config_.health.fleet_checks = true;
  auto manager = make_manager();

  // Eleven errors among the last 50 lines; older errors are ignored
  std::string log;
  for (int i = 0; i < 30; ++i)
    log += "2024/01/01 00:00:00 [error] old failure\n";
  for (int i = 0; i < 39; ++i)
    log += "2024/01/01 00:00:01 [notice] worker started\n";
  for (int i = 0; i < 11; ++i)
    log += "2024/01/01 00:00:02 [ERROR] upstream timed out\n";
  write_text(config_.proxy.error_log, log);

  auto checks = manager->health_aggregator().fleet_checks(1);
  const auto *proxy_log = find_check(checks, "proxy-log-errors");
  ASSERT_NE(proxy_log, nullptr);
  EXPECT_EQ(proxy_log->status, CheckStatus::Warn);
  EXPECT_THAT(proxy_log->message, ::testing::HasSubstr("11 recent errors"));

  // Ten is still within the threshold
  log.clear();
  for (int i = 0; i < 10; ++i)
    log += "[error] upstream timed out\n";
  write_text(config_.proxy.error_log, log);
  checks = manager->health_aggregator().fleet_checks(1);
  EXPECT_EQ(find_check(checks, "proxy-log-errors")->status, CheckStatus::Pass);
}
