#include "TestFixtures.hpp"
#include "devtools-fleet/server/ProxyEngine.hpp"
#include "devtools-fleet/server/RouteGenerator.hpp"

#include <algorithm>
#include <filesystem>

using namespace dtfleet;
using namespace dtfleet::test;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class RouteGeneratorTest : public FleetTest {
protected:
  RouteGenerator make_routes() { return RouteGenerator(config_, engine_); }

  std::vector<std::string> conf_dir_entries() const {
    std::vector<std::string> names;
    for (const auto &entry : fs::directory_iterator(conf_dir_))
      names.push_back(entry.path().filename().string());
    std::sort(names.begin(), names.end());
    return names;
  }
};

TEST_F(RouteGeneratorTest, ActivateWritesRenderedRoute) {
  auto routes = make_routes();
  auto result = routes.activate(48001);
  ASSERT_TRUE(result.success) << result.message;

  std::string content = read_text(routes.route_path(48001));
  EXPECT_NE(content.find("listen 48001;"), std::string::npos);
  EXPECT_NE(content.find("proxy_pass http://127.0.0.1:48001;"),
            std::string::npos);
  EXPECT_EQ(content.find("{{"), std::string::npos);
  EXPECT_EQ(engine_->validate_calls, 1);
  EXPECT_EQ(engine_->reload_calls, 1);
  EXPECT_EQ(conf_dir_entries(),
            (std::vector<std::string>{"chrome-proxy-48001.conf"}));
}

TEST_F(RouteGeneratorTest, InvalidReplacementKeepsPreviousRoute) {
  auto routes = make_routes();
  ASSERT_TRUE(routes.activate(48001).success);
  const std::string before = read_text(routes.route_path(48001));

  write_template("server { listen {{PORT}}; INVALID_DIRECTIVE; }\n");
  auto result = routes.activate(48001);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, FleetError::ValidationFailed);

  EXPECT_EQ(read_text(routes.route_path(48001)), before);
  EXPECT_EQ(engine_->reload_calls, 1);
  EXPECT_EQ(conf_dir_entries(),
            (std::vector<std::string>{"chrome-proxy-48001.conf"}));
}

TEST_F(RouteGeneratorTest, InvalidNewRouteLeavesNoFile) {
  auto routes = make_routes();
  write_template("server { INVALID_DIRECTIVE {{PORT}}; }\n");

  auto result = routes.activate(48002);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, FleetError::ValidationFailed);
  EXPECT_FALSE(routes.has_route(48002));
  EXPECT_TRUE(conf_dir_entries().empty());
  EXPECT_EQ(engine_->reload_calls, 0);
}

TEST_F(RouteGeneratorTest, MissingTemplate) {
  fs::remove(template_path_);
  auto routes = make_routes();
  auto result = routes.activate(48003);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, FleetError::TemplateMissing);
  EXPECT_FALSE(routes.has_route(48003));
  EXPECT_EQ(engine_->validate_calls, 0);
}

TEST_F(RouteGeneratorTest, ListenPortPastLimitIsRejected) {
  config_.proxy.listen_port_offset = 10000;
  write_template("server { listen {{PROXY_PORT}}; upstream {{PORT}}; }\n");
  auto routes = make_routes();

  for (uint16_t port : {uint16_t(60000), uint16_t(55536)}) {
    auto result = routes.activate(port);
    EXPECT_FALSE(result.success) << port;
    EXPECT_EQ(result.error, FleetError::InvalidArgument) << port;
    EXPECT_NE(result.message.find(std::to_string(port)), std::string::npos)
        << result.message;
    EXPECT_FALSE(routes.has_route(port));
  }
  EXPECT_EQ(engine_->validate_calls, 0);
  EXPECT_EQ(engine_->reload_calls, 0);
  EXPECT_TRUE(conf_dir_entries().empty());

  // Highest port whose route still fits
  auto edge = routes.activate(55535);
  ASSERT_TRUE(edge.success) << edge.message;
  EXPECT_EQ(routes.proxy_port(55535), 65535u);
  EXPECT_NE(read_text(routes.route_path(55535)).find("listen 65535;"),
            std::string::npos);
}

TEST_F(RouteGeneratorTest, ReloadFailureKeepsValidFile) {
  engine_->fail_reload = true;
  auto routes = make_routes();
  auto result = routes.activate(48004);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, FleetError::ReloadFailed);
  EXPECT_TRUE(routes.has_route(48004));
}

TEST_F(RouteGeneratorTest, DeactivateRemovesRoute) {
  auto routes = make_routes();
  ASSERT_TRUE(routes.activate(48005).success);

  auto result = routes.deactivate(48005);
  EXPECT_TRUE(result.success) << result.message;
  EXPECT_FALSE(routes.has_route(48005));
  EXPECT_EQ(engine_->reload_calls, 2);
}

TEST_F(RouteGeneratorTest, DeactivateWithoutRouteIsNoop) {
  auto routes = make_routes();
  auto result = routes.deactivate(48006);
  EXPECT_TRUE(result.success);
  EXPECT_EQ(engine_->validate_calls, 0);
  EXPECT_EQ(engine_->reload_calls, 0);
}

TEST_F(RouteGeneratorTest, DeactivateRollsBackWhenSetBecomesInvalid) {
  auto routes = make_routes();
  ASSERT_TRUE(routes.activate(48007).success);
  const std::string before = read_text(routes.route_path(48007));

  engine_->force_validation_failure = true;
  auto result = routes.deactivate(48007);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, FleetError::ValidationFailed);
  EXPECT_EQ(read_text(routes.route_path(48007)), before);
}

TEST_F(RouteGeneratorTest, DeactivateAll) {
  auto routes = make_routes();
  for (uint16_t port : {48010, 48011, 48012})
    ASSERT_TRUE(routes.activate(port).success);
  write_text(conf_dir_ + "/default.conf", "server { listen 80; }\n");

  auto listed = routes.list_routes();
  ASSERT_EQ(listed.size(), 3u);
  EXPECT_EQ(listed.front().port, 48010);

  auto result = routes.deactivate_all();
  EXPECT_TRUE(result.success) << result.message;
  EXPECT_TRUE(routes.list_routes().empty());
  EXPECT_EQ(conf_dir_entries(), (std::vector<std::string>{"default.conf"}));

  EXPECT_TRUE(routes.deactivate_all().success);
}

TEST_F(RouteGeneratorTest, DeactivateAllRestoresOnValidationFailure) {
  auto routes = make_routes();
  ASSERT_TRUE(routes.activate(48013).success);
  ASSERT_TRUE(routes.activate(48014).success);

  engine_->force_validation_failure = true;
  auto result = routes.deactivate_all();
  EXPECT_FALSE(result.success);
  EXPECT_EQ(routes.list_routes().size(), 2u);
  engine_->force_validation_failure = false;
}

TEST_F(RouteGeneratorTest, CommandProxyEngine) {
  ProxyConfig proxy;
  proxy.validate_command = "true";
  proxy.reload_command = "echo 'signal process started'";
  proxy.command_timeout = 2000ms;
  CommandProxyEngine engine(proxy);

  EXPECT_TRUE(engine.validate().success);
  auto reload = engine.reload();
  EXPECT_TRUE(reload.success);
  EXPECT_NE(reload.message.find("signal process started"), std::string::npos);

  proxy.validate_command = "echo 'unknown directive \"foo\"'; exit 1";
  auto invalid = engine.validate();
  EXPECT_FALSE(invalid.success);
  EXPECT_EQ(invalid.error, FleetError::ValidationFailed);
  EXPECT_NE(invalid.message.find("unknown directive"), std::string::npos);

  proxy.reload_command = "sleep 10";
  proxy.command_timeout = 200ms;
  auto slow = engine.reload();
  EXPECT_FALSE(slow.success);
  EXPECT_EQ(slow.error, FleetError::ReloadFailed);
  EXPECT_NE(slow.message.find("timed out"), std::string::npos);
}
