#include "devtools-fleet/server/RouteGenerator.hpp"

#include <gtest/gtest.h>

using namespace dtfleet;

TEST(RouteRender, SubstitutesAllOccurrences) {
  std::string text = "listen {{PROXY_PORT}};\n"
                     "proxy_pass http://{{UPSTREAM_HOST}}:{{PORT}};\n"
                     "# port {{PORT}}\n";
  auto rendered = RouteGenerator::render(
      text, {{"PORT", "48010"},
             {"PROXY_PORT", "58010"},
             {"UPSTREAM_HOST", "127.0.0.1"}});

  EXPECT_EQ(rendered, "listen 58010;\n"
                      "proxy_pass http://127.0.0.1:48010;\n"
                      "# port 48010\n");
}

TEST(RouteRender, LeavesUnknownPlaceholders) {
  auto rendered =
      RouteGenerator::render("a {{PORT}} b {{OTHER}} c", {{"PORT", "1"}});
  EXPECT_EQ(rendered, "a 1 b {{OTHER}} c");
}

TEST(RouteRender, UnterminatedPlaceholderCopiedVerbatim) {
  auto rendered = RouteGenerator::render("x {{PORT", {{"PORT", "1"}});
  EXPECT_EQ(rendered, "x {{PORT");
}

TEST(RouteRender, NginxBracesUntouched) {
  std::string text = "location / { return 200 '{\"port\":{{PORT}}}'; }";
  auto rendered = RouteGenerator::render(text, {{"PORT", "48001"}});
  EXPECT_EQ(rendered, "location / { return 200 '{\"port\":48001}'; }");
}

TEST(RouteRender, VariablesApplyListenOffset) {
  FleetConfig config;
  config.proxy.listen_port_offset = 10000;
  config.proxy.upstream_host = "10.0.0.5";
  config.proxy.conf_dir = "/tmp/conf.d";
  RouteGenerator routes(config, nullptr);

  auto vars = routes.variables_for(48002);
  EXPECT_EQ(vars["PORT"], "48002");
  EXPECT_EQ(vars["PROXY_PORT"], "58002");
  EXPECT_EQ(vars["UPSTREAM_HOST"], "10.0.0.5");
  EXPECT_EQ(routes.route_path(48002), "/tmp/conf.d/chrome-proxy-48002.conf");
}
