#include "basalt/core/config.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace basalt;

TEST(Config, EmptySourceGivesDefaults) {
  auto config = config_t::load_from_string("");

  EXPECT_FALSE(config.socket);
  EXPECT_EQ(config.log_level, "info");
  EXPECT_TRUE(config.shell.strict_layer_acks);
  EXPECT_EQ(config.shell.xdg_wm_base_version, 3);
  EXPECT_EQ(config.shell.layer_shell_version, 4);
}

TEST(Config, ReadsAllKeys) {
  auto config = config_t::load_from_string(R"(
    socket = "basalt-test";
    log = { level = "trace"; };
    shell = {
      strict_layer_acks = false;
      xdg_wm_base_version = 2;
      layer_shell_version = 3;
    };
  )");

  ASSERT_TRUE(config.socket);
  EXPECT_EQ(*config.socket, "basalt-test");
  EXPECT_EQ(config.log_level, "trace");
  EXPECT_FALSE(config.shell.strict_layer_acks);
  EXPECT_EQ(config.shell.xdg_wm_base_version, 2);
  EXPECT_EQ(config.shell.layer_shell_version, 3);
}

TEST(Config, SyntaxErrorCarriesLine) {
  try {
    config_t::load_from_string("socket = \"a\";\nshell = { strict_layer_acks = ; };\n");
    FAIL() << "expected a config_error_t";
  } catch (const config_error_t &e) {
    EXPECT_EQ(e.line, 2);
  }
}

TEST(Config, RejectsWrongTypes) {
  EXPECT_THROW(config_t::load_from_string("socket = 5;"), config_error_t);
  EXPECT_THROW(config_t::load_from_string("shell = { strict_layer_acks = 1; };"), config_error_t);
  EXPECT_THROW(config_t::load_from_string("shell = { xdg_wm_base_version = \"3\"; };"),
               config_error_t);
  EXPECT_THROW(config_t::load_from_string("shell = 3;"), config_error_t);
}

TEST(Config, RejectsOutOfRangeVersions) {
  EXPECT_THROW(config_t::load_from_string("shell = { xdg_wm_base_version = 4; };"), config_error_t);
  EXPECT_THROW(config_t::load_from_string("shell = { layer_shell_version = 0; };"), config_error_t);
  EXPECT_NO_THROW(config_t::load_from_string("shell = { layer_shell_version = 1; };"));
}

TEST(Config, RejectsUnknownLogLevel) {
  try {
    config_t::load_from_string("\nlog = {\n  level = \"verbose\";\n};");
    FAIL() << "expected a config_error_t";
  } catch (const config_error_t &e) {
    EXPECT_EQ(e.line, 3);
  }
}

TEST(Config, LoadsFromFile) {
  auto path = std::filesystem::temp_directory_path() / "basalt_config_test.conf";
  {
    std::ofstream out(path);
    out << "log = { level = \"warn\"; };\n";
  }

  auto config = config_t::load_from_file(path);
  EXPECT_EQ(config.log_level, "warn");
  std::filesystem::remove(path);
}

TEST(Config, MissingFileThrows) {
  EXPECT_THROW(config_t::load_from_file("/nonexistent/basalt.conf"), config_error_t);
}
