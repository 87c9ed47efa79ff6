#include "basalt/core/config.hpp"

#include <format>
#include <fstream>
#include <libconfig.h++>
#include <sstream>
#include <string>

#include "../log.hpp"

namespace basalt {

  namespace {
    constexpr int MAX_XDG_WM_BASE_VERSION = 3;
    constexpr int MAX_LAYER_SHELL_VERSION = 4;

    int
    setting_line(const libconfig::Setting &setting) {
      return static_cast<int>(setting.getSourceLine());
    }

    int
    parse_version(const libconfig::Setting &group, const char *name, int fallback, int max) {
      if (!group.exists(name))
        return fallback;

      auto &setting = group.lookup(name);
      if (setting.getType() != libconfig::Setting::TypeInt)
        throw config_error_t(std::format("shell.{} must be an integer", name),
                             setting_line(setting));

      int version = setting;
      if (version < 1 || version > max)
        throw config_error_t(std::format("shell.{} must be within 1..{}, got {}", name, max, version),
                             setting_line(setting));
      return version;
    }

    void
    parse_log_group(const libconfig::Setting &setting, config_t &cfg) {
      if (!setting.isGroup())
        throw config_error_t("`log` must be a group", setting_line(setting));

      std::string level;
      if (!setting.lookupValue("level", level))
        return;

      if (!parse_log_level(level))
        throw config_error_t(std::format("unknown log level '{}'", level),
                             setting_line(setting.lookup("level")));
      cfg.log_level = level;
    }

    void
    parse_shell_group(const libconfig::Setting &setting, config_t &cfg) {
      if (!setting.isGroup())
        throw config_error_t("`shell` must be a group", setting_line(setting));

      if (setting.exists("strict_layer_acks")) {
        auto &strict = setting.lookup("strict_layer_acks");
        if (strict.getType() != libconfig::Setting::TypeBoolean)
          throw config_error_t("shell.strict_layer_acks must be a boolean", setting_line(strict));
        cfg.shell.strict_layer_acks = strict;
      }

      cfg.shell.xdg_wm_base_version = parse_version(
        setting, "xdg_wm_base_version", cfg.shell.xdg_wm_base_version, MAX_XDG_WM_BASE_VERSION);
      cfg.shell.layer_shell_version = parse_version(
        setting, "layer_shell_version", cfg.shell.layer_shell_version, MAX_LAYER_SHELL_VERSION);
    }
  }

  config_t
  config_t::load_from_string(const std::string &source) {
    libconfig::Config config;
    config_t          cfg;

    try {
      config.readString(source);
    } catch (const libconfig::ParseException &e) {
      throw config_error_t(std::format("{}", e.getError()), e.getLine());
    }

    auto &root = config.getRoot();

    if (root.exists("socket")) {
      auto &socket = root.lookup("socket");
      if (socket.getType() != libconfig::Setting::TypeString)
        throw config_error_t("`socket` must be a string", setting_line(socket));
      cfg.socket = static_cast<const char *>(socket);
    }

    if (root.exists("log"))
      parse_log_group(root.lookup("log"), cfg);

    if (root.exists("shell"))
      parse_shell_group(root.lookup("shell"), cfg);

    return cfg;
  }

  config_t
  config_t::load_from_file(const std::filesystem::path &path) {
    std::ifstream file(path);
    if (!file)
      throw config_error_t(std::format("cannot open {}", path.string()));

    std::stringstream ss;
    ss << file.rdbuf();

    INFO("Loading configuration from {}", path.string());
    return load_from_string(ss.str());
  }

}
