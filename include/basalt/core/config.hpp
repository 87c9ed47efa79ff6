#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace basalt {

  /// Raised for unreadable or malformed configuration. `line` is 0
  /// when the error is not tied to a position in the source.
  class config_error_t : public std::runtime_error {
    public:
    int line;

    config_error_t(const std::string &what, int line = 0)
      : std::runtime_error(what)
      , line(line) {}
  };

  struct config_shell_t {
    bool strict_layer_acks{ true };

    /// Advertised global versions.
    int xdg_wm_base_version{ 3 };
    int layer_shell_version{ 4 };
  };

  struct config_t {
    /// Empty picks the first free `wayland-N` socket.
    std::optional<std::string> socket;

    /// One of trace, info, warn, error, critical.
    std::string log_level{ "info" };

    config_shell_t shell;

    static config_t
    load_from_file(const std::filesystem::path &);

    static config_t
    load_from_string(const std::string &);
  };
}
