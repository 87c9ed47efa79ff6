#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <type_traits>
#include <variant>

#include "basalt/core/config.hpp"
#include "basalt/shell/events.hpp"
#include "basalt/wayland/server.hpp"
#include "log.hpp"

using namespace basalt;

namespace {
  /// Log a shell event, with the surface it concerns where there is
  /// exactly one.
  void
  log_event(const shell_event_t &event) {
    std::visit(
      [&](const auto &e) {
        using _Ty = std::decay_t<decltype(e)>;
        if constexpr (requires(const _Ty &t) { t.window; })
          TRACE("shell: {} {}", event_name(event), e.window->surface);
        else if constexpr (std::is_same_v<_Ty, layer_created_t>)
          TRACE("shell: {} {} layer={} namespace=\"{}\"",
                event_name(event),
                e.layer_surface->surface,
                to_string(e.layer),
                e.namespace_);
        else if constexpr (std::is_same_v<_Ty, surface_abandoned_t>)
          WARN("shell: {} {} ({})", event_name(event), e.surface, e.reason);
        else
          TRACE("shell: {} {}", event_name(event), e.surface);
      },
      event);
  }
}

int
main(int argc, char **argv) {
  std::filesystem::path path = argc > 1 ? argv[1] : "basalt.conf";

  config_t config;
  try {
    if (argc > 1 || std::filesystem::exists(path))
      config = config_t::load_from_file(path);
  } catch (const config_error_t &e) {
    if (e.line > 0)
      CRITICAL("{}:{}: {}", path.string(), e.line, e.what());
    else
      CRITICAL("{}: {}", path.string(), e.what());
    return EXIT_FAILURE;
  }

  // Validated while loading.
  set_log_filter(parse_log_level(config.log_level).value_or(log_level::info));

  try {
    wayland::server_t server(config);
    server.shell().events.on_event.connect([](const shell_event_t &event) {
      log_event(event);
      return signal_action_t::eOk;
    });
    server.run();
  } catch (const std::runtime_error &e) {
    CRITICAL("{}", e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
