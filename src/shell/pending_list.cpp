#include "basalt/shell/pending_list.hpp"

namespace basalt {

  void
  pending_list_t::insert(surface_id_t surface) {
    entries_.insert(std::make_shared<pending_toplevel_t>(surface));
  }

  std::shared_ptr<const pending_toplevel_t>
  pending_list_t::find(surface_id_t surface) const {
    return entries_.find(surface);
  }

  std::shared_ptr<pending_toplevel_t>
  pending_list_t::find_mut(surface_id_t surface) {
    return entries_.find_mut(surface);
  }

  bool
  pending_list_t::contains(surface_id_t surface) const {
    return entries_.contains(surface);
  }

  std::shared_ptr<window_t>
  pending_list_t::try_promote(surface_id_t surface, const protocol_t &protocol) {
    if (!entries_.contains(surface))
      return nullptr;

    if (!protocol.has_buffer(surface))
      return nullptr;

    auto geometry = protocol.window_geometry(surface);
    if (!geometry)
      return nullptr;

    entries_.remove(surface);
    return std::make_shared<window_t>(surface, *geometry);
  }

  bool
  pending_list_t::remove(surface_id_t surface) {
    return entries_.remove(surface);
  }

  size_t
  pending_list_t::refresh(const protocol_t &protocol) {
    return entries_.refresh(protocol);
  }

}
