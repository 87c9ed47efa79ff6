#pragma once

#include "basalt/core/signal.hpp"

#include <cstdint>
#include <memory>
#include <utility>
#include <wayland-server-core.h>

namespace basalt::wayland {

  /**
   * @brief A `wl_resource` together with the object implementing it.
   *
   * The object is owned by a `std::shared_ptr` stored in the resource's
   * user data; it lives until libwayland destroys the resource (client
   * request or disconnect) and the last outside reference is dropped.
   *
   * @tparam _Ty Type of the managed object.
   */
  template<typename _Ty>
  struct resource_t : public _Ty {
    private:
    wl_resource *resource_{ nullptr };

    public:
    signal_t<wl_resource *> on_destroy; ///< Emitted when the wl_resource gets destroyed

    template<typename... Args>
    resource_t(Args &&...args)
      : _Ty(std::forward<Args>(args)...) {}

    resource_t(const resource_t &) = delete;
    resource_t &
    operator=(const resource_t &) = delete;

    /// Null once the wl_resource was destroyed.
    wl_resource *
    resource() const {
      return resource_;
    }

    void
    set_resource(wl_resource *res) {
      resource_ = res;
    }

    wl_client *
    owner() const {
      return resource_ ? wl_resource_get_client(resource_) : nullptr;
    }

    operator wl_resource *() const {
      return resource_;
    }
  };

  template<typename _Ty>
  using resource_ptr_t = std::shared_ptr<resource_t<_Ty>>;

  /// Retrieve the object behind a resource created by `make_resource<_Ty>`.
  template<typename _Ty>
  resource_ptr_t<_Ty>
  from_wl_resource(wl_resource *resource) {
    if (resource == nullptr)
      return nullptr;

    auto *shared = static_cast<resource_ptr_t<_Ty> *>(wl_resource_get_user_data(resource));
    return shared ? *shared : nullptr;
  }

  template<typename _Ty, typename _Interface, typename... Args>
  resource_ptr_t<_Ty>
  make_resource(wl_client          *client,
                const wl_interface &interface,
                const _Interface   &implementation,
                uint32_t            version,
                uint32_t            id,
                Args &&...args) {
    auto *wl_resource = wl_resource_create(client, &interface, static_cast<int>(version), id);
    if (!wl_resource) {
      wl_client_post_no_memory(client);
      return nullptr;
    }

    auto *resource =
      new resource_ptr_t<_Ty>(std::make_shared<resource_t<_Ty>>(std::forward<Args>(args)...));
    (*resource)->set_resource(wl_resource);

    wl_resource_set_implementation(
      wl_resource, &implementation, resource, [](struct wl_resource *res) {
        auto *shared = static_cast<resource_ptr_t<_Ty> *>(wl_resource_get_user_data(res));
        (*shared)->on_destroy.emit(res);
        (*shared)->set_resource(nullptr);
        delete shared;
      });

    return *resource;
  }

}
