#include "basalt/shell/shell.hpp"

#include "shell_fixture.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace basalt;
using basalt::testing::shell_fixture_t;

using names_t = std::vector<std::string>;

class ShellCommit : public shell_fixture_t {};

TEST_F(ShellCommit, ToplevelMapsOnFirstBufferedCommit) {
  auto id = protocol.create();
  shell.new_toplevel(id);
  EXPECT_TRUE(shell.pending().contains(id));
  EXPECT_TRUE(protocol.configures.empty());

  shell.commit(id);
  EXPECT_EQ(protocol.configures_for(id), 1u);
  EXPECT_TRUE(shell.pending().contains(id));
  EXPECT_EQ(recorder.names(), (names_t{ "surface_commit" }));

  recorder.clear();
  protocol.attach(id, region_t{ 0, 0, 300, 200 });
  shell.commit(id);

  EXPECT_EQ(recorder.names(), (names_t{ "window_created", "surface_commit" }));
  EXPECT_FALSE(shell.pending().contains(id));
  ASSERT_TRUE(shell.windows().contains(id));
  EXPECT_EQ(shell.windows().find(id)->size(), (ipoint_t{ 300, 200 }));
}

TEST_F(ShellCommit, InitialConfigureIsSentOnceUnderCommitStorm) {
  auto id = protocol.create();
  shell.new_toplevel(id);

  for (int i = 0; i < 10; ++i)
    shell.commit(id);
  protocol.attach(id, region_t{ 0, 0, 10, 10 });
  for (int i = 0; i < 10; ++i)
    shell.commit(id);

  EXPECT_EQ(protocol.configures_for(id), 1u);
  EXPECT_EQ(recorder.of<window_created_t>().size(), 1u);
}

TEST_F(ShellCommit, SurfaceIsNeverPendingAndMappedAtOnce) {
  auto id    = protocol.create();
  auto check = [&] { EXPECT_FALSE(shell.pending().contains(id) && shell.windows().contains(id)); };

  shell.events.on_event.connect([&](const shell_event_t &) {
    check();
    return signal_action_t::eOk;
  });

  shell.new_toplevel(id);
  check();
  shell.commit(id);
  check();
  protocol.attach(id, region_t{ 0, 0, 10, 10 });
  shell.commit(id);
  check();
}

TEST_F(ShellCommit, BufferIsImportedBeforeAnythingElse) {
  auto id = protocol.create();
  shell.events.on_event.connect([&](const shell_event_t &) {
    EXPECT_FALSE(protocol.imported.empty());
    return signal_action_t::eOk;
  });

  shell.commit(id);
  EXPECT_EQ(protocol.imported, (std::vector<surface_id_t>{ id }));
  EXPECT_EQ(recorder.names(), (names_t{ "surface_commit" }));
}

TEST_F(ShellCommit, CommitEnsuresAuxDataForWholeTree) {
  auto root  = protocol.create();
  auto child = protocol.create();
  auto leaf  = protocol.create();
  protocol.surfaces[root].children  = { child };
  protocol.surfaces[child].children = { leaf };

  shell.commit(root);

  EXPECT_NE(shell.surface_data(root), nullptr);
  EXPECT_NE(shell.surface_data(child), nullptr);
  EXPECT_NE(shell.surface_data(leaf), nullptr);
}

TEST_F(ShellCommit, SynchronizedSubsurfaceCommitDoesNotInitialize) {
  auto sub                  = protocol.create();
  protocol.surfaces[sub].sync = true;

  shell.commit(sub);

  EXPECT_EQ(shell.surface_data(sub), nullptr);
  EXPECT_EQ(recorder.names(), (names_t{ "surface_commit" }));
}

TEST_F(ShellCommit, FailedInitialConfigureAbandonsSurface) {
  auto id                              = protocol.create();
  protocol.surfaces[id].fail_configure = true;

  shell.new_toplevel(id);
  shell.commit(id);

  EXPECT_EQ(recorder.names(), (names_t{ "surface_abandoned", "surface_commit" }));
  EXPECT_FALSE(shell.pending().contains(id));
  ASSERT_NE(shell.surface_data(id), nullptr);
  EXPECT_TRUE(shell.surface_data(id)->abandoned);

  // The surface is a plain wl_surface from now on.
  recorder.clear();
  protocol.surfaces[id].fail_configure = false;
  protocol.attach(id, region_t{ 0, 0, 10, 10 });
  shell.new_toplevel(id);
  shell.commit(id);

  EXPECT_EQ(recorder.names(), (names_t{ "surface_commit" }));
  EXPECT_FALSE(shell.pending().contains(id));
  EXPECT_FALSE(shell.windows().contains(id));
  EXPECT_TRUE(protocol.configures.empty());
}

TEST_F(ShellCommit, AbandonmentOnlyAffectsThatSurface) {
  auto broken                              = protocol.create();
  protocol.surfaces[broken].fail_configure = true;
  shell.new_toplevel(broken);
  shell.commit(broken);

  auto window = map_toplevel(region_t{ 0, 0, 64, 64 });
  ASSERT_NE(window, nullptr);
  EXPECT_TRUE(shell.windows().contains(window->surface));
}

TEST_F(ShellCommit, DuplicateRoleIsIgnored) {
  auto id = protocol.create();
  shell.new_toplevel(id);
  shell.new_toplevel(id);
  shell.new_popup(id, protocol.create(), positioner(0, 0));

  EXPECT_EQ(shell.pending().size(), 1u);
  EXPECT_FALSE(shell.popups().contains(id));
  EXPECT_TRUE(recorder.events.empty());
}

TEST_F(ShellCommit, SurfaceDestroyedDropsPendingStateImmediately) {
  auto id = protocol.create();
  shell.new_toplevel(id);
  shell.commit(id);

  protocol.kill(id);
  shell.surface_destroyed(id);

  EXPECT_FALSE(shell.pending().contains(id));
  EXPECT_EQ(shell.surface_data(id), nullptr);
}

TEST_F(ShellCommit, RefreshRemovesDeadWindowsAndKeepsOrder) {
  std::vector<surface_id_t> ids(4);
  for (auto &id : ids)
    map_toplevel(region_t{ 0, 0, 10, 10 }, &id);

  protocol.kill(ids[0]);
  protocol.kill(ids[2]);
  shell.refresh();

  std::vector<surface_id_t> order;
  for (const auto &window : shell.windows())
    order.push_back(window->surface);

  EXPECT_EQ(order, (std::vector<surface_id_t>{ ids[1], ids[3] }));
  EXPECT_EQ(shell.surface_data(ids[0]), nullptr);
  EXPECT_NE(shell.surface_data(ids[1]), nullptr);
}

TEST_F(ShellCommit, MappedCommitRefreshesGeometry) {
  surface_id_t id;
  auto         window = map_toplevel(region_t{ 0, 0, 100, 100 }, &id);

  protocol.attach(id, region_t{ 4, 4, 120, 90 });
  shell.commit(id);

  EXPECT_EQ(window->geometry, region_t(4, 4, 120, 90));
  EXPECT_EQ(recorder.names(), (names_t{ "surface_commit" }));
}

TEST_F(ShellCommit, HandlerMayCallBackIntoShell) {
  surface_id_t id = protocol.create();

  std::optional<uint32_t> serial;
  shell.events.on_event.connect([&](const shell_event_t &event) {
    if (std::holds_alternative<window_created_t>(event)) {
      serial = shell.configure_toplevel(id, toplevel_state_t{ .activated = true });
      shell.maximize_request(id);
    }
    return signal_action_t::eOk;
  });

  shell.new_toplevel(id);
  shell.commit(id);
  protocol.attach(id, region_t{ 0, 0, 10, 10 });
  shell.commit(id);

  ASSERT_TRUE(serial);
  EXPECT_TRUE(protocol.last_configure().toplevel.activated);

  // Events raised by the handler are delivered after the ones already
  // queued.
  EXPECT_EQ(recorder.names(),
            (names_t{ "surface_commit", "window_created", "surface_commit", "window_maximize" }));
}

TEST_F(ShellCommit, ConfigureRequiresNegotiatedRole) {
  auto id = protocol.create();
  EXPECT_FALSE(shell.configure_toplevel(id, {}));

  shell.new_toplevel(id);
  EXPECT_FALSE(shell.configure_toplevel(id, {}));

  shell.commit(id);
  EXPECT_TRUE(shell.configure_toplevel(id, {}));
}

TEST_F(ShellCommit, LaterConfigureFailureIsNotTerminal) {
  surface_id_t id;
  map_toplevel(region_t{ 0, 0, 10, 10 }, &id);

  protocol.surfaces[id].fail_configure = true;
  EXPECT_FALSE(shell.configure_toplevel(id, {}));
  EXPECT_TRUE(shell.windows().contains(id));
  EXPECT_TRUE(recorder.of<surface_abandoned_t>().empty());
}
