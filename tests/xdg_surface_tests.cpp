#include <gtest/gtest.h>

#include "fake_connection.hpp"
#include "wisp/shell/xdg_surface.hpp"

#include <vector>

using namespace wisp;
using wisp::test::fake_connection_t;

namespace {
  window_options_t
  make_options() {
    window_options_t options;
    options.toplevel = { .title = "Hello, world!", .app_id = "wisp.test" };
    options.size     = { 500, 500 };
    options.color    = color_t{ 0xff0000ff };
    return options;
  }

  const std::vector<std::string> PRESENT_OPS = { "ack_configure", "attach", "commit" };
}

class Handshake : public ::testing::Test {
  protected:
  fake_connection_t    conn;
  buffer_provisioner_t provisioner{ conn, object_t{ 900 } };
  xdg_surface_t        window{ conn, provisioner, make_options() };

  const object_t compositor{ 901 }, wm_base{ 902 }, decoration_manager{ 903 };

  void
  create(std::optional<object_t> decorations = std::nullopt) {
    window.create(compositor, wm_base, decorations);
    conn.requests.clear();
  }
};

TEST_F(Handshake, CreateRequestsRolesThenCommitsWithoutBuffer) {
  window.create(compositor, wm_base, std::nullopt);

  EXPECT_EQ(conn.ops(),
            (std::vector<std::string>{
              "create_surface", "get_xdg_surface", "get_toplevel", "set_title", "set_app_id", "commit" }));
  EXPECT_EQ(conn.find("create_surface")[0].target, compositor);
  EXPECT_EQ(conn.find("get_xdg_surface")[0].target, wm_base);
  EXPECT_EQ(conn.find("set_title")[0].text, "Hello, world!");
  EXPECT_EQ(conn.find("commit")[0].target, window.surface());
  EXPECT_EQ(window.state(), handshake_state_t::eAwaitingConfigure);
  EXPECT_EQ(window.attached(), nullptr);
}

TEST_F(Handshake, CreateDeclaresServerSideDecorationsWhenAvailable) {
  window.create(compositor, wm_base, decoration_manager);

  auto get = conn.find("get_toplevel_decoration");
  ASSERT_EQ(get.size(), 1u);
  EXPECT_EQ(get[0].target, decoration_manager);
  EXPECT_EQ(get[0].args[0], static_cast<int64_t>(window.toplevel()->handle().value));

  auto mode = conn.find("set_decoration_mode");
  ASSERT_EQ(mode.size(), 1u);
  EXPECT_EQ(mode[0].args[0], static_cast<int64_t>(decoration_mode_t::eServerSide));

  // The initial commit comes last.
  EXPECT_EQ(conn.ops().back(), "commit");
  ASSERT_NE(window.decoration(), nullptr);
  EXPECT_FALSE(window.decoration()->current());
}

TEST(HandshakeOptions, NoDecorationObjectWhenDisabled) {
  fake_connection_t    conn;
  buffer_provisioner_t provisioner(conn, object_t{ 900 });
  auto                 options = make_options();
  options.decorations          = std::nullopt;
  xdg_surface_t window(conn, provisioner, options);

  window.create(object_t{ 901 }, object_t{ 902 }, object_t{ 903 });

  EXPECT_TRUE(conn.find("get_toplevel_decoration").empty());
  EXPECT_EQ(window.decoration(), nullptr);
}

TEST_F(Handshake, ConfigureBeforeRolesExistIsASequenceError) {
  try {
    window.configure(1);
    FAIL() << "expected fatal_error_t";
  } catch (const fatal_error_t &e) {
    EXPECT_EQ(e.kind(), error_kind_t::eProtocolSequence);
    EXPECT_EQ(e.phase(), phase_t::eHandshake);
  }
  EXPECT_TRUE(conn.requests.empty());
  EXPECT_EQ(window.state(), handshake_state_t::eCreated);
}

TEST_F(Handshake, CreatingTwiceIsASequenceError) {
  create();
  EXPECT_THROW(window.create(compositor, wm_base, std::nullopt), fatal_error_t);
}

TEST_F(Handshake, NothingIsAttachedBeforeTheFirstConfigure) {
  window.create(compositor, wm_base, decoration_manager);
  window.toplevel()->configure(0, 0, {});
  window.decoration()->configure(2);

  EXPECT_TRUE(conn.find("attach").empty());
  EXPECT_TRUE(conn.find("create_buffer").empty());
}

TEST_F(Handshake, ConfigureAcknowledgesThenAttachesThenCommits) {
  create();

  EXPECT_EQ(window.configure(7), event_outcome_t::eHandled);

  ASSERT_EQ(conn.ops(PRESENT_OPS), PRESENT_OPS);

  auto ack = conn.find("ack_configure")[0];
  EXPECT_EQ(ack.target, window.handle());
  EXPECT_EQ(ack.args, (std::vector<int64_t>{ 7 }));

  ASSERT_NE(window.attached(), nullptr);
  auto attach = conn.find("attach")[0];
  EXPECT_EQ(attach.target, window.surface());
  EXPECT_EQ(attach.args,
            (std::vector<int64_t>{ static_cast<int64_t>(window.attached()->buffer.value), 0, 0 }));

  EXPECT_EQ(conn.find("commit")[0].target, window.surface());
  EXPECT_EQ(window.state(), handshake_state_t::eCommitted);
}

TEST_F(Handshake, FirstFrameIsAnOpaqueBlue500x500Buffer) {
  create();
  window.configure(7);

  auto const *buffer = window.attached();
  ASSERT_NE(buffer, nullptr);
  EXPECT_EQ(buffer->width, 500);
  EXPECT_EQ(buffer->height, 500);
  EXPECT_EQ(buffer->stride, 2000);
  EXPECT_EQ(buffer->format, pixel_format_t::eArgb8888);
  EXPECT_TRUE(buffer->busy);

  auto bytes = buffer->region.bytes();
  EXPECT_EQ(bytes[0], 0xff);
  EXPECT_EQ(bytes[1], 0x00);
  EXPECT_EQ(bytes[2], 0x00);
  EXPECT_EQ(bytes[3], 0xff);
  EXPECT_EQ(bytes[bytes.size() - 1], 0xff);
}

TEST_F(Handshake, ConsecutiveConfiguresEachRunTheFullCycle) {
  create();

  window.configure(7);
  window.configure(8);

  EXPECT_EQ(conn.ops(PRESENT_OPS),
            (std::vector<std::string>{
              "ack_configure", "attach", "commit", "ack_configure", "attach", "commit" }));

  auto acks = conn.find("ack_configure");
  ASSERT_EQ(acks.size(), 2u);
  EXPECT_EQ(acks[0].args[0], 7);
  EXPECT_EQ(acks[1].args[0], 8);
  EXPECT_EQ(window.state(), handshake_state_t::eCommitted);
}

TEST_F(Handshake, ReleasedBufferIsReused) {
  create();

  window.configure(1);
  object_t first = window.attached()->buffer;
  EXPECT_EQ(window.release(first), event_outcome_t::eHandled);
  EXPECT_FALSE(window.attached()->busy);

  window.configure(2);

  EXPECT_EQ(conn.find("create_buffer").size(), 1u);
  EXPECT_EQ(window.attached()->buffer, first);
  EXPECT_TRUE(conn.find("destroy_buffer").empty());
}

TEST_F(Handshake, BusyBufferIsKeptUntilTheServerReleasesIt) {
  create();

  window.configure(1);
  object_t first = window.attached()->buffer;

  // The server still holds the first buffer.
  window.configure(2);
  object_t second = window.attached()->buffer;

  EXPECT_NE(first, second);
  EXPECT_EQ(conn.find("create_buffer").size(), 2u);
  EXPECT_TRUE(conn.find("destroy_buffer").empty());
  EXPECT_EQ(window.live_buffers(), 2u);
  EXPECT_TRUE(window.owns_buffer(first));

  EXPECT_EQ(window.release(first), event_outcome_t::eHandled);

  auto destroyed = conn.find("destroy_buffer");
  ASSERT_EQ(destroyed.size(), 1u);
  EXPECT_EQ(destroyed[0].target, first);
  EXPECT_EQ(window.live_buffers(), 1u);
  EXPECT_FALSE(window.owns_buffer(first));
}

TEST_F(Handshake, SuggestedToplevelSizeIsUsedForTheNextBuffer) {
  create();

  EXPECT_EQ(window.toplevel()->configure(300, 200, {}), event_outcome_t::eHandled);
  window.configure(3);

  auto create = conn.find("create_buffer");
  ASSERT_EQ(create.size(), 1u);
  EXPECT_EQ(create[0].args[1], 300);
  EXPECT_EQ(create[0].args[2], 200);
  EXPECT_EQ(create[0].args[3], 1200);
}

TEST_F(Handshake, ResizeReplacesAReleasedBufferImmediately) {
  create();

  window.configure(1);
  object_t first = window.attached()->buffer;
  window.release(first);
  conn.requests.clear();

  window.toplevel()->configure(640, 480, {});
  window.configure(2);

  auto destroyed = conn.find("destroy_buffer");
  ASSERT_EQ(destroyed.size(), 1u);
  EXPECT_EQ(destroyed[0].target, first);
  EXPECT_EQ(window.attached()->width, 640);
  EXPECT_EQ(window.live_buffers(), 1u);

  // Destroyed before the new buffer was created.
  auto ops = conn.ops({ "destroy_buffer", "create_buffer", "attach" });
  EXPECT_EQ(ops, (std::vector<std::string>{ "destroy_buffer", "create_buffer", "attach" }));
}

TEST_F(Handshake, ZeroToplevelSizeFallsBackToTheConfiguredSize) {
  create();

  window.toplevel()->configure(300, 200, {});
  window.toplevel()->configure(0, 0, {});
  window.configure(4);

  EXPECT_EQ(window.attached()->width, 500);
  EXPECT_EQ(window.attached()->height, 500);
}

TEST_F(Handshake, CommitSignalCarriesTheSerial) {
  create();

  std::vector<uint32_t> serials;
  window.events.on_commit.connect([&](uint32_t serial) { serials.push_back(serial); });

  window.configure(11);
  window.configure(12);

  EXPECT_EQ(serials, (std::vector<uint32_t>{ 11, 12 }));
}

TEST_F(Handshake, UnknownBufferReleaseIsIgnored) {
  create();
  window.configure(1);

  EXPECT_EQ(window.release(object_t{ 12345 }), event_outcome_t::eIgnored);
  EXPECT_TRUE(window.attached()->busy);
}

TEST_F(Handshake, WindowStatesAreReportedUnhandled) {
  create();

  std::vector<uint32_t> states = { static_cast<uint32_t>(toplevel_state_t::eActivated),
                                   static_cast<uint32_t>(toplevel_state_t::eMaximized) };
  EXPECT_EQ(window.toplevel()->configure(800, 600, states), event_outcome_t::eUnhandled);
  EXPECT_EQ(window.toplevel()->states(), states);
  EXPECT_EQ(window.toplevel()->suggested_size(), (extent_t{ 800, 600 }));
}

TEST_F(Handshake, CloseIsReportedUnhandled) {
  create();

  bool closed = false;
  window.toplevel()->events.on_close.connect([&] { closed = true; });

  EXPECT_EQ(window.toplevel()->close(), event_outcome_t::eUnhandled);
  EXPECT_TRUE(closed);
  EXPECT_TRUE(conn.requests.empty());
}

TEST_F(Handshake, DecorationConfigureRecordsTheEffectiveMode) {
  create(decoration_manager);

  std::vector<decoration_mode_t> modes;
  window.decoration()->events.on_mode.connect([&](decoration_mode_t m) { modes.push_back(m); });

  EXPECT_EQ(window.decoration()->configure(1), event_outcome_t::eHandled);
  EXPECT_EQ(window.decoration()->current(), decoration_mode_t::eClientSide);
  EXPECT_EQ(window.decoration()->requested(), decoration_mode_t::eServerSide);

  EXPECT_EQ(window.decoration()->configure(77), event_outcome_t::eUnhandled);
  EXPECT_EQ(window.decoration()->current(), decoration_mode_t::eClientSide);

  EXPECT_EQ(modes, (std::vector<decoration_mode_t>{ decoration_mode_t::eClientSide }));

  // Decoration events never drive the surface.
  EXPECT_TRUE(conn.requests.empty());
}
