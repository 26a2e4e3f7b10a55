#include <gtest/gtest.h>

#include "fake_connection.hpp"
#include "wisp/core/shm_pool.hpp"

#include <algorithm>
#include <array>
#include <sys/stat.h>

using namespace wisp;
using wisp::test::fake_connection_t;

namespace {
  constexpr object_t SHM{ 100 };
}

TEST(BufferProvisioner, GeometryHasNoPadding) {
  fake_connection_t    conn;
  buffer_provisioner_t provisioner(conn, SHM);

  auto buffer = provisioner.provision(500, 500, pixel_format_t::eArgb8888);

  EXPECT_EQ(buffer->stride, 500 * 4);
  EXPECT_EQ(buffer->size(), 500u * 500u * 4u);
  EXPECT_EQ(buffer->region.size(), 500u * 500u * 4u);

  for (auto [w, h] : { std::pair{ 1, 1 }, std::pair{ 3, 7 }, std::pair{ 641, 480 } }) {
    auto b = provisioner.provision(w, h, pixel_format_t::eXrgb8888);
    EXPECT_EQ(b->stride, w * 4);
    EXPECT_EQ(b->size(), static_cast<size_t>(w) * h * 4);
  }
}

TEST(BufferProvisioner, CreatesPoolThenBufferOverTheWholeRegion) {
  fake_connection_t    conn;
  buffer_provisioner_t provisioner(conn, SHM);

  auto buffer = provisioner.provision(20, 10, pixel_format_t::eArgb8888);

  ASSERT_EQ(conn.ops(), (std::vector<std::string>{ "create_pool", "create_buffer" }));

  auto const &pool = conn.requests[0];
  EXPECT_EQ(pool.target, SHM);
  EXPECT_EQ(pool.args[0], buffer->region.fd());
  EXPECT_EQ(pool.args[1], 20 * 10 * 4);
  EXPECT_EQ(pool.created, buffer->pool);

  auto const &create = conn.requests[1];
  EXPECT_EQ(create.target, buffer->pool);
  EXPECT_EQ(create.args,
            (std::vector<int64_t>{ 0, 20, 10, 80, static_cast<int64_t>(pixel_format_t::eArgb8888) }));
  EXPECT_EQ(create.created, buffer->buffer);
}

TEST(BufferProvisioner, DescriptorStaysOpenWhileTheBufferLives) {
  fake_connection_t    conn;
  buffer_provisioner_t provisioner(conn, SHM);

  auto buffer = provisioner.provision(8, 8, pixel_format_t::eArgb8888);

  struct stat st {};
  ASSERT_EQ(fstat(conn.pool_fds.front(), &st), 0);
  EXPECT_EQ(st.st_size, 8 * 8 * 4);
}

TEST(BufferProvisioner, DestroyingTheBufferDestroysBufferThenPool) {
  fake_connection_t    conn;
  buffer_provisioner_t provisioner(conn, SHM);

  auto     buffer = provisioner.provision(4, 4, pixel_format_t::eArgb8888);
  object_t wl_buffer = buffer->buffer, pool = buffer->pool;
  buffer.reset();

  auto destroys = conn.ops({ "destroy_buffer", "destroy_pool" });
  ASSERT_EQ(destroys, (std::vector<std::string>{ "destroy_buffer", "destroy_pool" }));
  EXPECT_EQ(conn.find("destroy_buffer")[0].target, wl_buffer);
  EXPECT_EQ(conn.find("destroy_pool")[0].target, pool);
}

TEST(BufferProvisioner, RejectsInvalidGeometry) {
  fake_connection_t    conn;
  buffer_provisioner_t provisioner(conn, SHM);

  EXPECT_THROW(provisioner.provision(0, 10, pixel_format_t::eArgb8888), fatal_error_t);
  EXPECT_THROW(provisioner.provision(10, -1, pixel_format_t::eArgb8888), fatal_error_t);
  // 4 * 40000 * 40000 does not fit the int32 pool size.
  EXPECT_THROW(provisioner.provision(40000, 40000, pixel_format_t::eArgb8888), fatal_error_t);
  EXPECT_TRUE(conn.requests.empty());
}

TEST(ShmBuffer, FillOpaqueBlueMatchesReferenceBytes) {
  fake_connection_t    conn;
  buffer_provisioner_t provisioner(conn, SHM);

  auto buffer = provisioner.provision(500, 500, pixel_format_t::eArgb8888);
  buffer->fill(color_t{ 0xff0000ff });

  // Little-endian 0xAARRGGBB: B, G, R, A in memory.
  constexpr std::array<uint8_t, 4> expected = { 0xff, 0x00, 0x00, 0xff };

  auto bytes = buffer->region.bytes();
  ASSERT_EQ(bytes.size(), 1000000u);
  for (size_t i = 0; i < bytes.size(); i += 4) {
    ASSERT_EQ(bytes[i + 0], expected[0]) << "pixel " << i / 4;
    ASSERT_EQ(bytes[i + 1], expected[1]) << "pixel " << i / 4;
    ASSERT_EQ(bytes[i + 2], expected[2]) << "pixel " << i / 4;
    ASSERT_EQ(bytes[i + 3], expected[3]) << "pixel " << i / 4;
  }
}

TEST(ShmBuffer, FillUsesWlShmByteOrder) {
  fake_connection_t    conn;
  buffer_provisioner_t provisioner(conn, SHM);

  auto buffer = provisioner.provision(2, 1, pixel_format_t::eArgb8888);
  buffer->fill(color_t{ 0x80123456 });

  auto bytes = buffer->region.bytes();
  std::array<uint8_t, 8> reference = { 0x56, 0x34, 0x12, 0x80, 0x56, 0x34, 0x12, 0x80 };
  EXPECT_TRUE(std::equal(reference.begin(), reference.end(), bytes.begin()));
}

TEST(BufferProvisioner, TracksAdvertisedFormats) {
  fake_connection_t    conn;
  buffer_provisioner_t provisioner(conn, SHM);

  // Nothing advertised yet: the mandatory formats are assumed.
  EXPECT_TRUE(provisioner.supports(pixel_format_t::eArgb8888));

  provisioner.on_format(1);
  provisioner.on_format(1);
  EXPECT_TRUE(provisioner.supports(pixel_format_t::eXrgb8888));
  EXPECT_FALSE(provisioner.supports(pixel_format_t::eArgb8888));

  provisioner.on_format(0);
  EXPECT_TRUE(provisioner.supports(pixel_format_t::eArgb8888));
}
