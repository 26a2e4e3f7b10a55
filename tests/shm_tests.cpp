#include <gtest/gtest.h>

#include "wisp/core/error.hpp"
#include "wisp/core/shm.hpp"

#include <cstring>
#include <fcntl.h>
#include <limits>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace wisp;

TEST(ShmRegion, AllocatesExactlyTheRequestedSize) {
  auto region = shm_region_t::allocate(4096);

  ASSERT_GE(region.fd(), 0);
  ASSERT_NE(region.data(), nullptr);
  EXPECT_EQ(region.size(), 4096u);

  struct stat st {};
  ASSERT_EQ(fstat(region.fd(), &st), 0);
  EXPECT_EQ(st.st_size, 4096);
}

TEST(ShmRegion, MappingIsSharedThroughTheDescriptor) {
  auto region = shm_region_t::allocate(64);
  std::memset(region.data(), 0xab, region.size());

  // A second mapping of the same descriptor, like the server's.
  void *other = mmap(nullptr, 64, PROT_READ, MAP_SHARED, region.fd(), 0);
  ASSERT_NE(other, MAP_FAILED);
  EXPECT_EQ(static_cast<const uint8_t *>(other)[0], 0xab);
  EXPECT_EQ(static_cast<const uint8_t *>(other)[63], 0xab);
  munmap(other, 64);
}

TEST(ShmRegion, DescriptorIsCloseOnExec) {
  auto region = shm_region_t::allocate(16);
  int  flags  = fcntl(region.fd(), F_GETFD);
  ASSERT_GE(flags, 0);
  EXPECT_TRUE(flags & FD_CLOEXEC);
}

TEST(ShmRegion, ZeroSizeIsAnAllocationError) {
  try {
    shm_region_t::allocate(0);
    FAIL() << "expected fatal_error_t";
  } catch (const fatal_error_t &e) {
    EXPECT_EQ(e.kind(), error_kind_t::eAllocation);
    EXPECT_EQ(e.phase(), phase_t::eAllocation);
  }
}

TEST(ShmRegion, UnrepresentableSizeIsAnAllocationError) {
  EXPECT_THROW(shm_region_t::allocate(std::numeric_limits<size_t>::max()), fatal_error_t);
}

TEST(ShmRegion, MoveTransfersOwnership) {
  auto a  = shm_region_t::allocate(32);
  int  fd = a.fd();

  shm_region_t b = std::move(a);
  EXPECT_EQ(b.fd(), fd);
  EXPECT_EQ(a.fd(), -1);
  EXPECT_EQ(a.data(), nullptr);
  EXPECT_EQ(a.size(), 0u);

  // Still open, owned by `b'.
  EXPECT_GE(fcntl(fd, F_GETFD), 0);
}

TEST(ShmRegion, DestructionClosesTheDescriptor) {
  int fd;
  {
    auto region = shm_region_t::allocate(32);
    fd          = region.fd();
  }
  EXPECT_EQ(fcntl(fd, F_GETFD), -1);
}
