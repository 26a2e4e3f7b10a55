#include "wisp/core/shm.hpp"
#include "wisp/core/error.hpp"

#include "../log.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <limits>
#include <string>
#include <sys/mman.h>
#include <sys/types.h>
#include <unistd.h>
#include <utility>

namespace wisp {

  shm_region_t::shm_region_t(int fd, void *data, size_t size)
    : fd_(fd)
    , data_(data)
    , size_(size) {}

  shm_region_t
  shm_region_t::allocate(size_t size) {
    if (size == 0) {
      throw fatal_error_t(
        error_kind_t::eAllocation, phase_t::eAllocation, "shared memory size must be positive");
    }

    if (size > static_cast<size_t>(std::numeric_limits<off_t>::max())) {
      throw fatal_error_t(error_kind_t::eAllocation,
                          phase_t::eAllocation,
                          std::format("shared memory size {} exceeds off_t", size));
    }

    int fd = memfd_create("wisp-shm", MFD_CLOEXEC);
    if (fd < 0) {
      throw fatal_error_t(error_kind_t::eAllocation,
                          phase_t::eAllocation,
                          std::format("memfd_create failed: {}", strerror(errno)));
    }

    int ret;
    do {
      ret = ftruncate(fd, static_cast<off_t>(size));
    } while (ret < 0 && errno == EINTR);

    if (ret < 0) {
      int err = errno;
      close(fd);
      throw fatal_error_t(error_kind_t::eAllocation,
                          phase_t::eAllocation,
                          std::format("ftruncate to {} bytes failed: {}", size, strerror(err)));
    }

    void *data = mmap(nullptr, size, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    if (data == MAP_FAILED) {
      int err = errno;
      close(fd);
      throw fatal_error_t(error_kind_t::eAllocation,
                          phase_t::eAllocation,
                          std::format("mmap of {} bytes failed: {}", size, strerror(err)));
    }

    TRACE("Allocated {} bytes of shared memory (fd {})", size, fd);
    return shm_region_t(fd, data, size);
  }

  shm_region_t::shm_region_t(shm_region_t &&other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , data_(std::exchange(other.data_, nullptr))
    , size_(std::exchange(other.size_, 0)) {}

  shm_region_t &
  shm_region_t::operator=(shm_region_t &&other) noexcept {
    if (this != &other) {
      reset();
      fd_   = std::exchange(other.fd_, -1);
      data_ = std::exchange(other.data_, nullptr);
      size_ = std::exchange(other.size_, 0);
    }
    return *this;
  }

  shm_region_t::~shm_region_t() {
    reset();
  }

  void
  shm_region_t::reset() {
    if (data_ && munmap(data_, size_)) {
      ERROR("munmap of shared memory failed: {}", strerror(errno));
    }
    if (fd_ >= 0)
      close(fd_);

    fd_   = -1;
    data_ = nullptr;
    size_ = 0;
  }
}
