#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace wisp {

  /**
   * @brief An anonymous, memory-mapped file used as pixel storage.
   *
   * The region exclusively owns its descriptor and its mapping, both are
   * released in the destructor. The server maps the same descriptor, so
   * the owner must keep the region alive until every buffer referencing
   * it was released by the server.
   */
  class shm_region_t {
    int    fd_;
    void  *data_;
    size_t size_;

    shm_region_t(int fd, void *data, size_t size);

    public:
    /**
     * @brief Create a memfd of exactly `size' bytes and map it shared,
     * read-write.
     *
     * Throws `fatal_error_t' (eAllocation) when `size' is zero or the file
     * cannot be sized or mapped.
     */
    static shm_region_t
    allocate(size_t size);

    shm_region_t(shm_region_t &&) noexcept;
    shm_region_t &
    operator=(shm_region_t &&) noexcept;

    shm_region_t(const shm_region_t &) = delete;
    shm_region_t &
    operator=(const shm_region_t &) = delete;

    ~shm_region_t();

    int
    fd() const {
      return fd_;
    }

    void *
    data() {
      return data_;
    }

    size_t
    size() const {
      return size_;
    }

    std::span<uint8_t>
    bytes() {
      return { static_cast<uint8_t *>(data_), size_ };
    }

    std::span<const uint8_t>
    bytes() const {
      return { static_cast<const uint8_t *>(data_), size_ };
    }

    private:
    void
    reset();
  };
}
