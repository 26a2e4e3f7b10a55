#pragma once

#include "wisp/core/protocol.hpp"
#include "wisp/core/shm.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace wisp {

  constexpr int32_t
  bytes_per_pixel(pixel_format_t format) {
    switch (format) {
      case pixel_format_t::eArgb8888:
      case pixel_format_t::eXrgb8888:
        return 4;
    }
    return 4;
  }

  /// A 32-bit `0xAARRGGBB' colour.
  struct color_t {
    uint32_t argb;

    constexpr uint8_t
    a() const {
      return argb >> 24;
    }
    constexpr uint8_t
    r() const {
      return (argb >> 16) & 0xff;
    }
    constexpr uint8_t
    g() const {
      return (argb >> 8) & 0xff;
    }
    constexpr uint8_t
    b() const {
      return argb & 0xff;
    }
  };

  /**
   * @brief A `wl_buffer' together with the pool and shared memory
   * backing it.
   *
   * The destructor destroys the buffer and the pool, then unmaps and
   * closes the region.  Owners must not destroy (or refill) a buffer
   * while it is `busy', i.e. attached and not yet released by the
   * server.
   */
  struct shm_buffer_t {
    shm_requests_t *requests;
    object_t        pool, buffer;
    shm_region_t    region;
    int32_t         width, height, stride;
    pixel_format_t  format;
    bool            busy{ false };

    shm_buffer_t(shm_requests_t &,
                 object_t pool,
                 object_t buffer,
                 shm_region_t,
                 int32_t width,
                 int32_t height,
                 int32_t stride,
                 pixel_format_t);
    ~shm_buffer_t();

    shm_buffer_t(const shm_buffer_t &) = delete;
    shm_buffer_t &
    operator=(const shm_buffer_t &) = delete;

    size_t
    size() const {
      return static_cast<size_t>(stride) * height;
    }

    /// Write `color' to every pixel, in the wl_shm little-endian layout
    /// (B, G, R, A in memory).
    void
    fill(color_t color);

    /// Mark the buffer as in use by the server; cleared on `release'.
    void
    mark_busy() {
      busy = true;
    }

    void
    release() {
      busy = false;
    }
  };

  class buffer_provisioner_t {
    public:
    buffer_provisioner_t(shm_requests_t &requests, object_t shm);

    /**
     * @brief Allocate `width * height' pixels of shared memory, create a
     * pool spanning exactly that memory and a single buffer covering
     * the whole pool.
     *
     * Throws `fatal_error_t' (eAllocation) on invalid geometry or when the
     * memory cannot be allocated.
     */
    std::unique_ptr<shm_buffer_t>
    provision(int32_t width, int32_t height, pixel_format_t format);

    void
    on_format(uint32_t format);

    bool
    supports(pixel_format_t format) const;

    private:
    shm_requests_t       &requests_;
    object_t              shm_;
    std::vector<uint32_t> formats_;
  };
}
