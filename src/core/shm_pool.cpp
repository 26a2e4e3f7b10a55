#include "wisp/core/shm_pool.hpp"
#include "wisp/core/error.hpp"

#include "../log.hpp"

#include <algorithm>
#include <cstring>
#include <format>
#include <limits>

namespace wisp {

  shm_buffer_t::shm_buffer_t(shm_requests_t &requests,
                             object_t        pool,
                             object_t        buffer,
                             shm_region_t    region,
                             int32_t         width,
                             int32_t         height,
                             int32_t         stride,
                             pixel_format_t  format)
    : requests(&requests)
    , pool(pool)
    , buffer(buffer)
    , region(std::move(region))
    , width(width)
    , height(height)
    , stride(stride)
    , format(format) {}

  shm_buffer_t::~shm_buffer_t() {
    if (busy) {
      // Only reached when the whole session is torn down.
      WARN("Destroying wl_buffer {:#x} that was not released by the server", buffer.value);
    }

    // The region is unmapped after this body, when the member is
    // destroyed; both protocol objects are gone by then.
    requests->destroy_buffer(buffer);
    requests->destroy_pool(pool);
  }

  void
  shm_buffer_t::fill(color_t color) {
    uint8_t pixel[4] = { color.b(), color.g(), color.r(), color.a() };

    auto bytes = region.bytes();
    for (int32_t y = 0; y < height; ++y) {
      uint8_t *row = bytes.data() + static_cast<size_t>(y) * stride;
      for (int32_t x = 0; x < width; ++x) {
        std::memcpy(row + static_cast<size_t>(x) * 4, pixel, sizeof(pixel));
      }
    }
  }

  buffer_provisioner_t::buffer_provisioner_t(shm_requests_t &requests, object_t shm)
    : requests_(requests)
    , shm_(shm) {}

  std::unique_ptr<shm_buffer_t>
  buffer_provisioner_t::provision(int32_t width, int32_t height, pixel_format_t format) {
    if (width <= 0 || height <= 0) {
      throw fatal_error_t(error_kind_t::eAllocation,
                          phase_t::eAllocation,
                          std::format("invalid buffer geometry {}x{}", width, height));
    }

    int64_t stride = static_cast<int64_t>(width) * bytes_per_pixel(format);
    int64_t size   = stride * height;
    if (size > std::numeric_limits<int32_t>::max()) {
      throw fatal_error_t(error_kind_t::eAllocation,
                          phase_t::eAllocation,
                          std::format("buffer of {}x{} does not fit a wl_shm_pool", width, height));
    }

    if (!supports(format)) {
      WARN("Server did not advertise wl_shm format {}", static_cast<uint32_t>(format));
    }

    auto region = shm_region_t::allocate(static_cast<size_t>(size));

    object_t pool = requests_.create_pool(shm_, region.fd(), static_cast<int32_t>(size));
    object_t buffer =
      requests_.create_buffer(pool, 0, width, height, static_cast<int32_t>(stride), format);

    TRACE("Provisioned {}x{} buffer, stride {}, {} bytes", width, height, stride, size);
    return std::make_unique<shm_buffer_t>(requests_,
                                          pool,
                                          buffer,
                                          std::move(region),
                                          width,
                                          height,
                                          static_cast<int32_t>(stride),
                                          format);
  }

  void
  buffer_provisioner_t::on_format(uint32_t format) {
    if (std::find(formats_.begin(), formats_.end(), format) == formats_.end())
      formats_.push_back(format);
  }

  bool
  buffer_provisioner_t::supports(pixel_format_t format) const {
    // ARGB8888 and XRGB8888 are mandatory for every compositor.
    if (formats_.empty())
      return true;
    return std::find(formats_.begin(), formats_.end(), static_cast<uint32_t>(format))
           != formats_.end();
  }
}
