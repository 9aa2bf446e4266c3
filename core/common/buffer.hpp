/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "common/buffer_view.hpp"
#include "common/hexutil.hpp"
#include "outcome/outcome.hpp"

namespace parabridge::common {

  /**
   * @brief Class represents arbitrary (including empty) byte buffer.
   */
  class Buffer : public std::vector<uint8_t> {
   public:
    using Base = std::vector<uint8_t>;

    Buffer() = default;

    /**
     * @brief lvalue construct buffer from a byte vector
     */
    explicit Buffer(const Base &other) : Base(other) {}
    Buffer(Base &&other) : Base(std::move(other)) {}

    Buffer(const BufferView &s) : Base(s.begin(), s.end()) {}

    template <size_t N>
    explicit Buffer(const std::array<value_type, N> &other)
        : Base(other.begin(), other.end()) {}

    Buffer(const uint8_t *begin, const uint8_t *end) : Base(begin, end) {}

    using Base::Base;
    using Base::operator=;

    Buffer &operator+=(const BufferView &view) {
      return put(view);
    }

    /**
     * @brief Put a 8-bit {@param n} in this buffer.
     * @return this buffer, suitable for chaining.
     */
    Buffer &putUint8(uint8_t n) {
      push_back(n);
      return *this;
    }

    /**
     * @brief Put a 32-bit {@param n} number in this buffer, little-endian
     * as SCALE and the storage key hashers expect it
     * @return this buffer, suitable for chaining.
     */
    Buffer &putUint32LE(uint32_t n) {
      for (size_t i = 0; i < sizeof(n); ++i) {
        push_back(static_cast<uint8_t>(n >> (8 * i)));
      }
      return *this;
    }

    /**
     * @brief Put a sequence of bytes in this buffer.
     * @return this buffer, suitable for chaining.
     */
    Buffer &put(std::string_view view) {
      insert(end(), view.begin(), view.end());
      return *this;
    }

    /**
     * @brief Put a sequence of bytes in this buffer.
     * @return this buffer, suitable for chaining.
     */
    Buffer &put(const BufferView &view) {
      insert(end(), view.begin(), view.end());
      return *this;
    }

    BufferView view() const {
      return *this;
    }

    /**
     * @brief encode bytearray as hex
     * @return hex-encoded string
     */
    std::string toHex() const {
      return hex_lower(*this);
    }

    std::string toHexWithPrefix() const {
      return hex_lower_0x(*this);
    }

    /**
     * @brief Construct Buffer from hex string, 0x-prefixed or not
     */
    static outcome::result<Buffer> fromHex(std::string_view hex) {
      if (hex.starts_with("0x")) {
        hex.remove_prefix(2);
      }
      OUTCOME_TRY(bytes, unhex(hex));
      return Buffer{std::move(bytes)};
    }

    /**
     * @brief Construct Buffer from string, its characters become bytes
     */
    static Buffer fromString(std::string_view str) {
      return {str.begin(), str.end()};
    }
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const Buffer &buffer) {
    return s << static_cast<const Buffer::Base &>(buffer);
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, Buffer &buffer) {
    return s >> static_cast<Buffer::Base &>(buffer);
  }

  inline std::ostream &operator<<(std::ostream &os, const Buffer &buffer) {
    return os << buffer.view();
  }

  namespace literals {
    inline Buffer operator""_buf(const char *c, size_t s) {
      return Buffer::fromString({c, s});
    }
  }  // namespace literals

}  // namespace parabridge::common

template <>
struct fmt::formatter<parabridge::common::Buffer>
    : fmt::formatter<parabridge::common::BufferView> {
  template <typename FormatCtx>
  auto format(const parabridge::common::Buffer &buffer, FormatCtx &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<parabridge::common::BufferView>::format(
        buffer.view(), ctx);
  }
};
