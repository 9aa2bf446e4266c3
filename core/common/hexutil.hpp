/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <boost/algorithm/hex.hpp>

#include "outcome/outcome.hpp"

namespace parabridge::common {

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
    VALUE_OUT_OF_RANGE,
    MISSING_0X_PREFIX,
    UNKNOWN
  };
}  // namespace parabridge::common

OUTCOME_HPP_DECLARE_ERROR(parabridge::common, UnhexError);

namespace parabridge::common {
  /**
   * @brief Converts bytes to hex representation
   * @param bytes bytes
   * @return hexstring
   */
  std::string hex_lower(std::span<const uint8_t> bytes);

  /**
   * @brief Converts bytes to hex representation with prefix 0x
   * @param bytes bytes
   * @return hexstring
   */
  std::string hex_lower_0x(std::span<const uint8_t> bytes);

  template <std::output_iterator<uint8_t> Iter>
  outcome::result<void> unhex_to(std::string_view hex, Iter out) {
    try {
      boost::algorithm::unhex(hex.begin(), hex.end(), out);
      return outcome::success();

    } catch (const boost::algorithm::not_enough_input &e) {
      return UnhexError::NOT_ENOUGH_INPUT;

    } catch (const boost::algorithm::non_hex_input &e) {
      return UnhexError::NON_HEX_INPUT;

    } catch (const std::exception &e) {
      return UnhexError::UNKNOWN;
    }
  }

  /**
   * @brief Converts hex representation to bytes
   * @param hex individual chars
   * @return result containing array of bytes if input string is hex encoded
   * and has even length
   *
   * @note reads both uppercase and lowercase hexstrings
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);

  /**
   * @brief Unhex hex-string with 0x in the beginning
   * @param hex hex string with 0x in the beginning
   * @return unhexed buffer
   */
  outcome::result<std::vector<uint8_t>> unhexWith0x(std::string_view hex);

  /**
   * @brief unhex big-endian hex-string with 0x in the beginning, as
   * JSON-RPC returns quantities (e.g. block numbers)
   * @tparam T unsigned integer value type to decode
   * @param value source hex string, leading zeros may be omitted
   * @return unhexed value
   */
  template <class T, typename = std::enable_if_t<std::is_unsigned_v<T>>>
  outcome::result<T> unhexNumber(std::string_view value) {
    constexpr std::string_view prefix = "0x";
    if (not value.starts_with(prefix)) {
      return UnhexError::MISSING_0X_PREFIX;
    }
    value.remove_prefix(prefix.size());
    if (value.empty()) {
      return UnhexError::NOT_ENOUGH_INPUT;
    }

    std::string padded;
    if (value.size() % 2 != 0) {
      padded.reserve(value.size() + 1);
      padded.push_back('0');
      padded.append(value);
      value = padded;
    }

    std::vector<uint8_t> bytes;
    OUTCOME_TRY(unhex_to(value, std::back_inserter(bytes)));

    while (bytes.size() > 1 and bytes.front() == 0) {
      bytes.erase(bytes.begin());
    }
    if (bytes.size() > sizeof(T)) {
      return UnhexError::VALUE_OUT_OF_RANGE;
    }

    T result{0u};
    for (auto b : bytes) {
      if constexpr (sizeof(T) > 1) {
        result <<= 8u;
      } else {
        result = 0;
      }
      result += b;
    }

    return result;
  }

}  // namespace parabridge::common
