/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <system_error>
#include <type_traits>

#include <fmt/format.h>

#include "outcome/custom.hpp"
#include "outcome/outcome.hpp"

namespace parabridge::scanner {

  enum class ScannerError {
    PARACHAIN_NOT_REGISTERED = 1,
    MESSAGES_NOT_FOUND,
    PROOF_NOT_FOUND,
    PROOF_ROOT_MISMATCH,
    PROOF_INVALID,
    MALFORMED_COMMITMENT_DIGEST,
    VALIDATION_DATA_NOT_FOUND,
    INCLUSION_NOT_FOUND,
    LOOKBACK_EXCEEDED,
    INCOMPLETE_TASK,
    CANCELLED,
  };

}  // namespace parabridge::scanner

OUTCOME_HPP_DECLARE_ERROR(parabridge::scanner, ScannerError);

namespace parabridge::scanner {

  /**
   * Error of a scan step: the classifying code and the chain of operations
   * that led to it, outermost first
   */
  struct ScanError {
    ScanError() = default;

    ScanError(std::error_code code, std::string context = {})
        : code{code}, context{std::move(context)} {}

    ScanError(ScannerError e, std::string context = {})
        : ScanError{make_error_code(e), std::move(context)} {}

    void prependContext(std::string_view outer) {
      context = context.empty() ? std::string{outer}
                                : fmt::format("{}: {}", outer, context);
    }

    std::string message() const {
      if (context.empty()) {
        return code.message();
      }
      return fmt::format("{}: {}", context, code.message());
    }

    std::error_code code;
    std::string context;
  };

  inline std::error_code make_error_code(const ScanError &error) {
    return error.code;
  }

  [[noreturn]] inline void outcome_throw_as_system_error_with_payload(
      const ScanError &error) {
    throw std::system_error(error.code, error.context);
  }

  template <typename T>
  using ScanOutcome = CustomOutcome<T, ScanError>;

  namespace detail {
    inline ScanError toScanError(const std::error_code &ec) {
      return ScanError{ec};
    }

    inline ScanError toScanError(ScanError error) {
      return error;
    }
  }  // namespace detail

  /**
   * Passes a value through, or prepends the formatted description of the
   * failed operation to the error
   */
  template <typename Result, typename... Args>
  auto withContext(Result &&result,
                   fmt::format_string<Args...> format,
                   Args &&...args)
      -> ScanOutcome<typename std::decay_t<Result>::value_type> {
    using T = typename std::decay_t<Result>::value_type;
    if (result.has_error()) {
      auto error = detail::toScanError(std::forward<Result>(result).error());
      error.prependContext(fmt::format(format, std::forward<Args>(args)...));
      return error;
    }
    if constexpr (std::is_void_v<T>) {
      return outcome::success();
    } else {
      return std::forward<Result>(result).value();
    }
  }

}  // namespace parabridge::scanner

template <>
struct fmt::formatter<parabridge::scanner::ScanError>
    : fmt::formatter<std::string_view> {
  template <typename FormatCtx>
  auto format(const parabridge::scanner::ScanError &error,
              FormatCtx &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(error.message(), ctx);
  }
};
