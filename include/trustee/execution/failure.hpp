#pragma once

#include <trustee/schema/transaction_error_code.hpp>
#include <optional>
#include <string>

namespace trustee::execution {

/// Rejection reason produced by wallet components. An empty
/// `std::optional<failure>` means the step succeeded.
struct failure final {
  trustee::schema::transaction_error_code code{};
  std::string log;
  std::string info;
};

inline std::optional<failure> fail(
    const trustee::schema::transaction_error_code code,
    std::string log,
    std::string info = {}) {
  return failure{.code = code, .log = std::move(log), .info = std::move(info)};
}

}  // namespace trustee::execution
