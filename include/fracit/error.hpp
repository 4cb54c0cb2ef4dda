#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace fracit {

enum class errc : int {
  configuration = 1, // max iteration count below 1
  domain_shape,      // domain has no rows or no columns
  domain_access,     // a sample point could not be fetched
};

[[nodiscard]] constexpr auto what(errc code) noexcept -> std::string_view {
  switch (code) {
  case errc::configuration:
    return "configuration error";
  case errc::domain_shape:
    return "domain shape error";
  case errc::domain_access:
    return "domain access fault";
  }
  return "unknown error";
}

struct error {
  errc code;
  std::string message;
};

[[nodiscard]] inline auto make_error(errc code, std::string message) -> error {
  return error{code, std::move(message)};
}

} // namespace fracit
