#include <syncoro/assert.hpp>
#include <syncoro/error.hpp>

#include <string>

namespace syncoro {
namespace detail {

struct error_category_impl : std::error_category {
  auto name() const noexcept -> char const* override {
    return "syncoro";
  }

  auto message(int ev) const -> std::string override {
    // clang-format off
    switch (static_cast<error>(ev)) {
      case error::not_connected:     return "Not connected.";
      case error::connection_closed: return "Connection closed.";
      case error::bootstrap_failed:  return "Failed to open the underlying resource.";
      case error::operation_failed:  return "Operation raised an exception.";
      case error::teardown_failed:   return "Failed to release the underlying resource.";
      case error::internal_error:    return "Internal error.";
    }
    // clang-format on
    return "syncoro error.";
  }
};

}  // namespace detail

auto error_category() noexcept -> std::error_category const& {
  static detail::error_category_impl instance;
  return instance;
}

auto make_error_code(error e) -> std::error_code {
  return std::error_code{static_cast<int>(e), error_category()};
}

}  // namespace syncoro
