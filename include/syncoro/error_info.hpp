#pragma once

#include <syncoro/error.hpp>

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace syncoro {

/// A compact failure record with:
/// - a stable error_code (domain + value)
/// - an optional detail string (human-oriented; usually the exception message)
/// - an optional underlying std::error_code (no nesting)
/// - the original exception, when the failure was raised by user code on the worker thread
struct error_info {
  std::error_code code{};
  std::string detail{};
  std::error_code cause_ec{};
  std::exception_ptr exception{};

  error_info() = default;

  explicit error_info(std::error_code c) : code(c) {}

  error_info(std::error_code c, std::string d) : code(c), detail(std::move(d)) {}

  template <typename Errc>
    requires requires(Errc e) { std::error_code{e}; }
  explicit error_info(Errc e) : code(std::error_code{e}) {}

  template <typename Errc>
    requires requires(Errc e) { std::error_code{e}; }
  error_info(Errc e, std::string d) : code(std::error_code{e}), detail(std::move(d)) {}

  /// Build an error_info around a captured exception.
  ///
  /// The detail is the exception's what() when it derives from std::exception. A
  /// std::system_error also contributes its code as cause_ec.
  static auto from_exception(std::error_code c, std::exception_ptr ep) -> error_info {
    error_info out{c};
    out.exception = ep;
    if (ep == nullptr) {
      out.detail = "unknown exception";
      return out;
    }
    try {
      std::rethrow_exception(ep);
    } catch (std::system_error const& e) {
      out.detail = e.what();
      out.cause_ec = e.code();
    } catch (std::exception const& e) {
      out.detail = e.what();
    } catch (...) {
      out.detail = "unknown exception";
    }
    return out;
  }

  auto append_detail(std::string_view s) -> error_info& {
    if (s.empty()) {
      return *this;
    }
    if (!detail.empty()) {
      detail += " ";
    }
    detail.append(s.data(), s.size());
    return *this;
  }

  auto set_cause(std::error_code ec) -> error_info& {
    cause_ec = ec;
    return *this;
  }

  [[nodiscard]] auto has_exception() const noexcept -> bool { return exception != nullptr; }

  /// Rethrow the original exception if there is one, otherwise throw std::system_error.
  [[noreturn]] auto rethrow() const -> void {
    if (exception) {
      std::rethrow_exception(exception);
    }
    throw std::system_error(code, detail);
  }

  [[nodiscard]] auto to_string() const -> std::string {
    std::string out;

    if (code) {
      out += code.category().name();
      out += ": ";
      out += code.message();
    } else {
      out += "unknown error";
    }

    if (!detail.empty()) {
      out += " (";
      out += detail;
      out += ")";
      return out;
    }

    if (cause_ec) {
      out += " (cause=";
      out += cause_ec.category().name();
      out += ": ";
      out += cause_ec.message();
      out += ")";
    }

    return out;
  }
};

}  // namespace syncoro
