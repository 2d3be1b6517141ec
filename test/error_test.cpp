#include <gtest/gtest.h>

#include <syncoro/error.hpp>
#include <syncoro/error_info.hpp>

#include <exception>
#include <stdexcept>
#include <string>
#include <system_error>

using syncoro::error;
using syncoro::error_info;

TEST(error_test, category_and_messages) {
  std::error_code ec = error::bootstrap_failed;
  EXPECT_STREQ(ec.category().name(), "syncoro");
  EXPECT_EQ(ec.value(), static_cast<int>(error::bootstrap_failed));
  EXPECT_EQ(ec.message(), "Failed to open the underlying resource.");

  EXPECT_EQ(std::error_code{error::not_connected}.message(), "Not connected.");
  EXPECT_EQ(std::error_code{error::connection_closed}.message(), "Connection closed.");
  EXPECT_EQ(std::error_code{error::teardown_failed}.message(),
            "Failed to release the underlying resource.");
  EXPECT_EQ(&std::error_code{error::internal_error}.category(), &syncoro::error_category());
}

TEST(error_test, codes_are_non_zero_and_distinct) {
  EXPECT_TRUE(static_cast<bool>(std::error_code{error::not_connected}));
  EXPECT_NE(std::error_code{error::not_connected}, std::error_code{error::connection_closed});
  EXPECT_NE(std::error_code{error::operation_failed},
            std::make_error_code(std::errc::operation_canceled));
}

TEST(error_test, from_exception_keeps_message_and_exception) {
  auto ep = std::make_exception_ptr(std::invalid_argument("bad key"));
  auto info = error_info::from_exception(error::operation_failed, ep);

  EXPECT_EQ(info.code, error::operation_failed);
  EXPECT_EQ(info.detail, "bad key");
  EXPECT_FALSE(static_cast<bool>(info.cause_ec));
  EXPECT_TRUE(info.has_exception());
  EXPECT_THROW(info.rethrow(), std::invalid_argument);
}

TEST(error_test, from_exception_takes_system_error_code_as_cause) {
  auto cause = std::make_error_code(std::errc::no_such_file_or_directory);
  auto ep = std::make_exception_ptr(std::system_error(cause, "open"));
  auto info = error_info::from_exception(error::bootstrap_failed, ep);

  EXPECT_EQ(info.code, error::bootstrap_failed);
  EXPECT_EQ(info.cause_ec, cause);
  EXPECT_NE(info.detail.find("open"), std::string::npos);
}

TEST(error_test, from_exception_with_non_standard_exception) {
  auto ep = std::make_exception_ptr(17);
  auto info = error_info::from_exception(error::operation_failed, ep);

  EXPECT_EQ(info.detail, "unknown exception");
  EXPECT_THROW(info.rethrow(), int);
}

TEST(error_test, rethrow_without_exception_throws_system_error) {
  error_info info{error::connection_closed, "worker stopped"};
  EXPECT_FALSE(info.has_exception());

  try {
    info.rethrow();
    FAIL() << "rethrow() returned";
  } catch (std::system_error const& e) {
    EXPECT_EQ(e.code(), error::connection_closed);
  }
}

TEST(error_test, to_string_formats) {
  EXPECT_EQ(error_info{}.to_string(), "unknown error");
  EXPECT_EQ(error_info{error::not_connected}.to_string(), "syncoro: Not connected.");

  error_info with_detail{error::operation_failed, "division by zero"};
  EXPECT_EQ(with_detail.to_string(), "syncoro: Operation raised an exception. (division by zero)");

  error_info with_cause{error::teardown_failed};
  with_cause.set_cause(std::make_error_code(std::errc::io_error));
  EXPECT_NE(with_cause.to_string().find("(cause=generic: "), std::string::npos);

  error_info appended{error::internal_error, "worker"};
  appended.append_detail("could not start");
  EXPECT_EQ(appended.detail, "worker could not start");
}
