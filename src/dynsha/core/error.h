// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <boost/outcome/result.hpp>
#include <fmt/core.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

namespace dynsha {

class UserErrorCategory : public std::error_category {
public:
  const char* name() const noexcept override {
    return "user";
  }
  std::string message(int condition) const override {
    return "unspecified error";
  }
};

inline const std::error_category& user_category() {
  static UserErrorCategory category{};
  return category;
}

class Error {
public:
  constexpr Error() noexcept = default;

  // NOTE: Do not set default value for 2nd parameter (error_category),
  // it makes `dynsha::Error` constructible from int, and break implicit construction of Result<int> from value.
  constexpr Error(int ec, const std::error_category& ecat): value_(ec), category_(&ecat) {}

  template<typename T>
  requires std::is_convertible_v<T, std::error_code>
  Error(T&& err) {
    auto ec = static_cast<std::error_code>(err);
    value_ = ec.value();
    category_ = &ec.category();
  }

  /// \brief constructs an error carrying both a code and a detailed message
  Error(std::error_code ec, std::string_view message)
    : value_(ec.value()), category_(&ec.category()), message_(message) {}

  /// \brief returns a copy of this error with a formatted detail message
  template<typename... T>
  auto with(fmt::format_string<T...> fmt, T&&... args) const -> Error {
    return Error(code(), fmt::vformat(fmt, fmt::make_format_args(args...)));
  }

  int value() const noexcept {
    return value_;
  }

  const std::error_category& category() const noexcept {
    return *category_;
  }

  std::error_code code() const noexcept {
    return {value_, *category_};
  }

  std::string message() const {
    if (message_) {
      return *message_;
    } else {
      return category().message(value());
    }
  }

  explicit operator bool() const noexcept {
    return value() != 0;
  }

  /// \brief compares by code only, ignoring the detail message
  bool is(const Error& err) const noexcept {
    return category() == err.category() && value() == err.value();
  }

  bool operator==(const Error& err) const& noexcept {
    return category() == err.category() && value() == err.value() && message_ == err.message_;
  }

  bool operator!=(const Error& err) const& noexcept {
    return !(*this == err);
  }

private:
  int value_ = 0;
  const std::error_category* category_ = &user_category();
  std::optional<std::string> message_{};
};

// hooks looked up by Boost.Outcome through ADL
inline std::error_code make_error_code(const Error& err) {
  return err.code();
}

[[noreturn]] inline void outcome_throw_as_system_error_with_payload(const Error& err) {
  throw std::system_error(err.code(), err.message());
}

} // namespace dynsha
