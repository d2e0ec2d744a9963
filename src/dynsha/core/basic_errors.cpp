// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <dynsha/core/basic_errors.h>

namespace dynsha {

namespace {
  class DynshaErrorCategory : public std::error_category {
  public:
    const char* name() const noexcept override {
      return "dynsha";
    }

    std::string message(int condition) const override {
      switch (static_cast<Errc>(condition)) {
      case Errc::malformed_length:
        return "malformed length";
      case Errc::invalid_index:
        return "invalid index";
      case Errc::padding_violation:
        return "padding violation";
      case Errc::null_in_selection:
        return "null byte in selection";
      case Errc::selector_not_found:
        return "selector not found";
      case Errc::capacity_exceeded:
        return "capacity exceeded";
      }
      return "unknown error";
    }
  };
} // namespace

const std::error_category& dynsha_category() {
  static DynshaErrorCategory category{};
  return category;
}

const Error err_malformed_length = make_error(Errc::malformed_length);
const Error err_invalid_index = make_error(Errc::invalid_index);
const Error err_padding_violation = make_error(Errc::padding_violation);
const Error err_null_in_selection = make_error(Errc::null_in_selection);
const Error err_selector_not_found = make_error(Errc::selector_not_found);
const Error err_capacity_exceeded = make_error(Errc::capacity_exceeded);

} // namespace dynsha
