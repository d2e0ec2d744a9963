// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <dynsha/core/error.h>

namespace dynsha {

/// \brief error codes of the hashing engine and its input preparation
enum class Errc {
  malformed_length = 1,
  invalid_index,
  padding_violation,
  null_in_selection,
  selector_not_found,
  capacity_exceeded,
};

const std::error_category& dynsha_category();

inline Error make_error(Errc e) {
  return Error(static_cast<int>(e), dynsha_category());
}

extern const Error err_malformed_length;
extern const Error err_invalid_index;
extern const Error err_padding_violation;
extern const Error err_null_in_selection;
extern const Error err_selector_not_found;
extern const Error err_capacity_exceeded;

} // namespace dynsha
