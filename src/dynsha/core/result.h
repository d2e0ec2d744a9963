// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <dynsha/core/error.h>

namespace dynsha {

using namespace BOOST_OUTCOME_V2_NAMESPACE;

// NOTE:
// `std::expected` doesn't support construction from Error type,
// so it needs to wrap an error like `return std::unexpected(E);` to propagate it.
// `Result<T, E>` derived from `boost::outcome_v2::basic_result<T, E>` allows construction from error.
template<typename T, typename E = Error, typename NoValuePolicy = policy::default_policy<T, E, void>>
class Result : public basic_result<T, E, NoValuePolicy> {
public:
  using basic_result<T, E, NoValuePolicy>::basic_result;
};

template<typename E, typename NoValuePolicy>
class Result<void, E, NoValuePolicy> : public basic_result<void, E, NoValuePolicy> {
public:
  using basic_result<void, E, NoValuePolicy>::basic_result;

  Result(): basic_result<void, E, NoValuePolicy>(std::in_place_type<void>) {}
};

} // namespace dynsha
