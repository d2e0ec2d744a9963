// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <concepts>
#include <cstddef>
#include <type_traits>

namespace dynsha {

template<typename T>
concept UnsignedIntegral = std::unsigned_integral<T>;

template<typename T>
concept Pointer = std::is_pointer_v<T>;

template<typename T>
concept ConstPointer = Pointer<T> && std::is_const_v<std::remove_pointer_t<T>>;

template<typename T>
concept BytePointer = Pointer<T> && (sizeof(std::remove_pointer_t<T>) == 1) &&
  (std::is_integral_v<std::remove_cv_t<std::remove_pointer_t<T>>> ||
    std::is_same_v<std::remove_cv_t<std::remove_pointer_t<T>>, std::byte>);

/// \brief contiguous sequence of bytes exposing data() and size()
template<typename T>
concept ByteSequence = requires(const T& v) {
  { v.data() } -> BytePointer;
  { v.size() } -> std::convertible_to<size_t>;
};

} // namespace dynsha
