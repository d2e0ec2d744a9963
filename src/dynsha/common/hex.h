// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <dynsha/common/bytes.h>
#include <cppcodec/hex_lower.hpp>
#include <string>
#include <string_view>

namespace dynsha {

using hex = cppcodec::hex_lower;

/// \addtogroup common
/// \{

/// \brief converts bytes to lowercase hex string
std::string to_hex(BytesView s);

/// \brief converts hex string (optionally prefixed with "0x") to bytes
/// \param s hex string
/// \param out output buffer
/// \return size of bytes written
size_t from_hex(std::string_view s, BytesViewMut out);

/// \brief converts hex string (optionally prefixed with "0x") to bytes
Bytes from_hex(std::string_view s);

/// \}

} // namespace dynsha
