// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <dynsha/log/log.h>
#include <string>

namespace dynsha::log {

void set_level(const std::string& level);

void setup(Logger* logger = nullptr);

} // namespace dynsha::log
