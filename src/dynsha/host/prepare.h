// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <dynsha/config/hash_config.h>
#include <dynsha/host/pad.h>

namespace dynsha::host {

/// \brief builds engine inputs for \p message as configured
///
/// Without a selector the whole message is padded to the capacity and the
/// precomputed hash is the IV, so the result can always be fed to
/// sha256::partial_sha256().
/// \ingroup host
auto prepare(BytesView message, const config::HashConfig& config) -> Result<PartialInput>;

/// \brief prepares \p message and hashes it with the fixed-cost engine
/// \ingroup host
auto hash_message(BytesView message, const config::HashConfig& config) -> Result<sha256::Digest>;

} // namespace dynsha::host
