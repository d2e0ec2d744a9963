// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#pragma once
#include <spdlog/spdlog.h>

namespace dynsha::log {

using Logger = spdlog::logger;

const auto default_logger = spdlog::default_logger;
const auto default_logger_raw = spdlog::default_logger_raw;

} // namespace dynsha::log

#define dynsha_ilog(LOGGER, FORMAT, ...) SPDLOG_LOGGER_INFO(LOGGER, FORMAT __VA_OPT__(, ) __VA_ARGS__)
#define dynsha_dlog(LOGGER, FORMAT, ...) SPDLOG_LOGGER_DEBUG(LOGGER, FORMAT __VA_OPT__(, ) __VA_ARGS__)
#define dynsha_wlog(LOGGER, FORMAT, ...) SPDLOG_LOGGER_WARN(LOGGER, FORMAT __VA_OPT__(, ) __VA_ARGS__)
#define dynsha_elog(LOGGER, FORMAT, ...) SPDLOG_LOGGER_ERROR(LOGGER, FORMAT __VA_OPT__(, ) __VA_ARGS__)

#define ilog(FORMAT, ...) dynsha_ilog(dynsha::log::default_logger_raw(), FORMAT __VA_OPT__(, ) __VA_ARGS__)
#define dlog(FORMAT, ...) dynsha_dlog(dynsha::log::default_logger_raw(), FORMAT __VA_OPT__(, ) __VA_ARGS__)
#define wlog(FORMAT, ...) dynsha_wlog(dynsha::log::default_logger_raw(), FORMAT __VA_OPT__(, ) __VA_ARGS__)
#define elog(FORMAT, ...) dynsha_elog(dynsha::log::default_logger_raw(), FORMAT __VA_OPT__(, ) __VA_ARGS__)
