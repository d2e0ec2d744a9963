// This file is part of DYNSHA.
//
// Copyright (c) 2022 Haderech Pte. Ltd.
// SPDX-License-Identifier: AGPL-3.0-or-later
//
#include <dynsha/log/setup.h>
#include <spdlog/details/fmt_helper.h>
#include <spdlog/pattern_formatter.h>

namespace dynsha::log {

namespace fmt_helper = spdlog::details::fmt_helper;

namespace {
  const std::string spaces(64, ' ');
}

class source_location_formatter : public spdlog::custom_flag_formatter {
public:
  void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
    if (msg.source.empty()) {
      if (padinfo_.enabled()) {
        fmt_helper::append_string_view(std::string_view(spaces).substr(0, padinfo_.width_), dest);
      }
      return;
    }
    auto filename = std::string_view(msg.source.filename);
    auto pos = filename.find_last_of('/');
    auto basename = pos == std::string_view::npos ? filename : filename.substr(pos + 1);
    fmt_helper::append_string_view(basename, dest);
    dest.push_back(':');
    fmt_helper::append_int(msg.source.line, dest);
    if (padinfo_.enabled()) {
      auto size = basename.size() + 1 + fmt_helper::count_digits(msg.source.line);
      if (size < padinfo_.width_) {
        fmt_helper::append_string_view(std::string_view(spaces).substr(0, padinfo_.width_ - size), dest);
      }
    }
  }

  std::unique_ptr<custom_flag_formatter> clone() const override {
    return std::make_unique<source_location_formatter>();
  }
};

void set_level(const std::string& level) {
  spdlog::set_level(spdlog::level::from_str(level));
}

void setup(Logger* logger) {
  static const char* pattern = "%^%-5l%$ %Y-%m-%dT%T.%e %-29@ %-21!] %v";
  auto formatter = std::make_unique<spdlog::pattern_formatter>(pattern, spdlog::pattern_time_type::utc);
  formatter->add_flag<source_location_formatter>('@');
  if (logger) {
    logger->set_formatter(std::move(formatter));
  } else {
    spdlog::set_formatter(std::move(formatter));
  }
}

} // namespace dynsha::log
