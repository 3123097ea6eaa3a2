/**
 * Copyright (c) 2024 Peking University and Peking University
 * Changsha Institute for Computing and Digital Economy
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as
 * published by the Free Software Foundation, either version 3 of the
 * License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <source_location>

// For better logging inside lambda functions
#if defined(__clang__) || defined(__GNUC__) || defined(__GNUG__)
#  define __FUNCTION__ __PRETTY_FUNCTION__
#endif

#include "PublicHeader.h"

#define EGRESS_LOG_LEVEL_TRACE 0
#define EGRESS_LOG_LEVEL_DEBUG 1
#define EGRESS_LOG_LEVEL_INFO 2
#define EGRESS_LOG_LEVEL_WARN 3
#define EGRESS_LOG_LEVEL_ERROR 4
#define EGRESS_LOG_LEVEL_CRITICAL 5
#define EGRESS_LOG_LEVEL_OFF 6

#if !defined(EGRESS_LOG_LEVEL)
#  if defined(NDEBUG)
#    define EGRESS_LOG_LEVEL EGRESS_LOG_LEVEL_INFO
#  else
#    define EGRESS_LOG_LEVEL EGRESS_LOG_LEVEL_TRACE
#  endif
#endif

#define SPDLOG_ACTIVE_LEVEL EGRESS_LOG_LEVEL

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

// Must be after the static log level definition
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <optional>

#define EGRESS_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define EGRESS_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define EGRESS_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define EGRESS_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define EGRESS_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define EGRESS_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

// Accepts trace|debug|info|warn|warning|error|off, case-insensitively.
std::optional<spdlog::level::level_enum> StrToLogLevel(
    const std::string& level);

// Installs an async default logger named `logger_name`, which shows up as
// the [%n] field of every line.
void InitLogger(spdlog::level::level_enum level,
                const std::filesystem::path& log_file_path,
                const std::string& logger_name, bool enable_console,
                uint64_t max_file_size, uint64_t max_file_num);

// Custom type formatting
namespace fmt {

template <>
struct formatter<egress::grpc::EgressStatus> : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(egress::grpc::EgressStatus v, FormatContext& ctx) const {
    return formatter<std::string_view>::format(
        egress::grpc::EgressStatus_Name(v), ctx);
  }
};

template <>
struct formatter<egress::grpc::ErrCode> : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(egress::grpc::ErrCode v, FormatContext& ctx) const {
    return formatter<std::string_view>::format(egress::grpc::ErrCode_Name(v),
                                               ctx);
  }
};

}  // namespace fmt
