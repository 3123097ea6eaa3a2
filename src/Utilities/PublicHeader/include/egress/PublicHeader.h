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

#include <spdlog/fmt/fmt.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "protos/PublicDefs.pb.h"

#if !defined(EGRESS_VERSION_STRING)
#  define EGRESS_VERSION_STRING "Unknown"
#endif

using EgressErrCode = egress::grpc::ErrCode;
using EgressErrKind = egress::grpc::ErrKind;

using EgressRichError = egress::grpc::RichError;

using EgressInfo = egress::grpc::EgressInfo;
using EgressStatus = egress::grpc::EgressStatus;

template <typename T>
using EgressExpected = std::expected<T, EgressRichError>;

constexpr const char* kLogPattern =
    "[%^%L%$ %C-%m-%d %H:%M:%S.%e %s:%#][%n] %v";

inline const char* const kDefaultHost = "0.0.0.0";
inline const char* const kBusDefaultPort = "10031";
inline const char* const kIOInfoDefaultPort = "10032";

inline const char* const kDefaultConfigPath = "/etc/egress/handler.yaml";
inline const char* const kDefaultTmpDir = "/tmp/egress";
inline const char* const kDefaultHandlerLogPath = "/var/log/egress/handler.log";

// Name of the local introspection socket inside the job's temporary dir.
inline const char* const kHandlerSocketName = "service_rpc.sock";
inline const char* const kStreamFileName = "streams.txt";

inline constexpr uint64_t kDefaultHandlerMaxLogFileSize =
    1024 * 1024 * 50;  // 50 MB
inline constexpr uint64_t kDefaultHandlerMaxLogFileNum = 3;

inline constexpr std::chrono::seconds kPipelineDotTimeout{2};
inline constexpr std::chrono::seconds kIOInfoRpcTimeout{5};
inline constexpr uint64_t kDefaultStopWarnIntervalSec = 30;
inline constexpr int32_t kMaxProfileSeconds = 30;

namespace Internal {
// clang-format off
constexpr std::array<std::string_view, egress::grpc::ErrCode_ARRAYSIZE>
    kEgressErrStrArr = {
        // 0 - 4
        "Success",
        "The egress does not exist in this handler",
        "Deadline exceeded",
        "Invalid parameter",
        "The operation is not supported",

        // 5 - 9
        "RPC failure",
        "Failed to register the topic on the message bus",
        "Failed to listen on the address",
        "System error",
        "Profiler error",

        // 10 - 13
        "Failed to serialize metrics",
        "Pipeline failure",
        "Protobuf error",
        "Generic failure",
    };
// clang-format on
}  // namespace Internal

inline std::string_view ErrStr(EgressErrCode err) {
  return Internal::kEgressErrStrArr[static_cast<uint16_t>(err)];
}

template <typename... Args>
inline EgressRichError FormatRichErr(EgressErrCode code,
                                     fmt::format_string<Args...> format_str,
                                     Args&&... args) {
  EgressRichError rich_err;

  rich_err.set_code(code);
  rich_err.set_description(
      fmt::format(format_str, std::forward<Args>(args)...));
  rich_err.set_kind(egress::grpc::ERR_KIND_USER);

  return rich_err;
}

// Same as FormatRichErr, but tags the error as an infrastructure fault.
template <typename... Args>
inline EgressRichError FormatFatalErr(EgressErrCode code,
                                      fmt::format_string<Args...> format_str,
                                      Args&&... args) {
  EgressRichError rich_err =
      FormatRichErr(code, format_str, std::forward<Args>(args)...);
  rich_err.set_kind(egress::grpc::ERR_KIND_FATAL);
  return rich_err;
}

inline bool IsFatal(const EgressRichError& err) {
  return err.kind() == egress::grpc::ERR_KIND_FATAL;
}

inline EgressRichError ErrEgressNotFound() {
  return FormatRichErr(EgressErrCode::ERR_EGRESS_NOT_FOUND, "{}",
                       ErrStr(EgressErrCode::ERR_EGRESS_NOT_FOUND));
}

// Unix nanoseconds, the unit of every EgressInfo timestamp.
inline int64_t NowUnixNano() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

inline bool IsTerminalStatus(EgressStatus status) {
  return status == EgressStatus::EGRESS_COMPLETE ||
         status == EgressStatus::EGRESS_FAILED ||
         status == EgressStatus::EGRESS_ABORTED;
}
