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

#include "HandlerPreCompiledHeader.h"
// Precompiled header comes first

namespace Egress::Supervisor {

struct Config {
  std::string EgressId;
  std::string RoomName;

  // The job directory is TmpDir/EgressId.
  std::filesystem::path TmpDir{kDefaultTmpDir};

  std::string BusListenAddr{kDefaultHost};
  std::string BusListenPort{kBusDefaultPort};

  std::string IOInfoAddr{"127.0.0.1"};
  std::string IOInfoPort{kIOInfoDefaultPort};

  std::string DebugLevel{"info"};
  std::filesystem::path LogFile{kDefaultHandlerLogPath};
  uint64_t MaxLogFileSize{kDefaultHandlerMaxLogFileSize};
  uint64_t MaxLogFileNum{kDefaultHandlerMaxLogFileNum};

  uint64_t StopWarnIntervalSec{kDefaultStopWarnIntervalSec};

  struct PipelineConfig {
    std::filesystem::path Executable;
    std::vector<std::string> Args;
    std::vector<std::string> StreamUrls;
  };
  PipelineConfig Pipeline;

  [[nodiscard]] std::filesystem::path JobDir() const {
    return TmpDir / EgressId;
  }

  [[nodiscard]] std::filesystem::path HandlerSocketPath() const {
    return JobDir() / kHandlerSocketName;
  }
};

// Descriptor every job starts from.
inline EgressInfo InitialEgressInfo(const Config& config) {
  EgressInfo info;
  info.set_egress_id(config.EgressId);
  info.set_room_name(config.RoomName);
  info.set_status(EgressStatus::EGRESS_STARTING);
  for (const auto& url : config.Pipeline.StreamUrls) info.add_stream_urls(url);
  return info;
}

inline const char* const kRpcServiceName = "EgressHandler";
inline const char* const kRpcUpdateStreamMethod = "UpdateStream";
inline const char* const kRpcStopEgressMethod = "StopEgress";

}  // namespace Egress::Supervisor
