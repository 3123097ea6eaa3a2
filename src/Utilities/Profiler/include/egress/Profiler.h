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

#include <string>

#include "egress/PublicHeader.h"

namespace egress {

class IProfiler {
 public:
  virtual ~IProfiler() = default;

  // timeout_sec is the sampling duration of time-based profiles.
  virtual EgressExpected<std::string> GetProfileData(
      const std::string& profile_name, int32_t timeout_sec, int32_t debug) = 0;
};

/**
 * Profiles the current process from /proc/self.
 *   status, maps, limits: raw snapshot of the corresponding file.
 *   threads: one line per thread with its name and cpu ticks.
 *   cpu: process cpu time consumed during timeout_sec seconds, with a
 *        per-thread breakdown when debug > 0.
 */
class ProcfsProfiler : public IProfiler {
 public:
  EgressExpected<std::string> GetProfileData(const std::string& profile_name,
                                             int32_t timeout_sec,
                                             int32_t debug) override;

 private:
  struct CpuTicks {
    uint64_t utime{0};
    uint64_t stime{0};
  };

  static EgressExpected<CpuTicks> ReadCpuTicks_(const std::string& stat_path);
  static EgressExpected<std::string> ThreadsProfile_();
  static EgressExpected<std::string> CpuProfile_(int32_t timeout_sec,
                                                 int32_t debug);
};

}  // namespace egress
