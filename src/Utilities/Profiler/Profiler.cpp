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

#include "egress/Profiler.h"

#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>
#include <unistd.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <map>
#include <thread>

#include "egress/Logger.h"
#include "egress/String.h"

namespace egress {

EgressExpected<std::string> ProcfsProfiler::GetProfileData(
    const std::string& profile_name, int32_t timeout_sec, int32_t debug) {
  EGRESS_DEBUG("Profile {} requested, timeout {}s, debug {}", profile_name,
               timeout_sec, debug);

  if (profile_name == "status" || profile_name == "maps" ||
      profile_name == "limits")
    return util::ReadFileIntoString(
        std::filesystem::path("/proc/self") / profile_name);

  if (profile_name == "threads") return ThreadsProfile_();

  if (profile_name == "cpu") return CpuProfile_(timeout_sec, debug);

  return std::unexpected(FormatRichErr(EgressErrCode::ERR_INVALID_PARAM,
                                       "Unknown profile: {}", profile_name));
}

EgressExpected<ProcfsProfiler::CpuTicks> ProcfsProfiler::ReadCpuTicks_(
    const std::string& stat_path) {
  auto content = util::ReadFileIntoString(stat_path);
  if (!content) return std::unexpected(content.error());

  // The command name may contain spaces, fields start after the last ')'.
  size_t pos = content->rfind(')');
  if (pos == std::string::npos)
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_PROFILER,
                                         "Malformed {}", stat_path));

  std::vector<absl::string_view> fields = absl::StrSplit(
      absl::string_view(*content).substr(pos + 1), ' ', absl::SkipEmpty());
  // utime and stime are the 14th and 15th fields of stat, i.e. the 12th and
  // 13th after the command name.
  if (fields.size() < 13)
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_PROFILER,
                                         "Malformed {}", stat_path));

  CpuTicks ticks;
  if (!absl::SimpleAtoi(fields[11], &ticks.utime) ||
      !absl::SimpleAtoi(fields[12], &ticks.stime))
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_PROFILER,
                                         "Malformed cpu times in {}",
                                         stat_path));
  return ticks;
}

EgressExpected<std::string> ProcfsProfiler::ThreadsProfile_() {
  std::string out;
  std::error_code ec;
  for (const auto& entry :
       std::filesystem::directory_iterator("/proc/self/task", ec)) {
    std::string tid = entry.path().filename().string();
    auto comm = util::ReadFileIntoString(entry.path() / "comm");
    auto ticks = ReadCpuTicks_((entry.path() / "stat").string());
    // The thread may have exited in the meantime.
    if (!comm || !ticks) continue;

    std::string name = *comm;
    if (!name.empty() && name.back() == '\n') name.pop_back();
    fmt::format_to(std::back_inserter(out), "{} {} utime={} stime={}\n", tid,
                   name, ticks->utime, ticks->stime);
  }

  if (ec)
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_PROFILER,
                                         "Failed to list threads: {}",
                                         ec.message()));
  return out;
}

EgressExpected<std::string> ProcfsProfiler::CpuProfile_(int32_t timeout_sec,
                                                        int32_t debug) {
  int32_t duration = std::clamp(timeout_sec, 1, kMaxProfileSeconds);

  auto thread_ticks = [] {
    std::map<std::string, CpuTicks> ticks;
    std::error_code ec;
    for (const auto& entry :
         std::filesystem::directory_iterator("/proc/self/task", ec)) {
      auto t = ReadCpuTicks_((entry.path() / "stat").string());
      if (t) ticks.emplace(entry.path().filename().string(), *t);
    }
    return ticks;
  };

  auto begin = ReadCpuTicks_("/proc/self/stat");
  if (!begin) return std::unexpected(begin.error());
  auto threads_begin = debug > 0 ? thread_ticks() : std::map<std::string, CpuTicks>{};

  std::this_thread::sleep_for(std::chrono::seconds(duration));

  auto end = ReadCpuTicks_("/proc/self/stat");
  if (!end) return std::unexpected(end.error());

  long hz = sysconf(_SC_CLK_TCK);
  if (hz <= 0) hz = 100;

  std::string out = fmt::format(
      "duration={}s utime={:.2f}s stime={:.2f}s\n", duration,
      static_cast<double>(end->utime - begin->utime) / hz,
      static_cast<double>(end->stime - begin->stime) / hz);

  if (debug > 0) {
    for (const auto& [tid, ticks] : thread_ticks()) {
      auto it = threads_begin.find(tid);
      CpuTicks base = it == threads_begin.end() ? CpuTicks{} : it->second;
      fmt::format_to(std::back_inserter(out),
                     "thread {} utime={:.2f}s stime={:.2f}s\n", tid,
                     static_cast<double>(ticks.utime - base.utime) / hz,
                     static_cast<double>(ticks.stime - base.stime) / hz);
    }
  }

  return out;
}

}  // namespace egress
