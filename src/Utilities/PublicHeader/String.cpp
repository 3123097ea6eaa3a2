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

#include "egress/String.h"

#include <pthread.h>

#include <cctype>
#include <charconv>
#include <cstring>
#include <fstream>
#include <limits>
#include <regex>
#include <sstream>

#include "egress/Logger.h"

namespace util {

EgressExpected<std::string> ReadFileIntoString(
    std::filesystem::path const &p) {
  std::ifstream file(p, std::ios::in | std::ios::binary);
  if (!file.is_open())
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_SYSTEM_ERR,
                                         "Failed to open {}: {}", p.string(),
                                         std::strerror(errno)));

  std::ostringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

EgressExpected<uint64_t> ParseMemory(const std::string &mem) {
  static const std::regex kMemRegex(R"((\d+)\s*([KMG]?)B?)",
                                    std::regex::icase);
  std::smatch mem_group;
  if (!std::regex_match(mem, mem_group, kMemRegex))
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_INVALID_PARAM,
                                         "Invalid memory format: {}", mem));

  uint64_t value;
  const std::string digits = mem_group[1].str();
  auto [ptr, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc())
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_INVALID_PARAM,
                                         "Memory size out of range: {}", mem));

  int shift = 0;
  switch (std::toupper(static_cast<unsigned char>(
      mem_group[2].length() ? mem_group[2].str()[0] : 'B'))) {
  case 'K':
    shift = 10;
    break;
  case 'M':
    shift = 20;
    break;
  case 'G':
    shift = 30;
    break;
  default:
    break;
  }

  if (value > (std::numeric_limits<uint64_t>::max() >> shift))
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_INVALID_PARAM,
                                         "Memory size out of range: {}", mem));
  return value << shift;
}

void SetCurrentThreadName(const std::string &name) {
  // The thread name is not allowed to exceed 16 characters including '\0'.
  if (name.size() >= 16) {
    EGRESS_ERROR("Thread name cannot exceed 16 character!");
    return;
  }

  pthread_setname_np(pthread_self(), name.c_str());
}

}  // namespace util
