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

#include "egress/Logger.h"

#include <algorithm>
#include <cctype>
#include <utility>
#include <vector>

namespace {

constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>,
                     7>
    kLogLevelNames{{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"off", spdlog::level::off},
    }};

constexpr size_t kLogQueueSize = 8192;

}  // namespace

std::optional<spdlog::level::level_enum> StrToLogLevel(
    const std::string& level) {
  std::string lowered(level);
  std::ranges::transform(lowered, lowered.begin(),
                         [](unsigned char c) { return std::tolower(c); });

  auto it = std::ranges::find_if(
      kLogLevelNames, [&](const auto& kv) { return kv.first == lowered; });
  if (it == kLogLevelNames.end()) return std::nullopt;
  return it->second;
}

void InitLogger(spdlog::level::level_enum level,
                const std::filesystem::path& log_file_path,
                const std::string& logger_name, bool enable_console,
                uint64_t max_file_size, uint64_t max_file_num) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.emplace_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      log_file_path.string(), max_file_size, max_file_num));
  if (enable_console)
    sinks.emplace_back(
        std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  for (auto& sink : sinks) {
    sink->set_level(level);
    sink->set_pattern(kLogPattern);
  }

  spdlog::init_thread_pool(kLogQueueSize, 1);
  auto logger = std::make_shared<spdlog::async_logger>(
      logger_name, sinks.begin(), sinks.end(), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));

  spdlog::flush_on(spdlog::level::err);
  spdlog::flush_every(std::chrono::seconds(1));
}
