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
#include <yaml-cpp/yaml.h>

#include <expected>
#include <filesystem>
#include <string>

#include "egress/PublicHeader.h"

namespace util {

template <typename T = std::string, typename YamlNode, typename DefaultType>
  requires requires(const YamlNode &node) {
    { node.template as<T>() };
  } && std::convertible_to<DefaultType, T>
T YamlValueOr(const YamlNode &node, const DefaultType &default_value) {
  return node ? node.template as<T>() : default_value;
}

// Works for files under /proc as well, whose reported size is 0.
EgressExpected<std::string> ReadFileIntoString(std::filesystem::path const &p);

// "<n>[K|M|G][B]" in binary units, case-insensitive. A bare number is bytes.
EgressExpected<uint64_t> ParseMemory(const std::string &mem);

void SetCurrentThreadName(const std::string &name);

}  // namespace util
