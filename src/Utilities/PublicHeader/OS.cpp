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

#include "egress/OS.h"

#include "egress/Logger.h"

namespace util::os {

bool DeleteFile(std::string const& p) {
  std::error_code ec;
  bool ok = std::filesystem::remove(p, ec);

  if (!ok && ec) EGRESS_ERROR("Failed to remove file {}: {}", p, ec.message());

  return !ec;
}

bool CreateFolders(std::string const& p) {
  std::error_code ec;
  std::filesystem::create_directories(p, ec);
  if (ec) {
    EGRESS_ERROR("Failed to create folder {}: {}", p, ec.message());
    return false;
  }

  return true;
}

bool CreateFoldersForFile(std::string const& p) {
  auto dir = std::filesystem::path{p}.parent_path();
  if (dir.empty()) return true;

  return CreateFolders(dir.string());
}

int GetFdOpenMax() { return static_cast<int>(sysconf(_SC_OPEN_MAX)); }

void CloseFdFrom(int fd_begin) {
  if (close_range(fd_begin, ~0U, 0) == 0) return;

  // Kernels older than 5.9 lack close_range.
  int fd_max = GetFdOpenMax();
  for (int i = fd_begin; i < fd_max; i++) close(i);
}

}  // namespace util::os
