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

#include "HandlerPublicDefs.h"
// Precompiled header comes first.

#include "protos/Egress.pb.h"

namespace Egress::Supervisor {

/**
 * The managed job driven by the supervisor. Run() is called exactly once
 * after a successful Start(), from a thread of its own. All other methods
 * may be called concurrently with Run() and with each other.
 */
class IJobHandle {
 public:
  virtual ~IJobHandle() = default;

  virtual EgressExpected<void> Start() = 0;

  // Blocks until the job is terminal and returns the final descriptor.
  virtual EgressInfo Run() = 0;

  // Requests a graceful stop. Safe to call several times and before Start().
  virtual void SendEos() = 0;

  virtual EgressExpected<void> UpdateStream(
      const egress::grpc::UpdateStreamRequest& request) = 0;

  // May block for as long as the job takes to answer.
  virtual std::string GetPipelineDebugDot() = 0;

  [[nodiscard]] virtual EgressInfo Info() const = 0;
};

using JobFactory =
    std::function<EgressExpected<std::unique_ptr<IJobHandle>>(const Config&)>;

}  // namespace Egress::Supervisor
