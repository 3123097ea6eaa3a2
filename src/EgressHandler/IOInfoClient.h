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

#include "protos/Egress.grpc.pb.h"
#include "protos/Egress.pb.h"

namespace Egress::Supervisor {

class IStatusReporter {
 public:
  virtual ~IStatusReporter() = default;

  virtual EgressExpected<void> UpdateEgress(const EgressInfo& info) = 0;
};

// Reports egress status to the IOInfo service.
class IOInfoClient : public IStatusReporter {
 public:
  IOInfoClient() = default;
  ~IOInfoClient() override = default;

  void InitChannelAndStub(const std::string& address, const std::string& port);

  EgressExpected<void> UpdateEgress(const EgressInfo& info) override;

 private:
  std::shared_ptr<grpc::Channel> m_channel_;
  std::unique_ptr<egress::grpc::IOInfo::Stub> m_stub_;
};

}  // namespace Egress::Supervisor
