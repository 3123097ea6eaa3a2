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

#include "IOInfoClient.h"

#include "egress/GrpcHelper.h"

namespace Egress::Supervisor {

void IOInfoClient::InitChannelAndStub(const std::string& address,
                                      const std::string& port) {
  m_channel_ = CreateTcpInsecureChannel(address, port);
  m_stub_ = egress::grpc::IOInfo::NewStub(m_channel_);
}

EgressExpected<void> IOInfoClient::UpdateEgress(const EgressInfo& info) {
  if (!m_stub_)
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_RPC_FAILURE,
                                         "IOInfo channel is not initialized"));

  grpc::ClientContext context;
  egress::grpc::UpdateEgressReply reply;
  context.set_deadline(std::chrono::system_clock::now() + kIOInfoRpcTimeout);

  EGRESS_TRACE("Sending UpdateEgress for {}, status: {}", info.egress_id(),
               info.status());

  grpc::Status status = m_stub_->UpdateEgress(&context, info, &reply);
  if (!status.ok()) {
    EGRESS_DEBUG("UpdateEgress failed: {} | {}, code: {}",
                 status.error_message(), context.debug_error_string(),
                 int(status.error_code()));
    return std::unexpected(RichErrFromGrpcStatus(status));
  }

  return {};
}

}  // namespace Egress::Supervisor
