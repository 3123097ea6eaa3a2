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

#include "RpcHandlerServer.h"

#include "Handler.h"
#include "egress/GrpcHelper.h"

namespace Egress::Supervisor {

namespace {

grpc::Status SerializeReply(const EgressInfo& info, std::string* reply) {
  if (!info.SerializeToString(reply))
    return {grpc::StatusCode::INTERNAL, "Failed to serialize EgressInfo"};
  return grpc::Status::OK;
}

}  // namespace

RpcHandlerServer::RpcHandlerServer(egress::MessageBus* bus, Handler* handler,
                                   std::string egress_id)
    : m_bus_(bus), m_handler_(handler), m_egress_id_(std::move(egress_id)) {}

RpcHandlerServer::~RpcHandlerServer() { Shutdown(); }

EgressExpected<void> RpcHandlerServer::RegisterTopics() {
  using TopicHandler = egress::MessageBus::TopicHandler;
  std::vector<std::pair<std::string, TopicHandler>> topics;
  topics.emplace_back(kRpcUpdateStreamMethod,
                      [this](const std::string& payload, std::string* reply) {
                        return UpdateStream_(payload, reply);
                      });
  topics.emplace_back(kRpcStopEgressMethod,
                      [this](const std::string& payload, std::string* reply) {
                        return StopEgress_(payload, reply);
                      });

  for (auto& [method, topic_handler] : topics) {
    auto result = m_bus_->Register(kRpcServiceName, method, m_egress_id_,
                                   std::move(topic_handler));
    if (!result) {
      Shutdown();
      return std::unexpected(FormatFatalErr(
          EgressErrCode::ERR_TOPIC_REGISTRATION,
          "Failed to register {}.{} for egress {}: {}", kRpcServiceName,
          method, m_egress_id_, result.error().description()));
    }

    absl::MutexLock lk(&m_mtx_);
    m_registered_methods_.push_back(method);
  }

  EGRESS_DEBUG("[Egress #{}] Rpc topics registered.", m_egress_id_);
  return {};
}

void RpcHandlerServer::Shutdown() {
  std::vector<std::string> methods;
  {
    absl::MutexLock lk(&m_mtx_);
    methods.swap(m_registered_methods_);
  }

  for (const auto& method : methods)
    m_bus_->Unregister(kRpcServiceName, method, m_egress_id_);

  if (!methods.empty())
    EGRESS_DEBUG("[Egress #{}] Rpc topics unregistered.", m_egress_id_);
}

grpc::Status RpcHandlerServer::UpdateStream_(const std::string& payload,
                                             std::string* reply) {
  egress::grpc::UpdateStreamRequest request;
  if (!request.ParseFromString(payload))
    return {grpc::StatusCode::INVALID_ARGUMENT,
            "Malformed UpdateStreamRequest"};

  auto info = m_handler_->UpdateStream(request);
  if (!info) return RichErrToGrpcStatus(info.error());

  return SerializeReply(*info, reply);
}

grpc::Status RpcHandlerServer::StopEgress_(const std::string& payload,
                                           std::string* reply) {
  egress::grpc::StopEgressRequest request;
  if (!request.ParseFromString(payload))
    return {grpc::StatusCode::INVALID_ARGUMENT, "Malformed StopEgressRequest"};

  auto info = m_handler_->StopEgress(request);
  if (!info) return RichErrToGrpcStatus(info.error());

  return SerializeReply(*info, reply);
}

}  // namespace Egress::Supervisor
