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

#include "egress/MessageBus.h"

#include "egress/Logger.h"

namespace egress {

std::string LocalMessageBus::TopicKey_(const std::string& service,
                                       const std::string& method,
                                       const std::string& topic) {
  return fmt::format("{}.{}.{}", service, method, topic);
}

EgressExpected<void> LocalMessageBus::Register(const std::string& service,
                                               const std::string& method,
                                               const std::string& topic,
                                               TopicHandler handler) {
  std::string key = TopicKey_(service, method, topic);

  absl::MutexLock lk(&m_mtx_);
  if (m_topics_.contains(key))
    return std::unexpected(
        FormatRichErr(EgressErrCode::ERR_TOPIC_REGISTRATION,
                      "Topic {} is already registered", key));

  auto reg = std::make_shared<Registration>();
  reg->handler = std::move(handler);
  m_topics_.emplace(std::move(key), std::move(reg));
  EGRESS_TRACE("Topic {}.{}.{} registered.", service, method, topic);
  return {};
}

void LocalMessageBus::Unregister(const std::string& service,
                                 const std::string& method,
                                 const std::string& topic) {
  std::string key = TopicKey_(service, method, topic);

  absl::MutexLock lk(&m_mtx_);
  auto it = m_topics_.find(key);
  if (it == m_topics_.end()) return;

  std::shared_ptr<Registration> reg = std::move(it->second);
  m_topics_.erase(it);

  m_mtx_.Await(absl::Condition(
      +[](Registration* r) { return r->inflight == 0; }, reg.get()));
  EGRESS_TRACE("Topic {} unregistered.", key);
}

::grpc::Status LocalMessageBus::Call(const std::string& service,
                                     const std::string& method,
                                     const std::string& topic,
                                     const std::string& payload,
                                     std::string* reply) {
  std::shared_ptr<Registration> reg;
  {
    absl::MutexLock lk(&m_mtx_);
    auto it = m_topics_.find(TopicKey_(service, method, topic));
    if (it == m_topics_.end())
      return {::grpc::StatusCode::NOT_FOUND,
              fmt::format("No handler for {}.{} on topic {}", service, method,
                          topic)};
    reg = it->second;
    reg->inflight++;
  }

  ::grpc::Status status = reg->handler(payload, reply);

  absl::MutexLock lk(&m_mtx_);
  reg->inflight--;
  return status;
}

bool LocalMessageBus::IsRegistered(const std::string& service,
                                   const std::string& method,
                                   const std::string& topic) const {
  absl::MutexLock lk(&m_mtx_);
  return m_topics_.contains(TopicKey_(service, method, topic));
}

::grpc::Status BusServiceImpl::Call(
    ::grpc::ServerContext* context, const egress::grpc::BusRequest* request,
    egress::grpc::BusReply* response) {
  return m_bus_->Call(request->service(), request->method(), request->topic(),
                      request->payload(), response->mutable_payload());
}

BusServer::BusServer(MessageBus* bus, const std::string& listen_addr,
                     const std::string& port) {
  m_service_impl_ = std::make_unique<BusServiceImpl>(bus);

  ::grpc::ServerBuilder builder;
  ServerBuilderSetKeepAliveArgs(&builder);
  ServerBuilderAddTcpInsecureListeningPort(&builder, listen_addr, port);
  builder.RegisterService(m_service_impl_.get());

  m_server_ = builder.BuildAndStart();
  if (!m_server_)
    EGRESS_ERROR("Failed to start the bus server on {}:{}", listen_addr, port);
  else
    EGRESS_INFO("Bus server is listening on {}:{}", listen_addr, port);
}

}  // namespace egress
