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

#include <absl/base/thread_annotations.h>
#include <absl/container/flat_hash_map.h>
#include <absl/synchronization/mutex.h>

#include <functional>
#include <memory>
#include <string>

#include "egress/GrpcHelper.h"
#include "egress/PublicHeader.h"
#include "protos/Egress.grpc.pb.h"
#include "protos/Egress.pb.h"

namespace egress {

/**
 * Topic-scoped request/response transport shared by every egress handler.
 * A handler is addressed by (service, method, topic) and exchanges
 * serialized protobuf payloads.
 */
class MessageBus {
 public:
  using TopicHandler = std::function<::grpc::Status(const std::string& payload,
                                                    std::string* reply)>;

  virtual ~MessageBus() = default;

  virtual EgressExpected<void> Register(const std::string& service,
                                        const std::string& method,
                                        const std::string& topic,
                                        TopicHandler handler) = 0;

  // Returns after all in-flight calls of the key have finished.
  virtual void Unregister(const std::string& service,
                          const std::string& method,
                          const std::string& topic) = 0;

  virtual ::grpc::Status Call(const std::string& service,
                              const std::string& method,
                              const std::string& topic,
                              const std::string& payload,
                              std::string* reply) = 0;
};

class LocalMessageBus : public MessageBus {
 public:
  LocalMessageBus() = default;
  ~LocalMessageBus() override = default;

  LocalMessageBus(const LocalMessageBus&) = delete;
  LocalMessageBus& operator=(const LocalMessageBus&) = delete;

  EgressExpected<void> Register(const std::string& service,
                                const std::string& method,
                                const std::string& topic,
                                TopicHandler handler) override;

  void Unregister(const std::string& service, const std::string& method,
                  const std::string& topic) override;

  ::grpc::Status Call(const std::string& service, const std::string& method,
                      const std::string& topic, const std::string& payload,
                      std::string* reply) override;

  [[nodiscard]] bool IsRegistered(const std::string& service,
                                  const std::string& method,
                                  const std::string& topic) const;

 private:
  struct Registration {
    TopicHandler handler;
    uint32_t inflight{0};
  };

  static std::string TopicKey_(const std::string& service,
                               const std::string& method,
                               const std::string& topic);

  mutable absl::Mutex m_mtx_;
  absl::flat_hash_map<std::string, std::shared_ptr<Registration>> m_topics_
      ABSL_GUARDED_BY(m_mtx_);
};

class BusServiceImpl : public egress::grpc::Bus::Service {
 public:
  explicit BusServiceImpl(MessageBus* bus) : m_bus_(bus) {}

  ::grpc::Status Call(::grpc::ServerContext* context,
                      const egress::grpc::BusRequest* request,
                      egress::grpc::BusReply* response) override;

 private:
  MessageBus* m_bus_;
};

// Exposes a bus to remote callers over gRPC.
class BusServer {
 public:
  BusServer(MessageBus* bus, const std::string& listen_addr,
            const std::string& port);

  [[nodiscard]] bool Started() const { return m_server_ != nullptr; }

  void Shutdown() {
    if (m_server_) m_server_->Shutdown();
  }

  void Wait() {
    if (m_server_) m_server_->Wait();
  }

 private:
  std::unique_ptr<BusServiceImpl> m_service_impl_;
  std::unique_ptr<::grpc::Server> m_server_;
};

}  // namespace egress
