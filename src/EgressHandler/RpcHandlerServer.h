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

#include "egress/MessageBus.h"

namespace Egress::Supervisor {

class Handler;

/**
 * Binds UpdateStream and StopEgress of one egress to the shared bus. The
 * topics are scoped by the egress id so that exactly one handler in the
 * whole system receives the requests of a given egress.
 */
class RpcHandlerServer {
 public:
  RpcHandlerServer(egress::MessageBus* bus, Handler* handler,
                   std::string egress_id);
  ~RpcHandlerServer();

  RpcHandlerServer(const RpcHandlerServer&) = delete;
  RpcHandlerServer& operator=(const RpcHandlerServer&) = delete;

  // On failure no topic is left registered.
  EgressExpected<void> RegisterTopics();

  // Returns after in-flight requests have been answered. Idempotent.
  void Shutdown();

 private:
  grpc::Status UpdateStream_(const std::string& payload, std::string* reply);
  grpc::Status StopEgress_(const std::string& payload, std::string* reply);

  egress::MessageBus* m_bus_;
  Handler* m_handler_;
  std::string m_egress_id_;

  absl::Mutex m_mtx_;
  std::vector<std::string> m_registered_methods_ ABSL_GUARDED_BY(m_mtx_);
};

}  // namespace Egress::Supervisor
