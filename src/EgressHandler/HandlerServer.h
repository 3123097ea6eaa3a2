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

class Handler;

class EgressHandlerServiceImpl : public egress::grpc::EgressHandler::Service {
 public:
  explicit EgressHandlerServiceImpl(Handler* handler) : m_handler_(handler) {}

  grpc::Status GetPipelineDot(
      grpc::ServerContext* context,
      const egress::grpc::PipelineDebugDotRequest* request,
      egress::grpc::PipelineDebugDotResponse* response) override;

  grpc::Status GetPProf(grpc::ServerContext* context,
                        const egress::grpc::PProfRequest* request,
                        egress::grpc::PProfResponse* response) override;

  grpc::Status GetMetrics(grpc::ServerContext* context,
                          const egress::grpc::MetricsRequest* request,
                          egress::grpc::MetricsResponse* response) override;

 private:
  Handler* m_handler_;
};

// Introspection server, reachable through a unix socket only.
class HandlerServer {
 public:
  HandlerServer(Handler* handler, const std::filesystem::path& socket_path);

  [[nodiscard]] bool Started() const { return m_server_ != nullptr; }

  inline void Shutdown() {
    if (m_server_) m_server_->Shutdown();
  }

  inline void Wait() {
    if (m_server_) m_server_->Wait();
  }

 private:
  std::unique_ptr<EgressHandlerServiceImpl> m_service_impl_;
  std::unique_ptr<grpc::Server> m_server_;
};

}  // namespace Egress::Supervisor
