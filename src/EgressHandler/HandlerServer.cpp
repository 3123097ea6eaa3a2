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

#include "HandlerServer.h"

#include <sys/stat.h>

#include <cerrno>
#include <cstring>

#include "Handler.h"
#include "egress/GrpcHelper.h"
#include "egress/OS.h"

namespace Egress::Supervisor {

grpc::Status EgressHandlerServiceImpl::GetPipelineDot(
    grpc::ServerContext* context,
    const egress::grpc::PipelineDebugDotRequest* request,
    egress::grpc::PipelineDebugDotResponse* response) {
  auto dot = m_handler_->GetPipelineDot();
  if (!dot) return RichErrToGrpcStatus(dot.error());

  response->set_dot_file(std::move(dot.value()));
  return grpc::Status::OK;
}

grpc::Status EgressHandlerServiceImpl::GetPProf(
    grpc::ServerContext* context, const egress::grpc::PProfRequest* request,
    egress::grpc::PProfResponse* response) {
  auto data = m_handler_->GetPProf(request->profile_name(), request->timeout(),
                                   request->debug());
  if (!data) return RichErrToGrpcStatus(data.error());

  response->set_pprof_file(std::move(data.value()));
  return grpc::Status::OK;
}

grpc::Status EgressHandlerServiceImpl::GetMetrics(
    grpc::ServerContext* context, const egress::grpc::MetricsRequest* request,
    egress::grpc::MetricsResponse* response) {
  auto metrics = m_handler_->GetMetrics();
  if (!metrics) return RichErrToGrpcStatus(metrics.error());

  response->set_metrics(std::move(metrics.value()));
  return grpc::Status::OK;
}

HandlerServer::HandlerServer(Handler* handler,
                             const std::filesystem::path& socket_path) {
  m_service_impl_ = std::make_unique<EgressHandlerServiceImpl>(handler);

  // A stale socket from a previous run would make the bind fail.
  if (std::filesystem::exists(socket_path))
    util::os::DeleteFile(socket_path.string());

  auto unix_socket_path = fmt::format("unix://{}", socket_path.string());
  grpc::ServerBuilder builder;
  ServerBuilderAddUnixInsecureListeningPort(&builder, unix_socket_path);
  builder.RegisterService(m_service_impl_.get());

  m_server_ = builder.BuildAndStart();
  if (!m_server_) {
    EGRESS_ERROR("Failed to listen on {}", unix_socket_path);
    return;
  }

  if (chmod(socket_path.c_str(), 0600) != 0)
    EGRESS_WARN("Failed to chmod {}: {}", socket_path.string(),
                std::strerror(errno));
  EGRESS_DEBUG("Handler server is listening on {}", unix_socket_path);
}

}  // namespace Egress::Supervisor
