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

#include "egress/GrpcHelper.h"

static std::string GrpcFormatIpAddress(std::string const& addr) {
  // Grpc needs to use [] to wrap ipv6 address
  if (addr.find(':') != std::string::npos && !addr.starts_with('['))
    return fmt::format("[{}]", addr);

  return addr;
}

void ServerBuilderSetKeepAliveArgs(grpc::ServerBuilder* builder) {
  builder->AddChannelArgument(GRPC_ARG_HTTP2_MAX_PINGS_WITHOUT_DATA,
                              0 /*no limit*/);
  builder->AddChannelArgument(
      GRPC_ARG_HTTP2_MIN_RECV_PING_INTERVAL_WITHOUT_DATA_MS,
      10 * 1000 /*10 sec*/);
  builder->AddChannelArgument(GRPC_ARG_KEEPALIVE_TIME_MS, 10 * 60 * 1000);
  builder->AddChannelArgument(GRPC_ARG_KEEPALIVE_TIMEOUT_MS,
                              20 * 1000 /*20 sec*/);
  builder->AddChannelArgument(GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS,
                              1 /*true*/);
  builder->AddChannelArgument(GRPC_ARG_HTTP2_MAX_PING_STRIKES,
                              0 /* unlimited */);
}

void ServerBuilderAddUnixInsecureListeningPort(grpc::ServerBuilder* builder,
                                               const std::string& address) {
  builder->AddListeningPort(address, grpc::InsecureServerCredentials());
}

void ServerBuilderAddTcpInsecureListeningPort(grpc::ServerBuilder* builder,
                                              const std::string& address,
                                              const std::string& port) {
  std::string listen_addr_port =
      fmt::format("{}:{}", GrpcFormatIpAddress(address), port);
  builder->AddListeningPort(listen_addr_port,
                            grpc::InsecureServerCredentials());
}

std::shared_ptr<grpc::Channel> CreateUnixInsecureChannel(
    const std::string& socket_addr) {
  return grpc::CreateChannel(socket_addr, grpc::InsecureChannelCredentials());
}

std::shared_ptr<grpc::Channel> CreateTcpInsecureChannel(
    const std::string& address, const std::string& port) {
  std::string target = fmt::format("{}:{}", GrpcFormatIpAddress(address), port);
  return grpc::CreateChannel(target, grpc::InsecureChannelCredentials());
}

grpc::StatusCode ErrCodeToGrpcStatusCode(EgressErrCode code) {
  switch (code) {
  case EgressErrCode::SUCCESS:
    return grpc::StatusCode::OK;
  case EgressErrCode::ERR_EGRESS_NOT_FOUND:
    return grpc::StatusCode::NOT_FOUND;
  case EgressErrCode::ERR_DEADLINE_EXCEEDED:
    return grpc::StatusCode::DEADLINE_EXCEEDED;
  case EgressErrCode::ERR_INVALID_PARAM:
    return grpc::StatusCode::INVALID_ARGUMENT;
  case EgressErrCode::ERR_NOT_SUPPORTED:
    return grpc::StatusCode::UNIMPLEMENTED;
  case EgressErrCode::ERR_TOPIC_REGISTRATION:
    return grpc::StatusCode::ALREADY_EXISTS;
  case EgressErrCode::ERR_RPC_FAILURE:
    return grpc::StatusCode::UNAVAILABLE;
  default:
    return grpc::StatusCode::INTERNAL;
  }
}

grpc::Status RichErrToGrpcStatus(const EgressRichError& err) {
  return {ErrCodeToGrpcStatusCode(err.code()), err.description()};
}

EgressRichError RichErrFromGrpcStatus(const grpc::Status& status) {
  EgressErrCode code;
  switch (status.error_code()) {
  case grpc::StatusCode::OK:
    code = EgressErrCode::SUCCESS;
    break;
  case grpc::StatusCode::NOT_FOUND:
    code = EgressErrCode::ERR_EGRESS_NOT_FOUND;
    break;
  case grpc::StatusCode::DEADLINE_EXCEEDED:
    code = EgressErrCode::ERR_DEADLINE_EXCEEDED;
    break;
  case grpc::StatusCode::INVALID_ARGUMENT:
    code = EgressErrCode::ERR_INVALID_PARAM;
    break;
  case grpc::StatusCode::UNIMPLEMENTED:
    code = EgressErrCode::ERR_NOT_SUPPORTED;
    break;
  case grpc::StatusCode::ALREADY_EXISTS:
    code = EgressErrCode::ERR_TOPIC_REGISTRATION;
    break;
  default:
    code = EgressErrCode::ERR_RPC_FAILURE;
    break;
  }

  return FormatRichErr(code, "{}", status.error_message());
}
