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

#include "Handler.h"

#include "egress/OS.h"
#include "egress/String.h"

namespace Egress::Supervisor {

EgressExpected<std::unique_ptr<Handler>> Handler::Create(const Config& config,
                                                         HandlerDeps deps) {
  if (config.EgressId.empty())
    return std::unexpected(FormatFatalErr(EgressErrCode::ERR_INVALID_PARAM,
                                          "Egress id is empty"));
  if (deps.bus == nullptr || !deps.job_factory)
    return std::unexpected(FormatFatalErr(
        EgressErrCode::ERR_INVALID_PARAM,
        "Message bus and job factory are required by the handler"));

  std::unique_ptr<Handler> handler(new Handler(config, std::move(deps)));
  auto result = handler->Init_();
  if (!result) return std::unexpected(result.error());

  return handler;
}

Handler::Handler(const Config& config, HandlerDeps deps)
    : m_config_(config), m_deps_(std::move(deps)) {}

Handler::~Handler() { ShutdownSurfaces_(); }

EgressExpected<void> Handler::Init_() {
  const std::string& egress_id = m_config_.EgressId;

  m_rpc_server_ =
      std::make_unique<RpcHandlerServer>(m_deps_.bus, this, egress_id);
  auto registered = m_rpc_server_->RegisterTopics();
  if (!registered) {
    EGRESS_ERROR("[Egress #{}] {}", egress_id,
                 registered.error().description());
    return registered;
  }

  std::filesystem::path socket_path = m_config_.HandlerSocketPath();
  if (!util::os::CreateFolders(m_config_.JobDir().string()))
    return std::unexpected(FormatFatalErr(EgressErrCode::ERR_SYSTEM_ERR,
                                          "Failed to create job dir {}",
                                          m_config_.JobDir().string()));

  // Only the owner may reach the introspection socket, from bind onwards.
  std::error_code ec;
  std::filesystem::permissions(m_config_.JobDir(),
                               std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::replace, ec);
  if (ec)
    return std::unexpected(FormatFatalErr(EgressErrCode::ERR_SYSTEM_ERR,
                                          "Failed to restrict job dir {}: {}",
                                          m_config_.JobDir().string(),
                                          ec.message()));

  m_handler_server_ = std::make_unique<HandlerServer>(this, socket_path);
  if (!m_handler_server_->Started())
    return std::unexpected(FormatFatalErr(EgressErrCode::ERR_LISTEN_FAILURE,
                                          "Failed to listen on {}",
                                          socket_path.string()));

  auto job = m_deps_.job_factory(m_config_);
  if (!job) {
    const EgressRichError& err = job.error();
    if (IsFatal(err)) {
      EGRESS_ERROR("[Egress #{}] Failed to build the job: {}", egress_id,
                   err.description());
      return std::unexpected(err);
    }

    EGRESS_WARN("[Egress #{}] Request rejected: {}", egress_id,
                err.description());

    EgressInfo info = InitialEgressInfo(m_config_);
    int64_t now = NowUnixNano();
    info.set_started_at(now);
    info.set_updated_at(now);
    info.set_ended_at(now);
    info.set_status(EgressStatus::EGRESS_FAILED);
    info.set_error(err.description());
    ReportStatus_(info);

    return std::unexpected(err);
  }

  absl::MutexLock lk(&m_job_mtx_);
  m_job_ = std::move(job.value());
  EGRESS_INFO("[Egress #{}] Job built, handler is ready.", egress_id);
  return {};
}

std::shared_ptr<IJobHandle> Handler::GetJob_() const {
  absl::MutexLock lk(&m_job_mtx_);
  return m_job_;
}

void Handler::ReportStatus_(const EgressInfo& info) {
  if (m_deps_.status_reporter == nullptr) return;

  auto result = m_deps_.status_reporter->UpdateEgress(info);
  if (!result)
    EGRESS_WARN("[Egress #{}] Failed to report status {}: {}",
                info.egress_id(), info.status(),
                result.error().description());
}

void Handler::ShutdownSurfaces_() {
  {
    absl::MutexLock lk(&m_shutdown_mtx_);
    if (m_surfaces_down_) return;
    m_surfaces_down_ = true;
  }

  if (m_rpc_server_) m_rpc_server_->Shutdown();

  if (m_handler_server_) {
    m_handler_server_->Shutdown();
    m_handler_server_->Wait();

    std::filesystem::path socket_path = m_config_.HandlerSocketPath();
    if (std::filesystem::exists(socket_path))
      util::os::DeleteFile(socket_path.string());
  }

  EGRESS_DEBUG("[Egress #{}] Control and introspection surfaces are down.",
               m_config_.EgressId);
}

EgressExpected<void> Handler::Run() {
  if (m_run_called_.exchange(true))
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_NOT_SUPPORTED,
                                         "Run() can only be called once"));

  std::shared_ptr<IJobHandle> job = GetJob_();
  if (!job) return std::unexpected(ErrEgressNotFound());

  const std::string& egress_id = m_config_.EgressId;

  m_kill_.OnTrigger([this] {
    absl::MutexLock lk(&m_run_mtx_);
    m_kill_pending_ = true;
  });

  std::thread runner([this, job] {
    util::SetCurrentThreadName("EgressJobRun");

    EgressInfo result;
    auto started = job->Start();
    if (started) {
      result = job->Run();
    } else {
      EGRESS_ERROR("[Egress #{}] Failed to start the job: {}",
                   m_config_.EgressId, started.error().description());
      result = job->Info();
      int64_t now = NowUnixNano();
      if (result.started_at() == 0) result.set_started_at(now);
      result.set_updated_at(now);
      result.set_ended_at(now);
      result.set_status(EgressStatus::EGRESS_FAILED);
      result.set_error(started.error().description());
    }

    absl::MutexLock lk(&m_run_mtx_);
    m_result_ = std::move(result);
  });

  absl::Duration warn_interval =
      absl::Seconds(std::max<uint64_t>(m_config_.StopWarnIntervalSec, 1));

  std::optional<EgressInfo> result;
  while (!result) {
    bool forward_kill = false;
    bool still_stopping = false;
    {
      absl::MutexLock lk(&m_run_mtx_);
      bool has_event = m_run_mtx_.AwaitWithTimeout(
          absl::Condition(this, &Handler::RunLoopHasEvent_), warn_interval);

      if (m_kill_pending_) {
        // A pending kill goes first even if the result is ready as well.
        m_kill_pending_ = false;
        m_stop_requested_ = true;
        forward_kill = true;
      } else if (m_result_) {
        result = std::move(m_result_);
        m_result_.reset();
      } else if (!has_event) {
        still_stopping = m_stop_requested_;
      }
    }

    if (forward_kill) {
      EGRESS_INFO("[Egress #{}] Kill received, requesting the job to stop.",
                  egress_id);
      job->SendEos();
    } else if (still_stopping) {
      EGRESS_WARN("[Egress #{}] Job is still running after a stop request.",
                  egress_id);
    }
  }

  runner.join();

  if (!IsTerminalStatus(result->status())) {
    EGRESS_ERROR("[Egress #{}] Job returned with non-terminal status {}.",
                 egress_id, result->status());
    result->set_error(fmt::format("Job returned with non-terminal status {}",
                                  result->status()));
    result->set_status(EgressStatus::EGRESS_FAILED);
    if (result->ended_at() == 0) result->set_ended_at(NowUnixNano());
  }

  EGRESS_INFO("[Egress #{}] Job ended with status {}.", egress_id,
              result->status());

  ReportStatus_(*result);
  ShutdownSurfaces_();

  {
    absl::MutexLock lk(&m_job_mtx_);
    m_job_.reset();
  }

  return {};
}

void Handler::Kill() {
  if (m_kill_.Trigger())
    EGRESS_INFO("[Egress #{}] Kill switch triggered.", m_config_.EgressId);
}

EgressExpected<EgressInfo> Handler::UpdateStream(
    const egress::grpc::UpdateStreamRequest& request) {
  std::shared_ptr<IJobHandle> job = GetJob_();
  if (!job) return std::unexpected(ErrEgressNotFound());

  auto result = job->UpdateStream(request);
  if (!result) return std::unexpected(result.error());

  return job->Info();
}

EgressExpected<EgressInfo> Handler::StopEgress(
    const egress::grpc::StopEgressRequest& request) {
  std::shared_ptr<IJobHandle> job = GetJob_();
  if (!job) return std::unexpected(ErrEgressNotFound());

  EGRESS_INFO("[Egress #{}] Stop requested.", m_config_.EgressId);
  job->SendEos();
  {
    absl::MutexLock lk(&m_run_mtx_);
    m_stop_requested_ = true;
  }

  return job->Info();
}

EgressExpected<std::string> Handler::GetPipelineDot() {
  std::shared_ptr<IJobHandle> job = GetJob_();
  if (!job) return std::unexpected(ErrEgressNotFound());

  // Each request owns its future. A late answer dies with it.
  std::future<std::string> dot =
      m_debug_pool_.submit_task([job] { return job->GetPipelineDebugDot(); });
  if (dot.wait_for(kPipelineDotTimeout) != std::future_status::ready)
    return std::unexpected(
        FormatRichErr(EgressErrCode::ERR_DEADLINE_EXCEEDED,
                      "timed out requesting pipeline debug info"));

  return dot.get();
}

EgressExpected<std::string> Handler::GetPProf(const std::string& profile_name,
                                              int32_t timeout_sec,
                                              int32_t debug) {
  if (!GetJob_()) return std::unexpected(ErrEgressNotFound());
  if (m_deps_.profiler == nullptr)
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_NOT_SUPPORTED,
                                         "Profiling is not enabled"));

  return m_deps_.profiler->GetProfileData(profile_name, timeout_sec, debug);
}

EgressExpected<std::string> Handler::GetMetrics() {
  if (!GetJob_()) return std::unexpected(ErrEgressNotFound());
  if (m_deps_.gatherer == nullptr)
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_NOT_SUPPORTED,
                                         "Metrics are not enabled"));

  auto families = m_deps_.gatherer->Gather();
  if (!families) return std::unexpected(families.error());

  auto rendered = egress::RenderMetrics(families.value());
  if (!rendered) {
    EGRESS_DEBUG("Failed to render metrics: {}",
                 rendered.error().description());
    return std::unexpected(rendered.error());
  }

  EGRESS_TRACE("Rendered {} metric entries.", rendered->entries);
  return std::move(rendered->text);
}

}  // namespace Egress::Supervisor
