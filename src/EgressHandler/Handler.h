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

#include "HandlerServer.h"
#include "IOInfoClient.h"
#include "JobHandle.h"
#include "RpcHandlerServer.h"
#include "egress/KillSwitch.h"
#include "egress/MessageBus.h"
#include "egress/MetricRegistry.h"
#include "egress/Profiler.h"

namespace Egress::Supervisor {

// Process-wide collaborators, owned by the caller and outliving the handler.
struct HandlerDeps {
  egress::MessageBus* bus{nullptr};
  IStatusReporter* status_reporter{nullptr};
  egress::IProfiler* profiler{nullptr};
  egress::MetricGatherer* gatherer{nullptr};
  JobFactory job_factory;
};

/**
 * Supervises exactly one egress job for the lifetime of the process.
 *
 * Create() registers the rpc topics, starts the introspection server and
 * builds the job. Run() drives the job to its end and is the only place
 * where the terminal status is reported and both surfaces are shut down.
 * Kill() may be called from any thread at any time.
 */
class Handler {
 public:
  // A failure carrying ERR_KIND_USER has already been reported as FAILED.
  static EgressExpected<std::unique_ptr<Handler>> Create(const Config& config,
                                                         HandlerDeps deps);

  ~Handler();

  Handler(const Handler&) = delete;
  Handler& operator=(const Handler&) = delete;

  // Blocks until the job ends. Returns an error only if called twice.
  EgressExpected<void> Run();

  void Kill();

  // ---------- Control surface ----------
  EgressExpected<EgressInfo> UpdateStream(
      const egress::grpc::UpdateStreamRequest& request);

  // Does not wait for the job to end.
  EgressExpected<EgressInfo> StopEgress(
      const egress::grpc::StopEgressRequest& request);

  // ---------- Introspection surface ----------
  EgressExpected<std::string> GetPipelineDot();

  EgressExpected<std::string> GetPProf(const std::string& profile_name,
                                       int32_t timeout_sec, int32_t debug);

  EgressExpected<std::string> GetMetrics();

  [[nodiscard]] const Config& GetConfig() const { return m_config_; }

 private:
  Handler(const Config& config, HandlerDeps deps);

  EgressExpected<void> Init_();

  std::shared_ptr<IJobHandle> GetJob_() const;

  void ReportStatus_(const EgressInfo& info);

  void ShutdownSurfaces_();

  bool RunLoopHasEvent_() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(m_run_mtx_) {
    return m_kill_pending_ || m_result_.has_value();
  }

  Config m_config_;
  HandlerDeps m_deps_;

  egress::KillSwitch m_kill_;

  std::unique_ptr<RpcHandlerServer> m_rpc_server_;
  std::unique_ptr<HandlerServer> m_handler_server_;

  absl::Mutex m_shutdown_mtx_;
  bool m_surfaces_down_ ABSL_GUARDED_BY(m_shutdown_mtx_){false};

  // Null before the job is built and after Run() has returned.
  mutable absl::Mutex m_job_mtx_;
  std::shared_ptr<IJobHandle> m_job_ ABSL_GUARDED_BY(m_job_mtx_);

  std::atomic_bool m_run_called_{false};

  absl::Mutex m_run_mtx_;
  bool m_kill_pending_ ABSL_GUARDED_BY(m_run_mtx_){false};
  bool m_stop_requested_ ABSL_GUARDED_BY(m_run_mtx_){false};
  std::optional<EgressInfo> m_result_ ABSL_GUARDED_BY(m_run_mtx_);

  // Debug requests run here so that a stuck job only stalls the pool.
  BS::thread_pool m_debug_pool_{4};
};

}  // namespace Egress::Supervisor
