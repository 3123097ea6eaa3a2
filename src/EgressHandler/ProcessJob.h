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

#include <sys/types.h>

#include "JobHandle.h"
#include "egress/MetricRegistry.h"

namespace Egress::Supervisor {

/**
 * Runs the pipeline executable as a child process.
 * The child receives EGRESS_ID and EGRESS_STREAM_FILE in its environment.
 * SIGINT asks it to flush and end the stream, SIGHUP tells it that the stream
 * file has been rewritten.
 */
class ProcessJob : public IJobHandle {
 public:
  static constexpr std::string_view kActiveGauge = "egress_pipeline_active";
  static constexpr std::string_view kStreamUpdateCounter =
      "egress_stream_updates_total";

  // registry may be null.
  static EgressExpected<std::unique_ptr<ProcessJob>> Create(
      const Config& config, egress::MetricRegistry* registry);

  ~ProcessJob() override;

  ProcessJob(const ProcessJob&) = delete;
  ProcessJob& operator=(const ProcessJob&) = delete;

  EgressExpected<void> Start() override;

  EgressInfo Run() override;

  void SendEos() override;

  EgressExpected<void> UpdateStream(
      const egress::grpc::UpdateStreamRequest& request) override;

  std::string GetPipelineDebugDot() override;

  [[nodiscard]] EgressInfo Info() const override;

  [[nodiscard]] pid_t Pid() const;

  static EgressExpected<void> ValidateStreamUrl(const std::string& url);

 private:
  ProcessJob(const Config& config, egress::MetricRegistry* registry);

  EgressExpected<void> WriteStreamFile_(const std::vector<std::string>& urls);

  void SetActiveGauge_(bool active);

  void AppendProcessTree_(pid_t pid, std::string* out, int depth) const;

  std::string m_egress_id_;
  Config::PipelineConfig m_pipeline_;
  std::filesystem::path m_stream_file_;
  egress::MetricRegistry* m_registry_;

  mutable absl::Mutex m_mtx_;
  EgressInfo m_info_ ABSL_GUARDED_BY(m_mtx_);
  pid_t m_pid_ ABSL_GUARDED_BY(m_mtx_){-1};
  bool m_exited_ ABSL_GUARDED_BY(m_mtx_){false};
  bool m_eos_sent_ ABSL_GUARDED_BY(m_mtx_){false};
};

}  // namespace Egress::Supervisor
