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

#include <absl/synchronization/mutex.h>
#include <absl/synchronization/notification.h>
#include <absl/time/time.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "IOInfoClient.h"
#include "JobHandle.h"
#include "egress/MetricRegistry.h"
#include "egress/Profiler.h"

namespace egress::test {

using Egress::Supervisor::IJobHandle;
using Egress::Supervisor::IStatusReporter;

// Scriptable job. Run() blocks until Finish() or, if complete_on_eos is set,
// until SendEos().
class FakeJob {
 public:
  explicit FakeJob(EgressInfo info) : m_info_(std::move(info)) {}

  bool complete_on_eos{false};
  std::optional<EgressRichError> start_error;
  std::optional<EgressRichError> update_error;
  // The first slow_dot_calls dot requests block until ReleaseDot().
  int slow_dot_calls{0};

  EgressExpected<void> Start() {
    absl::MutexLock lk(&m_mtx_);
    m_start_count_++;
    if (start_error) return std::unexpected(*start_error);
    m_info_.set_started_at(NowUnixNano());
    if (!m_finished_) m_info_.set_status(EgressStatus::EGRESS_ACTIVE);
    m_started_ = true;
    return {};
  }

  EgressInfo Run() {
    absl::MutexLock lk(&m_mtx_);
    m_mtx_.Await(absl::Condition(&m_finished_));
    m_run_count_++;
    return m_info_;
  }

  void SendEos() {
    absl::MutexLock lk(&m_mtx_);
    m_eos_count_++;
    if (complete_on_eos) FinishLocked_(EgressStatus::EGRESS_COMPLETE, "");
  }

  EgressExpected<void> UpdateStream(
      const egress::grpc::UpdateStreamRequest& request) {
    absl::MutexLock lk(&m_mtx_);
    if (update_error) return std::unexpected(*update_error);
    for (const auto& url : request.add_output_urls())
      m_info_.add_stream_urls(url);
    m_update_count_++;
    return {};
  }

  std::string GetPipelineDebugDot() {
    int call;
    {
      absl::MutexLock lk(&m_mtx_);
      call = ++m_dot_calls_;
    }
    if (call <= slow_dot_calls)
      m_dot_release_.WaitForNotificationWithTimeout(absl::Seconds(10));
    return fmt::format("digraph fake_{} {{}}\n", call);
  }

  EgressInfo Info() const {
    absl::MutexLock lk(&m_mtx_);
    return m_info_;
  }

  void Finish(EgressStatus status, const std::string& error = "") {
    absl::MutexLock lk(&m_mtx_);
    FinishLocked_(status, error);
  }

  void ReleaseDot() {
    if (!m_dot_release_.HasBeenNotified()) m_dot_release_.Notify();
  }

  bool WaitStarted(absl::Duration timeout) {
    absl::MutexLock lk(&m_mtx_);
    return m_mtx_.AwaitWithTimeout(absl::Condition(&m_started_), timeout);
  }

  int EosCount() const {
    absl::MutexLock lk(&m_mtx_);
    return m_eos_count_;
  }

  int StartCount() const {
    absl::MutexLock lk(&m_mtx_);
    return m_start_count_;
  }

  int RunCount() const {
    absl::MutexLock lk(&m_mtx_);
    return m_run_count_;
  }

  int UpdateCount() const {
    absl::MutexLock lk(&m_mtx_);
    return m_update_count_;
  }

 private:
  void FinishLocked_(EgressStatus status, const std::string& error)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(m_mtx_) {
    if (m_finished_) return;
    int64_t now = NowUnixNano();
    m_info_.set_status(status);
    m_info_.set_error(error);
    m_info_.set_updated_at(now);
    m_info_.set_ended_at(now);
    m_finished_ = true;
  }

  mutable absl::Mutex m_mtx_;
  EgressInfo m_info_ ABSL_GUARDED_BY(m_mtx_);
  bool m_started_ ABSL_GUARDED_BY(m_mtx_){false};
  bool m_finished_ ABSL_GUARDED_BY(m_mtx_){false};
  int m_start_count_ ABSL_GUARDED_BY(m_mtx_){0};
  int m_run_count_ ABSL_GUARDED_BY(m_mtx_){0};
  int m_eos_count_ ABSL_GUARDED_BY(m_mtx_){0};
  int m_update_count_ ABSL_GUARDED_BY(m_mtx_){0};
  int m_dot_calls_ ABSL_GUARDED_BY(m_mtx_){0};
  absl::Notification m_dot_release_;
};

// The handler owns its job, the test keeps the FakeJob alive through this.
class FakeJobHandle : public IJobHandle {
 public:
  explicit FakeJobHandle(std::shared_ptr<FakeJob> job)
      : m_job_(std::move(job)) {}

  EgressExpected<void> Start() override { return m_job_->Start(); }
  EgressInfo Run() override { return m_job_->Run(); }
  void SendEos() override { m_job_->SendEos(); }
  EgressExpected<void> UpdateStream(
      const egress::grpc::UpdateStreamRequest& request) override {
    return m_job_->UpdateStream(request);
  }
  std::string GetPipelineDebugDot() override {
    return m_job_->GetPipelineDebugDot();
  }
  EgressInfo Info() const override { return m_job_->Info(); }

 private:
  std::shared_ptr<FakeJob> m_job_;
};

class FakeStatusReporter : public IStatusReporter {
 public:
  std::optional<EgressRichError> error;

  EgressExpected<void> UpdateEgress(const EgressInfo& info) override {
    absl::MutexLock lk(&m_mtx_);
    m_reports_.push_back(info);
    if (error) return std::unexpected(*error);
    return {};
  }

  std::vector<EgressInfo> Reports() const {
    absl::MutexLock lk(&m_mtx_);
    return m_reports_;
  }

 private:
  mutable absl::Mutex m_mtx_;
  std::vector<EgressInfo> m_reports_ ABSL_GUARDED_BY(m_mtx_);
};

class FakeProfiler : public egress::IProfiler {
 public:
  std::optional<EgressRichError> error;

  EgressExpected<std::string> GetProfileData(const std::string& profile_name,
                                             int32_t timeout_sec,
                                             int32_t debug) override {
    if (error) return std::unexpected(*error);
    return fmt::format("{}:{}:{}", profile_name, timeout_sec, debug);
  }
};

class FakeGatherer : public egress::MetricGatherer {
 public:
  std::optional<EgressRichError> error;
  std::vector<egress::MetricFamily> families;

  EgressExpected<std::vector<egress::MetricFamily>> Gather() override {
    if (error) return std::unexpected(*error);
    return families;
  }
};

}  // namespace egress::test
