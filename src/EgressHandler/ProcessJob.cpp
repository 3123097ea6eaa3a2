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

#include "ProcessJob.h"

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/strip.h>
#include <pthread.h>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iterator>

#include "egress/OS.h"
#include "egress/String.h"

extern char** environ;

namespace Egress::Supervisor {

namespace {

constexpr std::array<std::string_view, 4> kSupportedSchemes = {
    "rtmp", "rtmps", "srt", "file"};

}  // namespace

EgressExpected<void> ProcessJob::ValidateStreamUrl(const std::string& url) {
  size_t pos = url.find("://");
  if (pos == std::string::npos || pos == 0)
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_INVALID_PARAM,
                                         "Malformed stream url: {}", url));

  std::string scheme = absl::AsciiStrToLower(url.substr(0, pos));
  if (std::ranges::find(kSupportedSchemes, scheme) == kSupportedSchemes.end())
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_INVALID_PARAM,
                                         "Unsupported stream scheme {} in {}",
                                         scheme, url));
  return {};
}

EgressExpected<std::unique_ptr<ProcessJob>> ProcessJob::Create(
    const Config& config, egress::MetricRegistry* registry) {
  const auto& exe = config.Pipeline.Executable;
  if (exe.empty())
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_INVALID_PARAM,
                                         "No pipeline executable configured"));

  std::error_code ec;
  if (!std::filesystem::is_regular_file(exe, ec) ||
      access(exe.c_str(), X_OK) != 0)
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_INVALID_PARAM,
                                         "Pipeline executable {} is not an "
                                         "executable file",
                                         exe.string()));

  if (config.Pipeline.StreamUrls.empty())
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_INVALID_PARAM,
                                         "No stream url given"));

  for (const auto& url : config.Pipeline.StreamUrls) {
    auto result = ValidateStreamUrl(url);
    if (!result) return std::unexpected(result.error());
  }

  if (!util::os::CreateFolders(config.JobDir().string()))
    return std::unexpected(FormatFatalErr(EgressErrCode::ERR_SYSTEM_ERR,
                                          "Failed to create job dir {}",
                                          config.JobDir().string()));

  if (registry) {
    auto result = registry->RegisterGauge(
        std::string(kActiveGauge), "Whether the pipeline process is running.");
    if (result)
      result = registry->RegisterCounter(std::string(kStreamUpdateCounter),
                                         "Number of applied stream updates.");
    if (!result)
      return std::unexpected(FormatFatalErr(
          EgressErrCode::ERR_METRICS, "Failed to register job metrics: {}",
          result.error().description()));
  }

  return std::unique_ptr<ProcessJob>(new ProcessJob(config, registry));
}

ProcessJob::ProcessJob(const Config& config, egress::MetricRegistry* registry)
    : m_egress_id_(config.EgressId),
      m_pipeline_(config.Pipeline),
      m_stream_file_(config.JobDir() / kStreamFileName),
      m_registry_(registry),
      m_info_(InitialEgressInfo(config)) {}

ProcessJob::~ProcessJob() {
  absl::MutexLock lk(&m_mtx_);
  if (m_pid_ > 0 && !m_exited_) {
    EGRESS_WARN("[Egress #{}] Pipeline {} still running on destruction, "
                "killing it.",
                m_egress_id_, m_pid_);
    kill(m_pid_, SIGKILL);
    waitpid(m_pid_, nullptr, 0);
    m_exited_ = true;
  }
}

EgressExpected<void> ProcessJob::WriteStreamFile_(
    const std::vector<std::string>& urls) {
  // Rename makes the update atomic for the reader.
  std::filesystem::path tmp = m_stream_file_;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::trunc);
    if (!ofs)
      return std::unexpected(FormatFatalErr(EgressErrCode::ERR_SYSTEM_ERR,
                                            "Failed to open {}: {}",
                                            tmp.string(),
                                            std::strerror(errno)));
    for (const auto& url : urls) ofs << url << '\n';
    ofs.flush();
    if (!ofs)
      return std::unexpected(FormatFatalErr(EgressErrCode::ERR_SYSTEM_ERR,
                                            "Failed to write {}",
                                            tmp.string()));
  }

  std::error_code ec;
  std::filesystem::rename(tmp, m_stream_file_, ec);
  if (ec)
    return std::unexpected(FormatFatalErr(EgressErrCode::ERR_SYSTEM_ERR,
                                          "Failed to rename {}: {}",
                                          tmp.string(), ec.message()));
  return {};
}

void ProcessJob::SetActiveGauge_(bool active) {
  if (!m_registry_) return;
  auto result = m_registry_->SetGauge(std::string(kActiveGauge),
                                      {{"egress_id", m_egress_id_}},
                                      active ? 1 : 0);
  if (!result)
    EGRESS_WARN("[Egress #{}] {}", m_egress_id_, result.error().description());
}

EgressExpected<void> ProcessJob::Start() {
  absl::MutexLock lk(&m_mtx_);

  if (m_eos_sent_) {
    EGRESS_INFO("[Egress #{}] Stopped before start, aborting.", m_egress_id_);
    int64_t now = NowUnixNano();
    m_info_.set_status(EgressStatus::EGRESS_ABORTED);
    m_info_.set_started_at(now);
    m_info_.set_updated_at(now);
    m_info_.set_ended_at(now);
    return {};
  }

  if (m_pid_ > 0)
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_NOT_SUPPORTED,
                                         "Pipeline is already started"));

  std::vector<std::string> urls(m_info_.stream_urls().begin(),
                                m_info_.stream_urls().end());
  auto written = WriteStreamFile_(urls);
  if (!written) return written;

  // Everything the child needs is prepared before fork.
  std::vector<std::string> argv{m_pipeline_.Executable.string()};
  argv.insert(argv.end(), m_pipeline_.Args.begin(), m_pipeline_.Args.end());

  std::vector<std::string> env;
  for (char** e = environ; e != nullptr && *e != nullptr; e++) {
    std::string_view kv(*e);
    if (kv.starts_with("EGRESS_ID=") || kv.starts_with("EGRESS_STREAM_FILE="))
      continue;
    env.emplace_back(kv);
  }
  env.emplace_back(fmt::format("EGRESS_ID={}", m_egress_id_));
  env.emplace_back(
      fmt::format("EGRESS_STREAM_FILE={}", m_stream_file_.string()));

  std::vector<char*> argv_ptrs;
  for (auto& arg : argv) argv_ptrs.push_back(arg.data());
  argv_ptrs.push_back(nullptr);

  std::vector<char*> env_ptrs;
  for (auto& kv : env) env_ptrs.push_back(kv.data());
  env_ptrs.push_back(nullptr);

  // Signals stay blocked across fork until the child has dropped the
  // handlers inherited from the supervisor. An EOS sent in between is kept
  // pending instead of being consumed by one of those handlers.
  sigset_t all_signals, saved_mask;
  sigfillset(&all_signals);
  int rc = pthread_sigmask(SIG_SETMASK, &all_signals, &saved_mask);
  if (rc != 0)
    return std::unexpected(FormatFatalErr(EgressErrCode::ERR_SYSTEM_ERR,
                                          "Failed to block signals: {}",
                                          std::strerror(rc)));

  pid_t pid = fork();
  if (pid == -1) {
    int fork_errno = errno;
    pthread_sigmask(SIG_SETMASK, &saved_mask, nullptr);
    return std::unexpected(FormatFatalErr(EgressErrCode::ERR_SYSTEM_ERR,
                                          "fork() failed: {}",
                                          std::strerror(fork_errno)));
  }

  if (pid == 0) {  // Child proc
    // Own process group, so that a terminal Ctrl-C reaches the supervisor
    // only.
    setpgid(0, 0);

    for (int sig = 1; sig < NSIG; sig++) {
      if (sig == SIGKILL || sig == SIGSTOP) continue;
      signal(sig, SIG_DFL);
    }

    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    sigprocmask(SIG_SETMASK, &empty_mask, nullptr);

    util::os::CloseFdFrom(3);

    execve(argv_ptrs[0], argv_ptrs.data(), env_ptrs.data());

    // Error occurred since execve returned. At this point, errno is set.
    fmt::print(stderr, "[Pipeline Subprocess] Failed to execve {}: {}\n",
               argv_ptrs[0], std::strerror(errno));
    _exit(127);
  }

  rc = pthread_sigmask(SIG_SETMASK, &saved_mask, nullptr);
  if (rc != 0)
    EGRESS_ERROR("[Egress #{}] Failed to restore the signal mask: {}",
                 m_egress_id_, std::strerror(rc));

  m_pid_ = pid;
  int64_t now = NowUnixNano();
  m_info_.set_status(EgressStatus::EGRESS_ACTIVE);
  m_info_.set_started_at(now);
  m_info_.set_updated_at(now);
  SetActiveGauge_(true);

  EGRESS_INFO("[Egress #{}] Pipeline {} started with pid {}.", m_egress_id_,
              m_pipeline_.Executable.string(), pid);
  return {};
}

EgressInfo ProcessJob::Run() {
  pid_t pid;
  {
    absl::MutexLock lk(&m_mtx_);
    if (m_pid_ <= 0 || m_exited_) return m_info_;
    pid = m_pid_;
  }

  // Wait without reaping, so that the pid cannot be recycled while
  // SendEos() or UpdateStream() may still signal it.
  siginfo_t si{};
  int rc;
  do {
    rc = waitid(P_PID, pid, &si, WEXITED | WNOWAIT);
  } while (rc == -1 && errno == EINTR);
  int wait_errno = errno;

  absl::MutexLock lk(&m_mtx_);
  m_exited_ = true;

  int status = 0;
  pid_t reaped;
  do {
    reaped = waitpid(pid, &status, 0);
  } while (reaped == -1 && errno == EINTR);

  int64_t now = NowUnixNano();
  m_info_.set_updated_at(now);
  m_info_.set_ended_at(now);
  SetActiveGauge_(false);

  if (rc == -1 || reaped == -1) {
    int err = rc == -1 ? wait_errno : errno;
    m_info_.set_status(EgressStatus::EGRESS_FAILED);
    m_info_.set_error(fmt::format("Failed to wait for the pipeline: {}",
                                  std::strerror(err)));
  } else if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
    m_info_.set_status(EgressStatus::EGRESS_COMPLETE);
  } else if (WIFSIGNALED(status) && WTERMSIG(status) == SIGINT &&
             m_eos_sent_) {
    m_info_.set_status(EgressStatus::EGRESS_COMPLETE);
  } else if (WIFEXITED(status)) {
    m_info_.set_status(EgressStatus::EGRESS_FAILED);
    m_info_.set_error(
        fmt::format("Pipeline exited with code {}", WEXITSTATUS(status)));
  } else {
    m_info_.set_status(EgressStatus::EGRESS_FAILED);
    m_info_.set_error(fmt::format("Pipeline was terminated by signal {}",
                                  WTERMSIG(status)));
  }

  EGRESS_INFO("[Egress #{}] Pipeline {} ended, status: {}.", m_egress_id_, pid,
              m_info_.status());
  return m_info_;
}

void ProcessJob::SendEos() {
  absl::MutexLock lk(&m_mtx_);
  if (m_eos_sent_) return;
  m_eos_sent_ = true;

  if (m_pid_ <= 0 || m_exited_) {
    EGRESS_DEBUG("[Egress #{}] EOS recorded, pipeline is not running.",
                 m_egress_id_);
    return;
  }

  m_info_.set_status(EgressStatus::EGRESS_ENDING);
  m_info_.set_updated_at(NowUnixNano());

  EGRESS_INFO("[Egress #{}] Sending EOS to pipeline {}.", m_egress_id_,
              m_pid_);
  if (kill(m_pid_, SIGINT) != 0)
    EGRESS_ERROR("[Egress #{}] Failed to send SIGINT to {}: {}", m_egress_id_,
                 m_pid_, std::strerror(errno));
}

EgressExpected<void> ProcessJob::UpdateStream(
    const egress::grpc::UpdateStreamRequest& request) {
  if (!request.egress_id().empty() && request.egress_id() != m_egress_id_)
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_INVALID_PARAM,
                                         "Request is for egress {}",
                                         request.egress_id()));

  for (const auto& url : request.add_output_urls()) {
    auto result = ValidateStreamUrl(url);
    if (!result) return result;
  }

  absl::MutexLock lk(&m_mtx_);
  if (m_info_.status() != EgressStatus::EGRESS_ACTIVE || m_exited_)
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_NOT_SUPPORTED,
                                         "Egress is {}, streams can only be "
                                         "updated while active",
                                         m_info_.status()));

  std::vector<std::string> urls(m_info_.stream_urls().begin(),
                                m_info_.stream_urls().end());
  for (const auto& url : request.remove_output_urls()) {
    auto it = std::ranges::find(urls, url);
    if (it == urls.end())
      return std::unexpected(FormatRichErr(
          EgressErrCode::ERR_INVALID_PARAM, "Unknown stream url {}", url));
    urls.erase(it);
  }
  for (const auto& url : request.add_output_urls())
    if (std::ranges::find(urls, url) == urls.end()) urls.push_back(url);

  auto written = WriteStreamFile_(urls);
  if (!written) return written;

  m_info_.clear_stream_urls();
  for (const auto& url : urls) m_info_.add_stream_urls(url);
  m_info_.set_updated_at(NowUnixNano());

  if (kill(m_pid_, SIGHUP) != 0)
    EGRESS_ERROR("[Egress #{}] Failed to send SIGHUP to {}: {}", m_egress_id_,
                 m_pid_, std::strerror(errno));

  if (m_registry_) {
    auto result = m_registry_->IncCounter(std::string(kStreamUpdateCounter),
                                          {{"egress_id", m_egress_id_}});
    if (!result)
      EGRESS_WARN("[Egress #{}] {}", m_egress_id_,
                  result.error().description());
  }

  EGRESS_DEBUG("[Egress #{}] Streams updated: [{}]", m_egress_id_,
               absl::StrJoin(urls, ","));
  return {};
}

void ProcessJob::AppendProcessTree_(pid_t pid, std::string* out,
                                    int depth) const {
  if (depth > 16) return;

  auto children = util::ReadFileIntoString(
      fmt::format("/proc/{}/task/{}/children", pid, pid));
  if (!children) return;

  for (std::string_view child :
       absl::StrSplit(*children, ' ', absl::SkipWhitespace())) {
    auto comm = util::ReadFileIntoString(fmt::format("/proc/{}/comm", child));
    std::string name = comm ? std::string(absl::StripAsciiWhitespace(*comm))
                            : std::string("?");
    fmt::format_to(std::back_inserter(*out),
                   "  \"{}\" [label=\"{}\\npid {}\"];\n  \"{}\" -> \"{}\";\n",
                   child, name, child, pid, child);

    pid_t child_pid = 0;
    if (absl::SimpleAtoi(child, &child_pid))
      AppendProcessTree_(child_pid, out, depth + 1);
  }
}

std::string ProcessJob::GetPipelineDebugDot() {
  pid_t pid;
  EgressStatus status;
  {
    absl::MutexLock lk(&m_mtx_);
    pid = m_exited_ ? -1 : m_pid_;
    status = m_info_.status();
  }

  pid_t self = getpid();
  std::string out = fmt::format("digraph \"egress_{}\" {{\n  rankdir=LR;\n",
                                m_egress_id_);
  fmt::format_to(std::back_inserter(out),
                 "  \"{}\" [shape=box,label=\"egress-handler\\npid {}\"];\n",
                 self, self);

  if (pid > 0) {
    fmt::format_to(std::back_inserter(out),
                   "  \"{}\" [shape=box,label=\"{}\\npid {}\\n{}\"];\n",
                   pid, m_pipeline_.Executable.filename().string(), pid,
                   status);
    fmt::format_to(std::back_inserter(out), "  \"{}\" -> \"{}\";\n", self,
                   pid);
    AppendProcessTree_(pid, &out, 0);
  }

  out += "}\n";
  return out;
}

EgressInfo ProcessJob::Info() const {
  absl::MutexLock lk(&m_mtx_);
  return m_info_;
}

pid_t ProcessJob::Pid() const {
  absl::MutexLock lk(&m_mtx_);
  return m_pid_;
}

}  // namespace Egress::Supervisor
