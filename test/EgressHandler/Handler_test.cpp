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

#include <gtest/gtest.h>
#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <thread>

#include "SharedTestImpl/FakeJob.h"

using Egress::Supervisor::Config;
using Egress::Supervisor::Handler;
using Egress::Supervisor::HandlerDeps;
using Egress::Supervisor::IJobHandle;
using Egress::Supervisor::InitialEgressInfo;
using Egress::Supervisor::kRpcServiceName;
using Egress::Supervisor::kRpcStopEgressMethod;
using Egress::Supervisor::kRpcUpdateStreamMethod;
using egress::test::FakeGatherer;
using egress::test::FakeJob;
using egress::test::FakeJobHandle;
using egress::test::FakeProfiler;
using egress::test::FakeStatusReporter;

class HandlerTest : public testing::Test {
 protected:
  void SetUp() override {
    static std::atomic_int counter{0};
    m_tmp_dir_ = std::filesystem::temp_directory_path() /
                 fmt::format("egress_handler_test_{}_{}", getpid(), counter++);

    config.EgressId = "EG_handler_test";
    config.RoomName = "room";
    config.TmpDir = m_tmp_dir_;
    config.StopWarnIntervalSec = 1;

    job = std::make_shared<FakeJob>(InitialEgressInfo(config));
  }

  void TearDown() override {
    job->ReleaseDot();
    std::error_code ec;
    std::filesystem::remove_all(m_tmp_dir_, ec);
  }

  HandlerDeps Deps() {
    return HandlerDeps{
        .bus = &bus,
        .status_reporter = &reporter,
        .profiler = &profiler,
        .gatherer = &gatherer,
        .job_factory = [this](const Config&)
            -> EgressExpected<std::unique_ptr<IJobHandle>> {
          factory_calls++;
          if (factory_error) return std::unexpected(*factory_error);
          return std::make_unique<FakeJobHandle>(job);
        },
    };
  }

  std::unique_ptr<Handler> CreateHandler() {
    auto handler = Handler::Create(config, Deps());
    EXPECT_TRUE(handler.has_value())
        << (handler ? "" : handler.error().description());
    return handler ? std::move(handler.value()) : nullptr;
  }

  grpc::Status CallBus(const std::string& method,
                       const google::protobuf::Message& request,
                       EgressInfo* info) {
    std::string reply;
    grpc::Status status = bus.Call(kRpcServiceName, method, config.EgressId,
                                   request.SerializeAsString(), &reply);
    if (status.ok()) EXPECT_TRUE(info->ParseFromString(reply));
    return status;
  }

  Config config;
  std::shared_ptr<FakeJob> job;

  egress::LocalMessageBus bus;
  FakeStatusReporter reporter;
  FakeProfiler profiler;
  FakeGatherer gatherer;

  std::atomic_int factory_calls{0};
  std::optional<EgressRichError> factory_error;

 private:
  std::filesystem::path m_tmp_dir_;
};

TEST_F(HandlerTest, FatalJobErrorIsNotReported) {
  factory_error = FormatFatalErr(EgressErrCode::ERR_SYSTEM_ERR, "disk gone");

  auto handler = Handler::Create(config, Deps());
  ASSERT_FALSE(handler.has_value());
  EXPECT_TRUE(IsFatal(handler.error()));
  EXPECT_EQ(handler.error().code(), EgressErrCode::ERR_SYSTEM_ERR);
  EXPECT_EQ(handler.error().description(), "disk gone");
  EXPECT_TRUE(reporter.Reports().empty());

  // A failed construction leaves no topic behind.
  EXPECT_FALSE(bus.IsRegistered(kRpcServiceName, kRpcStopEgressMethod,
                                config.EgressId));
}

TEST_F(HandlerTest, UserJobErrorIsReportedOnce) {
  factory_error =
      FormatRichErr(EgressErrCode::ERR_INVALID_PARAM, "unsupported url");

  auto handler = Handler::Create(config, Deps());
  ASSERT_FALSE(handler.has_value());
  EXPECT_FALSE(IsFatal(handler.error()));
  EXPECT_EQ(handler.error().code(), EgressErrCode::ERR_INVALID_PARAM);
  EXPECT_EQ(handler.error().description(), "unsupported url");

  auto reports = reporter.Reports();
  ASSERT_EQ(reports.size(), 1);
  const EgressInfo& info = reports.front();
  EXPECT_EQ(info.egress_id(), config.EgressId);
  EXPECT_EQ(info.status(), EgressStatus::EGRESS_FAILED);
  EXPECT_EQ(info.error(), "unsupported url");
  EXPECT_GT(info.started_at(), 0);
  EXPECT_GE(info.ended_at(), info.started_at());
  EXPECT_EQ(info.ended_at(), info.started_at());
  EXPECT_EQ(info.updated_at(), info.ended_at());
}

TEST_F(HandlerTest, TakenTopicIsFatalAndJobIsNeverBuilt) {
  ASSERT_TRUE(bus.Register(kRpcServiceName, kRpcStopEgressMethod,
                           config.EgressId,
                           [](const std::string&, std::string*) {
                             return grpc::Status::OK;
                           })
                  .has_value());

  auto handler = Handler::Create(config, Deps());
  ASSERT_FALSE(handler.has_value());
  EXPECT_TRUE(IsFatal(handler.error()));
  EXPECT_EQ(handler.error().code(), EgressErrCode::ERR_TOPIC_REGISTRATION);
  EXPECT_EQ(factory_calls, 0);
  EXPECT_TRUE(reporter.Reports().empty());

  EXPECT_FALSE(bus.IsRegistered(kRpcServiceName, kRpcUpdateStreamMethod,
                                config.EgressId));
  EXPECT_TRUE(bus.IsRegistered(kRpcServiceName, kRpcStopEgressMethod,
                               config.EgressId));
}

TEST_F(HandlerTest, CallsDuringConstructionAreNotFound) {
  grpc::StatusCode code = grpc::StatusCode::OK;
  HandlerDeps deps = Deps();
  deps.job_factory =
      [&](const Config&) -> EgressExpected<std::unique_ptr<IJobHandle>> {
    std::string reply;
    egress::grpc::StopEgressRequest request;
    request.set_egress_id(config.EgressId);
    code = bus.Call(kRpcServiceName, kRpcStopEgressMethod, config.EgressId,
                    request.SerializeAsString(), &reply)
               .error_code();
    return std::make_unique<FakeJobHandle>(job);
  };

  auto handler = Handler::Create(config, std::move(deps));
  ASSERT_TRUE(handler.has_value());
  EXPECT_EQ(code, grpc::StatusCode::NOT_FOUND);
  EXPECT_EQ(job->EosCount(), 0);
}

TEST_F(HandlerTest, StopEgressReturnsRunningInfoThenReportsOnce) {
  auto handler = CreateHandler();
  ASSERT_NE(handler, nullptr);

  EgressExpected<void> run_result;
  std::thread runner([&] { run_result = handler->Run(); });
  ASSERT_TRUE(job->WaitStarted(absl::Seconds(5)));

  egress::grpc::StopEgressRequest request;
  request.set_egress_id(config.EgressId);
  EgressInfo info;
  grpc::Status status = CallBus(kRpcStopEgressMethod, request, &info);
  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(info.status(), EgressStatus::EGRESS_ACTIVE);
  EXPECT_EQ(job->EosCount(), 1);

  // Run() keeps waiting for the job after the stop request.
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  EXPECT_TRUE(reporter.Reports().empty());

  job->Finish(EgressStatus::EGRESS_COMPLETE);
  runner.join();
  EXPECT_TRUE(run_result.has_value());

  auto reports = reporter.Reports();
  ASSERT_EQ(reports.size(), 1);
  EXPECT_EQ(reports.front().status(), EgressStatus::EGRESS_COMPLETE);
  EXPECT_EQ(job->RunCount(), 1);

  EXPECT_FALSE(bus.IsRegistered(kRpcServiceName, kRpcStopEgressMethod,
                                config.EgressId));
  EXPECT_FALSE(bus.IsRegistered(kRpcServiceName, kRpcUpdateStreamMethod,
                                config.EgressId));
}

TEST_F(HandlerTest, ConcurrentKillsSendOneEos) {
  job->complete_on_eos = true;
  auto handler = CreateHandler();
  ASSERT_NE(handler, nullptr);

  std::thread runner([&] { EXPECT_TRUE(handler->Run().has_value()); });
  ASSERT_TRUE(job->WaitStarted(absl::Seconds(5)));

  std::vector<std::thread> killers;
  for (int i = 0; i < 8; i++) killers.emplace_back([&] { handler->Kill(); });
  for (auto& t : killers) t.join();

  runner.join();
  handler->Kill();

  EXPECT_EQ(job->EosCount(), 1);
  auto reports = reporter.Reports();
  ASSERT_EQ(reports.size(), 1);
  EXPECT_EQ(reports.front().status(), EgressStatus::EGRESS_COMPLETE);
}

TEST_F(HandlerTest, KillBeforeRunStillStopsTheJob) {
  job->complete_on_eos = true;
  auto handler = CreateHandler();
  ASSERT_NE(handler, nullptr);

  handler->Kill();
  handler->Kill();
  EXPECT_EQ(job->EosCount(), 0);

  EXPECT_TRUE(handler->Run().has_value());
  EXPECT_EQ(job->EosCount(), 1);
  EXPECT_EQ(job->RunCount(), 1);
  EXPECT_EQ(reporter.Reports().size(), 1);
}

TEST_F(HandlerTest, RunCanOnlyBeCalledOnce) {
  job->Finish(EgressStatus::EGRESS_COMPLETE);
  auto handler = CreateHandler();
  ASSERT_NE(handler, nullptr);

  EXPECT_TRUE(handler->Run().has_value());

  auto second = handler->Run();
  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(second.error().code(), EgressErrCode::ERR_NOT_SUPPORTED);
  EXPECT_EQ(job->RunCount(), 1);
  EXPECT_EQ(reporter.Reports().size(), 1);
}

TEST_F(HandlerTest, StartFailureIsReportedAsFailed) {
  job->start_error =
      FormatRichErr(EgressErrCode::ERR_PIPELINE_FAILURE, "no encoder");
  auto handler = CreateHandler();
  ASSERT_NE(handler, nullptr);

  EXPECT_TRUE(handler->Run().has_value());
  EXPECT_EQ(job->RunCount(), 0);

  auto reports = reporter.Reports();
  ASSERT_EQ(reports.size(), 1);
  EXPECT_EQ(reports.front().status(), EgressStatus::EGRESS_FAILED);
  EXPECT_EQ(reports.front().error(), "no encoder");
  EXPECT_GE(reports.front().ended_at(), reports.front().started_at());
}

TEST_F(HandlerTest, NonTerminalResultIsReportedAsFailed) {
  job->Finish(EgressStatus::EGRESS_ACTIVE);
  auto handler = CreateHandler();
  ASSERT_NE(handler, nullptr);

  EXPECT_TRUE(handler->Run().has_value());
  auto reports = reporter.Reports();
  ASSERT_EQ(reports.size(), 1);
  EXPECT_EQ(reports.front().status(), EgressStatus::EGRESS_FAILED);
  EXPECT_NE(reports.front().error().find("EGRESS_ACTIVE"), std::string::npos)
      << reports.front().error();
  EXPECT_GT(reports.front().ended_at(), 0);
}

TEST_F(HandlerTest, ReporterFailureDoesNotBlockRun) {
  reporter.error = FormatRichErr(EgressErrCode::ERR_RPC_FAILURE, "down");
  job->Finish(EgressStatus::EGRESS_FAILED, "encoder crashed");
  auto handler = CreateHandler();
  ASSERT_NE(handler, nullptr);

  EXPECT_TRUE(handler->Run().has_value());
  auto reports = reporter.Reports();
  ASSERT_EQ(reports.size(), 1);
  EXPECT_EQ(reports.front().error(), "encoder crashed");
}

TEST_F(HandlerTest, CallsAfterRunAreNotFound) {
  job->Finish(EgressStatus::EGRESS_COMPLETE);
  auto handler = CreateHandler();
  ASSERT_NE(handler, nullptr);
  ASSERT_TRUE(handler->Run().has_value());

  egress::grpc::UpdateStreamRequest update;
  auto updated = handler->UpdateStream(update);
  ASSERT_FALSE(updated.has_value());
  EXPECT_EQ(updated.error().code(), EgressErrCode::ERR_EGRESS_NOT_FOUND);

  auto stopped = handler->StopEgress({});
  ASSERT_FALSE(stopped.has_value());
  EXPECT_EQ(stopped.error().code(), EgressErrCode::ERR_EGRESS_NOT_FOUND);

  EXPECT_EQ(handler->GetPipelineDot().error().code(),
            EgressErrCode::ERR_EGRESS_NOT_FOUND);
  EXPECT_EQ(handler->GetPProf("cpu", 1, 0).error().code(),
            EgressErrCode::ERR_EGRESS_NOT_FOUND);
  EXPECT_EQ(handler->GetMetrics().error().code(),
            EgressErrCode::ERR_EGRESS_NOT_FOUND);

  EgressInfo info;
  EXPECT_EQ(CallBus(kRpcStopEgressMethod, egress::grpc::StopEgressRequest{},
                    &info)
                .error_code(),
            grpc::StatusCode::NOT_FOUND);
  EXPECT_EQ(job->EosCount(), 0);
}

TEST_F(HandlerTest, UpdateStreamThroughBus) {
  auto handler = CreateHandler();
  ASSERT_NE(handler, nullptr);

  egress::grpc::UpdateStreamRequest request;
  request.set_egress_id(config.EgressId);
  request.add_add_output_urls("rtmp://live.example.com/app/key");

  EgressInfo info;
  grpc::Status status = CallBus(kRpcUpdateStreamMethod, request, &info);
  ASSERT_TRUE(status.ok()) << status.error_message();
  ASSERT_EQ(info.stream_urls_size(), 1);
  EXPECT_EQ(info.stream_urls(0), "rtmp://live.example.com/app/key");

  job->update_error =
      FormatRichErr(EgressErrCode::ERR_INVALID_PARAM, "bad url");
  status = CallBus(kRpcUpdateStreamMethod, request, &info);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(status.error_message(), "bad url");

  std::string reply;
  status = bus.Call(kRpcServiceName, kRpcUpdateStreamMethod, config.EgressId,
                    "\xff\xff\xff", &reply);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(HandlerTest, JobErrorsPassThroughUnchanged) {
  auto handler = CreateHandler();
  ASSERT_NE(handler, nullptr);

  job->update_error =
      FormatRichErr(EgressErrCode::ERR_NOT_SUPPORTED, "not active");
  auto updated = handler->UpdateStream({});
  ASSERT_FALSE(updated.has_value());
  EXPECT_EQ(updated.error().code(), EgressErrCode::ERR_NOT_SUPPORTED);
  EXPECT_EQ(updated.error().description(), "not active");

  profiler.error = FormatRichErr(EgressErrCode::ERR_PROFILER, "no samples");
  auto profile = handler->GetPProf("cpu", 1, 0);
  ASSERT_FALSE(profile.has_value());
  EXPECT_EQ(profile.error().code(), EgressErrCode::ERR_PROFILER);
  EXPECT_EQ(profile.error().description(), "no samples");

  gatherer.error = FormatRichErr(EgressErrCode::ERR_METRICS, "collector");
  auto metrics = handler->GetMetrics();
  ASSERT_FALSE(metrics.has_value());
  EXPECT_EQ(metrics.error().description(), "collector");
}

TEST_F(HandlerTest, PProfForwardsArguments) {
  auto handler = CreateHandler();
  ASSERT_NE(handler, nullptr);

  auto profile = handler->GetPProf("threads", 7, 2);
  ASSERT_TRUE(profile.has_value());
  EXPECT_EQ(profile.value(), "threads:7:2");
}

TEST_F(HandlerTest, SlowDotTimesOutWithoutLeaking) {
  job->slow_dot_calls = 1;
  auto handler = CreateHandler();
  ASSERT_NE(handler, nullptr);

  auto begin = std::chrono::steady_clock::now();
  auto dot = handler->GetPipelineDot();
  auto elapsed = std::chrono::steady_clock::now() - begin;
  ASSERT_FALSE(dot.has_value());
  EXPECT_EQ(dot.error().code(), EgressErrCode::ERR_DEADLINE_EXCEEDED);
  EXPECT_GE(elapsed, std::chrono::milliseconds(1900));
  EXPECT_LT(elapsed, std::chrono::seconds(5));

  job->ReleaseDot();

  dot = handler->GetPipelineDot();
  ASSERT_TRUE(dot.has_value());
  EXPECT_EQ(dot.value(), "digraph fake_2 {}\n");
}

TEST_F(HandlerTest, MetricsAreRenderedFromTheRegistry) {
  egress::MetricRegistry registry;
  ASSERT_TRUE(registry.RegisterCounter("egress_requests_total", "Requests."));
  ASSERT_TRUE(registry.IncCounter("egress_requests_total", {{"op", "stop"}}));
  ASSERT_TRUE(registry.RegisterGauge("egress_active", ""));
  ASSERT_TRUE(registry.SetGauge("egress_active", {}, 1));

  HandlerDeps deps = Deps();
  deps.gatherer = &registry;
  auto handler = Handler::Create(config, std::move(deps));
  ASSERT_TRUE(handler.has_value());

  auto metrics = handler.value()->GetMetrics();
  ASSERT_TRUE(metrics.has_value());
  EXPECT_EQ(metrics.value(),
            "# TYPE egress_active gauge\n"
            "egress_active 1\n"
            "# HELP egress_requests_total Requests.\n"
            "# TYPE egress_requests_total counter\n"
            "egress_requests_total{op=\"stop\"} 1\n");
}

TEST_F(HandlerTest, BrokenMetricFamilyFailsTheWholeRender) {
  for (int i = 0; i < 3; i++) {
    egress::MetricFamily& family = gatherer.families.emplace_back();
    family.set_name(fmt::format("family_{}", i));
    family.set_type(egress::grpc::MetricType::GAUGE);
    auto* metric = family.add_metric();
    // The second family claims to be a gauge but carries a counter.
    if (i == 1)
      metric->mutable_counter()->set_value(1);
    else
      metric->mutable_gauge()->set_value(i);
  }

  auto handler = CreateHandler();
  ASSERT_NE(handler, nullptr);

  auto metrics = handler->GetMetrics();
  ASSERT_FALSE(metrics.has_value());
  EXPECT_EQ(metrics.error().code(), EgressErrCode::ERR_METRICS);
}
