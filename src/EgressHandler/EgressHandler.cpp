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

#include "HandlerPublicDefs.h"
// Precompiled header comes first.

#include <yaml-cpp/yaml.h>

#include <cxxopts.hpp>

#include "Handler.h"
#include "IOInfoClient.h"
#include "ProcessJob.h"
#include "egress/MessageBus.h"
#include "egress/MetricRegistry.h"
#include "egress/OS.h"
#include "egress/Profiler.h"
#include "egress/String.h"

using Egress::Supervisor::Config;

Config ParseConfig(int argc, char** argv) {
  cxxopts::Options options("egress-handler");

  // clang-format off
  options.add_options()
      ("c,config-file", "Path to configuration file",
       cxxopts::value<std::string>()->default_value(kDefaultConfigPath))
      ("e,egress-id", "Id of the egress supervised by this handler",
       cxxopts::value<std::string>())
      ("L,log-file", "Path to the handler log file",
       cxxopts::value<std::string>())
      ("D,debug-level", "Logging level, format: <trace|debug|info|warn|error>",
       cxxopts::value<std::string>())
      ("v,version", "Display version information")
      ("h,help", "Display help for egress-handler")
      ;
  // clang-format on

  cxxopts::ParseResult parsed_args;
  try {
    parsed_args = options.parse(argc, argv);
  } catch (cxxopts::OptionException& e) {
    fmt::print(stderr, "{}\n{}", e.what(), options.help());
    std::exit(1);
  }

  if (parsed_args.count("help") > 0) {
    fmt::print("{}\n", options.help());
    std::exit(0);
  }

  if (parsed_args.count("version") > 0) {
    fmt::print("Version: {}\n", EGRESS_VERSION_STRING);
    std::exit(0);
  }

  Config config;
  std::string config_path = parsed_args["config-file"].as<std::string>();
  if (!std::filesystem::exists(config_path)) {
    fmt::print(stderr, "Config file {} not found.\n", config_path);
    std::exit(1);
  }

  try {
    using util::YamlValueOr;
    YAML::Node yaml = YAML::LoadFile(config_path);

    config.EgressId = YamlValueOr(yaml["EgressId"], "");
    if (parsed_args.count("egress-id"))
      config.EgressId = parsed_args["egress-id"].as<std::string>();

    config.RoomName = YamlValueOr(yaml["RoomName"], "");
    config.TmpDir = YamlValueOr(yaml["TmpDir"], kDefaultTmpDir);

    config.BusListenAddr = YamlValueOr(yaml["BusListen"], kDefaultHost);
    config.BusListenPort = YamlValueOr(yaml["BusListenPort"], kBusDefaultPort);
    config.IOInfoAddr = YamlValueOr(yaml["IOInfoAddress"], "127.0.0.1");
    config.IOInfoPort = YamlValueOr(yaml["IOInfoPort"], kIOInfoDefaultPort);

    config.DebugLevel = YamlValueOr(yaml["DebugLevel"], "info");
    if (parsed_args.count("debug-level"))
      config.DebugLevel = parsed_args["debug-level"].as<std::string>();

    config.LogFile = YamlValueOr(yaml["LogFile"], kDefaultHandlerLogPath);
    if (parsed_args.count("log-file"))
      config.LogFile = parsed_args["log-file"].as<std::string>();

    if (yaml["MaxLogFileSize"]) {
      auto size =
          util::ParseMemory(yaml["MaxLogFileSize"].as<std::string>());
      if (!size) {
        fmt::print(stderr, "Illegal MaxLogFileSize: {}\n",
                   size.error().description());
        std::exit(1);
      }
      config.MaxLogFileSize = size.value();
    }
    config.MaxLogFileNum = YamlValueOr<uint64_t>(
        yaml["MaxLogFileNum"], kDefaultHandlerMaxLogFileNum);

    config.StopWarnIntervalSec = YamlValueOr<uint64_t>(
        yaml["StopWarnInterval"], kDefaultStopWarnIntervalSec);

    if (const YAML::Node& pipeline = yaml["Pipeline"]) {
      config.Pipeline.Executable = YamlValueOr(pipeline["Executable"], "");
      if (pipeline["Args"])
        config.Pipeline.Args =
            pipeline["Args"].as<std::vector<std::string>>();
      if (pipeline["StreamUrls"])
        config.Pipeline.StreamUrls =
            pipeline["StreamUrls"].as<std::vector<std::string>>();
    }
  } catch (YAML::BadFile& e) {
    fmt::print(stderr, "Can't open config file {}: {}\n", config_path,
               e.what());
    std::exit(1);
  } catch (YAML::Exception& e) {
    fmt::print(stderr, "Invalid config file {}: {}\n", config_path, e.what());
    std::exit(1);
  }

  if (config.EgressId.empty()) {
    fmt::print(stderr, "EgressId is required.\n");
    std::exit(1);
  }

  // spdlog should be initialized as soon as possible
  std::optional log_level = StrToLogLevel(config.DebugLevel);
  if (!log_level.has_value()) {
    fmt::print(stderr, "Illegal debug-level format: {}.\n", config.DebugLevel);
    std::exit(1);
  }

  if (!util::os::CreateFoldersForFile(config.LogFile.string())) {
    fmt::print(stderr, "Failed to create the directory of log file {}.\n",
               config.LogFile.string());
    std::exit(1);
  }

  InitLogger(log_level.value(), config.LogFile, config.EgressId, true,
             config.MaxLogFileSize, config.MaxLogFileNum);

  return config;
}

void InstallStackTraceHooks() {
  static backward::SignalHandling sh;
  if (!sh.loaded()) {
    EGRESS_ERROR("Failed to install stacktrace hooks.");
    std::exit(1);
  }
}

int StartHandler(const Config& config) {
  using namespace Egress::Supervisor;

  egress::MetricRegistry registry;
  egress::LocalMessageBus bus;

  egress::BusServer bus_server(&bus, config.BusListenAddr,
                               config.BusListenPort);
  if (!bus_server.Started()) return 1;

  IOInfoClient io_info_client;
  io_info_client.InitChannelAndStub(config.IOInfoAddr, config.IOInfoPort);

  egress::ProcfsProfiler profiler;

  HandlerDeps deps{
      .bus = &bus,
      .status_reporter = &io_info_client,
      .profiler = &profiler,
      .gatherer = &registry,
      .job_factory =
          [&registry](const Config& job_config)
          -> EgressExpected<std::unique_ptr<IJobHandle>> {
        auto job = ProcessJob::Create(job_config, &registry);
        if (!job) return std::unexpected(job.error());
        return std::unique_ptr<IJobHandle>(std::move(job.value()));
      },
  };

  auto handler = Handler::Create(config, std::move(deps));
  if (!handler) {
    EGRESS_ERROR("[Egress #{}] Failed to create the handler: {} ({})",
                 config.EgressId, handler.error().description(),
                 IsFatal(handler.error()) ? "fatal" : "reported");
    bus_server.Shutdown();
    bus_server.Wait();
    return 1;
  }

  Handler* h = handler.value().get();

  // SIGINT and SIGTERM trigger the kill switch.
  std::shared_ptr<uvw::loop> loop = uvw::loop::create();

  auto sigint_handle = loop->resource<uvw::signal_handle>();
  sigint_handle->on<uvw::signal_event>(
      [h](const uvw::signal_event&, uvw::signal_handle&) { h->Kill(); });
  if (int rc = sigint_handle->start(SIGINT); rc != 0)
    EGRESS_ERROR("Failed to start the SIGINT handle: {}", uv_err_name(rc));

  auto sigterm_handle = loop->resource<uvw::signal_handle>();
  sigterm_handle->on<uvw::signal_event>(
      [h](const uvw::signal_event&, uvw::signal_handle&) { h->Kill(); });
  if (int rc = sigterm_handle->start(SIGTERM); rc != 0)
    EGRESS_ERROR("Failed to start the SIGTERM handle: {}", uv_err_name(rc));

  auto stop_loop_handle = loop->resource<uvw::async_handle>();
  stop_loop_handle->on<uvw::async_event>(
      [](const uvw::async_event&, uvw::async_handle& handle) {
        handle.parent().walk([](auto&& hd) { hd.close(); });
        handle.parent().stop();
      });

  std::thread loop_thread([loop] {
    util::SetCurrentThreadName("SignalLoopThr");
    loop->run();
  });

  auto result = h->Run();
  if (!result)
    EGRESS_ERROR("[Egress #{}] {}", config.EgressId,
                 result.error().description());

  stop_loop_handle->send();
  loop_thread.join();

  handler.value().reset();

  bus_server.Shutdown();
  bus_server.Wait();

  EGRESS_INFO("[Egress #{}] Handler exiting.", config.EgressId);
  return result ? 0 : 1;
}

int main(int argc, char** argv) {
  // If config parsing fails, this function will not return and will call
  // std::exit(1) instead.
  Config config = ParseConfig(argc, argv);
  InstallStackTraceHooks();

  int rc = StartHandler(config);

  spdlog::shutdown();
  return rc;
}
