#include "application_kernel.hpp"

#include <CLI/CLI.hpp>
#include <absl/log/globals.h>
#include <absl/log/log_sink.h>
#include <absl/log/log_sink_registry.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <filesystem>

namespace mdstream {
namespace engine {
namespace common {

ApplicationKernel* ApplicationKernel::instance_ = nullptr;

ApplicationKernel::ApplicationKernel()
    : app_name_("mdstream"), event_thread_("kernel") {
  instance_ = this;
}

ApplicationKernel::~ApplicationKernel() {
  Shutdown();
  if (instance_ == this) {
    instance_ = nullptr;
  }
}

//=== Main Lifecycle ===

bool ApplicationKernel::Initialize(int argc, char** argv) {
  try {
    std::string config_file = ParseCommandLineArguments(argc, argv);
    LoadConfiguration(config_file);

    int applied = config_.ApplyEnvironmentOverrides(GetEnvironmentOverrides());
    if (!cli_log_level_.empty()) {
      config_.SetString("app.log.level", cli_log_level_);
    }

    // Logging must come after config so the level and file are known
    InitializeLogging();
    if (applied > 0) {
      SPDLOG_INFO("ApplicationKernel: applied {} environment overrides", applied);
    }

    PrintStartupInfo();
    SetupSignalHandlers();
    InitializeRestServer();

    try {
      OnInitialize();
    } catch (const std::exception& e) {
      SPDLOG_ERROR("ApplicationKernel: OnInitialize failed: {}", e.what());
      return false;
    }
  } catch (const std::exception& e) {
    SPDLOG_ERROR("ApplicationKernel: initialization failed: {}", e.what());
    return false;
  }

  return true;
}

std::string ApplicationKernel::ParseCommandLineArguments(int argc, char** argv) {
  CLI::App app{app_name_};
  std::string config_file;
  app.add_option("--config_file", config_file, "Path to configuration file")
     ->required()
     ->check(CLI::ExistingFile);
  app.add_option("--log_level", cli_log_level_, "Override app.log.level")
     ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    throw std::runtime_error(std::string("Command-line parsing error: ") + e.what());
  }

  return config_file;
}

void ApplicationKernel::LoadConfiguration(const std::string& config_file) {
  loaded_config_file_ = config_file;
  if (!config_.LoadFromFile(config_file)) {
    throw std::runtime_error("Failed to load configuration from " + config_file);
  }
}

void ApplicationKernel::InitializeLogging() {
  std::string log_file_path = config_.GetString("app.log.file", "logs/" + app_name_ + ".log");
  std::string log_level_str = config_.GetString("app.log.level", "info");

  spdlog::level::level_enum level = spdlog::level::from_str(log_level_str);
  if (level == spdlog::level::off && log_level_str != "off") {
    level = spdlog::level::info;
  }

  std::string path_str = log_file_path;
  try {
    std::filesystem::path p(log_file_path);
    if (!p.is_absolute()) {
      p = std::filesystem::absolute(p);
    }
    path_str = p.string();
    if (p.has_parent_path()) {
      std::filesystem::create_directories(p.parent_path());
    }

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path_str, true);
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    std::vector<spdlog::sink_ptr> sinks{file_sink, console_sink};

    auto logger = std::make_shared<spdlog::logger>(app_name_, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v [%s:%#]");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
    spdlog::flush_every(std::chrono::seconds(1));

    // gRPC/Abseil output goes to the file only
    auto grpc_logger = std::make_shared<spdlog::logger>("grpc", file_sink);
    grpc_logger->set_level(level);
    grpc_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    spdlog::register_logger(grpc_logger);

    SPDLOG_INFO("ApplicationKernel: logging to {} at level {}", path_str, log_level_str);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "[%s] InitLogging failed (path=%s): %s\n",
                 app_name_.c_str(), path_str.c_str(), e.what());
    spdlog::set_default_logger(spdlog::stdout_color_mt(app_name_ + "_console"));
    spdlog::set_level(level);
  }

  SetGrpcLogToSpdlog();
}

void ApplicationKernel::SetGrpcLogToSpdlog() {
  // Redirects gRPC/Abseil logs to the "grpc" spdlog logger
  class SpdlogLogSink : public absl::LogSink {
   public:
    void Send(const absl::LogEntry& entry) override {
      std::shared_ptr<spdlog::logger> logger = spdlog::get("grpc");
      if (!logger) return;
      std::string msg(entry.text_message_with_prefix().data(),
                      entry.text_message_with_prefix().size());
      switch (entry.log_severity()) {
        case absl::LogSeverity::kInfo:
          logger->info("[grpc] {}", msg);
          break;
        case absl::LogSeverity::kWarning:
          logger->warn("[grpc] {}", msg);
          break;
        case absl::LogSeverity::kError:
          logger->error("[grpc] {}", msg);
          break;
        case absl::LogSeverity::kFatal:
          logger->critical("[grpc] {}", msg);
          break;
        default:
          logger->debug("[grpc] {}", msg);
          break;
      }
    }
  };

  static SpdlogLogSink sink;
  static std::once_flag registered;
  std::call_once(registered, [] {
    absl::AddLogSink(&sink);
    absl::SetStderrThreshold(absl::LogSeverityAtLeast::kFatal);
  });
}

void ApplicationKernel::PrintStartupInfo() {
  SPDLOG_INFO("ApplicationKernel: starting application {}", app_name_);
  config_.PrintAllConfig();
}

int ApplicationKernel::Run(int argc, char** argv) {
  if (!Initialize(argc, argv)) {
    return 1;
  }

  event_thread_.Start();

  SPDLOG_INFO("ApplicationKernel: starting application");
  running_ = true;
  try {
    OnStart();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("ApplicationKernel: start failed: {}", e.what());
    Shutdown();
    return 1;
  }

  SPDLOG_INFO("Application {} started", app_name_);

  {
    std::unique_lock<std::mutex> lock(shutdown_mutex_);
    while (running_.load()) {
      // Signal handler cannot lock; poll as well as wait
      shutdown_cv_.wait_for(lock, std::chrono::milliseconds(100));
    }
  }

  SPDLOG_INFO("ApplicationKernel: shutdown requested");

  try {
    OnStop();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("ApplicationKernel: OnStop failed: {}", e.what());
  }

  Shutdown();

  SPDLOG_INFO("Application {} stopped", app_name_);
  spdlog::shutdown();
  return 0;
}

void ApplicationKernel::RequestStop() {
  running_.store(false, std::memory_order_release);
  shutdown_cv_.notify_all();
}

//=== Task Posting ===
void ApplicationKernel::Post(std::function<void()> task) {
  event_thread_.Post(std::move(task));
}

int ApplicationKernel::PostDelayed(std::function<void()> task, std::chrono::milliseconds delay) {
  return event_thread_.PostDelayed(std::move(task), delay);
}

int ApplicationKernel::SchedulePeriodic(std::function<void()> task, std::chrono::milliseconds interval) {
  return event_thread_.SchedulePeriodic(std::move(task), interval);
}

void ApplicationKernel::CancelPeriodic(int task_id) {
  event_thread_.CancelPeriodic(task_id);
}

void ApplicationKernel::SetupSignalHandlers() {
  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);
}

void ApplicationKernel::SignalHandler(int signal) {
  if (instance_ && (signal == SIGINT || signal == SIGTERM)) {
    instance_->running_.store(false, std::memory_order_release);
  }
}

void ApplicationKernel::InitializeRestServer() {
  rest_server_.SetAppName(app_name_);

  rest_server_.SetStatusCallback([this]() {
    nlohmann::json status;
    status["app_name"] = app_name_;
    status["uptime_seconds"] = rest_server_.GetUptime().count();
    status["state"] = running_.load() ? "running" : "stopped";
    status["health"] = GetHealthStatus();
    status["config_file"] = loaded_config_file_;
    return status;
  });

  rest_server_.SetMetricsCallback([this]() {
    return metrics_.Snapshot();
  });

  rest_server_.SetHealthCallback([this]() {
    return GetHealthStatus();
  });

  rest_server_.SetStopCallback([this]() {
    RequestStop();
  });

  // app.rest_port 0 disables the admin server
  int rest_port = config_.GetInt("app.rest_port", 0);
  std::string rest_address = config_.GetString("app.rest_address", "0.0.0.0");

  if (rest_port > 0) {
    if (rest_server_.Start(rest_address, static_cast<uint16_t>(rest_port))) {
      SPDLOG_INFO("ApplicationKernel: REST server started on {}:{}", rest_address, rest_port);
    } else {
      SPDLOG_WARN("ApplicationKernel: failed to start REST server on {}:{}", rest_address, rest_port);
    }
  } else {
    SPDLOG_INFO("ApplicationKernel: REST server disabled (app.rest_port=0)");
  }
}

void ApplicationKernel::Shutdown() {
  if (shutdown_called_.exchange(true)) {
    return;
  }

  running_ = false;
  shutdown_cv_.notify_all();

  SPDLOG_INFO("ApplicationKernel: shutting down {}", app_name_);

  rest_server_.Stop();

  SPDLOG_DEBUG("ApplicationKernel: stopping kernel thread");
  event_thread_.Stop();

  try {
    OnShutdown();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("ApplicationKernel: OnShutdown failed: {}", e.what());
  }
}

}  // namespace common
}  // namespace engine
}  // namespace mdstream
