#pragma once

#include "config_manager.hpp"
#include "event_thread.hpp"
#include "metrics_emitter.hpp"
#include "rest_server.hpp"
#include <atomic>
#include <condition_variable>
#include <csignal>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace mdstream {
namespace engine {
namespace common {

/**
 * @brief Base application framework providing common infrastructure.
 *
 * ApplicationKernel provides a standardized lifecycle for applications:
 * 1. Initialize: parse CLI, load config, setup logging, start admin REST
 * 2. Start: begin processing (derived class logic)
 * 3. Run: wait for SIGINT/SIGTERM or POST /admin/stop
 * 4. Stop: graceful shutdown
 *
 * Usage:
 * ```cpp
 * class MyApp : public ApplicationKernel {
 *  protected:
 *   void OnStart() override { // Start your services }
 *   void OnStop() override { // Stop your services }
 * };
 * ```
 */
class ApplicationKernel {
 public:
  ApplicationKernel();
  virtual ~ApplicationKernel();

  // Non-copyable, non-movable
  ApplicationKernel(const ApplicationKernel&) = delete;
  ApplicationKernel& operator=(const ApplicationKernel&) = delete;

  /**
   * @brief Main entry point for the application.
   * @return Exit code (0 for success, non-zero for error).
   */
  int Run(int argc, char** argv);

  /** @brief Request a graceful stop from any thread. */
  void RequestStop();

  //=== Task Posting ===
  void Post(std::function<void()> task);
  int PostDelayed(std::function<void()> task, std::chrono::milliseconds delay);
  int SchedulePeriodic(std::function<void()> task, std::chrono::milliseconds interval);
  void CancelPeriodic(int task_id);

  //=== Accessors ===
  ConfigManager& GetConfig() { return config_; }
  const ConfigManager& GetConfig() const { return config_; }

  const std::string& GetAppName() const { return app_name_; }
  void SetAppName(const std::string& name) { app_name_ = name; }

  RestServer& GetRestServer() { return rest_server_; }
  EventThread& GetEventThread() { return event_thread_; }

  /** @brief Process-wide metrics sink, exposed on GET /metrics. */
  CountingMetricsEmitter& GetMetrics() { return metrics_; }

 protected:
  //=== Lifecycle Hooks (Override in Derived Classes) ===
  /** @brief Called after config loaded, before threads start. */
  virtual void OnInitialize() {}

  /** @brief Called when application starts (begin processing). */
  virtual void OnStart() {}

  /** @brief Called when application stops (end processing). */
  virtual void OnStop() {}

  /** @brief Called during final cleanup. */
  virtual void OnShutdown() {}

  /** @brief Environment variables mapped onto config keys before OnInitialize. */
  virtual std::map<std::string, std::string> GetEnvironmentOverrides() const { return {}; }

  /** @brief Value for GET /health ("healthy", "degraded" or "critical"). */
  virtual std::string GetHealthStatus() const { return "healthy"; }

 private:
  std::string app_name_;                   ///< Application name
  ConfigManager config_;                   ///< Configuration manager
  EventThread event_thread_;               ///< Kernel thread for async tasks
  RestServer rest_server_;                 ///< HTTP admin server
  CountingMetricsEmitter metrics_;         ///< Metrics sink

  std::atomic<bool> running_{false};       ///< Running state flag
  std::atomic<bool> shutdown_called_{false};
  std::mutex shutdown_mutex_;              ///< Protects shutdown CV
  std::condition_variable shutdown_cv_;    ///< Signals shutdown event
  std::string loaded_config_file_;         ///< Path to loaded config
  std::string cli_log_level_;              ///< --log_level override
  static ApplicationKernel* instance_;     ///< Singleton for signal handler

  bool Initialize(int argc, char** argv);
  void SetupSignalHandlers();
  static void SignalHandler(int signal);
  void Shutdown();
  void InitializeRestServer();

  std::string ParseCommandLineArguments(int argc, char** argv);
  void LoadConfiguration(const std::string& config_file);
  void InitializeLogging();
  void SetGrpcLogToSpdlog();
  void PrintStartupInfo();
};

}  // namespace common
}  // namespace engine
}  // namespace mdstream
