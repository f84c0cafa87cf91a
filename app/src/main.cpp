#include "app/cli.h"
#include "core/cancel_token.h"
#include "core/export_orchestrator.h"
#include "core/logger.h"
#include "infra/api_client.h"
#include "infra/config.h"
#include "infra/curl_http_client.h"
#include "infra/logger.h"
#include "infra/terminal_display.h"

#include <atomic>
#include <signal.h>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

// Read by the signal handler; only the lock-free flag inside is touched there.
std::atomic<evx::core::CancelToken *> g_cancel_token{nullptr};

extern "C" void on_interrupt(int /*signum*/) {
  if (auto *token = g_cancel_token.load()) {
    token->request_cancel();
  }
}

void install_interrupt_handlers(evx::core::CancelToken *token,
                                const std::shared_ptr<evx::core::ILogger> &logger) {
  g_cancel_token.store(token);

  struct sigaction action {};
  action.sa_handler = on_interrupt;
  sigemptyset(&action.sa_mask);
  // A second Ctrl-C terminates immediately.
  action.sa_flags = SA_RESETHAND;
  for (int signum : {SIGINT, SIGTERM}) {
    if (sigaction(signum, &action, nullptr) != 0 && logger) {
      logger->warn("startup", "app", "signal_handler_failed",
                   "Cannot install handler for signal " + std::to_string(signum));
    }
  }
}

int report_failure(const evx::core::TaskError &error,
                   const std::shared_ptr<evx::core::ILogger> &logger,
                   const std::string &trace_id) {
  if (logger) {
    logger->error(trace_id, "app", evx::core::to_string(error.category),
                  error.internal_message);
  }
  std::cerr << evx::app::format_error(error);
  return evx::app::exit_code_for(error);
}

int run(const evx::app::CliOptions &options) {
  auto logger = evx::infra::create_console_logger(
      options.verbose ? evx::infra::LogLevel::Info : evx::infra::LogLevel::Warn);

  auto config = evx::infra::load_config(evx::infra::process_environment(), logger);
  evx::app::apply_overrides(options, config);

  logger->info(options.target_id, "app", "config_loaded",
               "api_host=" + config.api_host +
                   " api_key=" + evx::core::mask_secret(config.api_key) +
                   " sse_c_key=" +
                   evx::core::mask_secret(config.s3_sse_c_key.value_or("")) +
                   " no_sse_c=" + (config.no_sse_c ? "true" : "false"));

  auto valid = evx::infra::validate_config(config);
  if (valid.is_err()) {
    return report_failure(valid.error(), logger, options.target_id);
  }

  auto cancel_token = evx::core::CancelToken::create();
  install_interrupt_handlers(cancel_token.get(), logger);

  evx::infra::HttpTimeouts timeouts;
  timeouts.connect = config.connect_timeout;
  timeouts.api_read = config.api_read_timeout;
  timeouts.download_read = config.download_read_timeout;

  auto service = std::make_shared<evx::infra::HttpJobService>(
      std::make_shared<evx::infra::CurlHttpClient>(),
      evx::infra::api_base_url(config.api_host), config.api_key, timeouts);
  auto display = evx::infra::TerminalDisplaySink::create_for_stdio();

  evx::core::ExportOrchestrator orchestrator(config, service, display, logger,
                                             cancel_token);

  int exit_code = 0;
  switch (options.command) {
  case evx::app::Command::Export: {
    auto report = orchestrator.run_export(options.target_id);
    if (report.is_err()) {
      exit_code = report_failure(report.error(), logger, options.target_id);
    }
    break;
  }
  case evx::app::Command::Status: {
    auto outcome = orchestrator.run_status(options.target_id);
    if (outcome.is_err()) {
      exit_code = report_failure(outcome.error(), logger, options.target_id);
    }
    break;
  }
  case evx::app::Command::Download: {
    auto report = orchestrator.run_download(options.target_id);
    if (report.is_err()) {
      exit_code = report_failure(report.error(), logger, options.target_id);
    }
    break;
  }
  case evx::app::Command::Help:
  case evx::app::Command::Version:
    break;
  }

  g_cancel_token.store(nullptr);
  return exit_code;
}

} // namespace

int main(int argc, char *argv[]) {
  const std::vector<std::string> args(argv + 1, argv + argc);

  auto parsed = evx::app::parse_command_line(args);
  if (parsed.is_err()) {
    std::cerr << evx::app::format_error(parsed.error())
              << "Run 'event-export --help' for usage.\n";
    return evx::app::exit_code_for(parsed.error());
  }
  const evx::app::CliOptions options = std::move(parsed).value();

  if (options.command == evx::app::Command::Help) {
    std::cout << evx::app::usage_text();
    return 0;
  }
  if (options.command == evx::app::Command::Version) {
    std::cout << evx::app::version_text() << '\n';
    return 0;
  }

  try {
    return run(options);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}
