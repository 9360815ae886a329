#include "monitor/table_monitor.hpp"
#include "config/app_config.hpp"
#include "errors/error_store.hpp"
#include "utils/args.hpp"
#include "utils/debug.hpp"
#include "utils/signals.hpp"
#include "utils/logging.hpp"
#include <iostream>
#include <string>

using namespace std;

// version string for the application
const string version = "0.1.0";

int main(int argc, char **argv)
{
  // Check for help or version flags first
  if (hasFlag(argc, argv, "--version"))
    debug::printVersionAndExit(version);
  if (hasFlag(argc, argv, "--help"))
    debug::printHelpAndExit();

  bool debug_mode = hasFlag(argc, argv, "--debug") || hasFlag(argc, argv, "-d");
  bool quite_mode = hasFlag(argc, argv, "--quiet") || hasFlag(argc, argv, "-q");

  // set log level based on debug mode
  if (debug_mode)
  {
    logging::setLogLevel(logging::LogLevel::DEBUG); // Show everything
    logging::setShowTimestamp(true);
    log_info("Debug mode enabled - showing all log messages");
  }
  else if (quite_mode)
  {
    logging::setLogLevel(logging::LogLevel::ERROR); // Only errors
  }

  string config_path = getArg(argc, argv, "--config", "config/settings.json");

  AppConfig config;
  try
  {
    config = config::load(config_path);

    // Command line overrides
    config.capture.source = getArg(argc, argv, "--source", config.capture.source);
    config.capture.fps = getArg(argc, argv, "--fps", config.capture.fps);
    config.vision.model_path = getArg(argc, argv, "--model", config.vision.model_path);
    config.dashboard.port = getArg(argc, argv, "--port", config.dashboard.port);
    config.validate();
  }
  catch (const exception &e)
  {
    ErrorStore errors(config.database.error_db_path);
    if (errors.initialize())
    {
      errors.logError(ErrorSeverity::CRITICAL, ErrorCategory::CONFIGURATION, "main", "loadConfig",
                      "Invalid configuration: " + string(e.what()), &e, {{"config_path", config_path}});
    }
    log_error("Invalid configuration in " + config_path + ": " + e.what());
    return 2;
  }

  if (hasFlag(argc, argv, "--write-config"))
  {
    try
    {
      config::save(config, config_path);
    }
    catch (const exception &e)
    {
      log_error("Could not write " + config_path + ": " + e.what());
      return 1;
    }
    log_info("Settings written to " + config_path);
    return 0;
  }

  if (debug_mode)
    logging::setFileLogging(true, config.log_dir + "/pokervision.log");

  // Print startup and configuration information
  debug::printStartup("pokervision", version);
  debug::printConfig(config);

  ErrorStore errors(config.database.error_db_path);
  if (!errors.initialize())
  {
    log_warning("Error log unavailable, errors go to the console only");
  }

  TableMonitor monitor(config, errors, MonitorComponents::fromConfig(config));

  signals::setupSignalHandlers();

  if (!monitor.start())
  {
    log_error("Table monitor failed to start");
    return 1;
  }

  string export_dir = getArg(argc, argv, "--export", "");

  // Block until SIGINT/SIGTERM, then shut the pipeline down
  signals::waitForShutdown([&monitor, &export_dir]()
                           {
    if (!export_dir.empty())
    {
      string path = monitor.exportSession(export_dir);
      if (!path.empty())
        log_info("Session exported to " + path);
    }
    monitor.stop(); });

  return 0;
}
