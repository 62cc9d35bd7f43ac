#include "app/scanner_app.hpp"
#include "utils/args.hpp"
#include "utils/config.hpp"
#include "utils/debug.hpp"
#include "utils/signals.hpp"
#include "utils/logging.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

using namespace std;

// version string for the application
const string version = "0.3.0";

int main(int argc, char **argv)
{
  // Check for help or version flags first
  if (hasFlag(argc, argv, "--version"))
    debug::printVersionAndExit(version);
  if (hasFlag(argc, argv, "--help"))
    debug::printHelpAndExit();

  // Defaults, then the config file, then command line overrides
  ScannerConfig cfg;
  string config_path = getArg(argc, argv, "--config", "");
  if (!config_path.empty() && !config::loadFile(config_path, cfg))
    log_warning("Continuing without " + config_path);
  config::applyArgs(argc, argv, cfg);

  // set log level based on debug mode
  if (cfg.debug)
  {
    logging::setLogLevel(logging::LogLevel::DEBUG); // Show everything
    logging::setFileLogging(true, cfg.log_file.empty() ? debug::ensureDebugDir() + "/stashscan.log" : cfg.log_file);
    log_info("Debug mode enabled - showing all log messages");
  }
  else if (cfg.quiet)
  {
    logging::setLogLevel(logging::LogLevel::ERROR); // Only errors
  }
  if (!cfg.debug && !cfg.log_file.empty())
    logging::setFileLogging(true, cfg.log_file);

  if (!config::validate(cfg))
  {
    log_error("Refusing to start with an invalid configuration");
    return 2;
  }

  // Print startup and configuration information
  debug::printStartup("StashScan", version);
  debug::printConfig(cfg);
  log_debug("Effective configuration: " + config::toJson(cfg));

  ScannerApp app(cfg);
  if (!app.initialize())
  {
    log_error("Failed to initialize scanner");
    return 1;
  }

  // The handler only records the signal, the foreground loop acts on it
  signals::setupSignalHandlers();

  if (cfg.autostart)
    app.controlQueue()->push(ControlSignal::StartScanning);
  else
    log_info("Scanner idle, POST /scan/start on the control port to begin");

  int code = app.run();
  if (!app.shutdownWasClean())
  {
    // A scan cycle is still running on its own thread; skip static destructors
    log_warning("Exiting without cleanup, a scan cycle did not finish");
    cout.flush();
    cerr.flush();
    _Exit(code);
  }
  return code;
}
