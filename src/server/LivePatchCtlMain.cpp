#include <cxxopts.hpp>

#include "ControlRouter.hpp"
#include "LogHandler.hpp"
#include "PipeSocketHandler.hpp"

using namespace lp;

int main(int argc, char** argv) {
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();
  defaultConf.setGlobally(el::ConfigurationType::ToStandardOutput, "false");
  defaultConf.setGlobally(el::ConfigurationType::ToFile, "false");

  lp::HandleTerminate();

  cxxopts::Options options("lpctl", "Control a running lpserver");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("reload", "Reload every connected page")    //
        ("stats", "Print session and queue counts")  //
        ("control", "Path of the server's control socket",
         cxxopts::value<std::string>()->default_value(
             DEFAULT_CONTROL_PATH))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "lpctl version " << LP_VERSION << endl;
      exit(0);
    }
    if (result.count("verbose")) {
      defaultConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
      LogHandler::setVerbosity(result["verbose"].as<int>());
    }
    el::Loggers::reconfigureLogger("default", defaultConf);

    if (result.count("reload") == result.count("stats")) {
      CLOG(INFO, "stdout") << "Pass exactly one of --reload or --stats" << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(1);
    }

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    ControlRequest request;
    request.set_type(result.count("reload") ? CONTROL_RELOAD : CONTROL_STATS);
    SocketEndpoint controlEndpoint;
    controlEndpoint.set_name(result["control"].as<string>());

    ControlResponse response;
    try {
      response = ControlRouter::sendRequest(make_shared<PipeSocketHandler>(),
                                            controlEndpoint, request);
    } catch (const std::runtime_error& re) {
      CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
      exit(1);
    }
    if (!response.ok()) {
      CLOG(INFO, "stdout") << "Server refused the request: "
                           << response.error() << endl;
      exit(1);
    }
    if (request.type() == CONTROL_RELOAD) {
      CLOG(INFO, "stdout") << "Reloaded " << response.reloaded_connections()
                           << " connections" << endl;
    } else {
      CLOG(INFO, "stdout") << "sessions: " << response.sessions() << endl
                           << "connections: " << response.connections()
                           << endl
                           << "pending patches: " << response.pending_patches()
                           << endl
                           << "cleanup callbacks: "
                           << response.cleanup_callbacks() << endl;
    }
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }
  return 0;
}
