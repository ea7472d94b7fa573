#include <cxxopts.hpp>

#include "AutoReloadWatcher.hpp"
#include "ClientScript.hpp"
#include "LivePatchServer.hpp"
#include "LogHandler.hpp"
#include "SimpleIni.h"
#include "TcpSocketHandler.hpp"

using namespace lp;

namespace {
string currentTime() {
  time_t now = time(NULL);
  char buffer[64];
  strftime(buffer, sizeof(buffer), "%H:%M:%S", localtime(&now));
  return string(buffer);
}

/**
 * Built-in demo pages: a clock that ticks over the patch channel and a button
 * that appends to a log.
 */
void registerDemoRoutes(LivePatchServer* server) {
  server->registerPage("/", [](RequestContext& context) {
    auto dispatcher = context.getDispatcher();
    string sessionId = context.getSessionId();
    auto self = make_shared<weak_ptr<Interval>>();
    *self = context.every(std::chrono::milliseconds(1000), [dispatcher,
                                                            sessionId, self]() {
      dispatcher->queuePatch(sessionId,
                             Patch("clock", SwapMode::INLINE, currentTime()),
                             [self]() {
                               auto interval = self->lock();
                               if (interval) {
                                 interval->stop();
                               }
                             });
    });
    return string("<!DOCTYPE html><html><head><meta charset=\"UTF-8\">"
                  "<title>LivePatch</title>") +
           ClientScript::tag() +
           "</head><body><h1>LivePatch</h1>"
           "<p>Server time: <span id=\"clock\">" +
           currentTime() +
           "</span></p>"
           "<button onclick=\"fetch('/ping',{method:'POST'})\">Ping</button>"
           "<ul id=\"log\"></ul></body></html>";
  });
  server->registerAction("/ping", [](RequestContext& context) {
    context.patch("log", SwapMode::APPEND,
                  "<li>ping at " + currentTime() + "</li>");
    return string("");
  });
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  lp::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, lp::InterruptSignalHandler);
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("lpserver",
                           "Real-time patch delivery for server-rendered pages");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("port", "Port to listen on",
         cxxopts::value<int>()->default_value("0"))  //
        ("bindip", "IP to listen on",
         cxxopts::value<string>()->default_value(""))  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("autoreload", "Reload open pages when watched files change")  //
        ("watch", "Directory to watch for --autoreload",
         cxxopts::value<std::string>()->default_value("."))  //
        ("control", "Path of the control socket",
         cxxopts::value<std::string>()->default_value(
             DEFAULT_CONTROL_PATH))  //
        ("logtostdout", "log to stdout")  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "lpserver version " << LP_VERSION << endl;
      exit(0);
    }

    // default max log file size is 20MB for lpserver
    string maxlogsize = "20971520";

    int port = 0;
    string bindIp = "";
    bool autoReload = false;
    string watchDir = result["watch"].as<string>();
    string controlPath = result["control"].as<string>();
    if (result.count("verbose")) {
      LogHandler::setVerbosity(result["verbose"].as<int>());
    }
    if (result.count("cfgfile")) {
      // Load the config file
      CSimpleIniA ini(true, false, false);
      string cfgfilename = result["cfgfile"].as<string>();
      SI_Error rc = ini.LoadFile(cfgfilename.c_str());
      if (rc == 0) {
        const char* portString = ini.GetValue("Networking", "port", NULL);
        if (portString) {
          port = atoi(portString);
        }
        const char* bindIpPtr = ini.GetValue("Networking", "bind_ip", NULL);
        if (bindIpPtr) {
          bindIp = string(bindIpPtr);
        }

        autoReload = ini.GetBoolValue("LivePatch", "autoreload", false);
        if (!result.count("watch")) {
          watchDir = ini.GetValue("LivePatch", "watch_dir", watchDir.c_str());
        }
        if (!result.count("control")) {
          controlPath =
              ini.GetValue("LivePatch", "control_path", controlPath.c_str());
        }

        // read verbose level (prioritize command line option over cfgfile)
        const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
        if (!result.count("verbose") && vlevel) {
          LogHandler::setVerbosity(atoi(vlevel));
        }
        // read silent setting
        const char* silent = ini.GetValue("Debug", "silent", NULL);
        if (silent && atoi(silent) != 0) {
          defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
        }
        // read log file size limit
        const char* logsize = ini.GetValue("Debug", "logsize", NULL);
        if (logsize && atoi(logsize) != 0) {
          // make sure maxlogsize is a string of int value
          maxlogsize = string(logsize);
        }
      } else {
        STFATAL << "Invalid config file: " << cfgfilename;
      }
    }

    if (result.count("port")) {
      port = result["port"].as<int>();
    }
    if (result.count("bindip")) {
      bindIp = result["bindip"].as<string>();
    }
    if (result.count("autoreload")) {
      autoReload = true;
    }

    GOOGLE_PROTOBUF_VERIFY_VERSION;
    if (sodium_init() == -1) {
      STFATAL << "libsodium failed to initialize";
    }

    if (port == 0) {
      port = 8080;
    }

    LogHandler::setupLogFiles(&defaultConf, GetTempDirectory() + "lpserver",
                              "lpserver", result.count("logtostdout") > 0,
                              !result.count("logtostdout"), maxlogsize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("lpserver-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    auto tcpSocketHandler = make_shared<TcpSocketHandler>();
    auto pipeSocketHandler = make_shared<PipeSocketHandler>();
    auto dispatcher = make_shared<PatchDispatcher>();

    SocketEndpoint serverEndpoint;
    serverEndpoint.set_port(port);
    if (bindIp.length()) {
      serverEndpoint.set_name(bindIp);
    }
    SocketEndpoint controlEndpoint;
    controlEndpoint.set_name(controlPath);

    shared_ptr<LivePatchServer> server;
    try {
      server = make_shared<LivePatchServer>(tcpSocketHandler, serverEndpoint,
                                            dispatcher);
      server->enableControlChannel(pipeSocketHandler, controlEndpoint);
    } catch (const std::runtime_error& re) {
      CLOG(INFO, "stdout") << "Could not start lpserver: " << re.what()
                           << endl;
      exit(1);
    }
    registerDemoRoutes(server.get());

    shared_ptr<AutoReloadWatcher> watcher;
    if (autoReload) {
      watcher = make_shared<AutoReloadWatcher>(
          vector<string>({watchDir}),
          [dispatcher]() { dispatcher->broadcastReload(); });
      watcher->start();
    }

    CLOG(INFO, "stdout") << "lpserver listening on port " << port << endl;
    server->run();

    if (watcher) {
      watcher->stop();
    }
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
