#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "PatchClient.hpp"
#include "TcpSocketHandler.hpp"

using namespace lp;

namespace {
/**
 * Prints every change it receives. With no ids given, any target is
 * accepted and created on first use.
 */
class PrintingDocument : public MemoryDocument {
 public:
  explicit PrintingDocument(bool _acceptAny) : acceptAny(_acceptAny) {}

  virtual bool hasElement(const string& id) {
    return acceptAny || MemoryDocument::hasElement(id);
  }
  virtual void setInner(const string& id, const string& html) {
    CLOG(INFO, "stdout") << "#" << id << " inline: " << html << endl;
    MemoryDocument::setInner(id, html);
  }
  virtual void replaceOuter(const string& id, const string& html) {
    CLOG(INFO, "stdout") << "#" << id << " outline: " << html << endl;
    MemoryDocument::replaceOuter(id, html);
  }
  virtual void insertAtEnd(const string& id, const string& html) {
    CLOG(INFO, "stdout") << "#" << id << " append: " << html << endl;
    MemoryDocument::insertAtEnd(id, html);
  }
  virtual void insertAtStart(const string& id, const string& html) {
    CLOG(INFO, "stdout") << "#" << id << " prepend: " << html << endl;
    MemoryDocument::insertAtStart(id, html);
  }
  virtual void reload() {
    CLOG(INFO, "stdout") << "reload" << endl;
    MemoryDocument::reload();
  }

 protected:
  bool acceptAny;
};

atomic<bool> halt(false);
}  // namespace

int main(int argc, char** argv) {
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();
  defaultConf.setGlobally(el::ConfigurationType::ToStandardOutput, "false");
  defaultConf.setGlobally(el::ConfigurationType::ToFile, "false");

  lp::HandleTerminate();
  ::signal(SIGINT, lp::InterruptSignalHandler);
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("lpwatch",
                           "Follow a page session and print its patches");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("host", "Server host",
         cxxopts::value<std::string>()->default_value("localhost"))  //
        ("port", "Server port",
         cxxopts::value<int>()->default_value("8080"))  //
        ("session", "Session id to follow (default: let the server issue one)",
         cxxopts::value<std::string>()->default_value(""))  //
        ("ids",
         "Comma-separated element ids the page has. Patches to other ids are "
         "reported as missing targets",
         cxxopts::value<std::string>()->default_value(""))  //
        ("duration", "Seconds to run for, 0 to run until interrupted",
         cxxopts::value<int>()->default_value("0"))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "lpwatch version " << LP_VERSION << endl;
      exit(0);
    }
    if (result.count("verbose")) {
      defaultConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
      LogHandler::setVerbosity(result["verbose"].as<int>());
    }
    el::Loggers::reconfigureLogger("default", defaultConf);

    GOOGLE_PROTOBUF_VERIFY_VERSION;
    if (sodium_init() == -1) {
      STFATAL << "libsodium failed to initialize";
    }

    string ids = result["ids"].as<string>();
    auto document = make_shared<PrintingDocument>(ids.empty());
    for (const auto& id : split(ids, ',')) {
      if (!trim(id).empty()) {
        document->addElement(trim(id), "");
      }
    }

    SocketEndpoint serverEndpoint;
    serverEndpoint.set_name(result["host"].as<string>());
    serverEndpoint.set_port(result["port"].as<int>());
    PatchClient client(make_shared<TcpSocketHandler>(), serverEndpoint,
                       document, result["session"].as<string>());

    int duration = result["duration"].as<int>();
    shared_ptr<thread> timer;
    if (duration > 0) {
      timer.reset(new thread([duration]() {
        std::this_thread::sleep_for(std::chrono::seconds(duration));
        halt = true;
      }));
    }
    client.run(halt);
    if (timer) {
      timer->join();
    }
    CLOG(INFO, "stdout") << "session " << client.getSessionId() << endl;
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }
  return 0;
}
