#include "AutoReloadWatcher.hpp"

namespace lp {
namespace {
const set<string> WATCHED_EXTENSIONS = {".html", ".htm", ".js",  ".ts",
                                        ".css",  ".json", ".ini"};
const set<string> SKIPPED_DIRECTORIES = {".git", "node_modules", "build"};
}  // namespace

AutoReloadWatcher::AutoReloadWatcher(const vector<string>& _roots,
                                     std::function<void()> _onChange,
                                     std::chrono::milliseconds _pollPeriod,
                                     std::chrono::milliseconds _debounce)
    : roots(_roots),
      onChange(std::move(_onChange)),
      pollPeriod(_pollPeriod),
      debounce(_debounce),
      running(false),
      signalledOnce(false) {
  previous = snapshot(roots);
}

AutoReloadWatcher::~AutoReloadWatcher() { stop(); }

void AutoReloadWatcher::start() {
  lock_guard<std::mutex> guard(watcherMutex);
  if (running) {
    return;
  }
  running = true;
  previous = snapshot(roots);
  pollThread = make_shared<thread>(&AutoReloadWatcher::pollLoop, this);
  LOG(INFO) << "Auto reload watching " << roots.size() << " directories ("
            << previous.size() << " files)";
}

void AutoReloadWatcher::stop() {
  shared_ptr<thread> toJoin;
  {
    lock_guard<std::mutex> guard(watcherMutex);
    if (!running) {
      return;
    }
    running = false;
    toJoin = pollThread;
    pollThread.reset();
  }
  wakeup.notify_all();
  if (toJoin && toJoin->joinable()) {
    toJoin->join();
  }
}

bool AutoReloadWatcher::isRunning() {
  lock_guard<std::mutex> guard(watcherMutex);
  return running;
}

void AutoReloadWatcher::pollLoop() {
  el::Helpers::setThreadName("autoreload");
  while (true) {
    {
      std::unique_lock<std::mutex> lock(watcherMutex);
      if (wakeup.wait_for(lock, pollPeriod, [this] { return !running; })) {
        break;
      }
    }
    checkForChanges();
  }
}

bool AutoReloadWatcher::checkForChanges() {
  auto current = snapshot(roots);
  {
    lock_guard<std::mutex> guard(watcherMutex);
    if (current == previous) {
      return false;
    }
    previous = current;
    auto now = std::chrono::steady_clock::now();
    if (signalledOnce && now - lastSignal < debounce) {
      VLOG(1) << "Change detected inside the debounce window, skipping reload";
      return false;
    }
    signalledOnce = true;
    lastSignal = now;
  }
  LOG(INFO) << "Source files changed, reloading connected clients";
  try {
    onChange();
  } catch (const std::exception& e) {
    LOG(WARNING) << "Reload callback threw: " << e.what();
  }
  return true;
}

bool AutoReloadWatcher::isWatchedFile(const fs::path& path) {
  string extension = toLower(path.extension().string());
  return extension.empty() ||
         WATCHED_EXTENSIONS.find(extension) != WATCHED_EXTENSIONS.end();
}

bool AutoReloadWatcher::isSkippedDirectory(const fs::path& path) {
  string name = path.filename().string();
  if (name.empty()) {
    return false;
  }
  return name[0] == '.' ||
         SKIPPED_DIRECTORIES.find(name) != SKIPPED_DIRECTORIES.end();
}

map<string, int64_t> AutoReloadWatcher::snapshot(const vector<string>& roots) {
  map<string, int64_t> files;
  for (const auto& root : roots) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
      continue;
    }
    fs::recursive_directory_iterator it(
        root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
      VLOG(1) << "Cannot watch " << root << ": " << ec.message();
      continue;
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
      if (ec) {
        VLOG(1) << "Error walking " << root << ": " << ec.message();
        break;
      }
      const auto& entry = *it;
      if (entry.is_directory(ec)) {
        if (isSkippedDirectory(entry.path())) {
          it.disable_recursion_pending();
        }
        continue;
      }
      if (!entry.is_regular_file(ec) || !isWatchedFile(entry.path())) {
        continue;
      }
      auto mtime = fs::last_write_time(entry.path(), ec);
      if (ec) {
        continue;
      }
      files[entry.path().string()] = int64_t(mtime.time_since_epoch().count());
    }
  }
  return files;
}
}  // namespace lp
