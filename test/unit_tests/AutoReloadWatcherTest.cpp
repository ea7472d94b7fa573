#include "AutoReloadWatcher.hpp"
#include "TestHeaders.hpp"

using namespace lp;

namespace {
string makeTempDirectory() {
  string pattern = GetTempDirectory() + string("lp_test_watch_XXXXXXXX");
  return string(mkdtemp(&pattern[0]));
}

void writeFile(const string& path, const string& contents) {
  std::ofstream out(path);
  out << contents;
}
}  // namespace

TEST_CASE("Only source files outside skipped directories are watched",
          "[AutoReloadWatcher]") {
  REQUIRE(AutoReloadWatcher::isWatchedFile("page.html"));
  REQUIRE(AutoReloadWatcher::isWatchedFile("style.CSS"));
  REQUIRE(AutoReloadWatcher::isWatchedFile("Makefile"));
  REQUIRE_FALSE(AutoReloadWatcher::isWatchedFile("photo.png"));
  REQUIRE_FALSE(AutoReloadWatcher::isWatchedFile("server.log"));

  REQUIRE(AutoReloadWatcher::isSkippedDirectory("/src/.git"));
  REQUIRE(AutoReloadWatcher::isSkippedDirectory("/src/node_modules"));
  REQUIRE(AutoReloadWatcher::isSkippedDirectory("/src/.cache"));
  REQUIRE_FALSE(AutoReloadWatcher::isSkippedDirectory("/src/templates"));

  string root = makeTempDirectory();
  fs::create_directories(root + "/templates");
  fs::create_directories(root + "/node_modules/pkg");
  writeFile(root + "/templates/index.html", "<p>hi</p>");
  writeFile(root + "/node_modules/pkg/index.js", "");
  writeFile(root + "/image.png", "");

  auto files = AutoReloadWatcher::snapshot({root});
  REQUIRE(files.size() == 1);
  REQUIRE(files.begin()->first == root + "/templates/index.html");

  REQUIRE(AutoReloadWatcher::snapshot({root + "/does-not-exist"}).empty());
  fs::remove_all(root);
}

TEST_CASE("Changes fire once per debounce window", "[AutoReloadWatcher]") {
  string root = makeTempDirectory();
  writeFile(root + "/index.html", "v1");

  int reloads = 0;
  AutoReloadWatcher watcher({root}, [&reloads]() { reloads++; },
                            std::chrono::milliseconds(1000),
                            std::chrono::hours(1));
  REQUIRE_FALSE(watcher.checkForChanges());

  writeFile(root + "/app.js", "");
  REQUIRE(watcher.checkForChanges());
  REQUIRE(reloads == 1);

  // Inside the window the change is absorbed
  writeFile(root + "/other.css", "");
  REQUIRE_FALSE(watcher.checkForChanges());
  REQUIRE_FALSE(watcher.checkForChanges());
  REQUIRE(reloads == 1);
  fs::remove_all(root);
}

TEST_CASE("The poll thread notices new files", "[AutoReloadWatcher]") {
  string root = makeTempDirectory();
  atomic<int> reloads(0);
  AutoReloadWatcher watcher({root}, [&reloads]() { reloads++; },
                            std::chrono::milliseconds(20),
                            std::chrono::milliseconds(0));
  watcher.start();
  REQUIRE(watcher.isRunning());
  writeFile(root + "/index.html", "");

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (reloads == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  watcher.stop();
  REQUIRE_FALSE(watcher.isRunning());
  REQUIRE(reloads >= 1);
  fs::remove_all(root);
}
