#include "../include/sup_a_launcher.hh"

#include <cassert>
#include <cerrno>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>
#include <chrono>
#include <unistd.h>
#include <fcntl.h>
#include <sys/wait.h>

static std::string temp_root_(const std::string& _tag)
{
  auto root = std::filesystem::temp_directory_path() / ("sup_a_test_" + _tag + "_" + std::to_string(getpid()));
  std::filesystem::remove_all(root);
  std::filesystem::create_directories(root);
  return root.string();
}

static std::string read_file_(const std::string& _path)
{
  std::ifstream file(_path);
  std::stringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

// waits for the watcher to move the record out of running
static sup_r settled_(const sup_d& _store, const std::string& _name, uint64_t _timeout_ms = 5000)
{
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(_timeout_ms);
  sup_r r;
  while (std::chrono::steady_clock::now() < deadline)
  {
    assert(_store.find_(_name, r) == sup_e::OK);
    if (!r.running_()) return r;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return r;
}

int main(int argc, char** argv)
{

std::cout << "\n=== Daemon Launcher Tests ===" << std::endl;
{
  const std::string root = temp_root_("launcher");
  sup_o options(root, "launch_" + std::to_string(getpid()));
  options.watch_poll_ms = 20;
  sup_n launcher(options);

  // Test 1: start
  std::cout << "\n--- Test 1: Start Daemon ---" << std::endl;
  sup_r web;
  {
    assert(launcher.start_("web", "sleep 30", {}, root, web) == sup_e::OK);
    assert(web.pid > 0);
    assert(web.name == "web");
    assert(web.command == "sleep 30");
    assert(web.status == sup_s::RUNNING);
    assert(web.project == options.project);
    assert(web.log_file == options.log_("web"));
    assert(launcher.prober.alive_(web));
    assert(launcher.watching_(web.pid));
    sup_r stored;
    assert(launcher.store.find_("web", stored) == sup_e::OK);
    assert(stored.pid == web.pid && stored.running_());
    std::cout << "✓ Daemon started and recorded (PID " << web.pid << ")" << std::endl;

    std::string log = read_file_(web.log_file);
    assert(log.find("=== sup_a daemon started at ") != std::string::npos);
    assert(log.find("Command: sleep 30\n") != std::string::npos);
    assert(log.find("Workdir: " + root + "\n") != std::string::npos);
    assert(log.find("=========================================\n\n") != std::string::npos);
    std::cout << "✓ Log banner written" << std::endl;

    sup_q sample;
    assert(sup_p::stat_(web.pid, sample) == 0);
    assert(sample.pgrp == web.pid); // own session and group
    std::cout << "✓ Daemon runs in its own process group" << std::endl;
  }

  // Test 2: no double start
  std::cout << "\n--- Test 2: Already Running ---" << std::endl;
  {
    sup_r again;
    assert(launcher.start_("web", "sleep 30", {}, root, again) == sup_e::ALREADY_RUNNING);
    assert(again.pid == web.pid);
    sup_t table;
    assert(launcher.store.load_(table) == sup_e::OK);
    assert(table.size_() == 1);
    assert(launcher.watchers_() == 1);
    std::cout << "✓ Second start of a live name is refused" << std::endl;
  }

  // Test 3: names
  std::cout << "\n--- Test 3: Invalid Names ---" << std::endl;
  {
    sup_r r;
    assert(launcher.start_("", "true", {}, root, r) == sup_e::INVALID_NAME);
    assert(launcher.start_("a/b", "true", {}, root, r) == sup_e::INVALID_NAME);
    assert(launcher.start_("..", "true", {}, root, r) == sup_e::INVALID_NAME);
    assert(sup_n::valid_name_("api-2.worker"));
    std::cout << "✓ Names that cannot be log file names are rejected" << std::endl;
  }

  // Test 4: output capture and clean exit
  std::cout << "\n--- Test 4: Output Capture ---" << std::endl;
  {
    sup_r out;
    assert(launcher.start_("out", "echo hello; echo oops 1>&2", {}, root, out) == sup_e::OK);
    sup_r done = settled_(launcher.store, "out");
    assert(done.status == sup_s::STOPPED);
    std::string log = read_file_(out.log_file);
    assert(log.find("hello\n") != std::string::npos);
    assert(log.find("oops\n") != std::string::npos);
    assert(log.find("=== sup_a daemon exited at ") != std::string::npos);
    assert(log.find("(exit code 0) ===") != std::string::npos);
    std::cout << "✓ stdout and stderr land in the log, exit 0 is stopped" << std::endl;
  }

  // Test 5: crash
  std::cout << "\n--- Test 5: Non-zero Exit ---" << std::endl;
  {
    sup_r bad;
    assert(launcher.start_("bad", "exit 3", {}, root, bad) == sup_e::OK);
    sup_r done = settled_(launcher.store, "bad");
    assert(done.status == sup_s::CRASHED);
    assert(read_file_(bad.log_file).find("(exit code 3) ===") != std::string::npos);
    std::cout << "✓ Non-zero exit is recorded as crashed" << std::endl;

    assert(launcher.start_("bad", "exit 0", {}, root, bad) == sup_e::OK);
    done = settled_(launcher.store, "bad");
    assert(done.status == sup_s::STOPPED);
    std::string log = read_file_(bad.log_file);
    assert(log.find("(exit code 3) ===") < log.rfind("=== sup_a daemon started at "));
    std::cout << "✓ A name can be started again and its log is appended" << std::endl;
  }

  // Test 6: spawn failure
  std::cout << "\n--- Test 6: Spawn Failure ---" << std::endl;
  {
    sup_r r;
    assert(launcher.start_("nowhere", "true", {}, root + "/does/not/exist", r) == sup_e::SPAWN_FAILURE);
    sup_r stored;
    assert(launcher.store.find_("nowhere", stored) == sup_e::NOT_FOUND);
    std::cout << "✓ Failed spawn leaves no record" << std::endl;
  }

  // Test 7: environment
  std::cout << "\n--- Test 7: Environment ---" << std::endl;
  {
    sup_r envy;
    std::vector<std::string> env = {"GREETING=bonjour", std::string(SUP_A_MARKER) + "=spoofed/x"};
    assert(launcher.start_("envy", "echo \"$GREETING\"; echo \"$" SUP_A_MARKER "\"; pwd", env, "/", envy) == sup_e::OK);
    settled_(launcher.store, "envy");
    std::string log = read_file_(envy.log_file);
    assert(log.find("bonjour\n") != std::string::npos);
    assert(log.find(options.project + "/envy\n") != std::string::npos);
    assert(log.find("spoofed") == std::string::npos);
    assert(log.find("\n/\n") != std::string::npos);
    std::cout << "✓ Environment, marker and workdir reach the daemon" << std::endl;
  }

  // Test 8: discovery
  std::cout << "\n--- Test 8: Scan ---" << std::endl;
  {
    std::vector<sup_r> found = sup_p::scan_(options.project);
    bool seen = false;
    for (const auto& r : found)
    {
      if (r.name == "web" && r.pid == web.pid) seen = true;
    }
    assert(seen);
    assert(sup_p::scan_("no_such_project_" + std::to_string(getpid())).empty());
    std::cout << "✓ Daemons are found by their environment marker" << std::endl;
  }

  // Test 9: signal death
  std::cout << "\n--- Test 9: Killed Daemon ---" << std::endl;
  {
    assert(exe_t::signal_(web.pid, SIGTERM) == 0);
    sup_r done = settled_(launcher.store, "web");
    assert(done.status == sup_s::CRASHED);
    assert(read_file_(web.log_file).find("(signal 15) ===") != std::string::npos);
    for (int i = 0; i < 100 && launcher.watching_(web.pid); ++i) std::this_thread::sleep_for(std::chrono::milliseconds(10));
    assert(!launcher.watching_(web.pid));
    assert(exe_t::signal_(web.pid, 0) == 1);
    std::cout << "✓ Unsolicited signal death is recorded as crashed" << std::endl;
  }

  // Test 10: detach
  std::cout << "\n--- Test 10: Daemons Outlive Watchers ---" << std::endl;
  {
    sup_r survivor;
    assert(launcher.start_("survivor", "sleep 30", {}, root, survivor) == sup_e::OK);
    launcher.fina_();
    assert(launcher.watchers_() == 0);
    assert(launcher.prober.alive_(survivor));
    sup_r stored;
    assert(launcher.store.find_("survivor", stored) == sup_e::OK);
    assert(stored.running_());
    std::cout << "✓ Cancelling watchers leaves the daemon and its record alone" << std::endl;

    assert(exe_t::signal_(survivor.pid, SIGKILL) == 0);
    int status;
    assert(waitpid(survivor.pid, &status, 0) == survivor.pid);
    sup_t table;
    assert(launcher.store.load_(table) == sup_e::OK);
    assert(launcher.prober.reconcile_(table));
    assert(table.find_("survivor")->status == sup_s::STOPPED);
    std::cout << "✓ Reconcile catches exits nobody watched" << std::endl;
  }

  // Test 11: the table cannot be written after the spawn
  std::cout << "\n--- Test 11: Unrecorded Daemon ---" << std::endl;
  {
    const std::string blocker = options.table_() + "." + std::to_string(getpid()) + ".tmp";
    std::filesystem::create_directories(blocker); // save_() cannot open its temp file
    sup_r orphan;
    assert(launcher.start_("orphan", "sleep 30", {}, root, orphan) == sup_e::ORPHANED_PROCESS);
    assert(orphan.pid > 0);
    assert(orphan.name == "orphan");
    assert(sup_p::is_alive_(orphan.pid));
    assert(launcher.watching_(orphan.pid));
    std::filesystem::remove_all(blocker);
    sup_r stored;
    assert(launcher.store.find_("orphan", stored) == sup_e::NOT_FOUND);
    std::cout << "✓ Spawned but unrecorded daemon is reported with its pid" << std::endl;

    assert(exe_t::signal_(orphan.pid, SIGKILL) == 0);
    for (int i = 0; i < 200 && launcher.watching_(orphan.pid); ++i) std::this_thread::sleep_for(std::chrono::milliseconds(10));
    assert(!launcher.watching_(orphan.pid));
    int status;
    assert(waitpid(orphan.pid, &status, WNOHANG) == -1 && errno == ECHILD);
    assert(read_file_(orphan.log_file).find("(signal 9) ===") != std::string::npos);
    assert(launcher.store.find_("orphan", stored) == sup_e::NOT_FOUND);
    std::cout << "✓ Its watcher still reaps it" << std::endl;
  }

  // Test 12: a watcher that lost the child to another reaper
  std::cout << "\n--- Test 12: Watcher Identity ---" << std::endl;
  {
    // this process is alive but not our child, so waitpid fails and the watcher checks identity
    sup_q sample;
    assert(sup_p::stat_(getpid(), sample) == 0);
    tim_t started;
    assert(sup_p::started_(sample, started));
    sup_r self(getpid(), "self", "test", started, sup_s::RUNNING, options.log_("self"), options.project);
    sup_w same(self, sup_h(open(options.log_("self").c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644)), launcher.store, 20, 2);
    assert(!same.wait_(300));
    std::cout << "✓ Matching start time keeps the watcher waiting" << std::endl;

    sup_r reused = self;
    reused.start_time = tim_t(started.utcs - 3600, 0);
    sup_w other(reused, sup_h(open(options.log_("self").c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644)), launcher.store, 20, 2);
    assert(other.wait_(2000));
    assert(read_file_(options.log_("self")).find("=== sup_a daemon exited at ") != std::string::npos);
    std::cout << "✓ A recycled pid ends the watch" << std::endl;
  }

  std::filesystem::remove_all(root);
}

std::cout << "\n=== All Daemon Launcher Tests Passed! ===" << std::endl;
return 0;
}
