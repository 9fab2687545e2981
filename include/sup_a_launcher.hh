#pragma once

#include "sup_a_types.hh"
#include "sup_a_config.hh"
#include "sup_a_record.hh"
#include "sup_a_store.hh"
#include "sup_a_probe.hh"
#include "sup_a_process_exec.hh"

#include <cstdio>
#include <cstring>
#include <unistd.h>
#include <fcntl.h>
#include <string>
#include <vector>
#include <memory>
#include <unordered_map>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <stop_token>
#include <chrono>
#include <filesystem>

extern char **environ;

/* --------------------------------------------- */

// One per live daemon: reaps the child, appends the exit trailer, closes the
// log handle and moves the record (same name and pid) to a terminal status.
// Cancellation leaves the child running and the record untouched.
class sup_w // watcher
{
public:
  const pid_t pid;
  const std::string name;
  std::atomic<bool> done{false};
  exe_r result;
private:
  sup_r record;
  sup_p prober;
  sup_h log;
  sup_d store;
  uint64_t poll_ms;
  std::mutex wait_m;
  std::condition_variable_any wait_c;
  std::jthread thread; // last: joined before the members above go away
public:
  sup_w(const sup_r& _record, sup_h&& _log, const sup_d& _store, uint64_t _poll_ms, int64_t _tolerance_s)
    : pid(_record.pid), name(_record.name), record(_record), prober(_tolerance_s)
    , log(std::move(_log)), store(_store), poll_ms(MAX2_(_poll_ms, 1))
  {
    thread = std::jthread([this](std::stop_token _stop_tok) { watch_(_stop_tok); });
  }
  sup_w(const sup_w&) = delete;
  sup_w& operator=(const sup_w&) = delete;
  sup_w(sup_w&&) = delete;
  sup_w& operator=(sup_w&&) = delete;
  ~sup_w() { cancel_(); }
  inline void cancel_()
  {
    if (!thread.joinable()) return;
    thread.request_stop();
    thread.join();
  }
  inline bool wait_(uint64_t _timeout_ms) const // true = finished
  {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(_timeout_ms);
    while (!done.load(std::memory_order_acquire))
    {
      if (std::chrono::steady_clock::now() >= deadline) return false;
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
  }
private:
  inline bool nap_(const std::stop_token& _stop_tok) // false = cancelled
  {
    std::unique_lock lock(wait_m);
    wait_c.wait_for(lock, _stop_tok, std::chrono::milliseconds(poll_ms), [] { return false; });
    return !_stop_tok.stop_requested();
  }
  inline void watch_(std::stop_token _stop_tok)
  {
    // 1. wait for exit
    bool exited = false;
    bool ours = true;
    while (!exited)
    {
      if (ours)
      {
        short r = exe_t::reap_(pid, result);
        if (r == 1) exited = true;
        else if (r < 0) ours = false; // reaped elsewhere: fall back to probing
      }
      else if (prober.probe_(record) != sup_l::ALIVE) exited = true; // gone, or the pid was reused
      if (!exited && !nap_(_stop_tok))
      {
        log.close_();
        done.store(true, std::memory_order_release);
        return;
      }
    }
    // 2. trailer and log handle
    std::string trailer = "\n=== sup_a daemon exited at " + tim_t::now_().rfc3339_() + " (" + result.describe_() + ") ===\n";
    if (!log.write_(trailer)) perror("sup_w.watch_(): ---write---");
    log.close_();
    // 3. terminal status for this very launch only: the name may have been reused since
    const sup_s terminal = (result.status != 3 || result.clean_()) ? sup_s::STOPPED : sup_s::CRASHED;
    sup_e e = store.update_([&](sup_t& t)
    {
      sup_r* r = t.find_(name);
      if (!r || r->pid != pid || !r->running_()) return false;
      r->status = terminal;
      return true;
    });
    if (!e.ok_())
    {
      fprintf(stderr, "sup_w.watch_() [%d]: Failed to record exit of %s (pid %d): %s\n"
        , getpid(), name.c_str(), pid, std::to_string(e).c_str());
    }
    done.store(true, std::memory_order_release);
  }
};

/* --------------------------------------------- */

class sup_n // daemon launcher
{
public:
  sup_o options;
  sup_d store;
  sup_p prober;
private:
  mutable std::mutex watchers_m;
  std::unordered_map<pid_t, std::shared_ptr<sup_w>> watchers;
public:
  explicit sup_n(const sup_o& _options)
    : options(_options), store(_options), prober(_options.identity_tolerance_s) {}
  sup_n(const sup_n&) = delete;
  sup_n& operator=(const sup_n&) = delete;
  ~sup_n() { fina_(); }
  inline void fina_() // cancel all watchers; daemons keep running
  {
    std::unordered_map<pid_t, std::shared_ptr<sup_w>> taken;
    {
      std::scoped_lock lock(watchers_m);
      taken.swap(watchers);
    }
    taken.clear();
  }

  static inline bool valid_name_(const std::string& _name)
  {
    if (_name.empty() || _name == "." || _name == "..") return false;
    for (char c : _name)
    {
      if (c == '/' || c == '\0' || c == '\n') return false;
    }
    return true;
  }

  inline sup_e start_(const std::string& _name
    , const std::string& _command
    , const std::vector<std::string>& _env
    , const std::string& _workdir
    , sup_r& _record
  )
  {
    if (!valid_name_(_name)) return sup_e::INVALID_NAME;
    // 1. table under lock, reconciled
    sup_k lock = store.lock_();
    if (!lock.held_()) return sup_e::IO_FAILURE;
    sup_t table;
    if (sup_e e = store.load_(table); !e.ok_()) return e;
    const bool reconciled = prober.reconcile_(table);
    if (const sup_r* r = table.find_(_name); r && r->running_())
    {
      _record = *r;
      if (reconciled) persist_(table);
      return sup_e::ALREADY_RUNNING;
    }
    // 2. log file and banner
    const std::string log_path = options.log_(_name);
    std::error_code ec;
    std::filesystem::create_directories(options.logs_(), ec);
    if (ec)
    {
      fprintf(stderr, "sup_n.start_() [%d]: Failed to create %s: %s\n", getpid(), options.logs_().c_str(), ec.message().c_str());
      return sup_e::IO_FAILURE;
    }
    int fd = open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0)
    {
      perror("sup_n.start_(): ---open---");
      return sup_e::IO_FAILURE;
    }
    sup_h log(fd);
    if (!log.write_(banner_(_command, _workdir)))
    {
      perror("sup_n.start_(): ---write---");
      return sup_e::IO_FAILURE;
    }
    // 3. spawn
    exe_c config(_command, _workdir, environment_(_name, _env), log.fd);
    exe_r result;
    if (exe_t::spawn_(config, result) != 0)
    {
      if (!log.write_("=== sup_a spawn failed: " + std::string(strerror(result.error)) + " ===\n")) perror("sup_n.start_(): ---write---");
      return sup_e::SPAWN_FAILURE;
    }
    // 4. record
    sup_r record(result.pid, _name, _command, result.init_time, sup_s::RUNNING, log_path, options.project);
    table.upsert_(record);
    _record = record;
    sup_e saved = store.save_(table);
    lock.unlock_();
    // 5. watcher, also for an untracked child so it gets reaped
    watch_(record, std::move(log));
    if (!saved.ok_())
    {
      fprintf(stderr, "sup_n.start_() [%d]: %s is running as pid %d but could not be recorded\n", getpid(), _name.c_str(), result.pid);
      return sup_e::ORPHANED_PROCESS;
    }
    return sup_e::OK;
  }

  inline bool watching_(pid_t _pid) const
  {
    std::scoped_lock lock(watchers_m);
    auto it = watchers.find(_pid);
    return it != watchers.end() && !it->second->done.load(std::memory_order_acquire);
  }

  inline size_t watchers_() const
  {
    std::scoped_lock lock(watchers_m);
    size_t n = 0;
    for (const auto& [pid, w] : watchers)
    {
      if (!w->done.load(std::memory_order_acquire)) ++n;
    }
    return n;
  }

  // exited-but-unreaped children: give their watchers a moment to classify the exit
  inline void settle_(uint64_t _timeout_ms)
  {
    std::vector<std::shared_ptr<sup_w>> pending;
    {
      std::scoped_lock lock(watchers_m);
      for (const auto& [pid, w] : watchers)
      {
        if (w->done.load(std::memory_order_acquire)) continue;
        if (!sup_p::is_alive_(pid)) pending.push_back(w);
      }
    }
    for (const auto& w : pending) w->wait_(_timeout_ms);
  }

  static inline std::string banner_(const std::string& _command, const std::string& _workdir)
  {
    return "\n=== sup_a daemon started at " + tim_t::now_().rfc3339_() + " ===\n"
      + "Command: " + _command + "\n"
      + "Workdir: " + _workdir + "\n"
      + "=========================================\n\n";
  }

private:
  inline void persist_(const sup_t& _table) const
  {
    if (sup_e e = store.save_(_table); !e.ok_())
    {
      fprintf(stderr, "sup_n.persist_() [%d]: Failed to save reconciled table: %s\n", getpid(), std::to_string(e).c_str());
    }
  }

  // caller's list (or the inherited environment) plus SUP_A_DAEMON=<project>/<name>
  inline std::vector<std::string> environment_(const std::string& _name, const std::vector<std::string>& _env) const
  {
    std::vector<std::string> env;
    const std::string key = std::string(SUP_A_MARKER) + "=";
    auto keep = [&](const std::string& kv) { if (kv.compare(0, key.size(), key) != 0) env.push_back(kv); };
    if (_env.empty())
    {
      for (char** e = environ; e && *e; ++e) keep(*e);
    }
    else
    {
      for (const auto& kv : _env) keep(kv);
    }
    env.push_back(key + options.project + "/" + _name);
    return env;
  }

  inline void watch_(const sup_r& _record, sup_h&& _log)
  {
    std::vector<std::shared_ptr<sup_w>> finished;
    std::scoped_lock lock(watchers_m);
    for (auto it = watchers.begin(); it != watchers.end();)
    {
      if (it->second->done.load(std::memory_order_acquire))
      {
        finished.push_back(std::move(it->second));
        it = watchers.erase(it);
      }
      else ++it;
    }
    watchers[_record.pid] = std::make_shared<sup_w>(_record, std::move(_log), store, options.watch_poll_ms, options.identity_tolerance_s);
  }
};

/* --------------------------------------------- */
