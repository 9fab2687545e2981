#pragma once

#include "sup_a_types.hh"
#include "sup_a_config.hh"
#include "sup_a_record.hh"
#include "sup_a_store.hh"
#include "sup_a_probe.hh"
#include "sup_a_process_exec.hh"
#include "sup_a_launcher.hh"
#include "sup_a_log_reader.hh"

#include <cstdio>
#include <csignal>
#include <unistd.h>
#include <string>
#include <vector>
#include <utility>
#include <mutex>
#include <thread>
#include <chrono>

/* --------------------------------------------- */

// sup_a app(options) -> app.start_()/stop_()/restart_()/list_()/status_()/tail_()/follow_() -> ~()
// Watchers die with the object; daemons do not. A later instance reconciles by probing.
class sup_a // supervisor
{
public:
  sup_o options;
private:
  sup_n launcher;
  sup_g reader;
  std::mutex follower_m;
  sup_f* follower = NULL; // active follow_() call, for stop_follow_()
  bool halt = false; // stop_follow_() arrived before follow_() registered
public:
  explicit sup_a(const sup_o& _options)
    : options(_options), launcher(_options), reader(_options) {}
  sup_a(const sup_a&) = delete;
  sup_a& operator=(const sup_a&) = delete;
  sup_a(sup_a&&) = delete;
  sup_a& operator=(sup_a&&) = delete;
  ~sup_a() { fina_(); }
  inline void fina_()
  {
    {
      std::scoped_lock lock(follower_m);
      if (follower) follower->stop_();
    }
    launcher.fina_();
  }

  inline sup_e start_(const std::string& _name
    , const std::string& _command
    , const std::vector<std::string>& _env
    , const std::string& _workdir
    , sup_r& _record
  )
  {
    launcher.settle_(options.watch_poll_ms * 4);
    return launcher.start_(_name, _command, _env, _workdir, _record);
  }

  inline sup_e list_(bool _include_stopped, std::vector<sup_r>& _records)
  {
    _records.clear();
    sup_t table;
    sup_e e = reconciled_(table);
    if (!e.ok_()) return e;
    for (const auto& r : table.records)
    {
      if (_include_stopped || r.running_()) _records.push_back(r);
    }
    return sup_e::OK;
  }

  inline sup_e status_(const std::string& _name, sup_r& _record)
  {
    sup_t table;
    sup_e e = reconciled_(table);
    if (!e.ok_()) return e;
    const sup_r* r = table.find_(_name);
    if (!r) return sup_e::NOT_FOUND;
    _record = *r;
    return sup_e::OK;
  }

  inline sup_e stop_(const std::string& _name)
  {
    launcher.settle_(options.watch_poll_ms * 4);
    // 1. under the lock: what are we stopping
    sup_r target;
    {
      sup_k lock = launcher.store.lock_();
      if (!lock.held_()) return sup_e::IO_FAILURE;
      sup_t table;
      if (sup_e e = launcher.store.load_(table); !e.ok_()) return e;
      if (launcher.prober.reconcile_(table)) persist_(table);
      const sup_r* r = table.find_(_name);
      if (!r) return sup_e::NOT_FOUND;
      if (!r->running_()) return sup_e::NOT_RUNNING;
      target = *r;
    }
    // 2. without the lock: SIGTERM, grace, SIGKILL
    short sent = exe_t::signal_(target.pid, SIGTERM);
    if (sent < 0) perror("sup_a.stop_(): ---kill SIGTERM---");
    if (sent != 1 && !gone_(target, options.grace_ms))
    {
      fprintf(stderr, "sup_a.stop_() [%d]: %s (pid %d) ignored SIGTERM for %llums, sending SIGKILL\n"
        , getpid(), _name.c_str(), target.pid, static_cast<unsigned long long>(options.grace_ms));
      short killed = exe_t::signal_(target.pid, SIGKILL);
      if (killed < 0)
      {
        perror("sup_a.stop_(): ---kill SIGKILL---");
        if (sent < 0) return sup_e::SIGNAL_FAILURE;
      }
      if (killed != 1 && !gone_(target, options.kill_ms))
      {
        fprintf(stderr, "sup_a.stop_() [%d]: %s (pid %d) still alive after SIGKILL\n", getpid(), _name.c_str(), target.pid);
        return sup_e::SIGNAL_FAILURE;
      }
    }
    // 3. under the lock: a stop always ends stopped, whatever the watcher saw
    return launcher.store.update_([&](sup_t& t)
    {
      sup_r* r = t.find_(_name);
      if (!r || r->pid != target.pid || r->status == sup_s::STOPPED) return false;
      r->status = sup_s::STOPPED;
      return true;
    });
  }

  inline sup_e stop_all_(std::vector<std::pair<std::string, sup_e>>& _results)
  {
    _results.clear();
    std::vector<sup_r> running;
    sup_e e = list_(false, running);
    if (!e.ok_()) return e;
    _results.resize(running.size());
    {
      std::vector<std::jthread> threads;
      threads.reserve(running.size());
      for (size_t i = 0; i < running.size(); ++i)
      {
        _results[i].first = running[i].name;
        threads.emplace_back([this, &_results, i]() { _results[i].second = stop_(_results[i].first); });
      }
    }
    for (const auto& [name, result] : _results)
    {
      if (!result.ok_() && result != sup_e::NOT_RUNNING) return result;
    }
    return sup_e::OK;
  }

  inline sup_e restart_(const std::string& _name
    , const std::string& _workdir
    , const std::vector<std::string>& _env
    , sup_r& _record
  )
  {
    sup_r existing;
    sup_e e = status_(_name, existing);
    if (!e.ok_()) return e;
    if (existing.running_())
    {
      e = stop_(_name);
      if (!e.ok_() && e != sup_e::NOT_RUNNING) return e;
      std::this_thread::sleep_for(std::chrono::milliseconds(options.teardown_ms));
    }
    return start_(_name, existing.command, _env, _workdir, _record);
  }

  inline sup_e remove_(const std::string& _name)
  {
    launcher.settle_(options.watch_poll_ms * 4);
    bool found = false;
    bool live = false;
    sup_e e = launcher.store.update_([&](sup_t& t)
    {
      bool changed = launcher.prober.reconcile_(t);
      const sup_r* r = t.find_(_name);
      if (!r) return changed;
      found = true;
      if (r->running_())
      {
        live = true;
        return changed;
      }
      t.remove_(_name);
      return true;
    });
    if (!e.ok_()) return e;
    if (!found) return sup_e::NOT_FOUND;
    return live ? sup_e::ALREADY_RUNNING : sup_e::OK;
  }

  inline sup_e prune_logs_(int64_t _max_age_s, std::vector<std::string>& _removed) const { return reader.prune_(_max_age_s, _removed); }
  inline sup_e tail_(const std::string& _name, size_t _n, std::vector<std::string>& _lines) const { return reader.tail_(_name, _n, _lines); }
  inline sup_e logs_(std::vector<std::string>& _names) const { return reader.list_(_names); }
  inline sup_e log_size_(const std::string& _name, uint64_t& _bytes) const { return reader.size_(_name, _bytes); }
  inline std::vector<sup_r> scan_() const { return sup_p::scan_(options.project); }

  // blocks until stop_follow_() or, with _signals, SIGINT/SIGTERM
  inline sup_e follow_(const std::string& _name, sup_c _on_line, bool _signals = false)
  {
    sup_f f(options.follow_poll_ms);
    {
      std::scoped_lock lock(follower_m);
      follower = &f;
      if (halt) f.stop_();
    }
    if (_signals) f.signal_();
    sup_e e = f.follow_(options.log_(_name), std::move(_on_line));
    {
      std::scoped_lock lock(follower_m);
      follower = NULL;
      halt = false;
    }
    return e;
  }

  // ends the running follow_(), or the next one to start
  inline void stop_follow_()
  {
    std::scoped_lock lock(follower_m);
    if (follower) follower->stop_();
    else halt = true;
  }

  inline const sup_n& launcher_() const { return launcher; }

  static inline std::string message_(sup_e _code, const std::string& _name, const sup_r& _record = sup_r())
  {
    switch (_code.v)
    {
      case sup_e::OK:               return "ok";
      case sup_e::ALREADY_RUNNING:  return "process '" + _name + "' is already running (PID " + std::to_string(_record.pid) + ")";
      case sup_e::NOT_RUNNING:      return "process '" + _name + "' is not running";
      case sup_e::NOT_FOUND:        return "process '" + _name + "' not found";
      case sup_e::LOG_NOT_FOUND:    return "no logs found for '" + _name + "'";
      case sup_e::ORPHANED_PROCESS: return "process '" + _name + "' started (PID " + std::to_string(_record.pid) + ") but could not be recorded";
      case sup_e::IO_FAILURE:       return "failed to access the process table or logs";
      case sup_e::SPAWN_FAILURE:    return "failed to start '" + _name + "'";
      case sup_e::SIGNAL_FAILURE:   return "failed to stop '" + _name + "'";
      default:                      return "invalid process name '" + _name + "'";
    }
  }

private:
  inline sup_e reconciled_(sup_t& _table)
  {
    launcher.settle_(options.watch_poll_ms * 4);
    sup_k lock = launcher.store.lock_();
    if (!lock.held_()) return sup_e::IO_FAILURE;
    if (sup_e e = launcher.store.load_(_table); !e.ok_()) return e;
    if (launcher.prober.reconcile_(_table)) persist_(_table);
    return sup_e::OK;
  }

  inline void persist_(const sup_t& _table) const
  {
    if (sup_e e = launcher.store.save_(_table); !e.ok_())
    {
      fprintf(stderr, "sup_a.persist_() [%d]: Failed to save reconciled table: %s\n", getpid(), std::to_string(e).c_str());
    }
  }

  // polls the prober until the tracked process is no longer the live one
  inline bool gone_(const sup_r& _record, uint64_t _timeout_ms) const
  {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(_timeout_ms);
    while (true)
    {
      if (!launcher.prober.alive_(_record)) return true;
      if (std::chrono::steady_clock::now() >= deadline) return false;
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
  }
};

/* --------------------------------------------- */
