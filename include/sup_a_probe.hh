#pragma once

#include "sup_a_types.hh"
#include "sup_a_record.hh"

#include <cstdlib>
#include <cerrno>
#include <csignal>
#include <ctime>
#include <unistd.h>
#include <dirent.h>
#include <sys/types.h>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

/* --------------------------------------------- */

struct sup_l // liveness
{
  enum value : uint8_t
  {
    DEAD = 0,    // no such process, or a zombie waiting to be reaped
    ALIVE = 1,   // exists and matches the record
    FOREIGN = 2  // pid exists but is not the process the record tracked
  };
  value v;
  constexpr sup_l() noexcept : v(DEAD) {}
  constexpr sup_l(value val) noexcept : v(val) {}
  constexpr operator value() const noexcept { return v; }
  explicit operator bool() = delete;
};

struct sup_q // /proc/<pid>/stat sample
{
  char state = '?';     // R (running), S (sleeping), D (disk sleep), T (stopped), Z (zombie), etc.
  pid_t ppid = -1;
  pid_t pgrp = -1;
  uint64_t start_ticks = 0; // clock ticks after boot
};

/* --------------------------------------------- */

// Liveness is judged by pid plus start time. The answer is only valid at the
// instant of the probe: the process may exit, and its pid be recycled, right after.
struct sup_p // prober
{
  int64_t tolerance_s = 2; // 0 = skip the start time identity check

  sup_p() = default;
  explicit sup_p(int64_t _tolerance_s) : tolerance_s(_tolerance_s) {}

  // 1338699 (cat) R 1338003 1338699 1338003 34826 1338699 4194304 92 0 0 0 0 0 0 0 20 0 1 0 2595845 ...
  static inline short stat_(pid_t _pid, sup_q& _sample)
  {
    std::ostringstream path;
    path << "/proc/" << _pid << "/stat";
    std::ifstream file(path.str());
    if (!file.is_open()) return -1;
    std::string line;
    if (!std::getline(file, line)) return -2;
    size_t end = line.rfind(')'); // comm may contain spaces and parentheses
    if (end == std::string::npos) return -3;
    size_t state_pos = end + 2;
    if (state_pos >= line.length()) return -4;
    std::istringstream iss(line.substr(state_pos));
    char state;
    long ppid, pgrp, session, tty_nr, tpgid;
    unsigned long flags, minflt, cminflt, majflt, cmajflt, utime, stime;
    long cutime, cstime, priority, nice, num_threads, itrealvalue;
    unsigned long long starttime;
    if (!(iss >> state >> ppid >> pgrp >> session >> tty_nr >> tpgid
      >> flags >> minflt >> cminflt >> majflt >> cmajflt
      >> utime >> stime >> cutime >> cstime >> priority >> nice >> num_threads
      >> itrealvalue >> starttime)
    ) return -5;
    _sample.state = state;
    _sample.ppid = static_cast<pid_t>(ppid);
    _sample.pgrp = static_cast<pid_t>(pgrp);
    _sample.start_ticks = starttime;
    return 0;
  }

  // wall-clock start time of a process from its age on the boot clock
  static inline bool started_(const sup_q& _sample, tim_t& _start)
  {
    long ticks = sysconf(_SC_CLK_TCK);
    if (ticks <= 0) return false;
    struct timespec boot, real;
    if (clock_gettime(CLOCK_BOOTTIME, &boot) != 0) return false;
    if (clock_gettime(CLOCK_REALTIME, &real) != 0) return false;
    double since_boot = static_cast<double>(boot.tv_sec) + static_cast<double>(boot.tv_nsec) / 1e9;
    double age = since_boot - static_cast<double>(_sample.start_ticks) / static_cast<double>(ticks);
    if (age < 0) age = 0;
    double started = static_cast<double>(real.tv_sec) + static_cast<double>(real.tv_nsec) / 1e9 - age;
    time_t secs = static_cast<time_t>(started);
    _start = tim_t(secs, static_cast<int64_t>((started - static_cast<double>(secs)) * 1e9));
    return true;
  }

  static inline bool is_alive_(pid_t _pid)
  {
    if (_pid <= 0) return false;
    if (kill(_pid, 0) != 0) return false; // ESRCH: gone; EPERM: somebody else's
    sup_q sample;
    if (stat_(_pid, sample) == 0 && (sample.state == 'Z' || sample.state == 'X')) return false;
    return true;
  }

  inline sup_l probe_(const sup_r& _record) const
  {
    if (_record.pid <= 0) return sup_l::DEAD;
    if (_record.pid == 1) return sup_l::FOREIGN; // init is never one of ours
    if (kill(_record.pid, 0) != 0)
    {
      if (errno == EPERM) return sup_l::FOREIGN;
      return sup_l::DEAD;
    }
    sup_q sample;
    if (stat_(_record.pid, sample) != 0) return sup_l::ALIVE; // no procfs: signal probe only
    if (sample.state == 'Z' || sample.state == 'X') return sup_l::DEAD;
    if (tolerance_s <= 0 || _record.start_time.utcs == 0) return sup_l::ALIVE;
    tim_t started;
    if (!started_(sample, started)) return sup_l::ALIVE;
    double diff = started.secs_() - _record.start_time.secs_();
    if (diff < 0) diff = -diff;
    if (diff > static_cast<double>(tolerance_s)) return sup_l::FOREIGN; // pid recycled
    return sup_l::ALIVE;
  }

  inline bool alive_(const sup_r& _record) const { return probe_(_record) == sup_l::ALIVE; }

  // running records whose process is gone (or was replaced) become stopped
  inline bool reconcile_(sup_t& _table) const
  {
    bool changed = false;
    for (auto& r : _table.records)
    {
      if (r.status != sup_s::RUNNING) continue;
      if (probe_(r) == sup_l::ALIVE) continue;
      r.status = sup_s::STOPPED;
      changed = true;
    }
    return changed;
  }

  // processes carrying SUP_A_DAEMON=<project>/<name>, whether tracked or not
  static inline std::vector<sup_r> scan_(const std::string& _project)
  {
    std::vector<sup_r> found;
    DIR* dir = opendir("/proc");
    if (!dir)
    {
      perror("sup_p.scan_(): ---opendir---");
      return found;
    }
    const std::string marker = std::string(SUP_A_MARKER) + "=" + _project + "/";
    while (struct dirent* entry = readdir(dir))
    {
      char* end = NULL;
      long pid = strtol(entry->d_name, &end, 10);
      if (pid <= 0 || *end != '\0') continue;
      std::ifstream env_file("/proc/" + std::string(entry->d_name) + "/environ", std::ios::binary);
      if (!env_file.is_open()) continue; // raced exit or not permitted
      std::string var;
      std::string name;
      while (std::getline(env_file, var, '\0'))
      {
        if (var.compare(0, marker.size(), marker) == 0)
        {
          name = var.substr(marker.size());
          break;
        }
      }
      if (name.empty()) continue;
      sup_q sample;
      if (stat_(static_cast<pid_t>(pid), sample) != 0 || sample.state == 'Z') continue;
      // only the session leader: the shell the launcher spawned, not its children
      if (sample.pgrp != static_cast<pid_t>(pid)) continue;
      sup_r r;
      r.pid = static_cast<pid_t>(pid);
      r.name = name;
      r.project = _project;
      r.status = sup_s::RUNNING;
      started_(sample, r.start_time);
      std::ifstream cmd_file("/proc/" + std::string(entry->d_name) + "/cmdline", std::ios::binary);
      std::string arg;
      std::vector<std::string> args;
      while (std::getline(cmd_file, arg, '\0')) args.push_back(arg);
      if (args.size() >= 3 && args[1] == "-c") r.command = args[2]; // sh -c <command>
      else
      {
        for (size_t i = 0; i < args.size(); ++i) r.command += (i ? " " : "") + args[i];
      }
      found.push_back(r);
    }
    closedir(dir);
    return found;
  }
};

/* --------------------------------------------- */
