#pragma once

/**
 * sup_a_cli.hh - command line helpers for the sup_a supervisor
 *
 * Provides:
 *   - Option structs and getopt_long parsers per subcommand
 *   - Process table and status rendering
 *   - JSON status document
 */

#include "../include/sup_a_supervisor.hh"

#include <getopt.h>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

/* --------------------------------------------- */

namespace cli
{
  constexpr int EXIT_USAGE = 2;

  enum : int
  {
    OPT_ROOT = 1000,
    OPT_PROJECT,
    OPT_GRACE,
    OPT_WORKDIR,
    OPT_ENV,
    OPT_ALL,
    OPT_QUIET,
    OPT_SYSTEM,
    OPT_JSON,
    OPT_LIST,
    OPT_OLDER,
    OPT_HELP
  };

  struct args_t
  {
    std::vector<std::string> positional;
    std::string workdir;
    std::vector<std::string> env;
    bool all = false;
    bool quiet = false;
    bool system = false;
    bool json = false;
    bool list = false;
    bool follow = false;
    size_t lines = 50;
    std::string older_than = "7d";
  };

  inline void usage_(const char* _argv0)
  {
    std::cerr
      << "Usage: " << _argv0 << " [--root DIR] [--project NAME] [--grace-ms N] <command> [options]\n"
      << "\n"
      << "Commands:\n"
      << "  start [--workdir DIR] [--env K=V]... <name> <command...>   start a daemon\n"
      << "  stop [--all] [name]                                       stop a daemon (SIGTERM, then SIGKILL)\n"
      << "  restart [--workdir DIR] [--env K=V]... [name]             stop and start with the recorded command\n"
      << "  ps [--all] [--quiet] [--system]                           list daemons\n"
      << "  status [name] [--json]                                    show one daemon or a summary\n"
      << "  logs [name] [-n N] [-f] [--list]                          print or follow a daemon log\n"
      << "  prune [--older-than DURATION]                             remove old log files (default 7d)\n"
      << "  rm <name>                                                 forget a stopped daemon\n"
      << "\n"
      << "Environment: SUP_A_ROOT, SUP_A_PROJECT, SUP_A_GRACE_MS, SUP_A_POLL_MS\n";
  }

  inline bool u64_(const char* _text, uint64_t& _out)
  {
    if (!_text || !*_text) return false;
    char* end = NULL;
    errno = 0;
    unsigned long long n = strtoull(_text, &end, 10);
    if (errno != 0 || *end != '\0' || _text[0] == '-') return false;
    _out = static_cast<uint64_t>(n);
    return true;
  }

  // global options up to the command word; optind is left on the command
  inline bool parse_global_(int _argc, char* const _argv[], sup_o& _options, bool& _help)
  {
    static struct option global_long_options[] = {
      {"root", required_argument, nullptr, OPT_ROOT},
      {"project", required_argument, nullptr, OPT_PROJECT},
      {"grace-ms", required_argument, nullptr, OPT_GRACE},
      {"help", no_argument, nullptr, OPT_HELP},
      {nullptr, 0, nullptr, 0}
    };
    opterr = 0;
    optind = 1;
    int option;
    while ((option = getopt_long(_argc, _argv, "+h", global_long_options, nullptr)) != -1)
    {
      switch (option)
      {
        case OPT_ROOT:
          _options.root = optarg;
          break;
        case OPT_PROJECT:
          _options.project = optarg;
          break;
        case OPT_GRACE:
          if (!u64_(optarg, _options.grace_ms))
          {
            std::cerr << "Invalid value for --grace-ms: " << optarg << std::endl;
            return false;
          }
          break;
        case 'h':
        case OPT_HELP:
          _help = true;
          return true;
        default:
          std::cerr << "Unknown global option: " << _argv[MAX2_(1, optind - 1)] << std::endl;
          return false;
      }
    }
    return true;
  }

  // _greedy: the first positional and everything after it are kept verbatim (start <name> <command...>)
  inline bool parse_command_(int _argc, char* const _argv[], args_t& _args, bool _greedy)
  {
    static struct option command_long_options[] = {
      {"workdir", required_argument, nullptr, OPT_WORKDIR},
      {"env", required_argument, nullptr, OPT_ENV},
      {"all", no_argument, nullptr, OPT_ALL},
      {"quiet", no_argument, nullptr, OPT_QUIET},
      {"system", no_argument, nullptr, OPT_SYSTEM},
      {"json", no_argument, nullptr, OPT_JSON},
      {"list", no_argument, nullptr, OPT_LIST},
      {"follow", no_argument, nullptr, 'f'},
      {"lines", required_argument, nullptr, 'n'},
      {"older-than", required_argument, nullptr, OPT_OLDER},
      {nullptr, 0, nullptr, 0}
    };
    opterr = 0;
    optind = 1;
    int option;
    const char* short_options = _greedy ? "+afqjn:" : "afqjn:";
    while ((option = getopt_long(_argc, _argv, short_options, command_long_options, nullptr)) != -1)
    {
      switch (option)
      {
        case OPT_WORKDIR:
          _args.workdir = optarg;
          break;
        case OPT_ENV:
          if (!strchr(optarg, '='))
          {
            std::cerr << "Invalid --env (expected KEY=VALUE): " << optarg << std::endl;
            optind = 1;
            return false;
          }
          _args.env.push_back(optarg);
          break;
        case 'a':
        case OPT_ALL:
          _args.all = true;
          break;
        case 'q':
        case OPT_QUIET:
          _args.quiet = true;
          break;
        case OPT_SYSTEM:
          _args.system = true;
          break;
        case 'j':
        case OPT_JSON:
          _args.json = true;
          break;
        case OPT_LIST:
          _args.list = true;
          break;
        case 'f':
          _args.follow = true;
          break;
        case 'n':
        {
          uint64_t n = 0;
          if (!u64_(optarg, n))
          {
            std::cerr << "Invalid value for --lines: " << optarg << std::endl;
            optind = 1;
            return false;
          }
          _args.lines = static_cast<size_t>(n);
          break;
        }
        case OPT_OLDER:
          _args.older_than = optarg;
          break;
        default:
          std::cerr << "Unknown option: " << _argv[MAX2_(1, optind - 1)] << std::endl;
          optind = 1;
          return false;
      }
    }
    for (int i = optind; i < _argc; ++i) _args.positional.push_back(_argv[i]);
    optind = 1;
    return true;
  }

  inline const char* color_(sup_s _status)
  {
    switch (_status.v)
    {
      case sup_s::RUNNING: return "\033[32m"; // green
      case sup_s::CRASHED: return "\033[31m"; // red
      default:             return "\033[33m"; // yellow
    }
  }

  inline std::string clip_(const std::string& _text, size_t _max)
  {
    if (_text.size() <= _max) return _text;
    return _text.substr(0, _max - 3) + "...";
  }

  inline void table_(const std::vector<sup_r>& _records)
  {
    const bool tty = isatty(STDOUT_FILENO);
    const tim_t now = tim_t::now_();
    printf("\n  %-8s %-15s %-10s %-12s %s\n", "PID", "NAME", "STATUS", "UPTIME", "COMMAND");
    printf("  %-8s %-15s %-10s %-12s %s\n", "---", "----", "------", "------", "-------");
    for (const auto& r : _records)
    {
      std::string uptime = r.running_() ? format_duration_(r.uptime_(now)) : "-";
      printf("  %-8d %-15s %s%-10s%s %-12s %s\n"
        , static_cast<int>(r.pid)
        , r.name.c_str()
        , tty ? color_(r.status) : ""
        , std::to_string(r.status).c_str()
        , tty ? "\033[0m" : ""
        , uptime.c_str()
        , clip_(r.command, 40).c_str());
    }
    printf("\n");
  }

  inline void record_(const sup_r& _r)
  {
    printf("Name:     %s\n", _r.name.c_str());
    printf("PID:      %d\n", static_cast<int>(_r.pid));
    printf("Status:   %s\n", std::to_string(_r.status).c_str());
    printf("Command:  %s\n", _r.command.c_str());
    printf("Started:  %s\n", _r.start_time.rfc3339_().c_str());
    if (_r.running_()) printf("Uptime:   %s\n", format_duration_(_r.uptime_()).c_str());
    printf("Log:      %s\n", _r.log_file.c_str());
    printf("Project:  %s\n", _r.project.c_str());
  }

  inline nlohmann::json summary_(sup_a& _app, const std::vector<sup_r>& _records)
  {
    size_t running = 0;
    nlohmann::json processes = nlohmann::json::array();
    for (const auto& r : _records)
    {
      if (r.running_()) ++running;
      processes.push_back(r.to_json_());
    }
    nlohmann::json logs = nlohmann::json::array();
    std::vector<std::string> names;
    if (_app.logs_(names).ok_())
    {
      for (const auto& n : names)
      {
        uint64_t bytes = 0;
        if (!_app.log_size_(n, bytes).ok_()) continue;
        logs.push_back({{"name", n}, {"size", bytes}});
      }
    }
    return {
      {"project", _app.options.project},
      {"root", _app.options.root},
      {"running", running},
      {"total", _records.size()},
      {"processes", processes},
      {"logs", logs}
    };
  }
}

/* --------------------------------------------- */
