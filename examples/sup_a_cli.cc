/**
 * sup_a_cli.cc - sup_a command line front end
 *
 * Demonstrates:
 *   - Starting shell commands as named background daemons
 *   - Listing, stopping and restarting them across invocations
 *   - Tailing and following their logs
 *
 * Build: cmake --build . --target sup_a_cli
 * Run:   ./sup_a start web "python3 -m http.server 8000"
 *        ./sup_a ps --all
 *        ./sup_a logs web -f
 *        ./sup_a stop web
 */

#include "sup_a_cli.hh"

static int fail_(sup_e _code, const std::string& _name, const sup_r& _record = sup_r())
{
  std::cerr << "Error: " << sup_a::message_(_code, _name, _record) << std::endl;
  return _code.exit_();
}

static int run_start_(sup_a& _app, const cli::args_t& _args)
{
  if (_args.positional.size() < 2)
  {
    std::cerr << "Error: start needs a name and a command" << std::endl;
    return cli::EXIT_USAGE;
  }
  const std::string& name = _args.positional[0];
  std::string command;
  for (size_t i = 1; i < _args.positional.size(); ++i) command += (i > 1 ? " " : "") + _args.positional[i];
  std::string workdir = _args.workdir.empty() ? _app.options.root : _args.workdir;
  sup_r record;
  sup_e e = _app.start_(name, command, _args.env, workdir, record);
  if (e == sup_e::ORPHANED_PROCESS) std::cerr << "Warning: " << sup_a::message_(e, name, record) << std::endl;
  if (!e.ok_()) return fail_(e, name, record);
  std::cout << "Started " << name << " (PID " << record.pid << ")" << std::endl;
  std::cout << "Logs: " << record.log_file << std::endl;
  return 0;
}

static int run_stop_(sup_a& _app, const cli::args_t& _args)
{
  if (_args.all)
  {
    std::vector<std::pair<std::string, sup_e>> results;
    sup_e e = _app.stop_all_(results);
    if (results.empty())
    {
      if (!e.ok_()) return fail_(e, "");
      std::cout << "No running processes to stop" << std::endl;
      return 0;
    }
    for (const auto& [name, result] : results)
    {
      if (result.ok_()) std::cout << "Stopped " << name << std::endl;
      else std::cerr << "Failed to stop " << name << ": " << sup_a::message_(result, name) << std::endl;
    }
    return e.exit_();
  }
  std::string name = _args.positional.empty() ? _app.options.project : _args.positional[0];
  sup_e e = _app.stop_(name);
  if (!e.ok_()) return fail_(e, name);
  std::cout << "Stopped " << name << std::endl;
  return 0;
}

static int run_restart_(sup_a& _app, const cli::args_t& _args)
{
  std::string name = _args.positional.empty() ? _app.options.project : _args.positional[0];
  std::string workdir = _args.workdir.empty() ? _app.options.root : _args.workdir;
  sup_r record;
  sup_e e = _app.restart_(name, workdir, _args.env, record);
  if (!e.ok_()) return fail_(e, name, record);
  std::cout << "Restarted " << name << " (PID " << record.pid << ")" << std::endl;
  return 0;
}

static int run_ps_(sup_a& _app, const cli::args_t& _args)
{
  std::vector<sup_r> records;
  if (_args.system) records = _app.scan_();
  else if (sup_e e = _app.list_(_args.all, records); !e.ok_()) return fail_(e, "");
  if (_args.quiet)
  {
    for (const auto& r : records) std::cout << r.pid << std::endl;
    return 0;
  }
  if (records.empty())
  {
    std::cout << (_args.all ? "No processes" : "No running processes") << std::endl;
    return 0;
  }
  cli::table_(records);
  return 0;
}

static int run_status_(sup_a& _app, const cli::args_t& _args)
{
  if (!_args.positional.empty())
  {
    const std::string& name = _args.positional[0];
    sup_r record;
    sup_e e = _app.status_(name, record);
    if (!e.ok_()) return fail_(e, name);
    if (_args.json) std::cout << record.to_json_().dump(2) << std::endl;
    else cli::record_(record);
    return 0;
  }
  std::vector<sup_r> records;
  if (sup_e e = _app.list_(true, records); !e.ok_()) return fail_(e, "");
  nlohmann::json summary = cli::summary_(_app, records);
  if (_args.json)
  {
    std::cout << summary.dump(2) << std::endl;
    return 0;
  }
  std::cout << "Project: " << _app.options.project << " (" << _app.options.root << ")" << std::endl;
  std::cout << "Processes: " << summary["running"].get<size_t>() << " running, " << records.size() << " total" << std::endl;
  if (!records.empty()) cli::table_(records);
  for (const auto& log : summary["logs"])
  {
    std::cout << "  • " << log["name"].get<std::string>() << " (" << format_bytes_(log["size"].get<uint64_t>()) << ")" << std::endl;
  }
  return 0;
}

static int run_logs_(sup_a& _app, const cli::args_t& _args)
{
  if (_args.list)
  {
    std::vector<std::string> names;
    if (sup_e e = _app.logs_(names); !e.ok_()) return fail_(e, "");
    if (names.empty())
    {
      std::cout << "No log files found" << std::endl;
      return 0;
    }
    std::cout << "Available logs:" << std::endl;
    for (const auto& n : names)
    {
      uint64_t bytes = 0;
      if (!_app.log_size_(n, bytes).ok_()) continue;
      std::cout << "  • " << n << " (" << format_bytes_(bytes) << ")" << std::endl;
    }
    return 0;
  }
  std::string name = _args.positional.empty() ? _app.options.project : _args.positional[0];
  std::vector<std::string> lines;
  sup_e e = _app.tail_(name, _args.lines, lines);
  if (!e.ok_()) return fail_(e, name);
  for (const auto& l : lines) std::cout << l << '\n';
  std::cout.flush();
  if (!_args.follow) return 0;
  std::cerr << "Following logs for '" << name << "' (Ctrl+C to exit)..." << std::endl;
  e = _app.follow_(name, [](const std::string& _line) { std::cout << _line << std::endl; }, true);
  if (!e.ok_()) return fail_(e, name);
  return 0;
}

static int run_prune_(sup_a& _app, const cli::args_t& _args)
{
  int64_t max_age = 0;
  if (!parse_duration_(_args.older_than, max_age))
  {
    std::cerr << "Invalid duration: " << _args.older_than << " (e.g. 90s, 30m, 24h, 7d)" << std::endl;
    return cli::EXIT_USAGE;
  }
  std::vector<std::string> removed;
  if (sup_e e = _app.prune_logs_(max_age, removed); !e.ok_()) return fail_(e, "");
  for (const auto& f : removed) std::cout << "  Removed: " << f << std::endl;
  std::cout << "Removed " << removed.size() << " log file(s)" << std::endl;
  return 0;
}

static int run_rm_(sup_a& _app, const cli::args_t& _args)
{
  if (_args.positional.size() != 1)
  {
    std::cerr << "Error: rm needs exactly one name" << std::endl;
    return cli::EXIT_USAGE;
  }
  const std::string& name = _args.positional[0];
  sup_e e = _app.remove_(name);
  if (!e.ok_()) return fail_(e, name);
  std::cout << "Removed " << name << std::endl;
  return 0;
}

int main(int argc, char** argv)
{
  sup_o options = sup_o::env_();
  bool help = false;
  if (!cli::parse_global_(argc, argv, options, help))
  {
    cli::usage_(argv[0]);
    return cli::EXIT_USAGE;
  }
  if (help)
  {
    cli::usage_(argv[0]);
    return 0;
  }
  if (optind >= argc)
  {
    cli::usage_(argv[0]);
    return cli::EXIT_USAGE;
  }
  char** command_argv = argv + optind;
  int command_argc = argc - optind;
  const std::string command = command_argv[0];
  options.init_(); // root and project defaults once --root/--project are known

  cli::args_t args;
  if (!cli::parse_command_(command_argc, command_argv, args, command == "start"))
  {
    cli::usage_(argv[0]);
    return cli::EXIT_USAGE;
  }

  try
  {
    sup_a app(options);
    if (command == "start") return run_start_(app, args);
    if (command == "stop") return run_stop_(app, args);
    if (command == "restart") return run_restart_(app, args);
    if (command == "ps") return run_ps_(app, args);
    if (command == "status") return run_status_(app, args);
    if (command == "logs") return run_logs_(app, args);
    if (command == "prune") return run_prune_(app, args);
    if (command == "rm") return run_rm_(app, args);
  }
  catch (const std::exception& ex)
  {
    std::cerr << "Error: " << ex.what() << std::endl;
    return sup_e(sup_e::IO_FAILURE).exit_();
  }
  std::cerr << "Unknown command: " << command << std::endl;
  cli::usage_(argv[0]);
  return cli::EXIT_USAGE;
}
