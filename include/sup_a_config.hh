#pragma once

#include "sup_a_types.hh"

#include <cstdlib>
#include <cstdint>
#include <string>
#include <filesystem>

/* --------------------------------------------- */

struct sup_o // options
{
  std::string root;                 // project root: <root>/.sup_a holds table and logs
  std::string project;              // logical project name stamped on records
  uint64_t grace_ms = 3000;         // SIGTERM -> SIGKILL escalation delay
  uint64_t kill_ms = 1000;          // wait after SIGKILL before giving up
  uint64_t teardown_ms = 500;       // restart: pause between stop and start
  uint64_t watch_poll_ms = 50;      // watcher waitpid period
  uint64_t follow_poll_ms = 100;    // log follow poll period
  int64_t identity_tolerance_s = 2; // pid/start-time identity window; 0 = disabled
  sup_o() = default;
  explicit sup_o(const std::string& _root) : root(_root) { init_(); }
  sup_o(const std::string& _root, const std::string& _project) : root(_root), project(_project) { init_(); }
  inline void init_()
  {
    if (root.empty())
    {
      std::error_code ec;
      root = std::filesystem::current_path(ec).string();
      if (ec) root = ".";
    }
    if (project.empty())
    {
      std::filesystem::path p(root);
      project = p.filename().string();
      if (project.empty()) project = p.parent_path().filename().string(); // "/a/b/"
      if (project.empty()) project = "default";
    }
  }
  // SUP_A_ROOT, SUP_A_PROJECT, SUP_A_GRACE_MS, SUP_A_POLL_MS; call init_() after any further overrides
  static inline sup_o env_()
  {
    sup_o o;
    if (const char* v = getenv("SUP_A_ROOT"); v && *v) o.root = v;
    if (const char* v = getenv("SUP_A_PROJECT"); v && *v) o.project = v;
    env_u64_("SUP_A_GRACE_MS", o.grace_ms);
    env_u64_("SUP_A_POLL_MS", o.follow_poll_ms);
    return o;
  }
  inline std::string dir_() const { return (std::filesystem::path(root) / SUP_A_DIR).string(); }
  inline std::string table_() const { return (std::filesystem::path(dir_()) / SUP_A_TABLE).string(); }
  inline std::string lock_() const { return table_() + ".lock"; }
  inline std::string logs_() const { return (std::filesystem::path(dir_()) / SUP_A_LOGS).string(); }
  inline std::string log_(const std::string& _name) const { return (std::filesystem::path(logs_()) / (_name + ".log")).string(); }
private:
  static inline void env_u64_(const char* _key, uint64_t& _out)
  {
    const char* v = getenv(_key);
    if (!v || !*v) return;
    char* end = NULL;
    errno = 0;
    unsigned long long n = strtoull(v, &end, 10);
    if (errno != 0 || end == v || *end != '\0')
    {
      fprintf(stderr, "sup_o.env_() [%d]: Ignoring invalid %s=%s\n", getpid(), _key, v);
      return;
    }
    _out = static_cast<uint64_t>(n);
  }
};

/* --------------------------------------------- */
