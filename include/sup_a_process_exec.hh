#pragma once

struct exe_c;
struct exe_r;
struct exe_t;

#include "sup_a_types.hh"

#include <cstdlib>
#include <cstddef>
#include <cerrno>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <spawn.h>
#include <signal.h>
#include <cstring>
#include <string>
#include <vector>

extern char **environ;

/* --------------------------------------------- */

struct exe_c // config
{
  std::string cmd; // shell command line: /bin/sh -c <cmd>
  std::string dir; // "" = inherit
  std::vector<std::string> env; // KEY=VALUE in order; empty = inherit environ
  int out_fd = -1; // stdout and stderr target; -1 = inherit
  std::string shell = "/bin/sh";
  exe_c(const std::string& _cmd
    , const std::string& _dir
    , const std::vector<std::string>& _env = {}
    , int _out_fd = -1
  ) : cmd(_cmd), dir(_dir), env(_env), out_fd(_out_fd) {}
};

struct exe_r // result
{
  pid_t pid = -1;
  uint8_t status = 0; // 0 = created; 1 = spawned (detached); 3 = completed; 5+ = failed
  int error = 0; // errno of the failed step
  bool exit_normal = false; // true = normal; false = signaled
  int exit_code = -1;
  int exit_sign = 0;
  bool core_dumped = false;
  tim_t init_time;
  inline bool clean_() const noexcept { return status == 3 && exit_normal && exit_code == 0; }
  inline std::string describe_() const
  {
    if (status != 3) return "unknown";
    if (exit_normal) return "exit code " + std::to_string(exit_code);
    return "signal " + std::to_string(exit_sign) + (core_dumped ? ", core dumped" : "");
  }
};

/* --------------------------------------------- */

class exe_t // executor
{
public:
  // spawn <shell> -c <cmd> detached in its own session: stdin /dev/null, stdout+stderr -> out_fd
  static inline short spawn_(const exe_c& _config, exe_r& _result)
  {
    _result.status = 0; // created
    // 1. build argv
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(_config.shell.c_str()));
    argv.push_back(const_cast<char*>("-c"));
    argv.push_back(const_cast<char*>(_config.cmd.c_str()));
    argv.push_back(NULL);
    // 2. build envp
    std::vector<char*> envp;
    char** envp_p = environ;
    if (!_config.env.empty())
    {
      for (const auto& e : _config.env)
      {
        envp.push_back(const_cast<char*>(e.c_str()));
      }
      envp.push_back(NULL);
      envp_p = envp.data();
    }
    // 3. setup posix_spawn attributes and file actions
    posix_spawnattr_t attr;
    posix_spawn_file_actions_t file_actions;
    posix_spawnattr_init(&attr);
    posix_spawn_file_actions_init(&file_actions);
    // 4. detached: new session and process group, default dispositions, nothing blocked
    sigset_t all, none;
    sigfillset(&all);
    sigemptyset(&none);
    posix_spawnattr_setsigdefault(&attr, &all);
    posix_spawnattr_setsigmask(&attr, &none);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSID | POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK);
    // 5. setup file redirections
    posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    if (_config.out_fd >= 0)
    {
      posix_spawn_file_actions_adddup2(&file_actions, _config.out_fd, STDOUT_FILENO);
      posix_spawn_file_actions_adddup2(&file_actions, _config.out_fd, STDERR_FILENO);
    }
    // 6. change directory if specified
    if (!_config.dir.empty()) posix_spawn_file_actions_addchdir_np(&file_actions, _config.dir.c_str());
    _result.init_time = tim_t::now_();
    // 7. spawn process
    pid_t pid;
    int spawn_ret = posix_spawn(&pid, _config.shell.c_str(), &file_actions, &attr, argv.data(), envp_p);
    posix_spawn_file_actions_destroy(&file_actions);
    posix_spawnattr_destroy(&attr);
    if (spawn_ret != 0)
    {
      errno = spawn_ret;
      perror("exe_t.spawn_(): ---posix_spawn---");
      _result.error = spawn_ret;
      _result.status = 6;
      return -1;
    }
    _result.pid = pid;
    _result.status = 1; // spawned
    return 0;
  }

  // non-blocking reap: 1 = exited (result filled); 0 = still running; <0 = error
  static inline short reap_(pid_t _pid, exe_r& _result)
  {
    int status;
    pid_t r = waitpid(_pid, &status, WNOHANG);
    if (r == 0) return 0;
    if (r < 0)
    {
      if (errno == EINTR) return 0; // interrupted by signal
      _result.error = errno;
      _result.status = 7; // failed: not our child or already reaped
      return -1;
    }
    _result.status = 3; // completed
    if (WIFEXITED(status))
    {
      _result.exit_normal = true;
      _result.exit_code = WEXITSTATUS(status);
    }
    else if (WIFSIGNALED(status))
    {
      _result.exit_normal = false;
      _result.exit_sign = WTERMSIG(status);
    }
    _result.core_dumped = WCOREDUMP(status);
    return 1;
  }

  // signal the session's process group, falling back to the pid alone
  // pid 1 and below never name a daemon; kill(-1) would reach every process
  static inline short signal_(pid_t _pid, int _signum)
  {
    if (_pid <= 1)
    {
      errno = EINVAL;
      return -1;
    }
    if (kill(-_pid, _signum) == 0) return 0;
    if (kill(_pid, _signum) == 0) return 0;
    if (errno == ESRCH) return 1; // already gone
    return -2;
  }
};

/* --------------------------------------------- */
