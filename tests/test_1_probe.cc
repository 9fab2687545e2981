#include "../include/sup_a_probe.hh"
#include "../include/sup_a_process_exec.hh"

#include <cassert>
#include <cerrno>
#include <csignal>
#include <iostream>
#include <thread>
#include <chrono>
#include <unistd.h>
#include <sys/wait.h>

static pid_t exited_child_(bool _reap)
{
  pid_t pid = fork();
  if (pid == 0) _exit(0);
  assert(pid > 0);
  if (_reap)
  {
    int status;
    assert(waitpid(pid, &status, 0) == pid);
  }
  else std::this_thread::sleep_for(std::chrono::milliseconds(200)); // let it become a zombie
  return pid;
}

int main(int argc, char** argv)
{

std::cout << "\n=== Liveness Prober Tests ===" << std::endl;
{
  sup_p prober(2);

  // Test 1: /proc/<pid>/stat
  std::cout << "\n--- Test 1: Stat Sample ---" << std::endl;
  {
    sup_q sample;
    assert(sup_p::stat_(getpid(), sample) == 0);
    assert(sample.state == 'R' || sample.state == 'S');
    assert(sample.ppid == getppid());
    assert(sample.start_ticks > 0);
    assert(sup_p::stat_(-1, sample) < 0);
    std::cout << "✓ Own stat line parses" << std::endl;

    tim_t started;
    assert(sup_p::started_(sample, started));
    double age = tim_t::now_().secs_() - started.secs_();
    assert(age > -2.0 && age < 600.0);
    std::cout << "✓ Start time derived from boot clock (" << age << "s ago)" << std::endl;
  }

  // Test 2: live process
  std::cout << "\n--- Test 2: Alive ---" << std::endl;
  {
    sup_r self(getpid(), "self", "test", tim_t(), sup_s::RUNNING, "", "demo");
    assert(sup_p::is_alive_(getpid()));
    assert(prober.probe_(self) == sup_l::ALIVE);
    sup_q sample;
    assert(sup_p::stat_(getpid(), sample) == 0);
    assert(sup_p::started_(sample, self.start_time));
    assert(prober.probe_(self) == sup_l::ALIVE);
    assert(prober.alive_(self));
    std::cout << "✓ Own process is alive with a matching start time" << std::endl;
  }

  // Test 3: exited and reaped
  std::cout << "\n--- Test 3: Dead ---" << std::endl;
  {
    pid_t pid = exited_child_(true);
    sup_r gone(pid, "gone", "true", tim_t::now_(), sup_s::RUNNING, "", "demo");
    assert(!sup_p::is_alive_(pid));
    assert(prober.probe_(gone) == sup_l::DEAD);
    sup_r never(-1, "never", "true", tim_t(), sup_s::RUNNING, "", "demo");
    assert(prober.probe_(never) == sup_l::DEAD);
    std::cout << "✓ Reaped and invalid pids are dead" << std::endl;
  }

  // Test 4: zombie
  std::cout << "\n--- Test 4: Zombie ---" << std::endl;
  {
    pid_t pid = exited_child_(false);
    sup_q sample;
    assert(sup_p::stat_(pid, sample) == 0);
    assert(sample.state == 'Z');
    sup_r z(pid, "z", "true", tim_t(), sup_s::RUNNING, "", "demo");
    assert(!sup_p::is_alive_(pid));
    assert(prober.probe_(z) == sup_l::DEAD);
    int status;
    assert(waitpid(pid, &status, 0) == pid);
    std::cout << "✓ Exited but unreaped children count as dead" << std::endl;
  }

  // Test 5: recycled pid
  std::cout << "\n--- Test 5: Start Time Mismatch ---" << std::endl;
  {
    sup_q sample;
    assert(sup_p::stat_(getpid(), sample) == 0);
    tim_t started;
    assert(sup_p::started_(sample, started));
    sup_r stale(getpid(), "stale", "test", tim_t(started.utcs - 3600, 0), sup_s::RUNNING, "", "demo");
    assert(prober.probe_(stale) == sup_l::FOREIGN);
    assert(!prober.alive_(stale));
    std::cout << "✓ Same pid with another start time is foreign" << std::endl;

    sup_p lenient(0);
    assert(lenient.probe_(stale) == sup_l::ALIVE);
    std::cout << "✓ Zero tolerance disables the identity check" << std::endl;
  }

  // Test 6: init
  std::cout << "\n--- Test 6: Pid 1 ---" << std::endl;
  {
    sup_r init(1, "x", "true", tim_t(), sup_s::RUNNING, "", "demo");
    assert(prober.probe_(init) == sup_l::FOREIGN);
    sup_p lenient(0);
    assert(lenient.probe_(init) == sup_l::FOREIGN);
    sup_t table;
    table.upsert_(init);
    assert(prober.reconcile_(table));
    assert(table.find_("x")->status == sup_s::STOPPED);
    std::cout << "✓ A record pointing at init is never alive" << std::endl;

    // signal 0 only probes; a broadcast would still succeed
    errno = 0;
    assert(exe_t::signal_(1, 0) == -1);
    assert(errno == EINVAL);
    assert(exe_t::signal_(0, 0) == -1);
    assert(exe_t::signal_(-1, 0) == -1);
    assert(exe_t::signal_(getpid(), 0) == 0);
    std::cout << "✓ Pids that would address a group of processes are refused" << std::endl;
  }

  // Test 7: reconcile
  std::cout << "\n--- Test 7: Reconcile ---" << std::endl;
  {
    pid_t dead = exited_child_(true);
    sup_t table;
    table.upsert_(sup_r(getpid(), "self", "test", tim_t(), sup_s::RUNNING, "", "demo"));
    table.upsert_(sup_r(dead, "dead", "true", tim_t::now_(), sup_s::RUNNING, "", "demo"));
    table.upsert_(sup_r(dead, "crashed", "false", tim_t::now_(), sup_s::CRASHED, "", "demo"));
    assert(prober.reconcile_(table));
    assert(table.find_("self")->status == sup_s::RUNNING);
    assert(table.find_("dead")->status == sup_s::STOPPED);
    assert(table.find_("crashed")->status == sup_s::CRASHED);
    assert(!prober.reconcile_(table));
    std::cout << "✓ Only running records with a dead process change, and only once" << std::endl;
  }
}

std::cout << "\n=== All Liveness Prober Tests Passed! ===" << std::endl;
return 0;
}
