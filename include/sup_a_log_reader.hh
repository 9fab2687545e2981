#pragma once

#include <uv.h>
#include "sup_a_types.hh"
#include "sup_a_config.hh"

#include <cstdio>
#include <cerrno>
#include <csignal>
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <string>
#include <vector>
#include <algorithm>
#include <atomic>
#include <functional>
#include <filesystem>
#include <stdexcept>

/* --------------------------------------------- */

struct sup_g // log reader
{
  sup_o options;

  sup_g() = default;
  explicit sup_g(const sup_o& _options) : options(_options) {}

  inline sup_e tail_(const std::string& _name, size_t _n, std::vector<std::string>& _lines) const
  {
    return tail_path_(options.log_(_name), _n, _lines);
  }

  // last _n lines oldest first, reading backwards one page at a time
  static inline sup_e tail_path_(const std::string& _path, size_t _n, std::vector<std::string>& _lines)
  {
    _lines.clear();
    int fd = open(_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0)
    {
      if (errno == ENOENT) return sup_e::LOG_NOT_FOUND;
      perror("sup_g.tail_(): ---open---");
      return sup_e::IO_FAILURE;
    }
    sup_h handle(fd);
    struct stat st;
    if (fstat(handle.fd, &st) < 0)
    {
      perror("sup_g.tail_(): ---fstat---");
      return sup_e::IO_FAILURE;
    }
    if (_n == 0 || st.st_size == 0) return sup_e::OK;
    const size_t page = 8192;
    off_t offset = st.st_size;
    std::string data;
    size_t newlines = 0;
    bool trailing = false; // final newline closes the last line, it does not open a new one
    while (offset > 0)
    {
      size_t len = static_cast<size_t>(MIN2_(static_cast<off_t>(page), offset));
      offset -= static_cast<off_t>(len);
      std::string chunk(len, '\0');
      size_t got = 0;
      while (got < len)
      {
        ssize_t r = pread(handle.fd, &chunk[got], len - got, offset + static_cast<off_t>(got));
        if (r < 0)
        {
          if (errno == EINTR) continue;
          perror("sup_g.tail_(): ---pread---");
          return sup_e::IO_FAILURE;
        }
        if (r == 0) break; // truncated underneath us
        got += static_cast<size_t>(r);
      }
      chunk.resize(got);
      if (data.empty() && !chunk.empty() && chunk.back() == '\n') trailing = true;
      newlines += static_cast<size_t>(std::count(chunk.begin(), chunk.end(), '\n'));
      data.insert(0, chunk);
      if (newlines >= _n + (trailing ? 1 : 0)) break;
    }
    if (trailing) data.pop_back();
    std::vector<std::string> all;
    size_t start = 0;
    while (true)
    {
      size_t nl = data.find('\n', start);
      if (nl == std::string::npos)
      {
        all.push_back(data.substr(start));
        break;
      }
      all.push_back(data.substr(start, nl - start));
      start = nl + 1;
    }
    // the first piece is a cut line when reading stopped early
    if (all.size() > _n) all.erase(all.begin(), all.end() - static_cast<ptrdiff_t>(_n));
    _lines.swap(all);
    return sup_e::OK;
  }

  inline sup_e list_(std::vector<std::string>& _names) const
  {
    _names.clear();
    std::error_code ec;
    if (!std::filesystem::exists(options.logs_(), ec)) return sup_e::OK;
    std::filesystem::directory_iterator it(options.logs_(), ec);
    if (ec)
    {
      fprintf(stderr, "sup_g.list_() [%d]: Failed to read %s: %s\n", getpid(), options.logs_().c_str(), ec.message().c_str());
      return sup_e::IO_FAILURE;
    }
    for (const auto& entry : it)
    {
      if (!entry.is_regular_file(ec) || entry.path().extension() != ".log") continue;
      _names.push_back(entry.path().stem().string());
    }
    std::sort(_names.begin(), _names.end());
    return sup_e::OK;
  }

  inline sup_e size_(const std::string& _name, uint64_t& _bytes) const
  {
    struct stat st;
    if (stat(options.log_(_name).c_str(), &st) < 0)
    {
      if (errno == ENOENT) return sup_e::LOG_NOT_FOUND;
      perror("sup_g.size_(): ---stat---");
      return sup_e::IO_FAILURE;
    }
    _bytes = static_cast<uint64_t>(st.st_size);
    return sup_e::OK;
  }

  // every regular file under logs/ last modified before now - _max_age_s
  inline sup_e prune_(int64_t _max_age_s, std::vector<std::string>& _removed) const
  {
    _removed.clear();
    std::error_code ec;
    if (!std::filesystem::exists(options.logs_(), ec)) return sup_e::OK;
    std::filesystem::directory_iterator it(options.logs_(), ec);
    if (ec)
    {
      fprintf(stderr, "sup_g.prune_() [%d]: Failed to read %s: %s\n", getpid(), options.logs_().c_str(), ec.message().c_str());
      return sup_e::IO_FAILURE;
    }
    const time_t cutoff = tim_t::now_().utcs - static_cast<time_t>(_max_age_s);
    for (const auto& entry : it)
    {
      if (!entry.is_regular_file(ec)) continue;
      struct stat st;
      if (stat(entry.path().c_str(), &st) < 0) continue; // raced removal
      if (st.st_mtime >= cutoff) continue;
      if (unlink(entry.path().c_str()) < 0)
      {
        perror("sup_g.prune_(): ---unlink---");
        continue;
      }
      _removed.push_back(entry.path().filename().string());
    }
    std::sort(_removed.begin(), _removed.end());
    return sup_e::OK;
  }
};

/* --------------------------------------------- */

using sup_c = std::function<void(const std::string&)>; // one complete line, newline stripped

// sup_f follower -> follower.signal_() -> follower.follow_() ... follower.stop_() from any thread -> ~()
class sup_f // log follower
{
public:
  std::atomic<uint8_t> state;          // 0 = finalized; 1 = initialized; 2 = following; 3 = stopped;
private:
  uint64_t poll_ms;
  uv_loop_t loop;                      // uv event loop
  uv_async_t loop_a;                   // uv async sender: stop from other threads
  uv_timer_t loop_t;                   // uv poll timer
  std::vector<uv_signal_t*> signalers; // uv signalers
  std::atomic<bool> halt;              // stop requested before or during follow_()
  std::string path;
  sup_h file;
  ino_t inode = 0;
  off_t offset = 0;
  std::string partial;                 // bytes after the last newline
  sup_c on_line;
public:
  explicit sup_f(uint64_t _poll_ms = 100) : poll_ms(MAX2_(_poll_ms, 1))
  {
    state.store(0);
    halt.store(false);
    init_();
  }
  ~sup_f() { fina_(); }
  sup_f(const sup_f&) = delete;
  sup_f& operator=(const sup_f&) = delete;
  sup_f(sup_f&&) = delete;
  sup_f& operator=(sup_f&&) = delete;
  inline void init_()
  {
    if (state.load() != 0) return;
    int r = uv_loop_init(&loop);
    if (r != 0) throw std::runtime_error(std::string("sup_f.init_(): Failed to init loop w/ ") + uv_strerror(r));
    uv_async_init(&loop, &loop_a, [](uv_async_t* handle)
    {
      auto* self = static_cast<sup_f*>(handle->data);
      uv_timer_stop(&self->loop_t);
      uv_stop(handle->loop);
    });
    uv_timer_init(&loop, &loop_t);
    loop_a.data = this;
    loop_t.data = this;
    state.store(1);
  }
  static inline void on_signal_(uv_signal_t* _sig, int _signum)
  {
    auto* self = static_cast<sup_f*>(_sig->data);
    fprintf(stderr, "\nsup_f.signal_() [%d]: Caught signal %d stopping follow ...\n", getpid(), _signum);
    self->stop_();
  }
  inline void signal_()
  {
    if (state.load() % 2 != 1) return; // finalized or following
    for (int signum : {SIGINT, SIGTERM})
    {
      uv_signal_t* signaler = new uv_signal_t;
      int r = uv_signal_init(&loop, signaler);
      if (r != 0)
      {
        delete signaler;
        continue;
      }
      signaler->data = this;
      r = uv_signal_start(signaler, on_signal_, signum);
      if (r != 0)
      {
        uv_close(reinterpret_cast<uv_handle_t*>(signaler)
          , [](uv_handle_t* handle) { delete reinterpret_cast<uv_signal_t*>(handle); }
        );
        continue;
      }
      signalers.push_back(signaler);
    }
  }
  inline void designal_()
  {
    for (auto* signaler : signalers)
    {
      if (uv_is_closing(reinterpret_cast<uv_handle_t*>(signaler)) == 0) uv_close(reinterpret_cast<uv_handle_t*>(signaler)
        , [](uv_handle_t* handle) { delete reinterpret_cast<uv_signal_t*>(handle); }
      );
    }
    signalers.clear();
  }
  // blocks until stop_(): hands every line appended after the call to _on_line
  inline sup_e follow_(const std::string& _path, sup_c _on_line)
  {
    uint8_t expected = 1;
    if (!state.compare_exchange_strong(expected, 2)) // initialized -> following
    {
      expected = 3; // stopped -> following
      if (!state.compare_exchange_strong(expected, 2)) return sup_e::IO_FAILURE; // finalized or already following
    }
    path = _path;
    on_line = std::move(_on_line);
    partial.clear();
    sup_e e = open_(false);
    if (e.ok_() && !halt.load())
    {
      uv_timer_start(&loop_t, on_tick_, poll_ms, poll_ms);
      uv_run(&loop, UV_RUN_DEFAULT); // until loop_a fires
      uv_timer_stop(&loop_t);
    }
    uv_run(&loop, UV_RUN_NOWAIT); // consume a wake-up sent before the loop ran
    file.close_();
    on_line = nullptr;
    halt.store(false);
    state.store(3); // stopped
    return e;
  }
  inline void stop_() // thread-safe
  {
    halt.store(true);
    if (state.load() == 0) return;
    uv_async_send(&loop_a);
  }
  inline void fina_()
  {
    if (state.load() == 0) return;
    designal_();
    uv_close(reinterpret_cast<uv_handle_t*>(&loop_a), NULL);
    uv_close(reinterpret_cast<uv_handle_t*>(&loop_t), NULL);
    uv_run(&loop, UV_RUN_DEFAULT); // only closing handles left -> instant return
    if (uv_loop_close(&loop) != 0) fprintf(stderr, "sup_f.fina_() [%d]: Loop closed with live handles\n", getpid());
    file.close_();
    state.store(0);
  }
private:
  inline sup_e open_(bool _from_start)
  {
    file.close_();
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0)
    {
      if (errno == ENOENT) return sup_e::LOG_NOT_FOUND;
      perror("sup_f.open_(): ---open---");
      return sup_e::IO_FAILURE;
    }
    file = sup_h(fd);
    struct stat st;
    if (fstat(file.fd, &st) < 0)
    {
      perror("sup_f.open_(): ---fstat---");
      file.close_();
      return sup_e::IO_FAILURE;
    }
    inode = st.st_ino;
    offset = _from_start ? 0 : st.st_size;
    return sup_e::OK;
  }
  static inline void on_tick_(uv_timer_t* _timer)
  {
    auto* self = static_cast<sup_f*>(_timer->data);
    if (self->halt.load()) return; // loop_a is on its way
    self->poll_();
  }
  inline void poll_()
  {
    struct stat st;
    // replaced by a new file (log removed and daemon restarted): read the new one from the top
    if (stat(path.c_str(), &st) == 0 && st.st_ino != inode)
    {
      partial.clear();
      if (!open_(true).ok_()) return;
    }
    if (!file.valid_() || fstat(file.fd, &st) < 0) return;
    if (st.st_size < offset) // truncated
    {
      offset = 0;
      partial.clear();
    }
    char buf[8192];
    while (offset < st.st_size && !halt.load())
    {
      ssize_t r = pread(file.fd, buf, sizeof(buf), offset);
      if (r < 0)
      {
        if (errno == EINTR) continue;
        perror("sup_f.poll_(): ---pread---");
        return;
      }
      if (r == 0) break;
      offset += r;
      partial.append(buf, static_cast<size_t>(r));
      size_t start = 0;
      for (size_t nl = partial.find('\n'); nl != std::string::npos; nl = partial.find('\n', start))
      {
        if (on_line) on_line(partial.substr(start, nl - start));
        start = nl + 1;
      }
      partial.erase(0, start);
    }
  }
};

/* --------------------------------------------- */
