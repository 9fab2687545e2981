#pragma once

#include <cstdlib>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <cstdio>
#include <ctime>
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <string>
#include <ostream>
#include <type_traits>

/* --------------------------------------------- */

#ifndef MAX2_
#define MAX2_(a, b) ((a) > (b) ? (a) : (b))
#endif
#ifndef MIN2_
#define MIN2_(a, b) ((a) < (b) ? (a) : (b))
#endif

#define SUP_A_DIR ".sup_a"
#define SUP_A_TABLE "processes.json"
#define SUP_A_LOGS "logs"
#define SUP_A_MARKER "SUP_A_DAEMON"

/* --------------------------------------------- */

struct tim_t
{
  time_t   utcs;  // seconds since epoch (UTC)
  int64_t  nsec;  // nanoseconds (0 <= nsec < 1e9)

  tim_t() : utcs(0), nsec(0) {}

  explicit tim_t(const struct timespec& _ts) : utcs(_ts.tv_sec), nsec(_ts.tv_nsec) {}

  tim_t(time_t _secs, int64_t _nsec) : utcs(_secs), nsec(_nsec) {}

  static inline tim_t now_()
  {
    tim_t t;
    struct timespec ts;
    if (clock_gettime(CLOCK_REALTIME, &ts) == 0) t = tim_t(ts);
    else t.utcs = time(NULL);
    return t;
  }

  inline double secs_() const { return static_cast<double>(utcs) + static_cast<double>(nsec) / 1e9; }

  inline std::string rfc3339_() const // 2026-10-19T12:00:00.123456789Z
  {
    char buffer[64];
    struct tm t;
    gmtime_r(&utcs, &t);
    size_t len = strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &t);
    if (len == 0) return std::string();
    snprintf(buffer + len, sizeof(buffer) - len, ".%09ldZ", static_cast<long>(nsec));
    return std::string(buffer);
  }

  // reads exactly _n decimal digits, no sign or padding
  static inline bool digits_(const char* _s, int _n, int& _out)
  {
    _out = 0;
    for (int i = 0; i < _n; ++i)
    {
      if (_s[i] < '0' || _s[i] > '9') return false;
      _out = _out * 10 + (_s[i] - '0');
    }
    return true;
  }

  // accepts YYYY-MM-DDTHH:MM:SS[.frac](Z|+HH:MM|-HH:MM), 't'/' ' separator and 'z' tolerated
  static inline bool parse_(const std::string& _str, tim_t& _t)
  {
    struct tm t;
    memset(&t, 0, sizeof(t));
    if (_str.size() < 20) return false;
    const char* s = _str.c_str();
    if (!digits_(s, 4, t.tm_year) || s[4] != '-'
      || !digits_(s + 5, 2, t.tm_mon) || s[7] != '-'
      || !digits_(s + 8, 2, t.tm_mday)
      || (s[10] != 'T' && s[10] != 't' && s[10] != ' ')
      || !digits_(s + 11, 2, t.tm_hour) || s[13] != ':'
      || !digits_(s + 14, 2, t.tm_min) || s[16] != ':'
      || !digits_(s + 17, 2, t.tm_sec)
    ) return false;
    if (t.tm_mon < 1 || t.tm_mon > 12 || t.tm_mday < 1 || t.tm_mday > 31
      || t.tm_hour > 23 || t.tm_min > 59 || t.tm_sec > 60
    ) return false;
    t.tm_year -= 1900;
    t.tm_mon -= 1;
    s += 19;
    int64_t nsec = 0;
    if (*s == '.')
    {
      ++s;
      int digits = 0;
      while (*s >= '0' && *s <= '9')
      {
        if (digits < 9)
        {
          nsec = nsec * 10 + (*s - '0');
          ++digits;
        }
        ++s;
      }
      if (digits == 0) return false;
      for (; digits < 9; ++digits) nsec *= 10;
    }
    long offset = 0;
    if (*s == 'Z' || *s == 'z') ++s;
    else if (*s == '+' || *s == '-')
    {
      int oh = 0, om = 0;
      if (!digits_(s + 1, 2, oh) || s[3] != ':' || !digits_(s + 4, 2, om)) return false;
      if (oh > 23 || om > 59) return false;
      offset = (oh * 3600L + om * 60L) * (*s == '-' ? -1 : 1);
      s += 6;
    }
    else return false;
    if (*s != '\0') return false;
    time_t secs = timegm(&t);
    if (secs == static_cast<time_t>(-1)) return false;
    _t = tim_t(secs - offset, nsec);
    return true;
  }
};

/* --------------------------------------------- */

struct sup_e // error
{
  enum value : uint8_t
  {
    OK = 0,
    ALREADY_RUNNING = 1,
    NOT_RUNNING = 2,
    NOT_FOUND = 3,
    LOG_NOT_FOUND = 4,
    ORPHANED_PROCESS = 5,
    IO_FAILURE = 6,
    SPAWN_FAILURE = 7,
    SIGNAL_FAILURE = 8,
    INVALID_NAME = 9
  };
  value v;
  constexpr sup_e() noexcept : v(OK) {}
  constexpr sup_e(value val) noexcept : v(val) {}
  constexpr operator value() const noexcept { return v; } // use as enum e.g. sup_e::NOT_FOUND
  explicit operator bool() = delete; // ban if(sup_e)
  constexpr bool ok_() const noexcept { return v == OK; }
  constexpr int exit_() const noexcept { return v == OK ? 0 : 10 + static_cast<int>(v); } // CLI exit status
};

struct sup_s // status
{
  enum value : uint8_t
  {
    RUNNING = 0,
    STOPPED = 1,
    CRASHED = 2
  };
  value v;
  constexpr sup_s() noexcept : v(STOPPED) {}
  constexpr sup_s(value val) noexcept : v(val) {}
  constexpr operator value() const noexcept { return v; }
  explicit operator bool() = delete;
  static inline bool parse_(const std::string& _str, sup_s& _s) noexcept
  {
    if (_str == "running") _s = RUNNING;
    else if (_str == "stopped") _s = STOPPED;
    else if (_str == "crashed") _s = CRASHED;
    else return false;
    return true;
  }
};

namespace std
{
  template <typename T, typename = std::enable_if_t<std::is_same_v<T, sup_e> || std::is_same_v<T, sup_s>>>
  inline std::string to_string(const T x)
  {
    if constexpr (std::is_same_v<T, sup_s>)
    {
      switch (x.v)
      {
        case sup_s::RUNNING: return "running";
        case sup_s::CRASHED: return "crashed";
        default:             return "stopped";
      }
    }
    else
    {
      switch (x.v)
      {
        case sup_e::OK:               return "OK";
        case sup_e::ALREADY_RUNNING:  return "ALREADY_RUNNING";
        case sup_e::NOT_RUNNING:      return "NOT_RUNNING";
        case sup_e::NOT_FOUND:        return "NOT_FOUND";
        case sup_e::LOG_NOT_FOUND:    return "LOG_NOT_FOUND";
        case sup_e::ORPHANED_PROCESS: return "ORPHANED_PROCESS";
        case sup_e::IO_FAILURE:       return "IO_FAILURE";
        case sup_e::SPAWN_FAILURE:    return "SPAWN_FAILURE";
        case sup_e::SIGNAL_FAILURE:   return "SIGNAL_FAILURE";
        default:                      return "INVALID_NAME";
      }
    }
  }
}
template <typename T, typename = std::enable_if_t<std::is_same_v<T, sup_e> || std::is_same_v<T, sup_s>>>
inline std::ostream& operator<<(std::ostream& os, const T x)
{
  return os << std::to_string(x);
}

/* --------------------------------------------- */

struct sup_h // owned file descriptor
{
  int fd = -1;
  sup_h() = default;
  explicit sup_h(int _fd) noexcept : fd(_fd) {}
  sup_h(const sup_h&) = delete;
  sup_h& operator=(const sup_h&) = delete;
  sup_h(sup_h&& other) noexcept : fd(other.fd) { other.fd = -1; }
  sup_h& operator=(sup_h&& other) noexcept
  {
    if (this != &other)
    {
      close_();
      fd = other.fd;
      other.fd = -1;
    }
    return *this;
  }
  ~sup_h() { close_(); }
  inline bool valid_() const noexcept { return fd >= 0; }
  inline void close_() noexcept
  {
    if (fd >= 0)
    {
      ::close(fd);
      fd = -1;
    }
  }
  inline bool write_(const std::string& _text) const noexcept // whole buffer or fail
  {
    size_t done = 0;
    while (done < _text.size())
    {
      ssize_t w = ::write(fd, _text.data() + done, _text.size() - done);
      if (w < 0)
      {
        if (errno == EINTR) continue;
        return false;
      }
      done += static_cast<size_t>(w);
    }
    return true;
  }
};

/* --------------------------------------------- */

inline std::string format_duration_(int64_t _secs) // 42s, 3m7s, 5h12m, 2d4h
{
  if (_secs < 0) _secs = 0;
  char buffer[32];
  if (_secs < 60) snprintf(buffer, sizeof(buffer), "%llds", static_cast<long long>(_secs));
  else if (_secs < 3600) snprintf(buffer, sizeof(buffer), "%lldm%llds", static_cast<long long>(_secs / 60), static_cast<long long>(_secs % 60));
  else if (_secs < 86400) snprintf(buffer, sizeof(buffer), "%lldh%lldm", static_cast<long long>(_secs / 3600), static_cast<long long>((_secs / 60) % 60));
  else snprintf(buffer, sizeof(buffer), "%lldd%lldh", static_cast<long long>(_secs / 86400), static_cast<long long>((_secs / 3600) % 24));
  return std::string(buffer);
}

inline std::string format_bytes_(uint64_t _bytes) // 512 B, 1.5 KB, 3.2 MB
{
  char buffer[32];
  if (_bytes < 1024)
  {
    snprintf(buffer, sizeof(buffer), "%llu B", static_cast<unsigned long long>(_bytes));
    return std::string(buffer);
  }
  uint64_t div = 1024;
  int exp = 0;
  for (uint64_t n = _bytes / 1024; n >= 1024; n /= 1024)
  {
    div *= 1024;
    ++exp;
  }
  snprintf(buffer, sizeof(buffer), "%.1f %cB", static_cast<double>(_bytes) / static_cast<double>(div), "KMGTPE"[exp]);
  return std::string(buffer);
}

inline bool parse_duration_(const std::string& _str, int64_t& _secs) // 90s, 30m, 24h, 7d, 1h30m
{
  if (_str.empty()) return false;
  int64_t total = 0;
  size_t i = 0;
  while (i < _str.size())
  {
    if (_str[i] < '0' || _str[i] > '9') return false;
    int64_t n = 0;
    while (i < _str.size() && _str[i] >= '0' && _str[i] <= '9') n = n * 10 + (_str[i++] - '0');
    if (i == _str.size()) return false; // unit required
    switch (_str[i++])
    {
      case 's': total += n; break;
      case 'm': total += n * 60; break;
      case 'h': total += n * 3600; break;
      case 'd': total += n * 86400; break;
      default: return false;
    }
  }
  _secs = total;
  return true;
}

/* --------------------------------------------- */
