#pragma once

#include <nlohmann/json.hpp>
#include "sup_a_types.hh"
#include "sup_a_config.hh"
#include "sup_a_record.hh"

#include <cstdio>
#include <unistd.h>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <string>
#include <system_error>
#include <filesystem>
#include <functional>

/* --------------------------------------------- */

struct sup_k // exclusive table lock: flock held for the lifetime of the object
{
  sup_h handle;
  sup_k() = default;
  explicit sup_k(const std::string& _path) { lock_(_path); }
  sup_k(const sup_k&) = delete;
  sup_k& operator=(const sup_k&) = delete;
  sup_k(sup_k&&) noexcept = default;
  sup_k& operator=(sup_k&&) noexcept = default;
  ~sup_k() { unlock_(); }
  inline bool held_() const noexcept { return handle.valid_(); }
  inline bool lock_(const std::string& _path)
  {
    unlock_();
    // own open file description per lock: threads of this process exclude each other too
    int fd = open(_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0)
    {
      perror("sup_k.lock_(): ---open---");
      return false;
    }
    while (flock(fd, LOCK_EX) < 0)
    {
      if (errno == EINTR) continue;
      perror("sup_k.lock_(): ---flock---");
      close(fd);
      return false;
    }
    handle = sup_h(fd);
    return true;
  }
  inline void unlock_()
  {
    if (!handle.valid_()) return;
    flock(handle.fd, LOCK_UN);
    handle.close_();
  }
};

/* --------------------------------------------- */

using sup_u = std::function<bool(sup_t&)>; // table mutation: true = changed, persist

struct sup_d // durable process table store
{
  sup_o options;

  sup_d() = default;
  explicit sup_d(const sup_o& _options) : options(_options) {}

  inline sup_e prepare_() const
  {
    std::error_code ec;
    std::filesystem::create_directories(options.dir_(), ec);
    if (ec)
    {
      fprintf(stderr, "sup_d.prepare_() [%d]: Failed to create %s: %s\n", getpid(), options.dir_().c_str(), ec.message().c_str());
      return sup_e::IO_FAILURE;
    }
    return sup_e::OK;
  }

  inline sup_k lock_() const
  {
    sup_k lock;
    if (prepare_().ok_()) lock.lock_(options.lock_());
    return lock;
  }

  inline sup_e load_(sup_t& _table) const
  {
    _table.records.clear();
    const std::string path = options.table_();
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0)
    {
      if (errno == ENOENT) return sup_e::OK; // no table yet
      perror("sup_d.load_(): ---open---");
      return sup_e::IO_FAILURE;
    }
    sup_h handle(fd);
    std::string content;
    char buf[4096];
    while (true)
    {
      ssize_t r = read(handle.fd, buf, sizeof(buf));
      if (r > 0) content.append(buf, static_cast<size_t>(r));
      else if (r == 0) break;
      else if (errno == EINTR) continue;
      else
      {
        perror("sup_d.load_(): ---read---");
        return sup_e::IO_FAILURE;
      }
    }
    if (content.find_first_not_of(" \t\r\n") == std::string::npos) return sup_e::OK; // empty file
    nlohmann::json j = nlohmann::json::parse(content, nullptr, false);
    if (j.is_discarded() || !sup_t::from_json_(j, _table))
    {
      fprintf(stderr, "sup_d.load_() [%d]: Malformed process table %s\n", getpid(), path.c_str());
      _table.records.clear();
      return sup_e::IO_FAILURE;
    }
    return sup_e::OK;
  }

  // temp file + fsync + rename: readers see the old or the new table, never a torn one
  inline sup_e save_(const sup_t& _table) const
  {
    if (sup_e e = prepare_(); !e.ok_()) return e;
    const std::string path = options.table_();
    const std::string temp = path + "." + std::to_string(getpid()) + ".tmp";
    std::string content;
    try { content = _table.to_json_().dump(2); }
    catch (const nlohmann::json::exception& ex)
    {
      fprintf(stderr, "sup_d.save_() [%d]: Failed to serialize table: %s\n", getpid(), ex.what());
      return sup_e::IO_FAILURE;
    }
    content.push_back('\n');
    int fd = open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0)
    {
      perror("sup_d.save_(): ---open---");
      return sup_e::IO_FAILURE;
    }
    sup_h handle(fd);
    if (!handle.write_(content))
    {
      perror("sup_d.save_(): ---write---");
      handle.close_();
      unlink(temp.c_str());
      return sup_e::IO_FAILURE;
    }
    if (fsync(handle.fd) < 0)
    {
      perror("sup_d.save_(): ---fsync---");
      handle.close_();
      unlink(temp.c_str());
      return sup_e::IO_FAILURE;
    }
    handle.close_();
    if (rename(temp.c_str(), path.c_str()) < 0)
    {
      perror("sup_d.save_(): ---rename---");
      unlink(temp.c_str());
      return sup_e::IO_FAILURE;
    }
    return sup_e::OK;
  }

  // lock, load, mutate, save if changed
  inline sup_e update_(const sup_u& _mutate) const
  {
    sup_k lock = lock_();
    if (!lock.held_()) return sup_e::IO_FAILURE;
    sup_t table;
    if (sup_e e = load_(table); !e.ok_()) return e;
    if (!_mutate(table)) return sup_e::OK;
    return save_(table);
  }

  inline sup_e upsert_(const sup_r& _record) const
  {
    return update_([&](sup_t& t) { t.upsert_(_record); return true; });
  }

  inline sup_e remove_(const std::string& _name) const
  {
    bool found = false;
    sup_e e = update_([&](sup_t& t) { found = t.remove_(_name); return found; });
    if (!e.ok_()) return e;
    return found ? sup_e::OK : sup_e::NOT_FOUND;
  }

  inline sup_e find_(const std::string& _name, sup_r& _record) const
  {
    sup_t table;
    if (sup_e e = load_(table); !e.ok_()) return e;
    const sup_r* r = table.find_(_name);
    if (!r) return sup_e::NOT_FOUND;
    _record = *r;
    return sup_e::OK;
  }
};

/* --------------------------------------------- */
