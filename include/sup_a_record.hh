#pragma once

#include <nlohmann/json.hpp>
#include "sup_a_types.hh"

#include <sys/types.h>
#include <climits>
#include <cstdint>
#include <string>
#include <vector>
#include <algorithm>

/* --------------------------------------------- */

struct sup_r // process record
{
  pid_t pid = -1;
  std::string name;
  std::string command;
  tim_t start_time;
  sup_s status = sup_s::STOPPED;
  std::string log_file;
  std::string project;

  sup_r() = default;
  sup_r(pid_t _pid
    , const std::string& _name
    , const std::string& _command
    , const tim_t& _start_time
    , sup_s _status
    , const std::string& _log_file
    , const std::string& _project
  ) : pid(_pid), name(_name), command(_command), start_time(_start_time)
    , status(_status), log_file(_log_file), project(_project) {}

  inline bool running_() const noexcept { return status == sup_s::RUNNING; }
  inline int64_t uptime_(const tim_t& _now = tim_t::now_()) const { return static_cast<int64_t>(_now.utcs - start_time.utcs); }

  nlohmann::json to_json_() const
  {
    return {
      {"pid", static_cast<int>(pid)},
      {"name", name},
      {"command", command},
      {"start_time", start_time.rfc3339_()},
      {"status", std::to_string(status)},
      {"log_file", log_file},
      {"project", project}
    };
  }

  static inline bool from_json_(const nlohmann::json& _j, sup_r& _r)
  {
    if (!_j.is_object()) return false;
    if (!_j.contains("pid") || !_j["pid"].is_number_integer()) return false;
    if (!_j.contains("name") || !_j["name"].is_string()) return false;
    int64_t pid = _j["pid"].get<int64_t>();
    if (pid < 2 || pid > INT_MAX) return false;
    _r.pid = static_cast<pid_t>(pid);
    _r.name = _j["name"].get<std::string>();
    if (_j.contains("command") && _j["command"].is_string()) _r.command = _j["command"].get<std::string>();
    if (_j.contains("start_time") && _j["start_time"].is_string())
    {
      if (!tim_t::parse_(_j["start_time"].get<std::string>(), _r.start_time)) return false;
    }
    if (_j.contains("status") && _j["status"].is_string())
    {
      if (!sup_s::parse_(_j["status"].get<std::string>(), _r.status)) return false;
    }
    if (_j.contains("log_file") && _j["log_file"].is_string()) _r.log_file = _j["log_file"].get<std::string>();
    if (_j.contains("project") && _j["project"].is_string()) _r.project = _j["project"].get<std::string>();
    return true;
  }
};

/* --------------------------------------------- */

struct sup_t // process table: insertion ordered, one record per name
{
  std::vector<sup_r> records;

  inline size_t size_() const noexcept { return records.size(); }
  inline bool empty_() const noexcept { return records.empty(); }
  inline sup_r* find_(const std::string& _name)
  {
    auto it = std::find_if(records.begin(), records.end(), [&](const sup_r& r) { return r.name == _name; });
    return it == records.end() ? NULL : &*it;
  }
  inline const sup_r* find_(const std::string& _name) const
  {
    auto it = std::find_if(records.begin(), records.end(), [&](const sup_r& r) { return r.name == _name; });
    return it == records.end() ? NULL : &*it;
  }
  inline void upsert_(const sup_r& _record) // same name replaces in place
  {
    if (sup_r* r = find_(_record.name)) *r = _record;
    else records.push_back(_record);
  }
  inline bool remove_(const std::string& _name)
  {
    auto it = std::remove_if(records.begin(), records.end(), [&](const sup_r& r) { return r.name == _name; });
    if (it == records.end()) return false;
    records.erase(it, records.end());
    return true;
  }

  nlohmann::json to_json_() const
  {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : records) arr.push_back(r.to_json_());
    return arr;
  }

  // a duplicate name in the file keeps the last occurrence
  static inline bool from_json_(const nlohmann::json& _j, sup_t& _t)
  {
    _t.records.clear();
    if (_j.is_null()) return true; // an empty table may be stored as null
    if (!_j.is_array()) return false;
    for (const auto& item : _j)
    {
      sup_r r;
      if (!sup_r::from_json_(item, r)) return false;
      _t.upsert_(r);
    }
    return true;
  }
};

/* --------------------------------------------- */
