#pragma once

#include <nlohmann/json.hpp>
#include "bld_a_types.hh"

#include <cmath>
#include <cerrno>
#include <string>

/* --------------------------------------------- */

struct lim_t // resource & timeout policy: pure validation and merge
{
  // 0 = absent; 1 = parsed into _out; -1 = present but invalid
  static inline short field_(const nlohmann::json& _j
    , const char* _name
    , int64_t& _out
    , std::string& _error
    , int64_t _max = INT64_MAX
  )
  {
    if (!_j.is_object()) return 0;
    auto it = _j.find(_name);
    if (it == _j.end() || it->is_null()) return 0;
    double d = 0;
    if (it->is_number()) d = it->get<double>();
    else if (it->is_string())
    {
      const std::string& s = it->get_ref<const std::string&>();
      if (s.empty())
      {
        _error = std::string(_name) + " must be a number";
        return -1;
      }
      char* end = NULL;
      errno = 0;
      d = std::strtod(s.c_str(), &end);
      if (end != s.c_str() + s.size() || errno == ERANGE)
      {
        _error = std::string(_name) + " must be a number";
        return -1;
      }
    }
    else
    {
      _error = std::string(_name) + " must be a number";
      return -1;
    }
    if (!std::isfinite(d) || d <= 0)
    {
      _error = std::string(_name) + " must be a finite number greater than zero";
      return -1;
    }
    d = std::ceil(d);
    if (d >= 9223372036854775807.0)
    {
      _error = std::string(_name) + " is out of range";
      return -1;
    }
    if (d > static_cast<double>(_max))
    {
      _error = std::string(_name) + " must not exceed " + std::to_string(_max);
      return -1;
    }
    _out = static_cast<int64_t>(d);
    return 1;
  }
  // every field is checked so a single reply names all offending fields
  static inline short merge_(const nlohmann::json& _overrides
    , const lim_c& _defaults
    , lim_c& _limits
    , std::string& _error
  )
  {
    lim_c merged = _defaults;
    std::string errors;
    auto check_ = [&](const char* _name, int64_t& _slot, int64_t _max = INT64_MAX)
    {
      std::string e;
      if (field_(_overrides, _name, _slot, e, _max) < 0)
      {
        if (!errors.empty()) errors += "; ";
        errors += e;
      }
    };
    check_("memory", merged.memory);
    check_("cpuPeriod", merged.cpu_period);
    check_("cpuQuota", merged.cpu_quota);
    if (_overrides.is_object() && _overrides.contains("timeoutMs")) check_("timeoutMs", merged.timeout_ms, BLD_A_TIMEOUT_MAX_MS);
    else check_("timeout", merged.timeout_ms, BLD_A_TIMEOUT_MAX_MS); // field name used by early clients
    if (!errors.empty())
    {
      _error = errors;
      return -1;
    }
    _limits = merged;
    return 0;
  }
  static inline nlohmann::json to_json_(const lim_c& _limits)
  {
    return {
      {"memory", _limits.memory},
      {"cpuPeriod", _limits.cpu_period},
      {"cpuQuota", _limits.cpu_quota},
      {"timeoutMs", _limits.timeout_ms}
    };
  }
};

/* --------------------------------------------- */
