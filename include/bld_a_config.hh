#pragma once

#include <nlohmann/json.hpp>
#include "bld_a_types.hh"
#include "bld_a_policy.hh"

#include <cstdlib>
#include <cerrno>
#include <string>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>

/* --------------------------------------------- */

struct cfg_c // process settings fixed at startup
{
  std::string host = "0.0.0.0";
  uint16_t port = 3001;
  std::string docker_host = "unix:///var/run/docker.sock";
  std::string docker_api = "v1.41";
  int docker_timeout_ms = 30000;  // per engine call, except wait
  size_t max_source_bytes = 96000; // the script is one argv string, capped at 128 KiB by the kernel
  size_t max_body_bytes = 10 * 1024 * 1024;
  int stop_grace_s = 0;
};

class cfg_t // settings plus the mutable default limits
{
private:
  cfg_c settings;
  lim_c limits;
  mutable std::shared_mutex limits_m;
  static inline const char* env_(const char* _name)
  {
    const char* v = getenv(_name);
    return (v != NULL && *v != '\0') ? v : NULL;
  }
  static inline int64_t integer_(const char* _name, const char* _value, int64_t _min, int64_t _max)
  {
    char* end = NULL;
    errno = 0;
    long long v = strtoll(_value, &end, 10);
    if (end == _value || *end != '\0' || errno == ERANGE || v < _min || v > _max)
    {
      throw std::runtime_error(std::string("cfg_t.load_(): ") + _name + " must be an integer in [" + std::to_string(_min) + ", " + std::to_string(_max) + "], got " + _value);
    }
    return v;
  }
public:
  cfg_t() = default;
  cfg_t(const cfg_c& _settings, const lim_c& _limits) : settings(_settings), limits(_limits) {}
  cfg_t(const cfg_t&) = delete;
  cfg_t& operator=(const cfg_t&) = delete;
  // environment first, then the first positional argument as the port
  inline void load_(int argc = 0, char** argv = NULL)
  {
    if (const char* v = env_("HOST")) settings.host = v;
    if (const char* v = env_("PORT")) settings.port = static_cast<uint16_t>(integer_("PORT", v, 1, 65535));
    if (const char* v = env_("DOCKER_HOST")) settings.docker_host = v;
    if (const char* v = env_("DOCKER_API_VERSION")) settings.docker_api = v;
    if (const char* v = env_("BLD_DOCKER_TIMEOUT_MS")) settings.docker_timeout_ms = static_cast<int>(integer_("BLD_DOCKER_TIMEOUT_MS", v, 0, 3600000));
    if (const char* v = env_("BLD_MAX_SOURCE_BYTES")) settings.max_source_bytes = static_cast<size_t>(integer_("BLD_MAX_SOURCE_BYTES", v, 1, 120000));
    if (const char* v = env_("BLD_MAX_BODY_BYTES")) settings.max_body_bytes = static_cast<size_t>(integer_("BLD_MAX_BODY_BYTES", v, 1024, INT64_C(1) << 32));
    if (const char* v = env_("BLD_STOP_GRACE_S")) settings.stop_grace_s = static_cast<int>(integer_("BLD_STOP_GRACE_S", v, 0, 600));
    nlohmann::json overrides = nlohmann::json::object();
    if (const char* v = env_("BLD_MEMORY")) overrides["memory"] = v;
    if (const char* v = env_("BLD_CPU_PERIOD")) overrides["cpuPeriod"] = v;
    if (const char* v = env_("BLD_CPU_QUOTA")) overrides["cpuQuota"] = v;
    if (const char* v = env_("BLD_TIMEOUT_MS")) overrides["timeoutMs"] = v;
    std::string error;
    lim_c merged;
    if (lim_t::merge_(overrides, limits, merged, error) != 0) throw std::runtime_error("cfg_t.load_(): " + error);
    {
      std::unique_lock<std::shared_mutex> lock(limits_m);
      limits = merged;
    }
    if (argc > 1 && argv != NULL && argv[1] != NULL) settings.port = static_cast<uint16_t>(integer_("port argument", argv[1], 1, 65535));
  }
  inline const cfg_c& settings_() const { return settings; }
  inline lim_c snapshot_() const // a copy: requests never observe a half-applied update
  {
    std::shared_lock<std::shared_mutex> lock(limits_m);
    return limits;
  }
  // 0 = stored; -1 = rejected and nothing changed
  inline short update_(const nlohmann::json& _overrides, std::string& _error)
  {
    if (!_overrides.is_object())
    {
      _error = "config update must be a JSON object";
      return -1;
    }
    for (const auto& item : _overrides.items())
    {
      const std::string& key = item.key();
      if (key != "memory" && key != "cpuPeriod" && key != "cpuQuota" && key != "timeoutMs")
      {
        _error = "unknown config field " + key;
        return -1;
      }
    }
    std::unique_lock<std::shared_mutex> lock(limits_m);
    lim_c merged;
    if (lim_t::merge_(_overrides, limits, merged, _error) != 0) return -1;
    limits = merged;
    return 0;
  }
  inline nlohmann::json json_() const
  {
    return lim_t::to_json_(snapshot_());
  }
};

/* --------------------------------------------- */
