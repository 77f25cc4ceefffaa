#pragma once

#include <nlohmann/json.hpp>
#include "bld_a_types.hh"
#include "bld_a_server.hh"

#include <string>
#include <vector>
#include <stdexcept>

/* --------------------------------------------- */

struct dkr_c // sandbox spec
{
  std::string name;
  std::string image;
  std::vector<std::string> cmd;   // argv, no shell interpolation on the host side
  std::vector<std::string> env;   // "KEY=VALUE"
  std::vector<std::string> binds; // "host:sandbox:rw"
  std::string user = "root";
  int64_t memory = 0;             // bytes
  int64_t cpu_period = 0;         // us
  int64_t cpu_quota = 0;          // us
  inline nlohmann::json json_() const // engine create body
  {
    return {
      {"Image", image},
      {"Cmd", cmd},
      {"Env", env},
      {"User", user},
      {"AttachStdout", true},
      {"AttachStderr", true},
      {"Tty", false},
      {"HostConfig", {
        {"Binds", binds},
        {"Memory", memory},
        {"CpuPeriod", cpu_period},
        {"CpuQuota", cpu_quota}
      }}
    };
  }
};

struct dkr_h // sandbox handle
{
  std::string id;
  std::string name;
};

class dkr_i // container runtime; every call throws std::runtime_error on failure
{
public:
  virtual ~dkr_i() = default;
  virtual dkr_h create_(const dkr_c& _spec) = 0;
  virtual void start_(const dkr_h& _h) = 0;
  virtual int64_t wait_(const dkr_h& _h) = 0; // exit status
  virtual std::string logs_(const dkr_h& _h) = 0; // framed stdout/stderr
  virtual std::string archive_(const dkr_h& _h, const std::string& _path) = 0; // tar of _path
  virtual void remove_(const dkr_h& _h, bool _force) = 0;
  virtual void stop_(const dkr_h& _h, int _grace_s) = 0;
};

/* --------------------------------------------- */

class dkr_t : public dkr_i // Docker Engine API over its unix socket
{
private:
  std::string socket_path;
  std::string api_version;
  int timeout_ms;
  inline srv_r call_(const std::string& _method
    , const std::string& _path
    , const std::string& _body
    , int _timeout_ms
  ) const
  {
    std::unordered_map<std::string, std::string> headers;
    if (!_body.empty()) headers.emplace("Content-Type", "application/json");
    std::string raw = srv_t::request_unix_(socket_path
      , _method
      , "/" + api_version + _path
      , _body
      , headers
      , _timeout_ms
    );
    if (raw.empty()) throw std::runtime_error("dkr_t.call_(): No response from engine at " + socket_path + " for " + _method + " " + _path);
    srv_r r(raw);
    if (r.status == 0) throw std::runtime_error("dkr_t.call_(): Malformed response for " + _method + " " + _path);
    return r;
  }
  static inline void check_(const srv_r& _r, std::initializer_list<int> _accepted, const std::string& _what)
  {
    for (int code : _accepted)
    {
      if (_r.status == code) return;
    }
    std::string message = _r.body;
    nlohmann::json j = _r.json_();
    if (j.is_object() && j.contains("message") && j["message"].is_string()) message = j["message"].get<std::string>();
    throw std::runtime_error(_what + " [" + std::to_string(_r.status) + "]: " + message);
  }
  static inline std::string path_of_(const std::string& _host) // "unix:///var/run/docker.sock" -> "/var/run/docker.sock"
  {
    static const std::string scheme = "unix://";
    if (_host.empty()) return "/var/run/docker.sock";
    if (_host.compare(0, scheme.size(), scheme) == 0) return _host.substr(scheme.size());
    if (_host[0] == '/') return _host;
    throw std::runtime_error("dkr_t.path_of_(): Unsupported engine address " + _host + " (only unix sockets)");
  }
public:
  explicit dkr_t(const std::string& _host = "unix:///var/run/docker.sock"
    , const std::string& _api_version = "v1.41"
    , int _timeout_ms = 30000
  ) : socket_path(path_of_(_host)), api_version(_api_version), timeout_ms(_timeout_ms)
  {
    if (!api_version.empty() && api_version[0] != 'v') api_version = "v" + api_version;
  }
  inline const std::string& socket_path_() const { return socket_path; }
  inline bool ping_() const
  {
    try
    {
      srv_r r = call_("GET", "/_ping", "", 3000);
      return r.status == 200;
    }
    catch (const std::exception& e)
    {
      fprintf(stderr, "dkr_t.ping_() [%d]: %s\n", getpid(), e.what());
      return false;
    }
  }
  inline bool image_has_(const std::string& _image) const
  {
    srv_r r = call_("GET", "/images/" + srv_q::encode_(_image, ":/") + "/json", "", timeout_ms);
    if (r.status == 404) return false;
    check_(r, {200}, "dkr_t.image_has_(): " + _image);
    return true;
  }
  dkr_h create_(const dkr_c& _spec) override
  {
    srv_r r = call_("POST", "/containers/create?name=" + srv_q::encode_(_spec.name), _spec.json_().dump(), timeout_ms);
    check_(r, {201}, "dkr_t.create_(): " + _spec.name);
    nlohmann::json j = r.json_();
    if (!j.is_object() || !j.contains("Id") || !j["Id"].is_string())
    {
      throw std::runtime_error("dkr_t.create_(): Engine reply carries no container id for " + _spec.name);
    }
    return {j["Id"].get<std::string>(), _spec.name};
  }
  void start_(const dkr_h& _h) override
  {
    srv_r r = call_("POST", "/containers/" + _h.id + "/start", "", timeout_ms);
    check_(r, {204, 304}, "dkr_t.start_(): " + _h.name);
  }
  int64_t wait_(const dkr_h& _h) override // blocks until exit; the caller owns the deadline
  {
    srv_r r = call_("POST", "/containers/" + _h.id + "/wait", "", 0);
    check_(r, {200}, "dkr_t.wait_(): " + _h.name);
    nlohmann::json j = r.json_();
    if (!j.is_object() || !j.contains("StatusCode") || !j["StatusCode"].is_number_integer())
    {
      throw std::runtime_error("dkr_t.wait_(): Engine reply carries no exit status for " + _h.name);
    }
    if (j.contains("Error") && j["Error"].is_object() && j["Error"].contains("Message"))
    {
      const auto& m = j["Error"]["Message"];
      if (m.is_string() && !m.get_ref<const std::string&>().empty())
      {
        throw std::runtime_error("dkr_t.wait_(): " + _h.name + ": " + m.get<std::string>());
      }
    }
    return j["StatusCode"].get<int64_t>();
  }
  std::string logs_(const dkr_h& _h) override
  {
    srv_r r = call_("GET", "/containers/" + _h.id + "/logs?stdout=1&stderr=1", "", timeout_ms);
    check_(r, {200}, "dkr_t.logs_(): " + _h.name);
    return std::move(r.body);
  }
  std::string archive_(const dkr_h& _h, const std::string& _path) override
  {
    srv_r r = call_("GET", "/containers/" + _h.id + "/archive?path=" + srv_q::encode_(_path), "", timeout_ms);
    check_(r, {200}, "dkr_t.archive_(): " + _h.name + ":" + _path);
    return std::move(r.body);
  }
  void remove_(const dkr_h& _h, bool _force) override
  {
    srv_r r = call_("DELETE", "/containers/" + _h.id + (_force ? "?force=1" : ""), "", timeout_ms);
    check_(r, {204}, "dkr_t.remove_(): " + _h.name);
  }
  void stop_(const dkr_h& _h, int _grace_s) override
  {
    int budget = timeout_ms > 0 ? timeout_ms + _grace_s * 1000 : 0; // the engine answers after the grace period
    srv_r r = call_("POST", "/containers/" + _h.id + "/stop?t=" + std::to_string(_grace_s), "", budget);
    check_(r, {204, 304}, "dkr_t.stop_(): " + _h.name);
  }
};

/* --------------------------------------------- */
