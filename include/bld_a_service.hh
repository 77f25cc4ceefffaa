#pragma once

#include <nlohmann/json.hpp>
#include "bld_a_types.hh"
#include "bld_a_policy.hh"
#include "bld_a_source.hh"
#include "bld_a_job.hh"
#include "bld_a_config.hh"
#include "bld_a_server.hh"

#include <memory>
#include <string>

/* --------------------------------------------- */

struct svc_r // reply: http status + json body
{
  int status = 200;
  nlohmann::json body;
};

class svc_t // compile service: request -> validation -> job -> reply
{
private:
  cfg_t& cfg;
  job_t jobs;
  static inline svc_r fail_(int _status, err_k _kind, const std::string& _error)
  {
    return {_status, {{"success", false}, {"errorKind", _kind.name_()}, {"error", _error}}};
  }
public:
  svc_t(cfg_t& _cfg, std::shared_ptr<dkr_i> _rt)
    : cfg(_cfg), jobs(std::move(_rt)) {}
  svc_t(const svc_t&) = delete;
  svc_t& operator=(const svc_t&) = delete;
  static inline int status_(err_k _kind) noexcept
  {
    return _kind == err_k::INFRASTRUCTURE ? 500 : 400;
  }
  static inline svc_r result_(const job_r& _r, const std::string& _framework)
  {
    if (_r.ok_())
    {
      return {200, {
        {"success", true},
        {"framework", _framework},
        {"files", _r.files},
        {"compilationTimeMs", _r.duration_ms}
      }};
    }
    svc_r reply = fail_(status_(_r.kind), _r.kind, _r.error);
    if (_r.has_transcript) reply.body["transcript"] = _r.transcript;
    return reply;
  }
  // every check here runs before a sandbox exists
  inline short validate_(const nlohmann::json& _body, job_c& _job, std::string& _error) const
  {
    if (!_body.is_object())
    {
      _error = "Request body must be a JSON object";
      return -1;
    }
    std::string framework = "angular";
    auto fit = _body.find("framework");
    if (fit != _body.end() && !fit->is_null())
    {
      if (!fit->is_string())
      {
        _error = "framework must be a string";
        return -2;
      }
      framework = fit->get<std::string>();
    }
    _job.profile = frm_p::find_(framework);
    if (_job.profile == NULL)
    {
      _error = "Unsupported framework: " + framework;
      return -3;
    }
    auto sit = _body.find("sourceCode");
    if (sit == _body.end() || sit->is_null()) sit = _body.find("code");
    if (sit == _body.end() || !sit->is_string() || sit->get_ref<const std::string&>().empty())
    {
      _error = "Invalid code provided";
      return -4;
    }
    const std::string& source = sit->get_ref<const std::string&>();
    if (source.size() > cfg.settings_().max_source_bytes)
    {
      _error = "Source exceeds " + std::to_string(cfg.settings_().max_source_bytes) + " bytes";
      return -5;
    }
    if (lim_t::merge_(_body, cfg.snapshot_(), _job.limits, _error) != 0) return -6;
    _job.source = src_t::normalize_(*_job.profile, source);
    _job.stop_grace_s = cfg.settings_().stop_grace_s;
    return 0;
  }
  inline svc_r compile_(const nlohmann::json& _body)
  {
    job_c job;
    std::string error;
    if (validate_(_body, job, error) != 0) return fail_(400, err_k::VALIDATION, error);
    if (uuid_(job.id) != 0) return fail_(500, err_k::INFRASTRUCTURE, "Failed to allocate a job id");
    job_r r = jobs.run_(job);
    return result_(r, job.profile->key);
  }
  static inline nlohmann::json health_()
  {
    return {{"status", "ok"}, {"service", "multi-compiler"}};
  }
  inline svc_r config_get_() const
  {
    return {200, cfg.json_()};
  }
  inline svc_r config_put_(const nlohmann::json& _body)
  {
    std::string error;
    if (cfg.update_(_body, error) != 0) return fail_(400, err_k::VALIDATION, error);
    return {200, cfg.json_()};
  }
  static inline void reply_(srv_s& _s, const svc_r& _r)
  {
    _s.status_(_r.status);
    _s.send_json_(_r.body);
  }
  inline void register_(srv_a& _app)
  {
    _app.limit_(cfg.settings_().max_body_bytes);
    _app.post_("/api/compile", [this](const srv_q& _q, srv_s& _s)
    {
      nlohmann::json body;
      if (_q.json_(body) != 0)
      {
        reply_(_s, fail_(400, err_k::VALIDATION, "Request body must be valid JSON"));
        return;
      }
      reply_(_s, compile_(body));
    });
    _app.get_("/api/health", [](const srv_q& _q, srv_s& _s)
    {
      _s.status_(200);
      _s.send_json_(health_());
    }, false);
    _app.get_("/api/config", [this](const srv_q& _q, srv_s& _s)
    {
      reply_(_s, config_get_());
    }, false);
    _app.put_("/api/config", [this](const srv_q& _q, srv_s& _s)
    {
      nlohmann::json body;
      if (_q.json_(body) != 0)
      {
        reply_(_s, fail_(400, err_k::VALIDATION, "Request body must be valid JSON"));
        return;
      }
      reply_(_s, config_put_(body));
    }, false);
  }
};

/* --------------------------------------------- */
