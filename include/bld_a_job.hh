#pragma once

#include "bld_a_types.hh"
#include "bld_a_source.hh"
#include "bld_a_logs.hh"
#include "bld_a_archive.hh"
#include "bld_a_runtime.hh"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

/* --------------------------------------------- */

struct job_c // one build request, already validated
{
  std::string id;
  const frm_p* profile = NULL;
  std::string source;             // normalized
  lim_c limits;
  int stop_grace_s = 0;           // > 0: stop gracefully before the forced removal on timeout
};

struct job_r // outcome
{
  job_s state;                    // CLEANED_UP once run_() returns
  job_s outcome;                  // terminal state reached before cleanup
  err_k kind;
  std::string error;
  std::string transcript;
  bool has_transcript = false;    // timeouts carry none
  int64_t exit_code = -1;
  art_m files;
  int64_t duration_ms = 0;
  inline bool ok_() const noexcept { return outcome == job_s::SUCCESS; }
};

/* --------------------------------------------- */

class job_t // job controller: CREATED -> RUNNING -> terminal -> CLEANED_UP
{
private:
  struct wai_r // what the waiter brings back
  {
    int64_t status = -1;
    std::string transcript;
  };
  struct job_g // removes the sandbox on every exit path
  {
    dkr_i* rt;
    const std::string& id;
    dkr_h handle;
    bool armed = false;
    job_g(dkr_i* _rt, const std::string& _id) : rt(_rt), id(_id) {}
    job_g(const job_g&) = delete;
    job_g& operator=(const job_g&) = delete;
    ~job_g()
    {
      if (!armed) return;
      try
      {
        rt->remove_(handle, true);
      }
      catch (const std::exception& e)
      {
        fprintf(stderr, "job_t.job_g() [%d]: [%s] Cleanup error: %s\n", getpid(), id.c_str(), e.what());
      }
    }
  };
  std::shared_ptr<dkr_i> rt;
  // one thread per job: a waiter never queues behind another job's build
  static inline std::future<wai_r> waiter_(std::shared_ptr<dkr_i> _rt, const dkr_h& _handle)
  {
    auto promise = std::make_shared<std::promise<wai_r>>();
    std::future<wai_r> future = promise->get_future();
    std::thread([runtime = std::move(_rt), handle = _handle, promise]()
    {
      try
      {
        wai_r w;
        w.status = runtime->wait_(handle);
        w.transcript = log_t::demux_(runtime->logs_(handle));
        promise->set_value(std::move(w));
      }
      catch (...)
      {
        promise->set_exception(std::current_exception()); // rethrown by future.get()
      }
    }).detach(); // a waiter that loses the race finishes on its own
    return future;
  }
public:
  explicit job_t(std::shared_ptr<dkr_i> _rt)
    : rt(std::move(_rt))
  {
    if (!rt) throw std::runtime_error("job_t.job_t(): No container runtime");
  }
  job_t(const job_t&) = delete;
  job_t& operator=(const job_t&) = delete;
  inline dkr_i& runtime_() { return *rt; }
  static inline dkr_c spec_(const job_c& _job)
  {
    const frm_p& p = *_job.profile;
    std::string encoded;
    if (src_t::encode_(_job.source, encoded) != 0) throw std::runtime_error("job_t.spec_(): Failed to encode source");
    dkr_c spec;
    spec.name = p.key + "-compile-" + _job.id;
    spec.image = p.image;
    spec.cmd = {"/bin/sh", "-c", src_t::script_(p, encoded)};
    spec.env = p.env;
    spec.binds = {p.cache_host + ":" + p.cache_cont + ":rw"};
    spec.user = "root";
    spec.memory = _job.limits.memory;
    spec.cpu_period = _job.limits.cpu_period;
    spec.cpu_quota = _job.limits.cpu_quota;
    return spec;
  }
  inline job_r run_(const job_c& _job)
  {
    job_r r;
    if (_job.profile == NULL)
    {
      r.state = r.outcome = job_s::ERRORED;
      r.kind = err_k::VALIDATION;
      r.error = "No framework profile";
      return r;
    }
    const auto t0 = std::chrono::steady_clock::now();
    auto elapsed_ = [&t0]()
    {
      return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
    };
    printf("[%s] Starting %s compilation...\n", _job.id.c_str(), _job.profile->key.c_str());
    {
      job_g guard(rt.get(), _job.id);
      try
      {
        // 1. CREATED
        guard.handle = rt->create_(spec_(_job));
        guard.armed = true;
        r.state = job_s::CREATED;
        printf("[%s] Container created (%s)\n", _job.id.c_str(), _job.profile->key.c_str());
        // 2. RUNNING
        rt->start_(guard.handle);
        r.state = job_s::RUNNING;
        std::future<wai_r> waiter = waiter_(rt, guard.handle);
        // 3. first of deadline and completion
        const int64_t budget_ms = MIN2_(_job.limits.timeout_ms, BLD_A_TIMEOUT_MAX_MS);
        if (waiter.wait_for(std::chrono::milliseconds(budget_ms)) == std::future_status::timeout)
        {
          r.state = job_s::TIMED_OUT;
          r.kind = err_k::TIMEOUT;
          r.error = "Compilation timeout after " + std::to_string(_job.limits.timeout_ms) + "ms";
          if (_job.stop_grace_s > 0)
          {
            try
            {
              rt->stop_(guard.handle, _job.stop_grace_s);
            }
            catch (const std::exception& e)
            {
              fprintf(stderr, "job_t.run_() [%d]: [%s] Graceful stop failed: %s\n", getpid(), _job.id.c_str(), e.what());
            }
          }
        }
        else
        {
          wai_r w = waiter.get();
          r.exit_code = w.status;
          r.transcript = std::move(w.transcript);
          r.has_transcript = true;
          if (w.status == 0 && r.transcript.find(BLD_A_MARKER) != std::string::npos)
          {
            r.state = job_s::SUCCESS;
            std::string archive;
            try
            {
              archive = rt->archive_(guard.handle, _job.profile->dist);
            }
            catch (const std::exception& e)
            {
              fprintf(stderr, "job_t.run_() [%d]: [%s] Archive fetch failed: %s\n", getpid(), _job.id.c_str(), e.what());
            }
            r.files = tar_t::collect_(archive);
            printf("[%s] Extracted %zu files from %s\n", _job.id.c_str(), r.files.size(), _job.profile->dist.c_str());
          }
          else
          {
            r.state = job_s::BUILD_FAILED;
            r.kind = err_k::BUILD_FAILED;
            std::string upper = _job.profile->key;
            std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            r.error = upper + " Build Failed";
            r.error += w.status != 0
              ? " (exit status " + std::to_string(w.status) + ")"
              : " (no completion marker)";
          }
        }
      }
      catch (const std::exception& e)
      {
        fprintf(stderr, "job_t.run_() [%d]: [%s] Error: %s\n", getpid(), _job.id.c_str(), e.what());
        r.state = job_s::ERRORED;
        r.kind = err_k::INFRASTRUCTURE;
        r.error = e.what();
      }
      r.outcome = r.state;
      r.duration_ms = elapsed_();
    }
    r.state = job_s::CLEANED_UP;
    if (r.outcome == job_s::SUCCESS) printf("[%s] ✓ Compiled in %lldms\n", _job.id.c_str(), static_cast<long long>(r.duration_ms));
    else printf("[%s] %s: %s\n", _job.id.c_str(), r.outcome.name_(), r.error.c_str());
    return r;
  }
};

/* --------------------------------------------- */
