#pragma once

#include <cstdio>
#include <cstddef>
#include <unistd.h>
#include <deque>
#include <vector>
#include <memory>
#include <random>
#include <string>
#include <optional>
#include <algorithm>
#include <functional>
#include <atomic>
#include <thread>
#include <future>
#include <mutex>
#include <condition_variable>
#include <semaphore>
#include <stdexcept>
#include <type_traits>

/* --------------------------------------------- */

class pth_q // one worker's task list: owner pops the front, idle peers steal the back
{
public:
  using task_f = std::function<void()>;
private:
  std::deque<task_f> tasks;
  std::mutex tasks_m;
public:
  std::binary_semaphore wake{0};
  std::atomic<int64_t> pending{0};   // queued here, not yet picked by anyone
  std::atomic<bool> active{false};   // owner is running a task or has been claimed for one
  pth_q() = default;
  pth_q(const pth_q&) = delete;
  pth_q& operator=(const pth_q&) = delete;
  inline void push_(task_f&& _task)
  {
    std::lock_guard<std::mutex> lock(tasks_m);
    tasks.push_back(std::move(_task));
    pending.fetch_add(1, std::memory_order_acq_rel);
  }
  inline bool claim_() noexcept // idle owner reserved for the next submission
  {
    bool expected = false;
    return pending.load(std::memory_order_acquire) == 0 && active.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
  }
  inline std::optional<task_f> pop_(bool _steal)
  {
    std::lock_guard<std::mutex> lock(tasks_m);
    if (tasks.empty()) return std::nullopt;
    std::optional<task_f> task;
    pending.fetch_sub(1, std::memory_order_acq_rel);
    if (_steal)
    {
      task = std::move(tasks.back());
      tasks.pop_back();
    }
    else
    {
      task = std::move(tasks.front());
      tasks.pop_front();
    }
    return task;
  }
};

/* --------------------------------------------- */

class pth_t // work-stealing pool; fina_() drains queued work before joining
{
private:
  std::string name;
  std::vector<std::jthread> workers;
  std::deque<pth_q> queues;
  std::atomic<size_t> next{0};
  std::atomic<size_t> running{0};       // workers accepting submissions
  std::atomic<int64_t> queued{0};        // submitted, not yet picked
  std::atomic<int64_t> in_flight{0};     // submitted, not yet finished
  std::mutex idle_m;
  std::condition_variable idle_c;
  inline void run_(const size_t _id, pth_q::task_f& _task)
  {
    queued.fetch_sub(1, std::memory_order_acq_rel);
    queues[_id].active.store(true, std::memory_order_release);
    _task();
    queues[_id].active.store(false, std::memory_order_release);
    if (in_flight.fetch_sub(1, std::memory_order_acq_rel) == 1)
    {
      std::lock_guard<std::mutex> lock(idle_m);
      idle_c.notify_all();
    }
  }
  inline void work_(const size_t _id, const std::stop_token& _stop)
  {
    std::mt19937 gen(std::random_device{}() ^ (_id << 16));
    while (!_stop.stop_requested())
    {
      queues[_id].wake.acquire();
      do
      {
        while (auto task = queues[_id].pop_(false)) run_(_id, *task);
        const size_t n = running.load(std::memory_order_acquire);
        for (size_t attempt = 0; n > 1 && attempt < std::min(size_t(4), n - 1); ++attempt)
        {
          size_t victim = std::uniform_int_distribution<size_t>(0, n - 2)(gen);
          if (victim >= _id) ++victim; // never ourselves
          if (auto task = queues[victim].pop_(true))
          {
            run_(_id, *task);
            break;
          }
        }
      } while (queued.load(std::memory_order_acquire) > 0);
      queues[_id].active.store(false, std::memory_order_release); // a claim whose task was stolen
    }
  }
  inline void push_(pth_q::task_f&& _task)
  {
    const size_t n = running.load(std::memory_order_acquire);
    if (n == 0) throw std::runtime_error("pth_t.push_(): " + name + " pool is not running");
    size_t i = next.fetch_add(1, std::memory_order_relaxed) % n;
    for (size_t k = 0; k < n; ++k) // an idle worker first, round-robin among the busy ones
    {
      if (queues[(i + k) % n].claim_())
      {
        i = (i + k) % n;
        break;
      }
    }
    queued.fetch_add(1, std::memory_order_acq_rel);
    in_flight.fetch_add(1, std::memory_order_acq_rel);
    queues[i].push_(std::move(_task));
    queues[i].wake.release();
  }
public:
  explicit pth_t(unsigned int _threads = std::thread::hardware_concurrency(), const std::string& _name = "worker")
    : name(_name)
  {
    init_(_threads);
  }
  pth_t(const pth_t&) = delete;
  pth_t& operator=(const pth_t&) = delete;
  ~pth_t() { fina_(); }
  inline void init_(unsigned int _threads)
  {
    if (running.load(std::memory_order_acquire) > 0) fina_();
    const size_t n = _threads == 0 ? 1 : _threads;
    queues.resize(n);
    workers.reserve(n);
    for (size_t i = 0; i < n; ++i)
    {
      workers.emplace_back([this, i](const std::stop_token& _stop) { work_(i, _stop); });
    }
    running.store(n, std::memory_order_release);
  }
  inline void fina_()
  {
    if (running.load(std::memory_order_acquire) == 0) return;
    {
      std::unique_lock<std::mutex> lock(idle_m);
      idle_c.wait(lock, [this]() { return in_flight.load(std::memory_order_acquire) == 0; });
    }
    running.store(0, std::memory_order_release);
    for (size_t i = 0; i < workers.size(); ++i)
    {
      workers[i].request_stop();
      queues[i].wake.release();
      workers[i].join();
    }
    workers.clear();
    queues.clear();
    next.store(0, std::memory_order_relaxed);
  }
  inline size_t size_() const { return workers.size(); }
  // result through a future whose destructor never blocks: a caller may stop waiting on it
  template <typename Func, typename RetType = std::invoke_result_t<Func&>>
  inline std::future<RetType> load_(Func _func)
  {
    auto promise = std::make_shared<std::promise<RetType>>();
    std::future<RetType> future = promise->get_future();
    push_([func = std::move(_func), promise]() mutable
    {
      try
      {
        if constexpr (std::is_void_v<RetType>)
        {
          func();
          promise->set_value();
        }
        else promise->set_value(func());
      }
      catch (...)
      {
        promise->set_exception(std::current_exception()); // rethrown by future.get()
      }
    });
    return future;
  }
  // detached task; an escaping exception is logged
  template <typename Func>
  inline void fire_(Func _func)
  {
    push_([this, func = std::move(_func)]() mutable
    {
      try
      {
        func();
      }
      catch (const std::exception& e)
      {
        fprintf(stderr, "pth_t.fire_() [%d]: %s task threw: %s\n", getpid(), name.c_str(), e.what());
      }
    });
  }
};

/* --------------------------------------------- */
