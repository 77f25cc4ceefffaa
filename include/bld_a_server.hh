#pragma once

#include <nlohmann/json.hpp>
#include "bld_a_types.hh"
#include "bld_a_thread_pool.hh"

struct srv_m;
struct srv_q;
struct srv_g;
struct srv_s;
struct srv_r;

#include <cstdlib>
#include <cstddef>
#include <csignal>
#include <cerrno>
#include <fcntl.h>
#include <sys/time.h>
#include <sys/socket.h>
#include <sys/select.h>
#include <sys/un.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sstream>
#include <iostream>
#include <vector>
#include <unordered_map>
#include <string_view>
#include <condition_variable>
#include <chrono>
#include <uv.h>
#include <h2o.h>
#include <h2o/http1.h>
#include <h2o/http2.h>

/* --------------------------------------------- */

struct srv_m // method
{
  enum value : uint8_t
  {
    NONE = 0,
    GET = 1,
    POST = 2,
    PUT = 3,
    DELETE = 4,
    HEAD = 5
  };
  value v;
  constexpr srv_m() noexcept : v(NONE) {}
  constexpr srv_m(value val) noexcept : v(val) {}
  constexpr srv_m(const char* str) noexcept : v(method_(str)) {}
  srv_m(const std::string& str) noexcept : v(method_(str.c_str())) {}
  constexpr operator value() const noexcept { return v; } // use as enum e.g. srv_m::GET
  explicit operator bool() = delete; // ban if(srv_m)
  static constexpr value method_(const char* str) noexcept
  {
    if (str[0] == 'G' && str[1] == 'E' && str[2] == 'T' && str[3] == '\0') return GET;
    if (str[0] == 'P' && str[1] == 'O' && str[2] == 'S' && str[3] == 'T' && str[4] == '\0') return POST;
    if (str[0] == 'P' && str[1] == 'U' && str[2] == 'T' && str[3] == '\0') return PUT;
    if (str[0] == 'D' && str[1] == 'E' && str[2] == 'L' && str[3] == 'E' && str[4] == 'T' && str[5] == 'E' && str[6] == '\0') return DELETE;
    if (str[0] == 'H' && str[1] == 'E' && str[2] == 'A' && str[3] == 'D' && str[4] == '\0') return HEAD;
    return NONE;
  }
  inline const char* name_() const noexcept
  {
    switch (v)
    {
      case GET:    return "GET";
      case POST:   return "POST";
      case PUT:    return "PUT";
      case DELETE: return "DELETE";
      case HEAD:   return "HEAD";
      default:     return "NONE";
    }
  }
};
namespace std
{
  template <>
  struct hash<srv_m>
  {
    std::size_t operator()(const srv_m& m) const noexcept
    {
      return static_cast<std::size_t>(m.v);
    }
  };
}

/* --------------------------------------------- */

using srv_f = std::function<void(const srv_q&, srv_s&)>; // functions

struct srv_q // request
{
  h2o_req_t* h2o_request = NULL;
  std::string_view url; // "/api/compile?verbose=1"
  std::string_view url_normal; // "/api/compile"
  std::string_view url_prefix; // "/api/compile" registered
  std::string_view url_query; // "?verbose=1"
  std::unordered_map<std::string_view, std::string_view> headers; // h2o already lowercased
  std::string_view body; // request entity
  static inline std::string encode_(std::string_view _decoded, const char* _preserve_chars = NULL)
  {
    std::string encoded;
    encoded.reserve(_decoded.size() * 3 + 1);
    for (size_t i = 0; i < _decoded.size(); ++i) // RFC 3986 unreserved only
    {
      int ch = static_cast<unsigned char>(_decoded[i]);
      if (('A' <= ch && ch <= 'Z') || ('a' <= ch && ch <= 'z') || ('0' <= ch && ch <= '9')
        || ch == '-' || ch == '.' || ch == '_' || ch == '~'
        || (ch != '\0' && _preserve_chars != NULL && strchr(_preserve_chars, ch) != NULL)
      ) encoded.push_back(static_cast<char>(ch));
      else
      {
        encoded.push_back('%');
        encoded.push_back("0123456789ABCDEF"[(ch >> 4) & 0xf]);
        encoded.push_back("0123456789ABCDEF"[ch & 0xf]);
      }
    }
    return encoded;
  }
  srv_q(h2o_req_t* _h2o_request) { init_(_h2o_request); }
  inline void init_(h2o_req_t* _h2o_request)
  {
    h2o_request = _h2o_request;
    url_(_h2o_request);
    headers_(_h2o_request);
    body_();
  }
  inline void url_(h2o_req_t* _h2o_request)
  {
    this->url = std::string_view(_h2o_request->path.base, _h2o_request->path.len);
    this->url_normal = std::string_view(_h2o_request->path_normalized.base, _h2o_request->path_normalized.len);
    this->url_prefix = std::string_view(_h2o_request->pathconf->path.base, _h2o_request->pathconf->path.len);
    this->url_query = (_h2o_request->query_at != SIZE_MAX)
      ? std::string_view(_h2o_request->path.base + _h2o_request->query_at, _h2o_request->path.len - _h2o_request->query_at)
      : std::string_view()
    ;
  }
  inline void headers_(h2o_req_t* _h2o_request)
  {
    headers.clear();
    headers.reserve(_h2o_request->headers.size);
    for (size_t i = 0; i < _h2o_request->headers.size; ++i)
    {
      const auto& h = _h2o_request->headers.entries[i];
      headers.emplace(std::string_view(h.name->base, h.name->len), std::string_view(h.value.base, h.value.len));
    }
  }
  inline std::string header_(std::string_view _key) const
  {
    auto it = headers.find(_key);
    if (it != headers.end()) return std::string(it->second);
    return std::string();
  }
  inline void body_()
  {
    size_t size = h2o_request->entity.len;
    if (size == SIZE_MAX) size = 0;
    body = h2o_request->entity.base
      ? std::string_view(h2o_request->entity.base, size)
      : std::string_view()
    ;
  }
  // 0 = parsed; -1 = empty body; -2 = malformed
  inline short json_(nlohmann::json& _j) const
  {
    if (body.empty()) return -1;
    _j = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
    if (_j.is_discarded()) return -2;
    return 0;
  }
};

struct srv_g // generator
{
  h2o_generator_t super;
  h2o_req_t* req;
  h2o_timer_t timer;
  uv_async_t notify;
  std::string body_data;
  std::mutex body_mutex;
  std::atomic<bool> sent{false};
  std::atomic<bool> completed{false};
  std::atomic<bool> is_failing{false};
  std::atomic<bool> is_timeout{false};
  static inline void on_notify_(uv_async_t* _notify)
  {
    auto* generator = H2O_STRUCT_FROM_MEMBER(srv_g, notify, _notify);
    proceed_(&generator->super, generator->req);
  }
  static inline void on_timeout_(h2o_timer_t* _entry)
  {
    auto* generator = H2O_STRUCT_FROM_MEMBER(srv_g, timer, _entry);
    if (!generator->completed)
    {
      {
        std::lock_guard<std::mutex> lock(generator->body_mutex);
        generator->body_data.clear();
      }
      generator->completed.store(true);
      generator->is_failing.store(true);
      generator->is_timeout.store(true);
      proceed_(&generator->super, generator->req);
    }
  }
  static inline void proceed_(h2o_generator_t* _self, h2o_req_t* _req)
  {
    auto* generator = reinterpret_cast<srv_g*>(_self);
    if (!generator->completed.load()) return;
    if (h2o_timer_is_linked(&generator->timer)) h2o_timer_unlink(&generator->timer);
    if (uv_is_active((uv_handle_t*)&generator->notify)) uv_close((uv_handle_t*)&generator->notify, NULL);
    bool expected = false;
    if (!generator->sent.compare_exchange_strong(expected, true)) return; // late notify after a timeout reply
    h2o_iovec_t body = h2o_iovec_init(NULL, 0);
    if (generator->is_timeout.load())
    {
      _req->res.status = 504;
      _req->res.reason = "Gateway Timeout";
    }
    else if (generator->is_failing.load())
    {
      _req->res.status = 500;
      _req->res.reason = "Execute Failure";
    }
    else
    {
      if (_req->res.status == 0) _req->res.status = 200;
      std::lock_guard<std::mutex> lock(generator->body_mutex);
      body = h2o_strdup(&_req->pool, generator->body_data.data(), generator->body_data.size());
    }
    h2o_send(_req
      , &body
      , 1
      , H2O_SEND_STATE_FINAL
    );
    generator->~srv_g();
  }
  static void stop_(h2o_generator_t* _self, h2o_req_t* _req)
  {
    auto* generator = reinterpret_cast<srv_g*>(_self);
    if (h2o_timer_is_linked(&generator->timer)) h2o_timer_unlink(&generator->timer);
    if (uv_is_active((uv_handle_t*)&generator->notify)) uv_close((uv_handle_t*)&generator->notify, NULL);
  }
};

struct srv_s // response
{ // async: body handed to the generator, sent from the loop thread
  h2o_req_t* h2o_request = NULL;
  bool async = false;
  srv_g* async_gen = NULL;
  inline void status_(int _code, const char* _reason = NULL)
  {
    h2o_request->res.status = _code;
    h2o_request->res.reason = _reason != NULL ? _reason
      : _code == 200 ? "OK"
      : _code == 201 ? "Created"
      : _code == 204 ? "No Content"
      : _code == 400 ? "Bad Request"
      : _code == 404 ? "Not Found"
      : _code == 405 ? "Method Not Allowed"
      : _code == 413 ? "Payload Too Large"
      : _code == 500 ? "Internal Server Error"
      : _code == 502 ? "Bad Gateway"
      : _code == 503 ? "Service Unavailable"
      : _code == 504 ? "Gateway Timeout"
      : ""
    ;
  }
  inline void header_(const std::string& _name, const std::string& _value)
  {
    h2o_iovec_t rcy_name = h2o_strdup(&h2o_request->pool, _name.data(), _name.size());
    h2o_iovec_t rcy_value = h2o_strdup(&h2o_request->pool, _value.data(), _value.size());
    std::string lc_name = _name;
    std::transform(lc_name.begin(), lc_name.end(), lc_name.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    h2o_iovec_t rcy_lc_name = h2o_strdup(&h2o_request->pool, lc_name.data(), lc_name.size());
    h2o_add_header_by_str(&h2o_request->pool
      , &h2o_request->res.headers
      , rcy_lc_name.base
      , rcy_lc_name.len
      , 1 // maybe_token
      , rcy_name.base
      , rcy_value.base
      , rcy_value.len
    );
  }
  inline void header_type_(const std::string& _type)
  {
    h2o_iovec_t rcy_value = h2o_strdup(&h2o_request->pool, _type.data(), _type.size());
    h2o_add_header(&h2o_request->pool
      , &h2o_request->res.headers
      , H2O_TOKEN_CONTENT_TYPE
      , NULL
      , rcy_value.base
      , rcy_value.len
    );
  }
  inline void send_(const std::string& _body)
  {
    if (async)
    {
      std::lock_guard<std::mutex> lock(async_gen->body_mutex);
      async_gen->body_data = _body;
    }
    else
    {
      if (h2o_request->res.status == 0) status_(200);
      h2o_iovec_t body = h2o_strdup(&h2o_request->pool, _body.data(), _body.size());
      static h2o_generator_t sync_gen = {NULL, NULL};
      h2o_start_response(h2o_request, &sync_gen);
      h2o_send(h2o_request
        , &body
        , 1
        , H2O_SEND_STATE_FINAL
      );
    }
  }
  inline void send_text_(const std::string& _body) { header_type_("text/plain; charset=utf-8"); send_(_body); }
  inline void send_json_(const nlohmann::json& _j)
  {
    header_type_("application/json; charset=utf-8");
    send_(_j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)); // build logs are not always valid utf-8
  }
};

/* --------------------------------------------- */

class srv_a // app -> register_()/listen_()/signal_() -> start_()/serve_() -> stop_() -> ~()
{ // async: register_() -> on_req_() -> business_() -> send_() -> proceed_() -> ~srv_g()
public:
  struct srv_h : public h2o_handler_t // handler
  {
    std::string method;
    srv_f business_;
    bool async;
    uint64_t timeout_ms;
    srv_a* app;
    static inline void fail_(h2o_req_t* _req, const char* _what)
    {
      srv_s s{_req, false, NULL};
      s.status_(500, "Execute Failure");
      s.send_text_(_what);
    }
    static inline int on_req_(h2o_handler_t* _self, h2o_req_t* _req)
    {
      auto* handler = static_cast<srv_h*>(_self);
      if (!h2o_memis(_req->method.base
        , _req->method.len
        , handler->method.data()
        , handler->method.size())
      ) return -1; // method mismatch -> h2o continue to next handler
      if (handler->async)
      {
        void* buffer = h2o_mem_alloc_pool(&_req->pool, char, sizeof(srv_g));
        if (!buffer)
        {
          fprintf(stderr, "srv_a.on_req_() [%d]: Failed to h2o_mem_alloc_pool() for %zu bytes.\n", getpid(), sizeof(srv_g));
          return -2;
        }
        srv_g* generator = new(buffer) srv_g(); // h2o_req_t* alive before generator disposed
        generator->super.proceed = srv_g::proceed_;
        generator->super.stop = srv_g::stop_;
        generator->req = _req;
        h2o_timer_init(&generator->timer, srv_g::on_timeout_);
        if (handler->timeout_ms > 0) h2o_timer_link(_req->conn->ctx->loop, handler->timeout_ms, &generator->timer);
        uv_async_init(_req->conn->ctx->loop, &generator->notify, srv_g::on_notify_);
        generator->notify.data = generator;
        h2o_start_response(_req, &generator->super);
        h2o_req_t* req_ptr = _req;
        handler->app->pthd.fire_(
          [generator, req_ptr, business_ = handler->business_]() mutable
          {
            bool failing = false;
            try
            {
              srv_q q{req_ptr};
              srv_s s{req_ptr, true, generator};
              business_(q, s);
            }
            catch (const std::exception& e)
            {
              fprintf(stderr, "srv_a.on_req_() [%d]: Handler threw: %s\n", getpid(), e.what());
              failing = true;
            }
            generator->is_failing.store(failing);
            generator->completed.store(true);
            uv_async_send(&generator->notify);
          }
        );
      }
      else
      {
        try
        {
          srv_q q{_req};
          srv_s s{_req, false, NULL};
          handler->business_(q, s);
        }
        catch (const std::exception& e)
        {
          fprintf(stderr, "srv_a.on_req_() [%d]: Handler threw: %s\n", getpid(), e.what());
          fail_(_req, e.what());
        }
      }
      return 0;
    }
    static inline void dispose_(h2o_handler_t* _self)
    {
      auto* handler = static_cast<srv_h*>(_self);
      handler->~srv_h();
    }
  };
  pth_t pthd{1, "http"};               // handler thread pool, sized in init_()
  std::atomic<uint8_t> state;          // 0 = finalized; 1 = initialized; 2 = serving; 3 = stopped;
  std::thread server_t;                // server thread
  std::atomic<bool> server_a;          // true = thread server alive
  std::atomic<bool> server_r;          // true = server does restart
  std::mutex server_m;
  std::condition_variable server_c;
  uv_loop_t loop;                      // uv event loop
  uv_async_t loop_a;                   // uv async sender
  std::vector<uv_tcp_t*> listeners;
  std::vector<uv_signal_t*> signalers;
  h2o_globalconf_t gconfig;            // h2o global configuration
  h2o_hostconf_t* hconfig = NULL;      // h2o host configuration
  h2o_hostconf_t* hconfig_a[2];
  h2o_context_t ctx;                   // h2o context (per-thread)
  h2o_accept_ctx_t accept_ctx;
  std::chrono::steady_clock::time_point start_time;
  struct prefix_c
  {
    h2o_pathconf_t* pathconf;
    std::unordered_map<srv_m, srv_h*> handlers; // <method, handler>
    prefix_c() : pathconf(NULL) {}
  };
  std::unordered_map<std::string, prefix_c> prefix_groups; // <prefix, prefix_c>
  srv_a()
  {
    state.store(0);
    server_a.store(false);
    server_r.store(false);
    init_();
  }
  ~srv_a() { fina_(); }
  srv_a(const srv_a&) = delete;
  srv_a& operator=(const srv_a&) = delete;
  srv_a(srv_a&&) = delete;
  srv_a& operator=(srv_a&&) = delete;
  inline void init_()
  {
    if (state.load() != 0) return;
    pthd.init_(MIN2_(4096, MAX2_(1, sysconf(_SC_NPROCESSORS_ONLN)) * 2));
    // 1. uv event loop with its wake-up sender
    uv_loop_init(&loop);
    uv_async_init(&loop, &loop_a, [](uv_async_t* handle) {});
    loop_a.data = this;
    // 2. h2o global configuration
    h2o_config_init(&gconfig);
    h2o_compress_register_configurator(&gconfig);
    gconfig.max_request_entity_size = 10 * 1024 * 1024;
    // 3. h2o host configuration
    hconfig = h2o_config_register_host(&gconfig
      , h2o_iovec_init(H2O_STRLIT("default"))
      , 65535
    );
    // 4. h2o context
    h2o_context_init(&ctx, &loop, &gconfig);
    // 5. accept context
    hconfig_a[0] = hconfig;
    hconfig_a[1] = NULL;
    accept_ctx.hosts = hconfig_a;
    accept_ctx.ctx = &ctx;
    accept_ctx.ssl_ctx = NULL;
    state.store(1);
  }
  inline void limit_(size_t _max_body_bytes) // request entities over the limit get 413 from h2o
  {
    if (state.load() % 2 != 1) return;
    gconfig.max_request_entity_size = _max_body_bytes;
  }
  static inline void on_accept_(uv_stream_t* _listener, int _status)
  {
    if (_status != 0) return;
    uv_tcp_t* conn = new uv_tcp_t;
    uv_tcp_init(_listener->loop, conn);
    if (uv_accept(_listener, reinterpret_cast<uv_stream_t*>(conn)) != 0)
    {
      uv_close(reinterpret_cast<uv_handle_t*>(conn)
        , [](uv_handle_t* handle) { delete reinterpret_cast<uv_tcp_t*>(handle); }
      );
      return;
    }
    auto* acc_ctx = static_cast<h2o_accept_ctx_t*>(_listener->data);
    h2o_socket_t* sock = h2o_uv_socket_create(reinterpret_cast<uv_handle_t*>(conn)
      , [](uv_handle_t* handle) { delete reinterpret_cast<uv_tcp_t*>(handle); }
    );
    h2o_accept(acc_ctx, sock);
  }
  inline void listen_(const std::string& _host = "0.0.0.0", uint16_t _port = 3001)
  {
    if (state.load() % 2 != 1) return; // finalized or serving
    uv_tcp_t* listener = new uv_tcp_t;
    uv_tcp_init(&loop, listener);
    listener->data = &accept_ctx;
    struct sockaddr_in addr;
    uv_ip4_addr(_host.c_str(), _port, &addr);
    int r = uv_tcp_bind(listener, reinterpret_cast<struct sockaddr*>(&addr), 0);
    if (r == 0) r = uv_listen(reinterpret_cast<uv_stream_t*>(listener), 128, on_accept_);
    if (r != 0)
    {
      uv_close(reinterpret_cast<uv_handle_t*>(listener)
        , [](uv_handle_t* handle) { delete reinterpret_cast<uv_tcp_t*>(handle); }
      );
      throw std::runtime_error("srv_a.listen_(): Failed to listen on " + _host + ":" + std::to_string(_port) + " w/ " + uv_strerror(r));
    }
    listeners.push_back(listener);
  }
  inline void delisten_()
  {
    for (auto* listener : listeners)
    {
      uv_read_stop(reinterpret_cast<uv_stream_t*>(listener));
      if (uv_is_closing(reinterpret_cast<uv_handle_t*>(listener)) == 0) uv_close(reinterpret_cast<uv_handle_t*>(listener)
        , [](uv_handle_t* handle) { delete reinterpret_cast<uv_tcp_t*>(handle); }
      );
    }
    listeners.clear();
    uv_async_send(&loop_a);
  }
  static inline void on_signal_(uv_signal_t* _sig, int _signum)
  {
    auto* self = static_cast<srv_a*>(_sig->data);
    printf("\nsrv_a.signal_() [%d]: Caught signal %d stopping loop ...\n", getpid(), _signum);
    self->stop_();
  }
  inline void signal_()
  {
    if (state.load() % 2 != 1) return;
    for (int signum : {SIGINT, SIGTERM})
    {
      uv_signal_t* signaler = new uv_signal_t;
      if (uv_signal_init(&loop, signaler) != 0)
      {
        delete signaler;
        continue;
      }
      signaler->data = this;
      if (uv_signal_start(signaler, on_signal_, signum) != 0)
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
    uv_async_send(&loop_a);
  }
  inline void serve_() // loop in calling thread
  {
    bool is_restart = false;
    uint8_t expected = 1;
    if (!state.compare_exchange_weak(expected, 2))
    {
      expected = 3;
      if (!state.compare_exchange_weak(expected, 2))
      {
        if (state.load() != 2) return;
      }
      is_restart = true;
    }
    is_restart = is_restart || server_r.load();
    if (is_restart)
    {
      h2o_context_dispose(&ctx);
      uv_run(&loop, UV_RUN_ONCE);
      h2o_context_init(&ctx, &loop, &gconfig);
      hconfig_a[0] = hconfig;
      hconfig_a[1] = NULL;
      accept_ctx.hosts = hconfig_a;
      accept_ctx.ctx = &ctx;
      for (auto* listener : listeners) listener->data = &accept_ctx;
    }
    server_r.store(false);
    start_time = std::chrono::steady_clock::now();
    {
      std::lock_guard<std::mutex> lock_server(server_m);
      server_a.store(true);
      server_c.notify_all();
    }
    uv_run(&loop, UV_RUN_DEFAULT);
    server_a.store(false);
    state.store(3); // stopped
  }
  inline void start_() // loop in a server thread
  {
    server_r.store(false);
    uint8_t expected = 1;
    if (!state.compare_exchange_weak(expected, 2))
    {
      expected = 3;
      if (!state.compare_exchange_weak(expected, 2)) return;
      server_r.store(true);
    }
    server_a.store(false);
    server_t = std::thread([this]() { serve_(); });
    std::unique_lock<std::mutex> lock_server(server_m);
    server_c.wait(lock_server, [this]() { return server_a.load() || state.load() == 3; });
  }
  inline void stop_()
  {
    uint8_t expected = 2;
    if (!state.compare_exchange_strong(expected, 3)) return; // serving -> stopped
    delisten_();
    designal_();
    h2o_context_request_shutdown(&ctx);
    uv_stop(&loop);
    uv_async_send(&loop_a);
    server_c.notify_all();
    if (server_t.joinable() && server_t.get_id() != std::this_thread::get_id()) server_t.join();
    server_a.store(false);
  }
  inline int64_t uptime_() const // ms
  {
    if (state.load() != 2) return 0;
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time).count();
  }
  inline void fina_()
  {
    const uint8_t s = state.load();
    if (s == 0) return;
    if (s == 2) stop_();
    pthd.fina_(); // handlers still reference the loop through their generators
    delisten_();
    designal_();
    h2o_context_request_shutdown(&ctx);
    h2o_context_dispose(&ctx);
    h2o_config_dispose(&gconfig); // h2o_handler_t* -> h2o_pathconf_t* -> h2o_hostconf_t* -> h2o_globalconf_t
    uv_close(reinterpret_cast<uv_handle_t*>(&loop_a), NULL);
    uv_run(&loop, UV_RUN_DEFAULT);
    uv_loop_close(&loop);
    prefix_groups.clear();
    h2o_buffer_clear_recycle(1);
    h2o_mem_clear_recycle(&h2o_mem_pool_allocator, 1);
    if (server_t.joinable() && server_t.get_id() != std::this_thread::get_id()) server_t.join();
    state.store(0);
  }
  inline void register_(std::string _prefix
    , const std::string& _method
    , srv_f _business_
    , bool _async = true
    , uint64_t _timeout_ms = 0 // 0 = no timeout
    , bool _compress = true
  )
  {
    if (state.load() % 2 != 1) return; // finalized or serving
    const srv_m m(_method);
    auto& pc = prefix_groups[_prefix];
    if (!pc.pathconf)
    {
      pc.pathconf = h2o_config_register_path(hconfig, _prefix.c_str(), 0);
      if (_compress)
      {
        h2o_compress_args_t compress_args;
        memset(&compress_args, 0, sizeof(compress_args));
        compress_args.min_size = 100;
        compress_args.gzip.quality = 1;
        compress_args.brotli.quality = 1;
        h2o_compress_register(pc.pathconf, &compress_args);
      }
    }
    auto handler_it = pc.handlers.find(m);
    srv_h* handler = NULL;
    if (handler_it == pc.handlers.end())
    {
      h2o_handler_t* raw_handler = h2o_create_handler(pc.pathconf, sizeof(srv_h));
      handler = new(raw_handler) srv_h();
      raw_handler->on_req = &srv_h::on_req_;
      raw_handler->dispose = &srv_h::dispose_;
      pc.handlers[m] = handler;
    }
    else handler = handler_it->second;
    handler->method = _method;
    handler->business_ = std::move(_business_);
    handler->async = _async;
    handler->timeout_ms = _timeout_ms;
    handler->app = this;
  }
  inline void get_(std::string _prefix, srv_f _business_, bool _async = true, uint64_t _timeout_ms = 0)
  {
    register_(std::move(_prefix), "GET", std::move(_business_), _async, _timeout_ms);
  }
  inline void post_(std::string _prefix, srv_f _business_, bool _async = true, uint64_t _timeout_ms = 0)
  {
    register_(std::move(_prefix), "POST", std::move(_business_), _async, _timeout_ms);
  }
  inline void put_(std::string _prefix, srv_f _business_, bool _async = true, uint64_t _timeout_ms = 0)
  {
    register_(std::move(_prefix), "PUT", std::move(_business_), _async, _timeout_ms);
  }
};

/* --------------------------------------------- */

struct srv_r // response received
{
  int status;
  std::string reason;
  std::unordered_map<std::string, std::vector<std::string>> headers;
  std::string body;
  std::string vers;
  srv_r() : status(0) {}
  srv_r(const std::string& _raw_response) : status(0) { parse_(_raw_response); }
  inline void parse_(const std::string& _raw_response)
  {
    if (_raw_response.empty()) return;
    std::string_view raw_response(_raw_response);
    // 1. header/body boundary
    size_t header_end = raw_response.find("\r\n\r\n");
    if (header_end == std::string_view::npos) return;
    std::string_view headers_section = raw_response.substr(0, header_end);
    body = std::string(raw_response.substr(header_end + 4));
    // 2. "HTTP/1.1 200 OK" with optional reason
    size_t line_end = headers_section.find("\r\n");
    if (line_end == std::string_view::npos) line_end = headers_section.size();
    std::string_view status_line = headers_section.substr(0, line_end);
    size_t pos = line_end + 2;
    size_t first_space = status_line.find(' ');
    if (first_space == std::string_view::npos) return;
    vers = std::string(status_line.substr(0, first_space));
    size_t second_space = status_line.find(' ', first_space + 1);
    std::string_view code_view = (second_space == std::string_view::npos)
      ? status_line.substr(first_space + 1)
      : status_line.substr(first_space + 1, second_space - first_space - 1)
    ;
    int code = 0;
    for (char c : code_view)
    {
      if (c < '0' || c > '9') return;
      code = code * 10 + (c - '0');
    }
    if (second_space != std::string_view::npos) reason = std::string(status_line.substr(second_space + 1));
    // 3. headers, lower-cased keys
    while (pos < headers_section.size())
    {
      line_end = headers_section.find("\r\n", pos);
      if (line_end == std::string_view::npos) line_end = headers_section.size();
      std::string_view line = headers_section.substr(pos, line_end - pos);
      pos = line_end + 2;
      if (line.empty()) break;
      size_t colon = line.find(':');
      if (colon == std::string_view::npos) continue; // malformed header line
      std::string key(line.substr(0, colon));
      std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      std::string_view value = line.substr(colon + 1);
      size_t start = value.find_first_not_of(" \t");
      value = (start == std::string_view::npos) ? std::string_view() : value.substr(start);
      headers[key].push_back(std::string(value));
    }
    status = code;
    process_body_();
  }
  inline void process_body_()
  {
    auto te_it = headers.find("transfer-encoding");
    if (te_it != headers.end())
    {
      for (const auto& encoding : te_it->second)
      {
        if (encoding.find("chunked") != std::string::npos)
        {
          body = decode_chunk_(body);
          return; // chunked takes precedence over Content-Length
        }
      }
    }
    auto cl_it = headers.find("content-length");
    if (cl_it != headers.end() && !cl_it->second.empty())
    {
      char* end = NULL;
      unsigned long long expected_len = strtoull(cl_it->second[0].c_str(), &end, 10);
      if (end != cl_it->second[0].c_str() && body.size() > expected_len) body.resize(expected_len);
    }
  }
  // binary-safe: chunk bodies are sliced by their announced size
  static inline std::string decode_chunk_(const std::string& _chunked_body)
  {
    std::string decoded;
    size_t pos = 0;
    while (pos < _chunked_body.size())
    {
      size_t line_end = _chunked_body.find("\r\n", pos);
      if (line_end == std::string::npos) break;
      std::string size_line = _chunked_body.substr(pos, line_end - pos);
      size_t semicolon = size_line.find(';'); // chunk extensions
      if (semicolon != std::string::npos) size_line.resize(semicolon);
      char* end = NULL;
      unsigned long long chunk_size = strtoull(size_line.c_str(), &end, 16);
      if (end == size_line.c_str()) break;
      pos = line_end + 2;
      if (chunk_size == 0) break; // trailers ignored
      if (chunk_size > _chunked_body.size() - pos)
      {
        decoded.append(_chunked_body, pos, std::string::npos); // peer closed mid-chunk
        break;
      }
      decoded.append(_chunked_body.data() + pos, chunk_size);
      pos += chunk_size;
      if (pos + 2 <= _chunked_body.size()
        && _chunked_body[pos] == '\r'
        && _chunked_body[pos + 1] == '\n'
      ) pos += 2;
      else break;
    }
    return decoded;
  }
  inline bool is_ok_() const { return status >= 200 && status < 300; }
  inline std::string header_(const std::string& _key) const
  {
    auto it = headers.find(_key);
    return (it != headers.end() && !it->second.empty()) ? it->second.front() : std::string();
  }
  inline nlohmann::json json_() const // discarded value when the body is not JSON
  {
    return nlohmann::json::parse(body, nullptr, false);
  }
};

class srv_t // client utilities: tcp for local peers, unix socket for the engine
{
public:
  static inline void socket_set_timeout_(int sock, int timeout_ms)
  {
    if (timeout_ms <= 0) return;
    timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  }
  static inline bool socket_set_block_(int sock, bool blocking)
  {
    int flags = fcntl(sock, F_GETFL, 0);
    if (flags == -1) return false;
    if (blocking) flags &= ~O_NONBLOCK;
    else flags |= O_NONBLOCK;
    return fcntl(sock, F_SETFL, flags) != -1;
  }
  static inline bool socket_wait_(int sock, bool for_write, int timeout_ms)
  {
    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(sock, &fds);
    timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    return select(sock + 1, for_write ? NULL : &fds, for_write ? &fds : NULL, NULL, &tv) == 1;
  }
  static inline int socket_connect_(int sock, const sockaddr* addr, socklen_t addr_len, int timeout_ms)
  { // 0 = success; 1 = timeout; 2 = error
    if (timeout_ms <= 0) return connect(sock, addr, addr_len) == 0 ? 0 : 2;
    if (!socket_set_block_(sock, false)) return 2;
    if (connect(sock, addr, addr_len) == 0) return socket_set_block_(sock, true) ? 0 : 2;
    if (errno != EINPROGRESS && errno != EAGAIN) return 2;
    if (!socket_wait_(sock, true, timeout_ms)) return 1;
    int err = 0;
    socklen_t len = sizeof(err);
    if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &err, &len) != 0 || err != 0) return 2;
    return socket_set_block_(sock, true) ? 0 : 2;
  }
  // -1 on failure; the caller owns the descriptor
  static inline int connect_tcp_(const std::string& _host, uint16_t _port, int _timeout_ms)
  {
    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0)
    {
      perror("srv_t.connect_tcp_(): ---socket---");
      return -1;
    }
    sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(_port);
    if (inet_pton(AF_INET, _host.c_str(), &addr.sin_addr) <= 0)
    {
      fprintf(stderr, "srv_t.connect_tcp_() [%d]: Invalid host format %s\n", getpid(), _host.c_str());
      close(sock);
      return -1;
    }
    if (socket_connect_(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr), _timeout_ms) != 0)
    {
      close(sock);
      return -1;
    }
    return sock;
  }
  static inline int connect_unix_(const std::string& _path, int _timeout_ms)
  {
    sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (_path.empty() || _path.size() >= sizeof(addr.sun_path))
    {
      fprintf(stderr, "srv_t.connect_unix_() [%d]: Invalid socket path %s\n", getpid(), _path.c_str());
      return -1;
    }
    memcpy(addr.sun_path, _path.data(), _path.size());
    int sock = socket(AF_UNIX, SOCK_STREAM, 0);
    if (sock < 0)
    {
      perror("srv_t.connect_unix_(): ---socket---");
      return -1;
    }
    if (socket_connect_(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr), _timeout_ms) != 0)
    {
      close(sock);
      return -1;
    }
    return sock;
  }
  static inline bool all_send_(int sock, const std::string& data)
  {
    size_t total = 0;
    while (total < data.size())
    {
      ssize_t sent = send(sock, data.data() + total, data.size() - total, MSG_NOSIGNAL);
      if (sent < 0)
      {
        if (errno == EINTR) continue;
        perror("srv_t.all_send_(): ---send---");
        return false;
      }
      total += sent;
    }
    return true;
  }
  // reads until the peer closes; requests always carry "Connection: close"
  static inline short all_recv_(int sock, std::string& _response)
  {
    char buf[16384];
    while (true)
    {
      ssize_t r = recv(sock, buf, sizeof(buf), 0);
      if (r < 0)
      {
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return 1; // SO_RCVTIMEO elapsed
        perror("srv_t.all_recv_(): ---recv---");
        return -1;
      }
      if (r == 0) return 0;
      _response.append(buf, r);
    }
  }
  static inline std::string message_(const std::string& _method
    , const std::string& _path
    , const std::string& _host
    , const std::string& _body
    , const std::unordered_map<std::string, std::string>& _headers
  )
  {
    std::ostringstream req;
    req << _method << " " << _path << " HTTP/1.1\r\n";
    req << "Host: " << _host << "\r\n";
    for (const auto& [key, value] : _headers) req << key << ": " << value << "\r\n";
    if (!_body.empty() || _method == "POST" || _method == "PUT") req << "Content-Length: " << _body.size() << "\r\n";
    req << "Connection: close\r\n\r\n";
    req << _body;
    return req.str();
  }
  // empty string on connection failure; 0 timeout = wait forever
  static inline std::string exchange_(int sock
    , const std::string& _message
    , int _timeout_ms
  )
  {
    socket_set_timeout_(sock, _timeout_ms);
    std::string response;
    if (!all_send_(sock, _message))
    {
      close(sock);
      return "";
    }
    short r = all_recv_(sock, response);
    close(sock);
    if (r != 0)
    {
      fprintf(stderr, "srv_t.exchange_() [%d]: Incomplete response (%d) after %zu bytes\n", getpid(), r, response.size());
      return "";
    }
    return response;
  }
  static inline short ping_(const std::string& _host, uint16_t _port, int _timeout_ms = 3000)
  { // 0 = reachable; 1 = unreachable
    int sock = connect_tcp_(_host, _port, _timeout_ms);
    if (sock < 0) return 1;
    close(sock);
    return 0;
  }
  static inline std::string request_(const std::string& _host
    , uint16_t _port
    , const std::string& _method
    , const std::string& _path
    , const std::string& _body = ""
    , const std::unordered_map<std::string, std::string>& _headers = {}
    , int _timeout_ms = 0
  )
  {
    int sock = connect_tcp_(_host, _port, _timeout_ms);
    if (sock < 0)
    {
      fprintf(stderr, "srv_t.request_() [%d]: Failed to connect to %s:%d\n", getpid(), _host.c_str(), _port);
      return "";
    }
    return exchange_(sock, message_(_method, _path, _host + ":" + std::to_string(_port), _body, _headers), _timeout_ms);
  }
  static inline std::string request_unix_(const std::string& _socket_path
    , const std::string& _method
    , const std::string& _path
    , const std::string& _body = ""
    , const std::unordered_map<std::string, std::string>& _headers = {}
    , int _timeout_ms = 0
  )
  {
    int sock = connect_unix_(_socket_path, _timeout_ms > 0 ? _timeout_ms : 5000);
    if (sock < 0)
    {
      fprintf(stderr, "srv_t.request_unix_() [%d]: Failed to connect to %s\n", getpid(), _socket_path.c_str());
      return "";
    }
    return exchange_(sock, message_(_method, _path, "localhost", _body, _headers), _timeout_ms);
  }
};

/* --------------------------------------------- */
