#pragma once

#include <cstdlib>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <cctype>
#include <cstdio>
#include <unistd.h>
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <algorithm>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/buffer.h>
#include <openssl/rand.h>

/* --------------------------------------------- */

#ifndef MAX2_
#define MAX2_(a, b) ((a) > (b) ? (a) : (b))
#endif
#ifndef MIN2_
#define MIN2_(a, b) ((a) < (b) ? (a) : (b))
#endif

#define BLD_A_MARKER "COMPILATION_COMPLETE" // echoed by the sandbox after a clean build
#define BLD_A_TIMEOUT_MAX_MS INT64_C(86400000) // one day, upper bound for timeoutMs

/* --------------------------------------------- */

inline short base64_encode_(std::string_view _data, std::string& _string) // binary to string
{
  if (_data.empty())
  {
    _string.clear();
    return 0;
  }
  BIO *b64 = BIO_new(BIO_f_base64());
  if (!b64)
  {
    fprintf(stderr, "base64_encode_() [%d]: Error creating BIO object.\n", getpid());
    return -1;
  }
  BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL); // single line: the result lands inside a shell string
  BIO *bmem = BIO_new(BIO_s_mem());
  if (!bmem)
  {
    fprintf(stderr, "base64_encode_() [%d]: Error creating BIO memory object.\n", getpid());
    BIO_free_all(b64);
    return -2;
  }
  b64 = BIO_push(b64, bmem);
  if (BIO_write(b64, _data.data(), static_cast<int>(_data.size())) <= 0)
  {
    fprintf(stderr, "base64_encode_() [%d]: Error writing to BIO.\n", getpid());
    BIO_free_all(b64);
    return -3;
  }
  if (BIO_flush(b64) != 1)
  {
    fprintf(stderr, "base64_encode_() [%d]: Error flushing BIO.\n", getpid());
    BIO_free_all(b64);
    return -4;
  }
  BUF_MEM *buffer_ptr = NULL;
  BIO_get_mem_ptr(b64, &buffer_ptr);
  if (!buffer_ptr || !buffer_ptr->data || buffer_ptr->length == 0)
  {
    fprintf(stderr, "base64_encode_() [%d]: Error getting memory pointer.\n", getpid());
    BIO_free_all(b64);
    return -5;
  }
  _string.assign(buffer_ptr->data, buffer_ptr->length);
  BIO_free_all(b64);
  return 0;
}
inline short base64_decode_(const std::string &_string64, std::string& _data) // string to binary
{
  if (_string64.empty())
  {
    _data.clear();
    return 0;
  }
  BIO *b64 = BIO_new(BIO_f_base64());
  if (!b64)
  {
    fprintf(stderr, "base64_decode_() [%d]: Error creating BIO object.\n", getpid());
    return -1;
  }
  BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
  BIO *bmem = BIO_new_mem_buf(_string64.data(), static_cast<int>(_string64.size()));
  if (!bmem)
  {
    fprintf(stderr, "base64_decode_() [%d]: Error creating BIO memory object.\n", getpid());
    BIO_free_all(b64);
    return -2;
  }
  b64 = BIO_push(b64, bmem);
  std::string result(EVP_DECODE_LENGTH(_string64.size()), '\0');
  int decoded_len = BIO_read(b64, result.data(), static_cast<int>(result.size()));
  if (decoded_len < 0)
  {
    fprintf(stderr, "base64_decode_() [%d]: Error reading from BIO.\n", getpid());
    BIO_free_all(b64);
    return -3;
  }
  result.resize(decoded_len);
  _data.swap(result);
  BIO_free_all(b64);
  return 0;
}

// RFC 4122 version 4 identifier from the OpenSSL CSPRNG
inline short uuid_(std::string& _uuid)
{
  unsigned char b[16];
  if (RAND_bytes(b, sizeof(b)) != 1)
  {
    fprintf(stderr, "uuid_() [%d]: RAND_bytes failed.\n", getpid());
    return -1;
  }
  b[6] = (b[6] & 0x0f) | 0x40; // version 4
  b[8] = (b[8] & 0x3f) | 0x80; // variant 10xx
  static const char* hex = "0123456789abcdef";
  _uuid.clear();
  _uuid.reserve(36);
  for (int i = 0; i < 16; ++i)
  {
    if (i == 4 || i == 6 || i == 8 || i == 10) _uuid.push_back('-');
    _uuid.push_back(hex[b[i] >> 4]);
    _uuid.push_back(hex[b[i] & 0xf]);
  }
  return 0;
}

/* --------------------------------------------- */

using art_m = std::map<std::string, std::string>; // artifacts: base filename -> content

struct frm_p // framework profile
{
  std::string key;
  std::string image;
  std::string workdir;                // template application root in the sandbox
  std::string file;                   // source path relative to workdir
  std::string dist;                   // build output directory (absolute)
  std::string cache_host;             // host side of the toolchain cache mount
  std::string cache_cont;             // sandbox side of the toolchain cache mount
  std::vector<std::string> purge;     // template files that would conflict with the submission
  std::vector<std::string> env;       // "KEY=VALUE"
  std::string build;                  // build command line
  static inline const std::vector<frm_p>& all_()
  {
    static const std::vector<frm_p> profiles =
    {
      {"angular"
        , "angular-compiler:latest"
        , "/workspace/template-app"
        , "src/app/app.ts"
        , "/workspace/template-app/dist/template-app"
        , "/tmp/angular-cache"
        , "/workspace/template-app/.angular/cache"
        , {"src/app/app.ts", "src/app/app.component.html", "src/app/app.component.css"}
        , {"NG_CLI_ANALYTICS=false"}
        , "ng build --configuration production --output-hashing none --optimization true --source-map true --progress false"
      },
      {"react"
        , "react-compiler:latest"
        , "/workspace/template-app"
        , "src/App.tsx"
        , "/workspace/template-app/dist"
        , "/tmp/react-cache"
        , "/workspace/template-app/node_modules/.vite"
        , {"src/*.css", "src/App.tsx"}
        , {}
        , "npm run build"
      },
      {"vue"
        , "vue-compiler:latest"
        , "/workspace/template-app"
        , "src/App.vue"
        , "/workspace/template-app/dist"
        , "/tmp/vue-cache"
        , "/workspace/template-app/node_modules/.vite"
        , {"src/components/*.vue"}
        , {}
        , "npx vite build"
      },
    };
    return profiles;
  }
  static inline const frm_p* find_(std::string_view _key) // case-insensitive; NULL when unsupported
  {
    std::string lc(_key);
    std::transform(lc.begin(), lc.end(), lc.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& p : all_())
    {
      if (p.key == lc) return &p;
    }
    return NULL;
  }
};

/* --------------------------------------------- */

struct lim_c // limits of one job
{
  int64_t memory = 2147483648;  // bytes
  int64_t cpu_period = 100000;  // us
  int64_t cpu_quota = 200000;   // us
  int64_t timeout_ms = 60000;   // wall clock
};

struct err_k // error kind
{
  enum value : uint8_t
  {
    NONE = 0,
    VALIDATION = 1,     // rejected before any sandbox exists
    BUILD_FAILED = 2,   // nonzero exit or missing completion marker
    TIMEOUT = 3,        // deadline elapsed first
    INFRASTRUCTURE = 4  // runtime unreachable, image missing, protocol error
  };
  value v;
  constexpr err_k() noexcept : v(NONE) {}
  constexpr err_k(value val) noexcept : v(val) {}
  constexpr operator value() const noexcept { return v; }
  explicit operator bool() = delete;
  inline const char* name_() const noexcept
  {
    switch (v)
    {
      case VALIDATION:     return "validation";
      case BUILD_FAILED:   return "build_failed";
      case TIMEOUT:        return "timeout";
      case INFRASTRUCTURE: return "infrastructure";
      default:             return "none";
    }
  }
};

struct job_s // job state
{
  enum value : uint8_t
  {
    NONE = 0,
    CREATED = 1,
    RUNNING = 2,
    SUCCESS = 3,
    BUILD_FAILED = 4,
    TIMED_OUT = 5,
    ERRORED = 6,
    CLEANED_UP = 7
  };
  value v;
  constexpr job_s() noexcept : v(NONE) {}
  constexpr job_s(value val) noexcept : v(val) {}
  constexpr operator value() const noexcept { return v; }
  explicit operator bool() = delete;
  constexpr bool terminal_() const noexcept { return v >= SUCCESS && v <= ERRORED; }
  inline const char* name_() const noexcept
  {
    switch (v)
    {
      case CREATED:      return "CREATED";
      case RUNNING:      return "RUNNING";
      case SUCCESS:      return "SUCCESS";
      case BUILD_FAILED: return "BUILD_FAILED";
      case TIMED_OUT:    return "TIMED_OUT";
      case ERRORED:      return "ERRORED";
      case CLEANED_UP:   return "CLEANED_UP";
      default:           return "NONE";
    }
  }
};

/* --------------------------------------------- */
