#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

/* --------------------------------------------- */

struct log_t // multiplexed log stream: [tag:1][reserved:3][length:4 BE][payload]
{
  static constexpr size_t header_size = 8;
  static inline uint32_t length_(const unsigned char* _h) noexcept
  {
    return (static_cast<uint32_t>(_h[4]) << 24)
      | (static_cast<uint32_t>(_h[5]) << 16)
      | (static_cast<uint32_t>(_h[6]) << 8)
      | static_cast<uint32_t>(_h[7]);
  }
  // stdout and stderr records merged in emission order
  static inline std::string demux_(std::string_view _raw)
  {
    std::string transcript;
    transcript.reserve(_raw.size());
    const auto* base = reinterpret_cast<const unsigned char*>(_raw.data());
    size_t offset = 0;
    while (offset + header_size <= _raw.size()) // incomplete trailing header = end of stream
    {
      size_t length = length_(base + offset);
      offset += header_size;
      size_t available = _raw.size() - offset;
      if (length > available) length = available; // truncated last record
      transcript.append(_raw.data() + offset, length);
      offset += length;
    }
    return transcript;
  }
};

/* --------------------------------------------- */
