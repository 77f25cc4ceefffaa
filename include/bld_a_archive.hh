#pragma once

#include "bld_a_types.hh"

#include <tar.h>
#include <zlib.h>
#include <string>
#include <string_view>

/* --------------------------------------------- */

struct tar_t // artifact collector over a tar stream
{
  static constexpr size_t block = 512;
  static constexpr char gnu_longname = 'L';
  static constexpr char pax_header = 'x';
  static constexpr char pax_global = 'g';
  static inline bool wanted_(std::string_view _base) noexcept // case-sensitive suffix allow-list
  {
    for (std::string_view ext : {".js", ".css", ".html", ".map"})
    {
      if (_base.size() >= ext.size() && _base.compare(_base.size() - ext.size(), ext.size(), ext) == 0) return true;
    }
    return false;
  }
  static inline std::string_view field_(const char* _p, size_t _n) noexcept // NUL-terminated or full width
  {
    size_t len = 0;
    while (len < _n && _p[len] != '\0') ++len;
    return std::string_view(_p, len);
  }
  static inline short number_(const unsigned char* _p, size_t _n, uint64_t& _out) noexcept
  {
    _out = 0;
    if (_p[0] & 0x80) // GNU base-256
    {
      if (_p[0] & 0x40) return -1; // negative
      _out = _p[0] & 0x3f;
      for (size_t i = 1; i < _n; ++i)
      {
        if (_out >> 56) return -2; // overflow
        _out = (_out << 8) | _p[i];
      }
      return 0;
    }
    size_t i = 0;
    while (i < _n && (_p[i] == ' ' || _p[i] == '\0')) ++i;
    bool any = false;
    for (; i < _n && _p[i] >= '0' && _p[i] <= '7'; ++i)
    {
      _out = (_out << 3) | static_cast<uint64_t>(_p[i] - '0');
      any = true;
    }
    for (; i < _n; ++i)
    {
      if (_p[i] != ' ' && _p[i] != '\0') return -3;
    }
    return any ? 0 : -4;
  }
  static inline bool checksum_(const unsigned char* _h) noexcept
  {
    uint64_t expected = 0;
    if (number_(_h + 148, 8, expected) != 0) return false;
    uint64_t sum_u = 0;
    int64_t sum_s = 0; // historic writers summed signed chars
    for (size_t i = 0; i < block; ++i)
    {
      unsigned char c = (i >= 148 && i < 156) ? ' ' : _h[i];
      sum_u += c;
      sum_s += static_cast<signed char>(c);
    }
    return expected == sum_u || static_cast<int64_t>(expected) == sum_s;
  }
  static inline std::string pax_path_(std::string_view _records) // "len path=value\n" ...
  {
    std::string path;
    size_t pos = 0;
    while (pos < _records.size())
    {
      size_t space = _records.find(' ', pos);
      if (space == std::string_view::npos) break;
      size_t len = 0;
      for (size_t i = pos; i < space; ++i)
      {
        if (_records[i] < '0' || _records[i] > '9') return path;
        len = len * 10 + (_records[i] - '0');
      }
      if (len == 0 || pos + len > _records.size()) break;
      std::string_view record = _records.substr(space + 1, pos + len - space - 1);
      if (!record.empty() && record.back() == '\n') record.remove_suffix(1);
      size_t eq = record.find('=');
      if (eq != std::string_view::npos && record.substr(0, eq) == "path") path = std::string(record.substr(eq + 1));
      pos += len;
    }
    return path;
  }
  static inline bool gzip_is_(std::string_view _raw) noexcept
  {
    return _raw.size() >= 2
      && static_cast<unsigned char>(_raw[0]) == 0x1f
      && static_cast<unsigned char>(_raw[1]) == 0x8b;
  }
  static inline short gunzip_(std::string_view _compressed, std::string& _out)
  {
    z_stream stream = {};
    stream.next_in = (Bytef*)_compressed.data();
    stream.avail_in = static_cast<uInt>(_compressed.size());
    if (inflateInit2(&stream, 16 + MAX_WBITS) != Z_OK)
    {
      fprintf(stderr, "tar_t.gunzip_() [%d]: inflateInit2 failed\n", getpid());
      return -1;
    }
    _out.clear();
    _out.reserve(_compressed.size() * 3);
    char buffer[32768];
    int ret;
    do
    {
      stream.next_out = (Bytef*)buffer;
      stream.avail_out = sizeof(buffer);
      size_t before_out = stream.total_out;
      ret = inflate(&stream, Z_NO_FLUSH);
      if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR)
      {
        fprintf(stderr, "tar_t.gunzip_() [%d]: inflate failed with code %d\n", getpid(), ret);
        inflateEnd(&stream);
        return -2;
      }
      if (ret == Z_BUF_ERROR && before_out == stream.total_out)
      {
        fprintf(stderr, "tar_t.gunzip_() [%d]: truncated gzip stream\n", getpid());
        inflateEnd(&stream);
        return -3;
      }
      _out.append(buffer, sizeof(buffer) - stream.avail_out);
    } while (ret != Z_STREAM_END);
    inflateEnd(&stream);
    return 0;
  }
  // 0 = ok; <0 = unreadable archive and _files left untouched
  static inline short extract_(std::string_view _raw, art_m& _files)
  {
    std::string inflated;
    if (gzip_is_(_raw))
    {
      if (gunzip_(_raw, inflated) != 0) return -1;
      _raw = inflated;
    }
    art_m files;
    std::string long_name;
    size_t pos = 0;
    while (pos + block <= _raw.size())
    {
      const auto* h = reinterpret_cast<const unsigned char*>(_raw.data() + pos);
      bool zero = true;
      for (size_t i = 0; i < block && zero; ++i) zero = h[i] == 0;
      if (zero) break; // end-of-archive marker
      if (!checksum_(h))
      {
        fprintf(stderr, "tar_t.extract_() [%d]: header checksum mismatch at offset %zu\n", getpid(), pos);
        return -2;
      }
      uint64_t size = 0;
      if (number_(h + 124, 12, size) != 0)
      {
        fprintf(stderr, "tar_t.extract_() [%d]: bad size field at offset %zu\n", getpid(), pos);
        return -3;
      }
      pos += block;
      if (size > _raw.size() - pos)
      {
        fprintf(stderr, "tar_t.extract_() [%d]: entry body truncated at offset %zu\n", getpid(), pos);
        return -4;
      }
      std::string_view body = _raw.substr(pos, size);
      pos += ((size + block - 1) / block) * block;
      if (pos > _raw.size()) pos = _raw.size(); // last body without padding
      const char type = static_cast<char>(h[156]);
      if (type == gnu_longname)
      {
        long_name = std::string(field_(body.data(), body.size()));
        continue;
      }
      if (type == pax_header)
      {
        std::string path = pax_path_(body);
        if (!path.empty()) long_name = path;
        continue;
      }
      if (type == pax_global) continue;
      std::string name;
      if (!long_name.empty()) name.swap(long_name);
      else
      {
        const char* hc = reinterpret_cast<const char*>(h);
        std::string_view prefix = memcmp(hc + 257, TMAGIC, TMAGLEN) == 0 ? field_(hc + 345, 155) : std::string_view();
        name = prefix.empty()
          ? std::string(field_(hc, 100))
          : std::string(prefix) + "/" + std::string(field_(hc, 100));
      }
      if (type != REGTYPE && type != AREGTYPE) continue; // directories, links, devices
      size_t slash = name.rfind('/');
      std::string base = (slash == std::string::npos) ? name : name.substr(slash + 1);
      if (!wanted_(base)) continue;
      files[base] = std::string(body); // flat namespace: the later entry wins
    }
    _files.swap(files);
    return 0;
  }
  static inline art_m collect_(std::string_view _raw)
  {
    art_m files;
    if (extract_(_raw, files) != 0)
    {
      fprintf(stderr, "tar_t.collect_() [%d]: Extraction failed, returning no files\n", getpid());
      return {};
    }
    return files;
  }
};

/* --------------------------------------------- */
