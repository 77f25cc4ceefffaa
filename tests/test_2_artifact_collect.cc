#include "../include/bld_a_archive.hh"

#include <cassert>
#include <iostream>
#include <string>

struct tar_w // minimal ustar writer for fixtures
{
  std::string out;
  static inline void put_(std::string& _h, size_t _off, size_t _len, const std::string& _v)
  {
    memcpy(&_h[_off], _v.data(), MIN2_(_len, _v.size()));
  }
  static inline std::string octal_(uint64_t _v, size_t _width) // zero padded, NUL terminated
  {
    std::string s(_width - 1, '0');
    for (size_t i = _width - 1; i > 0 && _v > 0; --i, _v >>= 3) s[i - 1] = static_cast<char>('0' + (_v & 7));
    return s + '\0';
  }
  static inline std::string header_(const std::string& _name
    , uint64_t _size
    , char _type
    , const std::string& _prefix = ""
    , bool _base256 = false
  )
  {
    std::string h(tar_t::block, '\0');
    put_(h, 0, 100, _name);
    put_(h, 100, 8, octal_(0644, 8));
    put_(h, 108, 8, octal_(0, 8));
    put_(h, 116, 8, octal_(0, 8));
    if (_base256)
    {
      h[124] = static_cast<char>(0x80);
      for (size_t i = 0; i < 8; ++i) h[135 - i] = static_cast<char>((_size >> (8 * i)) & 0xff);
    }
    else put_(h, 124, 12, octal_(_size, 12));
    put_(h, 136, 12, octal_(1700000000, 12));
    put_(h, 148, 8, std::string(8, ' '));
    h[156] = _type;
    put_(h, 257, 6, std::string(TMAGIC, TMAGLEN));
    put_(h, 263, 2, "00");
    put_(h, 345, 155, _prefix);
    unsigned int sum = 0;
    for (unsigned char c : h) sum += c;
    std::string chk = octal_(sum, 7) + " "; // 6 digits, NUL, space
    put_(h, 148, 8, chk);
    return h;
  }
  inline tar_w& add_(const std::string& _name
    , const std::string& _body
    , char _type = REGTYPE
    , const std::string& _prefix = ""
    , bool _base256 = false
  )
  {
    out += header_(_name, _body.size(), _type, _prefix, _base256);
    out += _body;
    size_t pad = (tar_t::block - _body.size() % tar_t::block) % tar_t::block;
    out += std::string(pad, '\0');
    return *this;
  }
  inline tar_w& dir_(const std::string& _name) { return add_(_name, "", DIRTYPE); }
  static inline std::string pax_record_(const std::string& _key, const std::string& _value)
  {
    std::string rest = " " + _key + "=" + _value + "\n";
    size_t len = rest.size() + 1;
    while (std::to_string(len).size() + rest.size() != len) ++len;
    return std::to_string(len) + rest;
  }
  inline std::string end_() const { return out + std::string(2 * tar_t::block, '\0'); }
};

static std::string gzip_(const std::string& _raw)
{
  z_stream s = {};
  int r = deflateInit2(&s, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
  assert(r == Z_OK);
  std::string out(deflateBound(&s, _raw.size()), '\0');
  s.next_in = (Bytef*)_raw.data();
  s.avail_in = static_cast<uInt>(_raw.size());
  s.next_out = (Bytef*)out.data();
  s.avail_out = static_cast<uInt>(out.size());
  r = deflate(&s, Z_FINISH);
  assert(r == Z_STREAM_END);
  out.resize(s.total_out);
  deflateEnd(&s);
  return out;
}

int main(int argc, char** argv)
{

std::cout << "=== Test 1: Extension filter ===" << std::endl;
{
  tar_w t;
  t.add_("a.js", "console.log(1);")
   .add_("b.CSS", "body{}")
   .dir_("dir/")
   .add_("dir/c.html", "<p>c</p>")
   .add_("dir/d.jsx", "x")
   .add_("dir/e.json", "{}")
   .add_("main.js.map", "{\"version\":3}")
   .add_("styles.css", "p{}", AREGTYPE);
  art_m files = tar_t::collect_(t.end_());
  assert(files.size() == 4);
  assert(files["a.js"] == "console.log(1);");
  assert(files["c.html"] == "<p>c</p>");
  assert(files["main.js.map"] == "{\"version\":3}");
  assert(files["styles.css"] == "p{}");
  assert(files.count("b.CSS") == 0);
  assert(files.count("dir/") == 0 && files.count("dir") == 0 && files.count("") == 0);
  std::cout << "✓ Only .js .css .html .map regular files kept, case-sensitive, by base name" << std::endl;

  assert(tar_t::wanted_("x.min.js"));
  assert(!tar_t::wanted_("x.JS"));
  assert(!tar_t::wanted_("js"));
  std::cout << "✓ Suffix test exact" << std::endl;
}

std::cout << "\n=== Test 2: Entry kinds and names ===" << std::endl;
{
  tar_w t;
  t.add_("one/main.js", "first")
   .add_("two/main.js", "second")
   .add_("link.js", "", SYMTYPE)
   .add_("hard.js", "", LNKTYPE)
   .add_("app.js", "from-prefix", REGTYPE, "browser/very/deep")
   .add_("big.css", std::string(1500, 'c'), REGTYPE, "", true);
  art_m files = tar_t::collect_(t.end_());
  assert(files["main.js"] == "second");
  assert(files.count("link.js") == 0);
  assert(files.count("hard.js") == 0);
  assert(files["app.js"] == "from-prefix");
  assert(files["big.css"] == std::string(1500, 'c'));
  assert(files.size() == 3);
  std::cout << "✓ Later duplicate wins, links skipped, prefix and base-256 sizes read" << std::endl;

  tar_w g;
  std::string long_name = "dist/" + std::string(120, 'n') + "/bundle.map";
  g.add_("././@LongLink", long_name + '\0', tar_t::gnu_longname)
   .add_(long_name.substr(0, 99), "gnu-long");
  g.add_("PaxHeaders/x", tar_w::pax_record_("mtime", "1700000000.5") + tar_w::pax_record_("path", "assets/theme.css"), tar_t::pax_header)
   .add_("theme.txt", "pax-path");
  g.add_("PaxHeaders/global", tar_w::pax_record_("comment", "ignored"), tar_t::pax_global)
   .add_("after.js", "plain");
  art_m files2 = tar_t::collect_(g.end_());
  assert(files2["bundle.map"] == "gnu-long");
  assert(files2["theme.css"] == "pax-path");
  assert(files2.count("theme.txt") == 0);
  assert(files2["after.js"] == "plain");
  assert(files2.size() == 3);
  std::cout << "✓ GNU long names and pax paths override the header name" << std::endl;
}

std::cout << "\n=== Test 3: Unreadable archives degrade to empty ===" << std::endl;
{
  tar_w t;
  t.add_("a.js", std::string(600, 'a'));
  std::string good = t.end_();
  assert(tar_t::collect_(good).size() == 1);

  std::string bad_checksum = good;
  bad_checksum[0] = 'b';
  assert(tar_t::collect_(bad_checksum).empty());
  std::cout << "✓ Checksum mismatch" << std::endl;

  std::string truncated = good.substr(0, tar_t::block + 100);
  assert(tar_t::collect_(truncated).empty());
  std::cout << "✓ Truncated body" << std::endl;

  std::string bad_size = good; // size field garbled: the checksum no longer holds either
  art_m out = {{"keep.js", "x"}};
  memcpy(&bad_size[124], "zzzzzzzzzzz", 11);
  assert(tar_t::extract_(bad_size, out) < 0);
  assert(out.size() == 1 && out["keep.js"] == "x");
  std::cout << "✓ Corrupted header reported, output untouched" << std::endl;

  assert(tar_t::collect_("").empty());
  assert(tar_t::collect_(std::string(1024, '\0')).empty());
  std::cout << "✓ Empty and all-zero input give no files" << std::endl;

  std::string not_gzip = "\x1f\x8b garbage";
  assert(tar_t::collect_(not_gzip).empty());
  std::cout << "✓ Broken gzip stream" << std::endl;
}

std::cout << "\n=== Test 4: Gzip-wrapped archive ===" << std::endl;
{
  tar_w t;
  t.add_("index.html", "<html></html>").add_("main.js", std::string(100000, 'm'));
  std::string raw = t.end_();
  std::string gz = gzip_(raw);
  assert(tar_t::gzip_is_(gz) && !tar_t::gzip_is_(raw));
  art_m files = tar_t::collect_(gz);
  assert(files.size() == 2);
  assert(files["index.html"] == "<html></html>");
  assert(files["main.js"] == std::string(100000, 'm'));
  std::cout << "✓ Inflated before parsing" << std::endl;
}

std::cout << "\n=== All Artifact Collector Tests Passed! ===" << std::endl;
return 0;

}
