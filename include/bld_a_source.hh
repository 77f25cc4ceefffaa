#pragma once

#include "bld_a_types.hh"

#include <sstream>
#include <string>

/* --------------------------------------------- */

struct src_t // source normalizer
{
  // linear scans only: a single minified line may be close to the source size cap
  static inline bool eol_(char _c) noexcept { return _c == '\n' || _c == '\r'; }
  static inline bool word_(char _c) noexcept
  {
    return ('A' <= _c && _c <= 'Z') || ('a' <= _c && _c <= 'z') || ('0' <= _c && _c <= '9') || _c == '_';
  }
  static inline bool space_(char _c) noexcept
  {
    return _c == ' ' || _c == '\t' || _c == '\n' || _c == '\r' || _c == '\f' || _c == '\v';
  }
  // first `selector:<spaces><quote>...<quote>` on one line -> `selector: 'app-root'`
  static inline void selector_(std::string& _code)
  {
    static const std::string key = "selector:";
    for (size_t at = _code.find(key); at != std::string::npos; at = _code.find(key, at + 1))
    {
      size_t open = at + key.size();
      while (open < _code.size() && space_(_code[open])) ++open;
      if (open >= _code.size() || (_code[open] != '\'' && _code[open] != '"')) continue;
      size_t close = _code.find_first_of("'\"\n\r", open + 1);
      if (close == std::string::npos || eol_(_code[close])) continue;
      _code.replace(at, close + 1 - at, "selector: 'app-root'");
      return;
    }
  }
  // first `export class <word>` -> `export class AppComponent`
  static inline void class_(std::string& _code)
  {
    static const std::string key = "export class ";
    for (size_t at = _code.find(key); at != std::string::npos; at = _code.find(key, at + 1))
    {
      size_t end = at + key.size();
      while (end < _code.size() && word_(_code[end])) ++end;
      if (end == at + key.size()) continue;
      _code.replace(at, end - at, "export class AppComponent");
      return;
    }
  }
  // every `<key>...<terminator>` on one line, shortest match, removed
  static inline void erase_(std::string& _code, const std::string& _key, const std::string& _terminator)
  {
    std::string kept;
    size_t copied = 0;
    size_t from = 0;
    for (size_t at = _code.find(_key, from); at != std::string::npos; at = _code.find(_key, from))
    {
      size_t end = _code.find(_terminator, at + _key.size());
      if (end == std::string::npos) break; // no later key can match either
      size_t eol = _code.find_first_of("\n\r", at);
      if (eol < end)
      {
        from = eol + 1; // keys before this line end share the same out-of-line terminator
        continue;
      }
      kept.append(_code, copied, at - copied);
      copied = from = end + _terminator.size();
    }
    if (copied == 0) return;
    kept.append(_code, copied, std::string::npos);
    _code.swap(kept);
  }
  // pattern rewrites, not a parser: a pattern that does not match leaves the text alone
  static inline std::string angular_(const std::string& _source)
  {
    std::string code = _source;
    // a. framework import
    if (code.find("@angular/common") == std::string::npos)
    {
      code = "import { CommonModule } from '@angular/common';\n" + code;
    }
    // b. canonical selector
    selector_(code);
    // c. canonical class name
    class_(code);
    // d. standalone component
    if (code.find("standalone:") == std::string::npos)
    {
      size_t at = code.find("@Component({");
      if (at != std::string::npos) code.insert(at + 12, "\n  standalone: true,");
    }
    // e. inline-only template and styles
    erase_(code, "templateUrl:", ",");
    erase_(code, "styleUrls:", "],");
    erase_(code, "styleUrl:", ",");
    return code;
  }
  static inline std::string normalize_(const frm_p& _profile, const std::string& _source)
  {
    if (_profile.key == "angular") return angular_(_source);
    return _source; // react and vue build the submission as is
  }
  static inline short encode_(const std::string& _text, std::string& _encoded)
  {
    return base64_encode_(_text, _encoded);
  }
  // /bin/sh -c script; _encoded must be base64 so nothing in it can close the quotes
  static inline std::string script_(const frm_p& _profile, const std::string& _encoded)
  {
    std::ostringstream sh;
    sh << "cd " << _profile.workdir << "\n";
    if (!_profile.purge.empty())
    {
      sh << "rm -f";
      for (const auto& f : _profile.purge) sh << " " << f;
      sh << "\n";
    }
    sh << "echo \"" << _encoded << "\" | base64 -d > " << _profile.file << "\n";
    sh << "touch " << _profile.file << "\n"; // file watchers in vite key on mtime
    sh << "sync\n";
    sh << _profile.build << " && echo \"" << BLD_A_MARKER << "\"\n";
    return sh.str();
  }
};

/* --------------------------------------------- */
