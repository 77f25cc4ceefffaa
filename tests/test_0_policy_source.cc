#include "../include/bld_a_policy.hh"
#include "../include/bld_a_source.hh"

#include <cassert>
#include <iostream>
#include <set>
#include <vector>
#include <cctype>

static size_t count_(const std::string& _hay, const std::string& _needle)
{
  size_t n = 0;
  for (size_t pos = _hay.find(_needle); pos != std::string::npos; pos = _hay.find(_needle, pos + 1)) ++n;
  return n;
}

int main(int argc, char** argv)
{

std::cout << "=== Test 1: Limits default and override ===" << std::endl;
{
  lim_c defaults;
  lim_c out;
  std::string error;
  assert(lim_t::merge_(nlohmann::json::object(), defaults, out, error) == 0);
  assert(out.memory == 2147483648LL);
  assert(out.cpu_period == 100000);
  assert(out.cpu_quota == 200000);
  assert(out.timeout_ms == 60000);
  std::cout << "✓ Empty overrides yield the defaults" << std::endl;

  nlohmann::json o = {{"memory", 536870912}, {"cpuPeriod", "50000"}, {"cpuQuota", 1.2}, {"timeoutMs", 9000}};
  assert(lim_t::merge_(o, defaults, out, error) == 0);
  assert(out.memory == 536870912);
  assert(out.cpu_period == 50000);
  assert(out.cpu_quota == 2); // rounded up
  assert(out.timeout_ms == 9000);
  std::cout << "✓ Numbers, numeric strings and fractions accepted" << std::endl;

  nlohmann::json n = {{"memory", nullptr}, {"timeoutMs", nullptr}};
  assert(lim_t::merge_(n, defaults, out, error) == 0);
  assert(out.memory == defaults.memory && out.timeout_ms == defaults.timeout_ms);
  std::cout << "✓ Null means absent" << std::endl;

  assert(lim_t::merge_({{"timeout", 5000}}, defaults, out, error) == 0);
  assert(out.timeout_ms == 5000);
  assert(lim_t::merge_({{"timeoutMs", 10}, {"timeout", 5}}, defaults, out, error) == 0);
  assert(out.timeout_ms == 10);
  std::cout << "✓ Legacy timeout field honoured, timeoutMs wins" << std::endl;

  assert(lim_t::merge_({{"timeoutMs", 86400000}}, defaults, out, error) == 0);
  assert(out.timeout_ms == 86400000);
  out.timeout_ms = 7;
  assert(lim_t::merge_({{"timeoutMs", 1e13}}, defaults, out, error) == -1);
  assert(error.find("timeoutMs") != std::string::npos && error.find("must not exceed") != std::string::npos);
  assert(lim_t::merge_({{"timeout", "86400001"}}, defaults, out, error) == -1);
  assert(error.find("timeout") != std::string::npos);
  assert(out.timeout_ms == 7);
  assert(lim_t::merge_({{"memory", 1e13}}, defaults, out, error) == 0);
  std::cout << "✓ Deadlines above one day rejected, other fields uncapped" << std::endl;
}

std::cout << "\n=== Test 2: Each field rejected on its own ===" << std::endl;
{
  const lim_c defaults;
  const std::vector<std::string> fields = {"memory", "cpuPeriod", "cpuQuota", "timeoutMs"};
  const std::vector<nlohmann::json> bad = {0, -1, -0.5, "abc", "", "12abc", true, "inf", nlohmann::json::array(), 1e19};
  for (const auto& field : fields)
  {
    for (const auto& value : bad)
    {
      lim_c out;
      out.memory = 7; // sentinel: untouched on failure
      std::string error;
      nlohmann::json o = {{field, value}};
      for (const auto& other : fields)
      {
        if (other != field) o[other] = 1000; // valid neighbours
      }
      assert(lim_t::merge_(o, defaults, out, error) == -1);
      assert(error.find(field) != std::string::npos);
      for (const auto& other : fields)
      {
        if (other != field) assert(error.find(other) == std::string::npos);
      }
      assert(out.memory == 7);
    }
  }
  std::cout << "✓ Non-positive, non-numeric and out-of-range values name their field" << std::endl;

  lim_c out;
  std::string error;
  assert(lim_t::merge_({{"memory", -1}, {"cpuQuota", "x"}}, defaults, out, error) == -1);
  assert(error.find("memory") != std::string::npos);
  assert(error.find("cpuQuota") != std::string::npos);
  assert(error.find("cpuPeriod") == std::string::npos);
  std::cout << "✓ Several bad fields are all reported" << std::endl;

  nlohmann::json j = lim_t::to_json_(defaults);
  assert(j["memory"] == 2147483648LL);
  assert(j["timeoutMs"] == 60000);
  std::cout << "✓ Limits serialize with request field names" << std::endl;
}

std::cout << "\n=== Test 3: Framework profiles ===" << std::endl;
{
  assert(frm_p::all_().size() == 3);
  std::set<std::string> keys;
  for (const auto& p : frm_p::all_()) keys.insert(p.key);
  assert(keys.size() == 3);
  assert(frm_p::find_("angular") != NULL);
  assert(frm_p::find_("React") == frm_p::find_("react"));
  assert(frm_p::find_("VUE")->file == "src/App.vue");
  assert(frm_p::find_("svelte") == NULL);
  assert(frm_p::find_("") == NULL);
  assert(frm_p::find_("\xc3\x85ngular") == NULL);
  assert(frm_p::find_("r\xe9act") == NULL);
  assert(frm_p::find_("angular")->dist == "/workspace/template-app/dist/template-app");
  std::cout << "✓ One profile per key, case-insensitive lookup, unknown keys absent" << std::endl;
}

std::cout << "\n=== Test 4: Angular normalization ===" << std::endl;
{
  const frm_p& ng = *frm_p::find_("angular");
  const std::string source =
    "import { Component } from '@angular/core';\n"
    "@Component({\n"
    "  selector: \"my-widget\",\n"
    "  templateUrl: './widget.html',\n"
    "  styleUrls: ['./widget.css'],\n"
    "  template: '<p>hi</p>'\n"
    "})\n"
    "export class WidgetComponent {}\n";
  std::string once = src_t::normalize_(ng, source);
  assert(once.rfind("import { CommonModule } from '@angular/common';\n", 0) == 0);
  assert(once.find("selector: 'app-root'") != std::string::npos);
  assert(once.find("my-widget") == std::string::npos);
  assert(once.find("export class AppComponent") != std::string::npos);
  assert(once.find("WidgetComponent") == std::string::npos);
  assert(once.find("@Component({\n  standalone: true,") != std::string::npos);
  assert(once.find("templateUrl") == std::string::npos);
  assert(once.find("styleUrls") == std::string::npos);
  assert(once.find("template: '<p>hi</p>'") != std::string::npos);
  std::cout << "✓ Import, selector, class, standalone and external resources rewritten" << std::endl;

  assert(src_t::normalize_(ng, once) == once);
  std::cout << "✓ Normalization is idempotent" << std::endl;

  const std::string standalone =
    "import { CommonModule } from '@angular/common';\n"
    "@Component({ standalone: false, selector: 'x', styleUrl: './a.css', template: '' })\n"
    "export class A {}\n";
  std::string kept = src_t::normalize_(ng, standalone);
  assert(count_(kept, "standalone:") == 1);
  assert(count_(kept, "@angular/common") == 1);
  assert(kept.find("styleUrl") == std::string::npos);
  std::cout << "✓ Existing standalone flag and import left alone" << std::endl;

  const std::string plain = "const x = 1;\n";
  std::string p = src_t::normalize_(ng, plain);
  assert(p == "import { CommonModule } from '@angular/common';\n" + plain);
  std::cout << "✓ Non-matching text only gains the import" << std::endl;

  const std::string wrapped = "@Component({\n  selector:\n    'multi-line',\n  templateUrl: './a.html'\n})\nexport class X {}\n";
  std::string w = src_t::normalize_(ng, wrapped);
  assert(w.find("selector: 'app-root'") != std::string::npos);
  assert(w.find("templateUrl: './a.html'") != std::string::npos); // no comma on its line
  std::cout << "✓ Selector quote may follow a line break, removals stay on one line" << std::endl;

  const std::string body(95000, 'a');
  std::string minified = "@Component({selector:'x-big',templateUrl:'" + body + "',styles:[]}) export class Big {}";
  std::string big = src_t::normalize_(ng, minified);
  assert(big.find(body) == std::string::npos);
  assert(big.find("selector: 'app-root'") != std::string::npos);
  assert(big.find("export class AppComponent") != std::string::npos);
  assert(big.size() < 200);
  std::string open_ended = "@Component({templateUrl:'" + body + "'}) export class Big {}";
  assert(src_t::normalize_(ng, open_ended).find(body) != std::string::npos);
  std::string many;
  for (int i = 0; i < 7000; ++i) many += "styleUrl: x ";
  assert(src_t::normalize_(ng, many + "\nstyleUrl: y,").find("styleUrl: y,") == std::string::npos);
  std::cout << "✓ Single-line sources near the size cap normalize" << std::endl;

  const frm_p& react = *frm_p::find_("react");
  assert(src_t::normalize_(react, source) == source);
  assert(src_t::normalize_(*frm_p::find_("vue"), source) == source);
  std::cout << "✓ React and Vue pass through" << std::endl;
}

std::cout << "\n=== Test 5: Sandbox script never carries raw source ===" << std::endl;
{
  const frm_p& react = *frm_p::find_("react");
  const std::string hostile = "const s = \"x\"; const t = `${a}`; $(rm -rf /); 'q'\necho pwned\n";
  std::string encoded;
  assert(src_t::encode_(hostile, encoded) == 0);
  for (char c : encoded)
  {
    assert(isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/' || c == '=');
  }
  std::string script = src_t::script_(react, encoded);
  assert(script.find(hostile) == std::string::npos);
  assert(script.find("$(rm") == std::string::npos);
  assert(script.find('`') == std::string::npos);
  assert(script.find("echo pwned") == std::string::npos);
  assert(script.rfind("cd /workspace/template-app\n", 0) == 0);
  assert(script.find("rm -f src/*.css src/App.tsx\n") != std::string::npos);
  assert(script.find("echo \"" + encoded + "\" | base64 -d > src/App.tsx\n") != std::string::npos);
  assert(script.find("touch src/App.tsx\nsync\n") != std::string::npos);
  const std::string tail = "npm run build && echo \"COMPILATION_COMPLETE\"\n";
  assert(script.size() > tail.size() && script.compare(script.size() - tail.size(), tail.size(), tail) == 0);
  std::cout << "✓ Script layout and quoting safe" << std::endl;

  std::string decoded;
  assert(base64_decode_(encoded, decoded) == 0);
  assert(decoded == hostile);
  std::cout << "✓ Encoded payload decodes to the exact source" << std::endl;

  std::string big(70000, 'x');
  assert(src_t::encode_(big, encoded) == 0);
  assert(encoded.find('\n') == std::string::npos);
  std::cout << "✓ Large payload stays on one line" << std::endl;

  std::string a, b;
  assert(uuid_(a) == 0 && uuid_(b) == 0);
  assert(a.size() == 36 && a != b && a[14] == '4');
  std::cout << "✓ Job ids are random v4 identifiers" << std::endl;
}

std::cout << "\n=== All Policy & Source Tests Passed! ===" << std::endl;
return 0;

}
