#include "../include/bld_a_logs.hh"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

// one framed record: [tag][0 0 0][len BE][payload]
static std::string frame_(unsigned char _tag, const std::string& _payload)
{
  std::string f(8, '\0');
  f[0] = static_cast<char>(_tag);
  uint32_t n = static_cast<uint32_t>(_payload.size());
  f[4] = static_cast<char>((n >> 24) & 0xff);
  f[5] = static_cast<char>((n >> 16) & 0xff);
  f[6] = static_cast<char>((n >> 8) & 0xff);
  f[7] = static_cast<char>(n & 0xff);
  return f + _payload;
}

int main(int argc, char** argv)
{

std::cout << "=== Test 1: Record counts ===" << std::endl;
{
  assert(log_t::demux_("") == "");
  std::cout << "✓ Empty stream gives empty transcript" << std::endl;

  assert(log_t::demux_(frame_(1, "hello\n")) == "hello\n");
  std::cout << "✓ Single record" << std::endl;

  std::string stream;
  std::string expected;
  for (int i = 0; i < 200; ++i)
  {
    std::string payload = "line " + std::to_string(i) + (i % 3 == 0 ? "\n" : "");
    stream += frame_(i % 2 == 0 ? 1 : 2, payload); // stdout and stderr interleaved
    expected += payload;
  }
  assert(log_t::demux_(stream) == expected);
  std::cout << "✓ Many records concatenated in order regardless of stream tag" << std::endl;
}

std::cout << "\n=== Test 2: Boundaries ===" << std::endl;
{
  std::string stream = frame_(1, "a") + frame_(2, "") + frame_(1, "b");
  assert(log_t::demux_(stream) == "ab");
  std::cout << "✓ Zero-length record contributes nothing" << std::endl;

  stream = frame_(1, "COMPILATION_") + frame_(1, "COMPLETE\n");
  assert(log_t::demux_(stream) == "COMPILATION_COMPLETE\n");
  std::cout << "✓ Records need not align with lines" << std::endl;

  std::string binary("\x00\xff\x01\r\n", 5);
  assert(log_t::demux_(frame_(2, binary)) == binary);
  std::cout << "✓ Payload bytes passed through unchanged" << std::endl;

  std::string big(70000, 'z');
  assert(log_t::demux_(frame_(1, big)) == big);
  std::cout << "✓ Length uses all four header bytes" << std::endl;
}

std::cout << "\n=== Test 3: Truncation ===" << std::endl;
{
  std::string stream = frame_(1, "complete") + std::string("\x01\x00\x00", 3);
  assert(log_t::demux_(stream) == "complete");
  std::cout << "✓ Incomplete trailing header ends the stream" << std::endl;

  stream = frame_(1, "first") + frame_(2, "second-record");
  stream.resize(stream.size() - 7);
  assert(log_t::demux_(stream) == "firstsecond");
  std::cout << "✓ Short final payload taken as far as it goes" << std::endl;

  stream = frame_(1, "x");
  stream.resize(8);
  assert(log_t::demux_(stream) == "");
  std::cout << "✓ Header without payload yields nothing" << std::endl;
}

std::cout << "\n=== All Log Demux Tests Passed! ===" << std::endl;
return 0;

}
