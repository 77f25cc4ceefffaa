/**
 * compile_once.cc — One-shot build from the command line
 *
 * Reads a component source file, runs one sandboxed build against the local
 * Docker engine and prints the JSON reply the service would send.
 *
 * Build: cmake --build . --target compile_once
 * Run:   ./compile_once <framework> <source-file> [timeoutMs]
 * Exit:  0 on success, 1 on a rejected request, build failure or timeout, 2 otherwise
 */

#include "../include/bld_a_service.hh"

#include <fstream>
#include <sstream>

int main(int argc, char** argv)
{
  if (argc < 3)
  {
    std::cerr << "usage: " << argv[0] << " <angular|react|vue> <source-file> [timeoutMs]" << std::endl;
    return 2;
  }
  std::ifstream in(argv[2], std::ios::binary);
  if (!in)
  {
    perror("compile_once: ---open---");
    return 2;
  }
  std::ostringstream source;
  source << in.rdbuf();

  cfg_t cfg;
  try
  {
    cfg.load_(); // environment only: argv carries the job here
  }
  catch (const std::exception& e)
  {
    fprintf(stderr, "compile_once [%d]: %s\n", getpid(), e.what());
    return 2;
  }
  const cfg_c& settings = cfg.settings_();

  nlohmann::json request = {
    {"framework", argv[1]},
    {"sourceCode", source.str()}
  };
  if (argc > 3) request["timeoutMs"] = argv[3];

  svc_t svc(cfg, std::make_shared<dkr_t>(settings.docker_host, settings.docker_api, settings.docker_timeout_ms));
  svc_r reply = svc.compile_(request);
  std::cout << reply.body.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  if (reply.status == 200) return 0;
  return reply.status == 500 ? 2 : 1;
}
