/**
 * compile_service.cc — Sandboxed framework build service
 *
 * Endpoints:
 *   POST /api/compile  — build Angular/React/Vue source in a container
 *   GET  /api/health   — liveness
 *   GET  /api/config   — current default limits
 *   PUT  /api/config   — update default limits
 *
 * Build: cmake --build . --target compile_service
 * Run:   ./compile_service [port]
 * Test:  curl -X POST localhost:3001/api/compile -H 'Content-Type: application/json' \
 *          -d '{"framework":"react","sourceCode":"export default function App(){return <p>hi</p>}"}'
 */

#include "../include/bld_a_service.hh"

int main(int argc, char** argv)
{
  cfg_t cfg;
  try
  {
    cfg.load_(argc, argv);
  }
  catch (const std::exception& e)
  {
    fprintf(stderr, "compile_service [%d]: %s\n", getpid(), e.what());
    return 2;
  }
  const cfg_c& settings = cfg.settings_();

  auto docker = std::make_shared<dkr_t>(settings.docker_host, settings.docker_api, settings.docker_timeout_ms);
  if (!docker->ping_())
  {
    fprintf(stderr, "compile_service [%d]: Docker engine not reachable at %s (continuing, compiles will fail)\n", getpid(), docker->socket_path_().c_str());
  }

  svc_t svc(cfg, docker);
  srv_a app;
  svc.register_(app);

  try
  {
    app.listen_(settings.host, settings.port);
  }
  catch (const std::exception& e)
  {
    fprintf(stderr, "compile_service [%d]: %s\n", getpid(), e.what());
    return 1;
  }
  app.signal_(); // graceful shutdown on SIGINT/SIGTERM

  std::cout << "Multi-Framework Compiler Service running on http://" << settings.host << ":" << settings.port << std::endl;
  std::cout << "Frameworks:";
  for (const auto& p : frm_p::all_()) std::cout << " " << p.key;
  std::cout << std::endl;
  std::cout << "Defaults: " << cfg.json_().dump() << std::endl;

  app.serve_(); // blocks until signal

  std::cout << "Server stopped." << std::endl;
  return 0;
}
