#include "code_executor.hpp"
#include "config.hpp"
#include "openai_compatible_http_provider.hpp"
#include "relay_router.hpp"

#include <httplib.h>

#include <csignal>
#include <iostream>
#include <memory>

int main() {
  std::cout.setf(std::ios::unitbuf);
  std::signal(SIGPIPE, SIG_IGN);

  toolseek::LoadDotEnv(".env");
  auto cfg = toolseek::LoadConfigFromEnv();
  if (cfg.upstream_api_key.empty()) {
    std::cerr << "DEEPSEEK_API_KEY must be set in environment\n";
    return 1;
  }

  auto upstream = std::make_unique<toolseek::OpenAiCompatibleHttpProvider>("deepseek", cfg.upstream, cfg.upstream_api_key);
  upstream->SetReadTimeout(cfg.upstream_read_timeout_s);
  toolseek::PythonExecutor executor(cfg.python_executable);

  httplib::Server server;
  toolseek::RelayRouter router(cfg, upstream.get(), &executor);
  router.Register(&server);

  std::cout << "[boot] listen=" << cfg.listen.host << ":" << cfg.listen.port
            << " upstream=" << toolseek::EndpointOrigin(cfg.upstream) << cfg.upstream.base_path
            << " model=" << cfg.upstream_model << " code_execution=" << (cfg.code_execution_enabled ? 1 : 0)
            << " python=" << cfg.python_executable << " max_sub_requests=" << cfg.max_sub_requests << "\n";
  if (!server.listen(cfg.listen.host.c_str(), cfg.listen.port)) {
    std::cerr << "failed to listen on " << cfg.listen.host << ":" << cfg.listen.port << "\n";
    return 1;
  }
  return 0;
}
