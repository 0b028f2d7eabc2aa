#pragma once

#include "code_executor.hpp"
#include "config.hpp"
#include "providers/provider.hpp"

#include <httplib.h>

namespace toolseek {

// OpenAI-compatible front of the relay. Streaming chat requests run through
// the tool loop when code execution is enabled; everything else is proxied.
class RelayRouter {
 public:
  RelayRouter(RelayConfig cfg, IUpstreamClient* upstream, ICodeExecutor* executor);
  void Register(httplib::Server* server);

 private:
  RelayConfig cfg_;
  IUpstreamClient* upstream_;
  ICodeExecutor* executor_;
};

}  // namespace toolseek
