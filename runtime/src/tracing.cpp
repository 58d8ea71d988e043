#include <fnbridge/runtime/tracing.hpp>

#include <cerrno>
#include <cstdlib>

#include <spdlog/spdlog.h>

namespace fnbridge::runtime {

  void EnvironmentTraceSink::propagate(const std::string& trace_id)
  {
    if (setenv(TRACE_VARIABLE, trace_id.c_str(), 1) != 0) {
      spdlog::warn("Could not export trace id {}, errno {}", trace_id, errno);
    }
  }

} // namespace fnbridge::runtime
