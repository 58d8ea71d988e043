#ifndef FNBRIDGE_RUNTIME_TRACING_HPP
#define FNBRIDGE_RUNTIME_TRACING_HPP

#include <string>

namespace fnbridge::runtime {

  struct TraceSink {

    TraceSink() = default;
    TraceSink(const TraceSink&) = default;
    TraceSink(TraceSink&&) = delete;
    TraceSink& operator=(const TraceSink&) = default;
    TraceSink& operator=(TraceSink&&) = delete;
    virtual ~TraceSink() = default;

    virtual void propagate(const std::string& trace_id) = 0;
  };

  // Exports the trace header to the variable read by X-Ray instrumentation.
  struct EnvironmentTraceSink : TraceSink {

    static constexpr char TRACE_VARIABLE[] = "_X_AMZN_TRACE_ID";

    void propagate(const std::string& trace_id) override;
  };

} // namespace fnbridge::runtime

#endif
