#ifndef FNBRIDGE_RUNTIME_TRANSPORT_HPP
#define FNBRIDGE_RUNTIME_TRANSPORT_HPP

#include <fnbridge/common/http.hpp>
#include <fnbridge/runtime/endpoint.hpp>
#include <fnbridge/runtime/event.hpp>
#include <fnbridge/runtime/state.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace fnbridge::runtime {

  namespace config {
    struct Runtime;
  } // namespace config

  struct Transport {

    Transport() = default;
    Transport(const Transport&) = default;
    Transport(Transport&&) = delete;
    Transport& operator=(const Transport&) = default;
    Transport& operator=(Transport&&) = delete;
    virtual ~Transport() = default;

    virtual void open(const RuntimeEndpoint& endpoint) = 0;

    /**
     * @brief Long-poll the next invocation event.
     *
     * A socket-level failure stops the loop state and returns no event.
     * Any other failure only returns no event; the caller polls again.
     */
    virtual std::optional<InvocationEvent>
    poll(LoopState& state, const CancellationToken& token) = 0;

    // Failed delivery throws common::HTTPError; the HTTP status is only logged.
    virtual void respond(
        const std::string& request_id, const std::string& body, const CancellationToken& token
    ) = 0;

    // Throws common::ReportingError when the report cannot be delivered.
    virtual void report_error(
        const std::string& request_id, const std::string& body, const CancellationToken& token
    ) = 0;
  };

  struct HTTPTransport : Transport {

    // Granularity of cancellation checks while waiting for a reply.
    static constexpr std::chrono::milliseconds WAIT_SLICE{50};

    HTTPTransport(const config::Runtime& cfg);

    void open(const RuntimeEndpoint& endpoint) override;

    std::optional<InvocationEvent> poll(LoopState& state, const CancellationToken& token) override;

    void respond(
        const std::string& request_id, const std::string& body, const CancellationToken& token
    ) override;

    void report_error(
        const std::string& request_id, const std::string& body, const CancellationToken& token
    ) override;

  private:
    std::string _user_agent;
    double _request_timeout;

    std::optional<RuntimeEndpoint> _endpoint;
    common::http::HTTPClient _client;

    std::shared_ptr<spdlog::logger> _logger;

    const RuntimeEndpoint& _opened_endpoint() const;
  };

} // namespace fnbridge::runtime

#endif
