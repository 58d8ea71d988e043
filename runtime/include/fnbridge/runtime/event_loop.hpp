#ifndef FNBRIDGE_RUNTIME_EVENT_LOOP_HPP
#define FNBRIDGE_RUNTIME_EVENT_LOOP_HPP

#include <fnbridge/runtime/config.hpp>
#include <fnbridge/runtime/error_reporter.hpp>
#include <fnbridge/runtime/functions.hpp>
#include <fnbridge/runtime/resolver.hpp>
#include <fnbridge/runtime/state.hpp>
#include <fnbridge/runtime/tracing.hpp>
#include <fnbridge/runtime/transport.hpp>

#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include <spdlog/spdlog.h>

namespace fnbridge::runtime {

  struct IterationResult {

    enum class Type {
      COMPLETED,
      // No event was received, e.g., transient poll failure.
      SKIPPED,
      // Failure of a single invocation, reported upstream.
      INVOCATION_FAILURE,
      // The control endpoint is unreachable; the loop stops.
      TRANSPORT_FAILURE,
      // The error report could not be delivered; the loop stops.
      REPORTING_FAILURE
    };

    Type type;
    std::string request_id{};
    std::exception_ptr failure{};

    bool fatal() const
    {
      return type == Type::TRANSPORT_FAILURE || type == Type::REPORTING_FAILURE;
    }

    static std::string_view type_name(Type type);
  };

  /**
   * @brief Custom runtime event loop.
   *
   * Runs poll, resolve, invoke and respond on a single worker thread, one
   * invocation at a time. The loop ends on stop(), on a socket failure while
   * polling, or when an error report cannot be delivered.
   */
  struct EventLoop {

    EventLoop(
        const config::Runtime& cfg, Transport& transport, Registry& registry, Codec& codec,
        TraceSink& tracing
    );

    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop(EventLoop&&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;
    EventLoop& operator=(EventLoop&&) = delete;

    /**
     * @brief Launches the worker thread and returns without waiting for events.
     *
     * Concurrent calls are serialized and only one of them starts a worker.
     * After stop(), the call blocks until the previous worker has finished
     * its in-flight invocation and exited.
     * Throws common::InvalidConfigurationError without a runtime API address.
     */
    void start();

    // Non-blocking and idempotent; the current iteration may still complete.
    void stop();

    void wait();

    bool is_running() const;

    // Fatal outcome that ended the loop, if any.
    std::optional<IterationResult> last_failure() const;

  private:
    void _loop(std::shared_ptr<CancellationToken> token);

    IterationResult _iterate(const CancellationToken& token);

    void _process(const InvocationEvent& event, const CancellationToken& token);

    const config::Runtime& _cfg;
    Transport& _transport;
    Codec& _codec;
    TraceSink& _tracing;

    Resolver _resolver;
    ErrorReporter _reporter;

    LoopState _state;
    std::atomic<bool> _stop_requested{false};

    mutable std::mutex _mutex;
    std::shared_ptr<CancellationToken> _token;
    std::optional<IterationResult> _last_failure;

    std::mutex _start_mutex;
    std::thread _worker;
    std::atomic<std::thread::id> _worker_id{};

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace fnbridge::runtime

#endif
