#include <fnbridge/runtime/event_loop.hpp>

#include <fnbridge/common/exceptions.hpp>
#include <fnbridge/common/util.hpp>
#include <fnbridge/runtime/endpoint.hpp>

#include <chrono>

#include <fmt/format.h>

extern char** environ;

namespace fnbridge::runtime {

  std::string_view IterationResult::type_name(Type type)
  {
    switch (type) {
    case Type::COMPLETED:
      return "completed";
    case Type::SKIPPED:
      return "skipped";
    case Type::INVOCATION_FAILURE:
      return "invocation failure";
    case Type::TRANSPORT_FAILURE:
      return "transport failure";
    case Type::REPORTING_FAILURE:
      return "reporting failure";
    }
    return "";
  }

  EventLoop::EventLoop(
      const config::Runtime& cfg, Transport& transport, Registry& registry, Codec& codec,
      TraceSink& tracing
  )
      : _cfg(cfg), _transport(transport), _codec(codec), _tracing(tracing),
        _resolver(registry, cfg), _reporter(transport)
  {
    _logger = common::util::create_logger("EventLoop");
  }

  EventLoop::~EventLoop()
  {
    stop();
    wait();
  }

  void EventLoop::start()
  {
    if (_worker_id.load() == std::this_thread::get_id()) {
      _logger->error("Event loop cannot be restarted from its own worker!");
      return;
    }

    std::lock_guard<std::mutex> start_lock{_start_mutex};

    if (_state.running()) {
      _logger->warn("Event loop is already running!");
      return;
    }

    // The previous worker has observed the stop, or is about to.
    wait();

    RuntimeEndpoint endpoint{_cfg.runtime_api.value_or("")};
    _transport.open(endpoint);

    auto token = std::make_shared<CancellationToken>();
    {
      std::lock_guard<std::mutex> lock{_mutex};
      _token = token;
      _last_failure.reset();
    }
    _stop_requested = false;
    _state.begin();

    _logger->info("Starting event loop against {}", endpoint.next_url());
    _worker = std::thread(&EventLoop::_loop, this, std::move(token));
    _worker_id = _worker.get_id();
  }

  void EventLoop::stop()
  {
    _stop_requested = true;
    _state.stop();

    std::lock_guard<std::mutex> lock{_mutex};
    if (_token) {
      _token->cancel();
    }
  }

  void EventLoop::wait()
  {
    if (_worker.joinable() && _worker.get_id() != std::this_thread::get_id()) {
      _worker.join();
      _worker_id = std::thread::id{};
    }
  }

  bool EventLoop::is_running() const
  {
    return _state.running();
  }

  std::optional<IterationResult> EventLoop::last_failure() const
  {
    std::lock_guard<std::mutex> lock{_mutex};
    return _last_failure;
  }

  void EventLoop::_loop(std::shared_ptr<CancellationToken> token)
  {
    if (_logger->should_log(spdlog::level::debug)) {
      for (char** var = environ; var != nullptr && *var != nullptr; ++var) {
        _logger->debug("Environment: {}", *var);
      }
    }

    _logger->info("Entering event loop");
    while (is_running()) {

      auto result = _iterate(*token);

      if (result.fatal()) {
        if (result.type == IterationResult::Type::REPORTING_FAILURE) {
          _logger->critical("Event loop stops, failures can no longer be reported upstream");
        } else {
          _logger->error("Event loop stops, the Runtime API is unreachable");
        }
        _state.stop();
        std::lock_guard<std::mutex> lock{_mutex};
        _last_failure = std::move(result);
      } else if (result.type == IterationResult::Type::SKIPPED) {
        if (_cfg.loop.poll_backoff_ms > 0 && is_running()) {
          std::this_thread::sleep_for(std::chrono::milliseconds(_cfg.loop.poll_backoff_ms));
        }
      } else {
        SPDLOG_LOGGER_DEBUG(
            _logger, "Request {} finished: {}", result.request_id,
            IterationResult::type_name(result.type)
        );
      }
    }

    _logger->info("Leaving event loop");
  }

  IterationResult EventLoop::_iterate(const CancellationToken& token)
  {
    SPDLOG_LOGGER_DEBUG(_logger, "Attempting to get new event");
    auto event = _transport.poll(_state, token);

    if (!event.has_value()) {
      if (!_state.running() && !_stop_requested) {
        return IterationResult{IterationResult::Type::TRANSPORT_FAILURE};
      }
      return IterationResult{IterationResult::Type::SKIPPED};
    }

    const std::string& request_id = event->request_id;
    try {
      _process(event.value(), token);
    } catch (...) {
      auto failure = std::current_exception();
      try {
        _reporter.report(request_id, failure, token);
      } catch (const common::ReportingError& exc) {
        _logger->critical("Could not report failure of request {}: {}", request_id, exc.what());
        common::util::traceback();
        return IterationResult{
            IterationResult::Type::REPORTING_FAILURE, request_id, std::current_exception()};
      }
      return IterationResult{IterationResult::Type::INVOCATION_FAILURE, request_id, failure};
    }

    return IterationResult{IterationResult::Type::COMPLETED, request_id};
  }

  void EventLoop::_process(const InvocationEvent& event, const CancellationToken& token)
  {
    if (event.trace_id.has_value() && !event.trace_id->empty()) {
      SPDLOG_LOGGER_DEBUG(_logger, "{}: {}", headers::TRACE_ID, event.trace_id.value());
      _tracing.propagate(event.trace_id.value());
    }

    auto function = _resolver.locate(event);

    Message input;
    try {
      input = _codec.decode(event.body, function->input_type(), function->is_producer());
    } catch (const std::exception&) {
      std::throw_with_nested(common::DecodingError{fmt::format(
          "Could not decode event of request {} for function {}", event.request_id,
          function->definition()
      )});
    }
    SPDLOG_LOGGER_DEBUG(
        _logger, "Event message of request {}: {} bytes", event.request_id, input.payload.size()
    );

    auto output = function->invoke(input);
    if (output.has_value()) {
      SPDLOG_LOGGER_DEBUG(
          _logger, "Reply from function {}: {} bytes", function->definition(),
          output->payload.size()
      );
    }

    std::string body;
    try {
      body = _codec.encode(input, output, function->output_type());
    } catch (const std::exception&) {
      std::throw_with_nested(common::EncodingError{fmt::format(
          "Could not encode output of request {} for function {}", event.request_id,
          function->definition()
      )});
    }

    _transport.respond(event.request_id, body, token);
  }

} // namespace fnbridge::runtime
