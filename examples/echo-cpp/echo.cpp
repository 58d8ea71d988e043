#include <fnbridge/common/exceptions.hpp>
#include <fnbridge/common/http.hpp>
#include <fnbridge/runtime/config.hpp>
#include <fnbridge/runtime/event_loop.hpp>
#include <fnbridge/runtime/functions.hpp>
#include <fnbridge/runtime/tracing.hpp>
#include <fnbridge/runtime/transport.hpp>

#include <algorithm>
#include <cctype>
#include <csignal>
#include <functional>
#include <map>

#include <spdlog/spdlog.h>

using namespace fnbridge::runtime;

struct LambdaFunction : FunctionHandle {

  using body_t = std::function<std::string(const std::string&)>;

  LambdaFunction(std::string name, body_t body) : _name(std::move(name)), _body(std::move(body))
  {
  }

  std::string input_type() const override
  {
    return "string";
  }

  std::string output_type() const override
  {
    return "string";
  }

  bool is_producer() const override
  {
    return false;
  }

  std::string definition() const override
  {
    return _name;
  }

  std::optional<Message> invoke(const Message& input) override
  {
    return Message{_body(input.payload), input.headers};
  }

private:
  std::string _name;
  body_t _body;
};

// A single registered function is also the default one.
struct InMemoryRegistry : Registry {

  void add(const std::string& name, LambdaFunction::body_t body)
  {
    _functions[name] = std::make_shared<LambdaFunction>(name, std::move(body));
  }

  FunctionPtr
  lookup(const std::optional<std::string>& identifier, const std::string& /*content_type*/) override
  {
    if (!identifier.has_value()) {
      return _functions.size() == 1 ? _functions.begin()->second : nullptr;
    }
    auto it = _functions.find(identifier.value());
    return it != _functions.end() ? it->second : nullptr;
  }

  std::set<std::string> names() const override
  {
    std::set<std::string> names;
    for (const auto& [name, _] : _functions) {
      names.insert(name);
    }
    return names;
  }

private:
  std::map<std::string, FunctionPtr> _functions;
};

struct PassthroughCodec : Codec {

  Message decode(const std::string& body, const std::string&, bool is_producer) override
  {
    return Message{is_producer ? "" : body, {}};
  }

  std::string
  encode(const Message&, const std::optional<Message>& output, const std::string&) override
  {
    return output.has_value() ? output->payload : "";
  }
};

EventLoop* instance = nullptr;

void signal_handler(int /*unused*/)
{
  if (instance != nullptr) {
    instance->stop();
  }
}

int main(int argc, char** argv)
{
  config::Runtime cfg;
  try {
    cfg = config::Runtime::deserialize(argc, argv);
  } catch (fnbridge::common::InvalidConfigurationError& exc) {
    spdlog::error("Invalid configuration: {}", exc.what());
    return 1;
  }
  cfg.load_env();

  if (cfg.verbose)
    spdlog::set_level(spdlog::level::debug);
  else
    spdlog::set_level(spdlog::level::info);
  spdlog::set_pattern("[%H:%M:%S:%f] [P %P] [T %t] [%l] %v ");
  spdlog::info("Executing fnbridge echo runtime!");

  fnbridge::common::http::HTTPClientFactory::initialize(cfg.http.io_threads);

  InMemoryRegistry registry;
  registry.add("echo", [](const std::string& input) { return input; });
  registry.add("uppercase", [](const std::string& input) {
    std::string output{input};
    std::transform(output.begin(), output.end(), output.begin(), [](unsigned char c) {
      return static_cast<char>(std::toupper(c));
    });
    return output;
  });

  PassthroughCodec codec;
  EnvironmentTraceSink tracing;
  int ret = 0;
  {
    // Clients must be released before their event loops are shut down.
    HTTPTransport transport{cfg};
    EventLoop loop{cfg, transport, registry, codec, tracing};
    instance = &loop;

    struct sigaction sigIntHandler {};
    sigIntHandler.sa_handler = &signal_handler;
    sigemptyset(&sigIntHandler.sa_mask);
    sigIntHandler.sa_flags = 0;
    sigaction(SIGINT, &sigIntHandler, nullptr);
    sigaction(SIGTERM, &sigIntHandler, nullptr);

    try {
      loop.start();
    } catch (fnbridge::common::InvalidConfigurationError& exc) {
      spdlog::error("Could not start the event loop: {}", exc.what());
      ret = 1;
    }
    loop.wait();

    auto failure = loop.last_failure();
    if (failure.has_value()) {
      spdlog::error(
          "Event loop ended with a {}", IterationResult::type_name(failure->type)
      );
      ret = 1;
    }
    instance = nullptr;
  }

  fnbridge::common::http::HTTPClientFactory::shutdown();

  spdlog::info("Echo runtime is closing down");
  return ret;
}
