#include <fnbridge/runtime/config.hpp>

#include <fnbridge/common/exceptions.hpp>
#include <fnbridge/common/util.hpp>

#include <fstream>

#include <cereal/archives/json.hpp>
#include <cereal/details/helpers.hpp>
#include <cereal/types/string.hpp>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

namespace fnbridge::runtime::config {

  void HTTP::load(cereal::JSONInputArchive& archive)
  {
    archive(cereal::make_nvp("io-threads", io_threads));
    archive(cereal::make_nvp("request-timeout", request_timeout));
  }

  void HTTP::set_defaults()
  {
    io_threads = DEFAULT_IO_THREADS;
    request_timeout = DEFAULT_REQUEST_TIMEOUT;
  }

  void Loop::load(cereal::JSONInputArchive& archive)
  {
    archive(cereal::make_nvp("poll-backoff-ms", poll_backoff_ms));
  }

  void Loop::set_defaults()
  {
    poll_backoff_ms = DEFAULT_POLL_BACKOFF_MS;
  }

  void Runtime::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(verbose));

    common::util::cereal_load_optional(archive, "runtime-api", runtime_api);
    common::util::cereal_load_optional(archive, "default-handler", default_handler);
    common::util::cereal_load_optional(archive, "handler", handler);
    common::util::cereal_load_optional(archive, FUNCTION_DEFINITION, function_definition);

    std::optional<std::string> version;
    common::util::cereal_load_optional(archive, "adapter-version", version);
    if (version.has_value()) {
      adapter_version = std::move(version.value());
    }

    common::util::cereal_load_optional(archive, "http", http);
    common::util::cereal_load_optional(archive, "loop", loop);
  }

  void Runtime::load_env()
  {
    // Environment has precedence over the configuration file.
    if (auto val = common::util::getenv(ENV_RUNTIME_API); val.has_value()) {
      runtime_api = std::move(val);
    }
    if (auto val = common::util::getenv(ENV_DEFAULT_HANDLER); val.has_value()) {
      default_handler = std::move(val);
    }
    if (auto val = common::util::getenv(ENV_HANDLER); val.has_value()) {
      handler = std::move(val);
    }
    if (auto val = common::util::getenv(ENV_FUNCTION_DEFINITION); val.has_value()) {
      function_definition = std::move(val);
    }
  }

  void Runtime::set_defaults()
  {
    runtime_api = std::nullopt;
    default_handler = std::nullopt;
    handler = std::nullopt;
    function_definition = std::nullopt;

    verbose = false;
#if defined(FNBRIDGE_VERSION)
    adapter_version = FNBRIDGE_VERSION;
#else
    adapter_version = UNKNOWN_VERSION;
#endif

    http.set_defaults();
    loop.set_defaults();
  }

  Runtime Runtime::deserialize(int argc, char** argv)
  {
    cxxopts::Options options(
        "fnbridge-runtime", "Serves Runtime API invocations with registered functions."
    );
    options.add_options()(
        "c,config", "JSON config.", cxxopts::value<std::string>()->default_value("")
    )("v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false"));
    auto parsed_options = options.parse(argc, argv);

    std::string config_file{parsed_options["config"].as<std::string>()};

    Runtime cfg;
    if (config_file.length() > 0) {
      std::ifstream in_stream{config_file};
      if (!in_stream.is_open()) {
        throw common::InvalidConfigurationError{
            fmt::format("Could not open config file {}", config_file)};
      }

      cfg = deserialize(in_stream);
    } else {

      cfg.set_defaults();
    }

    if (parsed_options["verbose"].as<bool>()) {
      cfg.verbose = true;
    }

    return cfg;
  }

  Runtime Runtime::deserialize(std::istream& json_config)
  {
    Runtime cfg;
    cfg.set_defaults();

    try {
      cereal::JSONInputArchive archive_in(json_config);
      cfg.load(archive_in);
    } catch (cereal::Exception& exc) {
      throw common::InvalidConfigurationError(
          "Could not parse configuration, reason: " + std::string{exc.what()}
      );
    }

    return cfg;
  }

} // namespace fnbridge::runtime::config
