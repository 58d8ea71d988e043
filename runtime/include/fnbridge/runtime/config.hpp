#ifndef FNBRIDGE_RUNTIME_CONFIG_HPP
#define FNBRIDGE_RUNTIME_CONFIG_HPP

#include <istream>
#include <optional>
#include <string>

#include <cereal/archives/json.hpp>

namespace fnbridge::runtime::config {

  struct HTTP {

    static constexpr int DEFAULT_IO_THREADS = 1;
    // Seconds; zero disables the client timeout so that the next-event long poll can block.
    static constexpr double DEFAULT_REQUEST_TIMEOUT = 0;

    HTTP()
    {
      set_defaults();
    }

    int io_threads;
    double request_timeout;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Loop {

    static constexpr int DEFAULT_POLL_BACKOFF_MS = 0;

    Loop()
    {
      set_defaults();
    }

    // Pause before polling again after a transient poll failure.
    int poll_backoff_ms;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Runtime {

    static constexpr char ENV_RUNTIME_API[] = "AWS_LAMBDA_RUNTIME_API";
    static constexpr char ENV_DEFAULT_HANDLER[] = "DEFAULT_HANDLER";
    static constexpr char ENV_HANDLER[] = "_HANDLER";
    // Dots are not portable in environment variable names.
    static constexpr char ENV_FUNCTION_DEFINITION[] = "FUNCTION_DEFINITION";
    static constexpr char FUNCTION_DEFINITION[] = "function.definition";

    static constexpr char UNKNOWN_VERSION[] = "UNKNOWN-VERSION";

    Runtime()
    {
      set_defaults();
    }

    std::optional<std::string> runtime_api;
    std::optional<std::string> default_handler;
    std::optional<std::string> handler;
    std::optional<std::string> function_definition;

    bool verbose;
    std::string adapter_version;

    HTTP http;
    Loop loop;

    void load(cereal::JSONInputArchive& archive);
    void load_env();
    void set_defaults();

    static Runtime deserialize(int argc, char** argv);
    static Runtime deserialize(std::istream&);
  };

} // namespace fnbridge::runtime::config

#endif
