#ifndef FNBRIDGE_RUNTIME_FUNCTIONS_HPP
#define FNBRIDGE_RUNTIME_FUNCTIONS_HPP

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace fnbridge::runtime {

  struct Message {

    std::string payload;

    std::map<std::string, std::string> headers;
  };

  /**
   * @brief A registered function resolved for one invocation.
   *
   * The registry owns the function; the event loop keeps the handle only
   * for the duration of a single iteration.
   */
  struct FunctionHandle {

    FunctionHandle() = default;
    FunctionHandle(const FunctionHandle&) = delete;
    FunctionHandle(FunctionHandle&&) = delete;
    FunctionHandle& operator=(const FunctionHandle&) = delete;
    FunctionHandle& operator=(FunctionHandle&&) = delete;
    virtual ~FunctionHandle() = default;

    virtual std::string input_type() const = 0;

    virtual std::string output_type() const = 0;

    // Producers accept no input.
    virtual bool is_producer() const = 0;

    virtual std::string definition() const = 0;

    virtual std::optional<Message> invoke(const Message& input) = 0;
  };

  using FunctionPtr = std::shared_ptr<FunctionHandle>;

  struct Registry {

    Registry() = default;
    Registry(const Registry&) = default;
    Registry(Registry&&) = delete;
    Registry& operator=(const Registry&) = default;
    Registry& operator=(Registry&&) = delete;
    virtual ~Registry() = default;

    // No identifier selects the registry's default function, if it has one.
    virtual FunctionPtr
    lookup(const std::optional<std::string>& identifier, const std::string& content_type) = 0;

    virtual std::set<std::string> names() const = 0;
  };

  struct Codec {

    Codec() = default;
    Codec(const Codec&) = default;
    Codec(Codec&&) = delete;
    Codec& operator=(const Codec&) = default;
    Codec& operator=(Codec&&) = delete;
    virtual ~Codec() = default;

    virtual Message
    decode(const std::string& body, const std::string& input_type, bool is_producer) = 0;

    virtual std::string encode(
        const Message& input, const std::optional<Message>& output, const std::string& output_type
    ) = 0;
  };

} // namespace fnbridge::runtime

#endif
