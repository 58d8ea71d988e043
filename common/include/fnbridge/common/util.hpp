#ifndef FNBRIDGE_COMMON_UTIL_HPP
#define FNBRIDGE_COMMON_UTIL_HPP

#include <fnbridge/common/exceptions.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeinfo>

#include <cereal/archives/json.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fnbridge::common::util {

  void traceback();

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name);

  // Unqualified, demangled name of the dynamic type, e.g. "FunctionNotFound".
  std::string short_type_name(const std::type_info& type);

  std::optional<std::string> getenv(const char* name);

  template <typename T>
  void cereal_load_optional(cereal::JSONInputArchive& archive, const std::string& name, T& obj)
  {

    // Unfortunately, Cereal does not allow to skip non-existing objects easily.
    // There is also no separate exception type for this.
    try {
      archive(cereal::make_nvp(name, obj));
    } catch (cereal::Exception& exc) {

      // Catch non existing object
      if (std::string_view{exc.what()}.find(fmt::format("({}) not found", name)) !=
          std::string::npos) {

        archive.setNextName(nullptr);
        obj.set_defaults();

      } else {
        throw common::InvalidConfigurationError(
            "Could not parse configuration, reason: " + std::string{exc.what()}
        );
      }
    }
  }

  template <typename T>
  void cereal_load_optional(
      cereal::JSONInputArchive& archive, const std::string& name, std::optional<T>& obj
  )
  {
    try {
      T value;
      archive(cereal::make_nvp(name, value));
      obj = std::move(value);
    } catch (cereal::Exception& exc) {

      if (std::string_view{exc.what()}.find(fmt::format("({}) not found", name)) !=
          std::string::npos) {

        archive.setNextName(nullptr);
        obj = std::nullopt;

      } else {
        throw common::InvalidConfigurationError(
            "Could not parse configuration, reason: " + std::string{exc.what()}
        );
      }
    }
  }

} // namespace fnbridge::common::util

#endif
