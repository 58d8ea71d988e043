#include <fnbridge/common/util.hpp>

#include <cstdlib>
#include <typeinfo>

#include <cxxabi.h>
#include <execinfo.h>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace fnbridge::common::util {

  void traceback()
  {
    void* array[10];
    size_t size = backtrace(array, 10);
    char** trace = backtrace_symbols(array, size);
    for (size_t i = 0; i < size; ++i)
      spdlog::warn("Traceback {}: {}", i, trace[i]);
    free(trace);
  }

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name)
  {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(std::string{name}, sink);
    logger->set_pattern("[%H:%M:%S:%f] [%n] [P %P] [T %t] [%l] %v ");
    logger->set_level(spdlog::get_level());
    return logger;
  }

  std::string short_type_name(const std::type_info& type)
  {
    int status = 0;
    char* demangled = abi::__cxa_demangle(type.name(), nullptr, nullptr, &status);
    std::string name = (status == 0 && demangled != nullptr) ? demangled : type.name();
    free(demangled);

    // Drop template arguments, then namespaces.
    auto template_pos = name.find('<');
    if (template_pos != std::string::npos) {
      name.erase(template_pos);
    }
    auto namespace_pos = name.rfind("::");
    if (namespace_pos != std::string::npos) {
      name.erase(0, namespace_pos + 2);
    }
    return name;
  }

  std::optional<std::string> getenv(const char* name)
  {
    const char* value = std::getenv(name);
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string{value};
  }

} // namespace fnbridge::common::util
