#include <fnbridge/runtime/event.hpp>

#include <algorithm>
#include <cctype>

namespace fnbridge::runtime {

  std::optional<std::string> InvocationEvent::header(std::string name) const
  {
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });
    auto it = headers.find(name);
    if (it == headers.end()) {
      return std::nullopt;
    }
    return it->second;
  }

} // namespace fnbridge::runtime
