#include "model/monitor.hpp"

namespace netmon_agent::model {

const char* to_string(const CheckType type) noexcept {
  switch (type) {
    case CheckType::tcp:
      return "tcp";
    case CheckType::http:
      return "http";
    case CheckType::dns:
      return "dns";
    case CheckType::ssl:
      return "ssl";
    case CheckType::ping:
      break;
  }
  return "ping";
}

CheckType parse_check_type(const std::string& value) noexcept {
  if (value == "tcp") {
    return CheckType::tcp;
  }
  if (value == "http") {
    return CheckType::http;
  }
  if (value == "dns") {
    return CheckType::dns;
  }
  if (value == "ssl") {
    return CheckType::ssl;
  }
  return CheckType::ping;
}

}  // namespace netmon_agent::model
