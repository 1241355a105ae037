#include "bridge/validator_client.hpp"

namespace agent_coord::bridge {

const char* to_string(const call_status status) noexcept {
  switch (status) {
    case call_status::OK:
      return "ok";
    case call_status::TRANSIENT_FAILURE:
      return "transient_failure";
    case call_status::TIMEOUT:
      return "timeout";
    case call_status::UNAVAILABLE:
      return "unavailable";
  }
  return "unavailable";
}

}  // namespace agent_coord::bridge
