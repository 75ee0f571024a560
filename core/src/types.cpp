#include "visionsync/types.hpp"

namespace visionsync {

std::string ConnectionState::to_string() const {
  switch (phase) {
  case ConnectionPhase::Disconnected:
    return "Disconnected";
  case ConnectionPhase::Connecting:
    return "Connecting";
  case ConnectionPhase::Connected:
    return "Connected";
  case ConnectionPhase::Failed:
    return "Failed(" + reason + ")";
  }
  return "Unknown";
}

} // namespace visionsync
