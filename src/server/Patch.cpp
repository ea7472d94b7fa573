#include "Patch.hpp"

namespace lp {
string swapModeToString(SwapMode swap) {
  switch (swap) {
    case SwapMode::INLINE:
      return "inline";
    case SwapMode::OUTLINE:
      return "outline";
    case SwapMode::APPEND:
      return "append";
    case SwapMode::PREPEND:
      return "prepend";
    case SwapMode::NONE:
      return "none";
  }
  return "inline";
}

SwapMode swapModeFromString(const string& name) {
  if (name == "outline") {
    return SwapMode::OUTLINE;
  }
  if (name == "append") {
    return SwapMode::APPEND;
  }
  if (name == "prepend") {
    return SwapMode::PREPEND;
  }
  if (name == "none") {
    return SwapMode::NONE;
  }
  return SwapMode::INLINE;
}

void to_json(json& j, const Patch& patch) {
  j = json{{"id", patch.targetId},
           {"swap", swapModeToString(patch.swap)},
           {"html", patch.html}};
}

void from_json(const json& j, Patch& patch) {
  patch.targetId = j.value("id", string());
  patch.html = j.value("html", string());
  auto swapIt = j.find("swap");
  if (swapIt != j.end() && swapIt->is_string()) {
    patch.swap = swapModeFromString(swapIt->get<string>());
  } else {
    patch.swap = SwapMode::INLINE;
  }
}

json makePatchEnvelope(const vector<Patch>& patches) {
  json envelope;
  envelope["type"] = "patch";
  envelope["patches"] = json::array();
  for (const auto& patch : patches) {
    envelope["patches"].push_back(patch);
  }
  return envelope;
}

json makeReloadEnvelope() { return json{{"type", "reload"}}; }

string envelopeToString(const json& envelope) {
  return envelope.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::ostream& operator<<(std::ostream& os, const Patch& patch) {
  os << "#" << patch.targetId << "/" << swapModeToString(patch.swap) << " ("
     << patch.html.length() << " bytes)";
  return os;
}
}  // namespace lp
