#ifndef __LP_PATCH__
#define __LP_PATCH__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace lp {
/** @brief How a patch's html is applied to its target element. */
enum class SwapMode { INLINE, OUTLINE, APPEND, PREPEND, NONE };

string swapModeToString(SwapMode swap);
/**
 * @brief Maps a wire name to a SwapMode. Unknown names map to INLINE.
 */
SwapMode swapModeFromString(const string& name);

/**
 * @brief A single DOM update addressed to an element id.
 */
struct Patch {
  string targetId;
  SwapMode swap = SwapMode::INLINE;
  string html;

  Patch() {}
  Patch(const string& _targetId, SwapMode _swap, const string& _html)
      : targetId(_targetId), swap(_swap), html(_html) {}

  bool operator==(const Patch& other) const {
    return targetId == other.targetId && swap == other.swap &&
           html == other.html;
  }
  bool operator!=(const Patch& other) const { return !(*this == other); }
};

/** @brief `{"id":..., "swap":..., "html":...}` */
void to_json(json& j, const Patch& patch);
/**
 * @brief Reads a wire patch. Missing fields become empty and a missing or
 * unknown swap becomes INLINE, as does a swap that is not a string.
 * @throws nlohmann::json::exception if `j` is not an object or a field has
 * the wrong type.
 */
void from_json(const json& j, Patch& patch);

/** @brief `{"type":"patch","patches":[...]}` */
json makePatchEnvelope(const vector<Patch>& patches);
/** @brief `{"type":"reload"}` */
json makeReloadEnvelope();

/**
 * @brief Serializes an envelope for the wire. Bytes that are not valid UTF-8
 * (e.g. latin-1 html) become U+FFFD instead of failing the whole message.
 */
string envelopeToString(const json& envelope);

std::ostream& operator<<(std::ostream& os, const Patch& patch);
}  // namespace lp

#endif  // __LP_PATCH__
