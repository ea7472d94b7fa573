#ifndef __LP_JSON_LIB__
#define __LP_JSON_LIB__

#include "nlohmann/json.hpp"

/**
 * @brief All wire payloads (envelopes, patches, invalid-target reports) are
 * nlohmann::json values.
 */
using json = nlohmann::json;

#endif  // __LP_JSON_LIB__
