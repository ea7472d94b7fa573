#ifndef __LP_CLIENT_SCRIPT__
#define __LP_CLIENT_SCRIPT__

#include "Headers.hpp"

namespace lp {
/**
 * @brief The browser side of patch delivery, served at CLIENT_SCRIPT_PATH.
 *
 * Keeps a WebSocket open (with exponential reconnect backoff), polls the
 * patch endpoint whenever the socket is down, applies patches to the DOM and
 * reports missing targets back to the server.
 */
class ClientScript {
 public:
  /** @brief JavaScript source with the protocol paths filled in. */
  static string source();
  /** @brief `<script>` element that pages embed to load source(). */
  static string tag();
};
}  // namespace lp

#endif  // __LP_CLIENT_SCRIPT__
