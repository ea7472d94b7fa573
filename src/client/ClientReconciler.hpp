#ifndef __LP_CLIENT_RECONCILER__
#define __LP_CLIENT_RECONCILER__

#include "Document.hpp"
#include "Headers.hpp"
#include "Patch.hpp"

namespace lp {
enum class ReconcilerState { CONNECTING, CONNECTED, RECONNECT_WAIT };

/** @brief Work the driver must do after an event or a tick. */
enum class ReconcilerAction { OPEN_SOCKET, POLL };

/**
 * @brief Client-side delivery state machine, independent of any I/O.
 *
 * The socket and the poll endpoint are both armed at all times: while the
 * socket is down the client polls every POLL_PERIOD, and reconnects with
 * exponential backoff. The driver feeds events and the current time in and
 * performs the returned actions.
 */
class ClientReconciler {
 public:
  typedef std::chrono::steady_clock::time_point TimePoint;

  static const std::chrono::milliseconds POLL_PERIOD;
  static const std::chrono::milliseconds BACKOFF_BASE;
  static const std::chrono::milliseconds BACKOFF_MAX;
  static constexpr int MAX_ATTEMPT = 6;

  ClientReconciler(shared_ptr<Document> _document,
                   std::function<void(const string&)> _reportInvalid);

  /** @brief Initial actions: open the socket and start polling. */
  vector<ReconcilerAction> start(TimePoint now);
  /** @brief The socket handshake completed. */
  vector<ReconcilerAction> onOpen(TimePoint now);
  /** @brief The socket failed to open, errored or closed. */
  vector<ReconcilerAction> onDisconnect(TimePoint now);
  /** @brief Fires whichever timers are due. */
  vector<ReconcilerAction> tick(TimePoint now);

  /** @brief A text frame from the socket. Malformed messages are ignored. */
  void handleMessage(const string& text);
  /** @brief A 200 body from the poll endpoint. */
  void handlePollResponse(const string& body);
  void applyPatches(const vector<Patch>& patches);
  void applyPatch(const Patch& patch);

  /** @brief min(BACKOFF_BASE * 2^attempt, BACKOFF_MAX) */
  static std::chrono::milliseconds backoffDelay(int attempt);

  ReconcilerState getState();
  int getAttempt();
  bool isPolling();
  /** @brief When the next reconnect or poll is due, if any. */
  optional<TimePoint> nextDeadline();

 protected:
  void scheduleReconnect(TimePoint now);
  void startPolling(TimePoint now, vector<ReconcilerAction>* actions);
  void applyJsonPatches(const json& patches);

  shared_ptr<Document> document;
  std::function<void(const string&)> reportInvalid;
  std::recursive_mutex reconcilerMutex;
  ReconcilerState state;
  int attempt;
  optional<TimePoint> reconnectAt;
  optional<TimePoint> nextPollAt;
};
}  // namespace lp

#endif  // __LP_CLIENT_RECONCILER__
