#ifndef __LP_WEBSOCKET_CODEC__
#define __LP_WEBSOCKET_CODEC__

#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace lp {
enum WebSocketOpcode : uint8_t {
  WS_OPCODE_CONTINUATION = 0x0,
  WS_OPCODE_TEXT = 0x1,
  WS_OPCODE_BINARY = 0x2,
  WS_OPCODE_CLOSE = 0x8,
  WS_OPCODE_PING = 0x9,
  WS_OPCODE_PONG = 0xA,
};

/** @brief GUID appended to the client key when computing the accept token. */
const string WEBSOCKET_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

struct WebSocketFrame {
  uint8_t opcode = WS_OPCODE_CONTINUATION;
  string payload;
};

/**
 * @brief Encodes and decodes single, unfragmented WebSocket frames and
 * computes the opening handshake token.
 *
 * Server-to-client frames are never masked. Client-to-server frames are
 * masked with a 4-byte key. Decoding understands both.
 */
class WebSocketCodec {
 public:
  /**
   * @brief base64(SHA-1(key + WEBSOCKET_GUID)), the Sec-WebSocket-Accept
   * value for a client's Sec-WebSocket-Key.
   */
  static string acceptToken(const string& key);

  /**
   * @brief Builds an unmasked frame with FIN set.
   * @throws std::runtime_error if the opcode does not fit in 4 bits or a
   * control frame payload exceeds 125 bytes.
   */
  static string encodeFrame(uint8_t opcode, const string& payload);

  /**
   * @brief Builds a masked frame with a random key (client side).
   */
  static string encodeMaskedFrame(uint8_t opcode, const string& payload);
  static string encodeMaskedFrame(uint8_t opcode, const string& payload,
                                  const array<uint8_t, 4>& maskKey);

  /**
   * @brief Decodes one frame from the front of an in-memory buffer.
   * @param consumed Set to the number of bytes the frame occupied.
   * @return nullopt when the buffer does not yet hold a whole frame.
   * @throws std::runtime_error when the declared length is over
   * MAX_MESSAGE_LENGTH.
   */
  static optional<WebSocketFrame> decodeFrame(const string& buffer,
                                              size_t* consumed);

  /**
   * @brief Reads one whole frame from a socket.
   * @throws std::runtime_error on short reads, timeouts or oversized frames.
   */
  static WebSocketFrame readFrame(SocketHandler* socketHandler, int fd,
                                  bool timeout);

 protected:
  static string encodeHeader(uint8_t opcode, uint64_t length, bool masked);
  static void applyMask(string* payload, const uint8_t* maskKey);
};
}  // namespace lp

#endif  // __LP_WEBSOCKET_CODEC__
