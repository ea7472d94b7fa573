#include "WebSocketCodec.hpp"

#include <openssl/sha.h>

namespace lp {
namespace {
const uint8_t FIN_BIT = 0x80;
const uint8_t MASK_BIT = 0x80;
const size_t MAX_CONTROL_PAYLOAD = 125;

uint64_t readBigEndian(const uint8_t* bytes, int count) {
  uint64_t value = 0;
  for (int i = 0; i < count; i++) {
    value = (value << 8) | bytes[i];
  }
  return value;
}

void checkLength(uint64_t length) {
  if (length > uint64_t(MAX_MESSAGE_LENGTH)) {
    throw std::runtime_error("WebSocket frame too large: " +
                             to_string(length));
  }
}
}  // namespace

string WebSocketCodec::acceptToken(const string& key) {
  string input = key + WEBSOCKET_GUID;
  unsigned char digest[SHA_DIGEST_LENGTH];
  SHA1((const unsigned char*)input.data(), input.length(), digest);
  string encoded;
  Base64::Encode(string((const char*)digest, SHA_DIGEST_LENGTH), &encoded);
  return encoded;
}

string WebSocketCodec::encodeHeader(uint8_t opcode, uint64_t length,
                                    bool masked) {
  if (opcode > 0xF) {
    throw std::runtime_error("Invalid WebSocket opcode: " + to_string(opcode));
  }
  if ((opcode & 0x8) && length > MAX_CONTROL_PAYLOAD) {
    throw std::runtime_error("Control frame payload too large: " +
                             to_string(length));
  }
  string header;
  header.push_back(char(FIN_BIT | opcode));
  uint8_t maskFlag = masked ? MASK_BIT : 0;
  if (length < 126) {
    header.push_back(char(maskFlag | uint8_t(length)));
  } else if (length <= 0xFFFF) {
    header.push_back(char(maskFlag | 126));
    header.push_back(char((length >> 8) & 0xFF));
    header.push_back(char(length & 0xFF));
  } else {
    header.push_back(char(maskFlag | 127));
    for (int shift = 56; shift >= 0; shift -= 8) {
      header.push_back(char((length >> shift) & 0xFF));
    }
  }
  return header;
}

void WebSocketCodec::applyMask(string* payload, const uint8_t* maskKey) {
  for (size_t i = 0; i < payload->length(); i++) {
    (*payload)[i] = char(uint8_t((*payload)[i]) ^ maskKey[i % 4]);
  }
}

string WebSocketCodec::encodeFrame(uint8_t opcode, const string& payload) {
  return encodeHeader(opcode, payload.length(), false) + payload;
}

string WebSocketCodec::encodeMaskedFrame(uint8_t opcode,
                                         const string& payload) {
  array<uint8_t, 4> maskKey;
  randombytes_buf(maskKey.data(), maskKey.size());
  return encodeMaskedFrame(opcode, payload, maskKey);
}

string WebSocketCodec::encodeMaskedFrame(uint8_t opcode, const string& payload,
                                         const array<uint8_t, 4>& maskKey) {
  string frame = encodeHeader(opcode, payload.length(), true);
  frame.append((const char*)maskKey.data(), maskKey.size());
  string masked = payload;
  applyMask(&masked, maskKey.data());
  return frame + masked;
}

optional<WebSocketFrame> WebSocketCodec::decodeFrame(const string& buffer,
                                                     size_t* consumed) {
  *consumed = 0;
  if (buffer.length() < 2) {
    return nullopt;
  }
  const uint8_t* bytes = (const uint8_t*)buffer.data();
  WebSocketFrame frame;
  frame.opcode = bytes[0] & 0x0F;
  bool masked = (bytes[1] & MASK_BIT) != 0;
  uint64_t length = bytes[1] & 0x7F;
  size_t pos = 2;
  if (length == 126 || length == 127) {
    int extendedBytes = (length == 126) ? 2 : 8;
    if (buffer.length() < pos + extendedBytes) {
      return nullopt;
    }
    length = readBigEndian(bytes + pos, extendedBytes);
    pos += extendedBytes;
  }
  checkLength(length);
  const uint8_t* maskKey = NULL;
  if (masked) {
    if (buffer.length() < pos + 4) {
      return nullopt;
    }
    maskKey = bytes + pos;
    pos += 4;
  }
  if (buffer.length() < pos + length) {
    return nullopt;
  }
  frame.payload = buffer.substr(pos, length);
  if (maskKey) {
    applyMask(&frame.payload, maskKey);
  }
  *consumed = pos + length;
  return frame;
}

WebSocketFrame WebSocketCodec::readFrame(SocketHandler* socketHandler, int fd,
                                         bool timeout) {
  uint8_t header[2];
  socketHandler->readAll(fd, header, 2, timeout);
  WebSocketFrame frame;
  frame.opcode = header[0] & 0x0F;
  bool masked = (header[1] & MASK_BIT) != 0;
  uint64_t length = header[1] & 0x7F;
  if (length == 126 || length == 127) {
    int extendedBytes = (length == 126) ? 2 : 8;
    uint8_t extended[8];
    socketHandler->readAll(fd, extended, extendedBytes, timeout);
    length = readBigEndian(extended, extendedBytes);
  }
  checkLength(length);
  uint8_t maskKey[4];
  if (masked) {
    socketHandler->readAll(fd, maskKey, 4, timeout);
  }
  frame.payload.resize(length);
  if (length > 0) {
    socketHandler->readAll(fd, &frame.payload[0], length, timeout);
  }
  if (masked) {
    applyMask(&frame.payload, maskKey);
  }
  VLOG(3) << "Read frame with opcode " << int(frame.opcode) << " and "
          << length << " payload bytes from fd " << fd;
  return frame;
}
}  // namespace lp
