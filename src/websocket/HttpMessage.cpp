#include "HttpMessage.hpp"

namespace lp {
namespace {
const string HEAD_TERMINATOR = "\r\n\r\n";
const int HEAD_READ_TIMEOUT_SECONDS = 10;

void parseHeaderLines(const vector<string>& lines, size_t start,
                      map<string, string>* headers) {
  for (size_t i = start; i < lines.size(); i++) {
    string line = lines[i];
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    auto colon = line.find(':');
    if (colon == string::npos || colon == 0) {
      throw HttpParseException(400, "Malformed header line: " + line);
    }
    string name = toLower(trim(line.substr(0, colon)));
    string value = trim(line.substr(colon + 1));
    auto it = headers->find(name);
    if (it == headers->end()) {
      (*headers)[name] = value;
    } else {
      it->second += ", " + value;
    }
  }
}
}  // namespace

string HttpRequest::header(const string& name) const {
  auto it = headers.find(toLower(name));
  if (it == headers.end()) {
    return "";
  }
  return it->second;
}

bool HttpRequest::hasHeader(const string& name) const {
  return headers.find(toLower(name)) != headers.end();
}

string HttpRequest::cookie(const string& name) const {
  auto cookies = HttpMessage::parseCookies(header("cookie"));
  auto it = cookies.find(name);
  if (it == cookies.end()) {
    return "";
  }
  return it->second;
}

HttpResponse::HttpResponse(int _status, const string& contentType,
                           const string& _body)
    : status(_status), body(_body) {
  if (!contentType.empty()) {
    setHeader("Content-Type", contentType);
  }
}

void HttpResponse::setHeader(const string& name, const string& value) {
  for (auto& it : headers) {
    if (toLower(it.first) == toLower(name)) {
      it.second = value;
      return;
    }
  }
  headers.push_back(make_pair(name, value));
}

string HttpResponse::header(const string& name) const {
  for (const auto& it : headers) {
    if (toLower(it.first) == toLower(name)) {
      return it.second;
    }
  }
  return "";
}

string HttpResponse::serialize() const {
  stringstream ss;
  ss << "HTTP/1.1 " << status << " " << HttpMessage::reasonPhrase(status)
     << "\r\n";
  for (const auto& it : headers) {
    ss << it.first << ": " << it.second << "\r\n";
  }
  if (status != 101) {
    ss << "Content-Length: " << body.length() << "\r\n";
    ss << "Connection: close\r\n";
  }
  ss << "\r\n";
  if (status != 101) {
    ss << body;
  }
  return ss.str();
}

string HttpMessage::reasonPhrase(int status) {
  switch (status) {
    case 101:
      return "Switching Protocols";
    case 200:
      return "OK";
    case 204:
      return "No Content";
    case 400:
      return "Bad Request";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 413:
      return "Payload Too Large";
    case 500:
      return "Internal Server Error";
    case 503:
      return "Service Unavailable";
    default:
      return "Unknown";
  }
}

HttpRequest HttpMessage::parseRequestHead(const string& head) {
  auto lines = split(head, '\n');
  if (lines.empty()) {
    throw HttpParseException(400, "Empty request");
  }
  string requestLine = trim(lines[0]);
  auto parts = split(requestLine, ' ');
  if (parts.size() != 3 || parts[0].empty() || parts[1].empty() ||
      parts[2].find("HTTP/") != 0) {
    throw HttpParseException(400, "Malformed request line: " + requestLine);
  }
  HttpRequest request;
  request.method = parts[0];
  request.target = parts[1];
  request.version = parts[2];
  auto question = request.target.find('?');
  if (question == string::npos) {
    request.path = request.target;
  } else {
    request.path = request.target.substr(0, question);
    request.query = request.target.substr(question + 1);
  }
  parseHeaderLines(lines, 1, &request.headers);
  return request;
}

HttpResponse HttpMessage::parseResponseHead(const string& head) {
  auto lines = split(head, '\n');
  if (lines.empty()) {
    throw HttpParseException(400, "Empty response");
  }
  string statusLine = trim(lines[0]);
  auto parts = split(statusLine, ' ');
  if (parts.size() < 2 || parts[0].find("HTTP/") != 0) {
    throw HttpParseException(400, "Malformed status line: " + statusLine);
  }
  HttpResponse response;
  try {
    response.status = stoi(parts[1]);
  } catch (const std::exception&) {
    throw HttpParseException(400, "Malformed status code: " + parts[1]);
  }
  map<string, string> headers;
  parseHeaderLines(lines, 1, &headers);
  for (const auto& it : headers) {
    response.headers.push_back(it);
  }
  return response;
}

map<string, string> HttpMessage::parseCookies(const string& cookieHeader) {
  map<string, string> cookies;
  for (const auto& pair : split(cookieHeader, ';')) {
    auto equals = pair.find('=');
    if (equals == string::npos) {
      continue;
    }
    string name = trim(pair.substr(0, equals));
    string value = trim(pair.substr(equals + 1));
    if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
      value = value.substr(1, value.length() - 2);
    }
    if (!name.empty() && cookies.find(name) == cookies.end()) {
      cookies[name] = value;
    }
  }
  return cookies;
}

string HttpMessage::readHead(SocketHandler* socketHandler, int fd,
                             string* leftover) {
  string buffer;
  char chunk[4096];
  time_t startTime = time(NULL);
  while (true) {
    auto terminator = buffer.find(HEAD_TERMINATOR);
    if (terminator != string::npos) {
      *leftover = buffer.substr(terminator + HEAD_TERMINATOR.length());
      return buffer.substr(0, terminator);
    }
    if (buffer.length() > MAX_HTTP_HEAD_LENGTH) {
      throw HttpParseException(400, "Request head too large");
    }
    if (time(NULL) > startTime + HEAD_READ_TIMEOUT_SECONDS) {
      throw std::runtime_error("Timed out reading HTTP head");
    }
    if (!waitOnSocketData(fd)) {
      continue;
    }
    ssize_t bytesRead = socketHandler->read(fd, chunk, sizeof(chunk));
    if (bytesRead == 0) {
      throw std::runtime_error("Peer closed before sending a full head");
    }
    if (bytesRead < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        continue;
      }
      throw std::runtime_error(string("Error reading HTTP head: ") +
                               strerror(errno));
    }
    buffer.append(chunk, bytesRead);
  }
}

HttpRequest HttpMessage::readRequest(SocketHandler* socketHandler, int fd) {
  string leftover;
  string head = readHead(socketHandler, fd, &leftover);
  HttpRequest request = parseRequestHead(head);
  if (request.hasHeader("transfer-encoding")) {
    throw HttpParseException(400, "Chunked request bodies are not supported");
  }
  size_t contentLength = 0;
  if (request.hasHeader("content-length")) {
    string value = request.header("content-length");
    if (value.empty() ||
        value.find_first_not_of("0123456789") != string::npos ||
        value.length() > 12) {
      throw HttpParseException(400, "Invalid Content-Length: " + value);
    }
    contentLength = stoull(value);
  }
  if (contentLength > MAX_HTTP_BODY_LENGTH) {
    throw HttpParseException(413, "Request body too large");
  }
  if (leftover.length() > contentLength) {
    leftover.resize(contentLength);
  }
  request.body = leftover;
  if (request.body.length() < contentLength) {
    size_t offset = request.body.length();
    request.body.resize(contentLength);
    socketHandler->readAll(fd, &request.body[offset], contentLength - offset,
                           true);
  }
  VLOG(2) << "Read " << request.method << " " << request.target << " ("
          << request.body.length() << " body bytes) from fd " << fd;
  return request;
}
}  // namespace lp
