#ifndef __LP_HTTP_MESSAGE__
#define __LP_HTTP_MESSAGE__

#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace lp {
const size_t MAX_HTTP_HEAD_LENGTH = 64 * 1024;
const size_t MAX_HTTP_BODY_LENGTH = 1024 * 1024;

/**
 * @brief Thrown when a request cannot be parsed. Carries the status code the
 * server should answer with.
 */
class HttpParseException : public std::exception {
 public:
  HttpParseException(int _status, const string& msg)
      : status(_status), message(msg) {}
  const char* what() const noexcept override { return message.c_str(); }
  int getStatus() const { return status; }

 private:
  int status;
  std::string message;
};

struct HttpRequest {
  string method;
  string target;
  string path;
  string query;
  string version;
  /** Header names are lower-cased. Repeated headers are joined with ", ". */
  map<string, string> headers;
  string body;

  string header(const string& name) const;
  bool hasHeader(const string& name) const;
  /** @brief Value of a cookie from the Cookie header, or "" if absent. */
  string cookie(const string& name) const;
};

struct HttpResponse {
  int status = 200;
  vector<pair<string, string>> headers;
  string body;

  HttpResponse() {}
  HttpResponse(int _status, const string& contentType, const string& _body);

  void setHeader(const string& name, const string& value);
  string header(const string& name) const;
  /**
   * @brief Renders the status line, headers and body. Adds Content-Length
   * and `Connection: close` except on 101 responses.
   */
  string serialize() const;
};

class HttpMessage {
 public:
  static string reasonPhrase(int status);

  /**
   * @brief Parses a request head (request line + headers, without the blank
   * line).
   * @throws HttpParseException (400) on malformed input.
   */
  static HttpRequest parseRequestHead(const string& head);
  /**
   * @brief Parses a response head into status and headers (client side).
   * @throws HttpParseException on malformed input.
   */
  static HttpResponse parseResponseHead(const string& head);
  static map<string, string> parseCookies(const string& cookieHeader);

  /**
   * @brief Reads bytes until the blank line that ends an HTTP head.
   * @param leftover Receives any bytes read past the head.
   * @throws HttpParseException (400) when the head exceeds
   * MAX_HTTP_HEAD_LENGTH, std::runtime_error on EOF or timeout.
   */
  static string readHead(SocketHandler* socketHandler, int fd,
                         string* leftover);
  /**
   * @brief Reads a full request, including a Content-Length body.
   * @throws HttpParseException (413) for bodies over MAX_HTTP_BODY_LENGTH.
   */
  static HttpRequest readRequest(SocketHandler* socketHandler, int fd);
};
}  // namespace lp

#endif  // __LP_HTTP_MESSAGE__
