#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// Connection error, timeout or cancelled request. No HTTP status was observed.
struct transport_failure : std::runtime_error
{
  using std::runtime_error::runtime_error;
};

enum class http_method
{
  get,
  post,
  del,
};

const char* http_method_name(http_method method);

struct session_request
{
  http_method method = http_method::get;
  // Relative to the server base URL, without a leading slash.
  std::string path;
  std::string content_type;
  std::vector<uint8_t> body;
  // When set, the body is left on the wire and handed back as session_response::body_stream.
  bool stream_response = false;
};

class response_body_stream {
public:
  // Returns 0 at end of body. Throws transport_failure.
  virtual size_t read(uint8_t* buffer, size_t count) = 0;
  virtual ~response_body_stream() {}
};

struct session_response
{
  int status_code = 0;
  std::string reason_phrase;
  std::vector<uint8_t> body;
  std::unique_ptr<response_body_stream> body_stream;
};

class session {
public:
  const std::string name;

  // Throws transport_failure when no response could be obtained.
  virtual session_response send(const session_request& request) = 0;
  virtual ~session() {}

protected:
  session(std::string name) : name(std::move(name)) {}
};

class curl_session : public session {
public:
  // A zero timeout disables the per-request deadline.
  curl_session(std::string base_url, std::chrono::milliseconds timeout);

  session_response send(const session_request& request) override;

private:
  std::string m_base_url;
  std::chrono::milliseconds m_timeout;
  std::shared_ptr<void> m_transport;
};
