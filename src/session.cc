#include "session.hh"

#include <type_traits>

#include <azure/core/context.hpp>
#include <azure/core/datetime.hpp>
#include <azure/core/http/curl_transport.hpp>
#include <azure/core/http/http.hpp>
#include <azure/core/io/body_stream.hpp>
#include <azure/core/url.hpp>

#include "utilities.hh"

namespace {

Azure::Core::Http::HttpMethod to_azure_method(http_method method)
{
  switch (method)
  {
    case http_method::post:
      return Azure::Core::Http::HttpMethod::Post;
    case http_method::del:
      return Azure::Core::Http::HttpMethod::Delete;
    case http_method::get:
      return Azure::Core::Http::HttpMethod::Get;
  }
  return Azure::Core::Http::HttpMethod::Get;
}

class curl_body_stream : public response_body_stream {
public:
  curl_body_stream(
      std::unique_ptr<Azure::Core::IO::BodyStream> stream,
      Azure::Core::Context context)
      : m_stream(std::move(stream)), m_context(std::move(context))
  {
  }

  size_t read(uint8_t* buffer, size_t count) override
  {
    try
    {
      return m_stream->Read(buffer, count, m_context);
    }
    catch (Azure::Core::OperationCancelledException& e)
    {
      throw transport_failure(std::string("request timed out: ") + e.what());
    }
    catch (Azure::Core::Http::TransportException& e)
    {
      throw transport_failure(e.what());
    }
  }

private:
  std::unique_ptr<Azure::Core::IO::BodyStream> m_stream;
  Azure::Core::Context m_context;
};

std::vector<uint8_t> read_to_end(
    Azure::Core::IO::BodyStream& stream,
    const Azure::Core::Context& context)
{
  try
  {
    return stream.ReadToEnd(context);
  }
  catch (Azure::Core::OperationCancelledException& e)
  {
    throw transport_failure(std::string("request timed out: ") + e.what());
  }
  catch (Azure::Core::Http::TransportException& e)
  {
    throw transport_failure(e.what());
  }
}

} // namespace

const char* http_method_name(http_method method)
{
  switch (method)
  {
    case http_method::post:
      return "POST";
    case http_method::del:
      return "DELETE";
    case http_method::get:
      return "GET";
  }
  return "GET";
}

curl_session::curl_session(std::string base_url, std::chrono::milliseconds timeout)
    : session("curl"), m_base_url(std::move(base_url)), m_timeout(timeout)
{
  Azure::Core::Http::CurlTransportOptions transport_options;
  transport_options.HttpKeepAlive = true;
  if (m_timeout.count() > 0)
  {
    transport_options.ConnectionTimeout = m_timeout;
  }
  m_transport = std::make_shared<Azure::Core::Http::CurlTransport>(transport_options);
}

session_response curl_session::send(const session_request& request)
{
  using namespace Azure::Core::Http;

  auto transport = std::static_pointer_cast<CurlTransport>(m_transport);

  Azure::Core::Url url(m_base_url);
  url.AppendPath(request.path);

  Azure::Core::Context context = Azure::Core::Context::ApplicationContext;
  if (m_timeout.count() > 0)
  {
    context = context.WithDeadline(
        Azure::DateTime(std::chrono::system_clock::now() + m_timeout));
  }

  Azure::Core::IO::MemoryBodyStream body_stream(request.body.data(), request.body.size());
  std::unique_ptr<Request> http_request;
  if (request.method == http_method::post)
  {
    http_request = std::make_unique<Request>(
        to_azure_method(request.method), url, &body_stream, !request.stream_response);
    http_request->SetHeader("Content-Length", std::to_string(request.body.size()));
  }
  else
  {
    http_request
        = std::make_unique<Request>(to_azure_method(request.method), url, !request.stream_response);
  }
  if (!request.content_type.empty())
  {
    http_request->SetHeader("Content-Type", request.content_type);
  }

  spdlog::debug("{} {}", http_method_name(request.method), url.GetAbsoluteUrl());

  std::unique_ptr<RawResponse> raw_response;
  try
  {
    raw_response = transport->Send(*http_request, context);
  }
  catch (Azure::Core::OperationCancelledException& e)
  {
    throw transport_failure(std::string("request timed out: ") + e.what());
  }
  catch (TransportException& e)
  {
    throw transport_failure(e.what());
  }
  if (!raw_response)
  {
    throw transport_failure("no response from " + url.GetAbsoluteUrl());
  }

  session_response response;
  response.status_code = static_cast<int>(
      static_cast<typename std::underlying_type<HttpStatusCode>::type>(
          raw_response->GetStatusCode()));
  response.reason_phrase = raw_response->GetReasonPhrase();

  // CurlTransport leaves the body on the wire even for buffered requests. Error bodies
  // are drained so the connection can go back to the pool.
  response.body = std::move(raw_response->GetBody());
  auto stream = raw_response->ExtractBodyStream();
  if (stream)
  {
    if (request.stream_response && response.status_code >= 200 && response.status_code < 300)
    {
      response.body_stream = std::make_unique<curl_body_stream>(std::move(stream), context);
    }
    else if (response.body.empty())
    {
      response.body = read_to_end(*stream, context);
    }
  }
  return response;
}
