#include "transfer_client.hh"

#include <fstream>
#include <vector>

#include "constants.hh"
#include "utilities.hh"

namespace {

std::string download_path(retrieval_mode mode, const std::string& name)
{
  if (mode == retrieval_mode::chunked)
  {
    return std::string(chunked_download_prefix) + "/" + name;
  }
  return name;
}

int64_t write_streamed_body(response_body_stream& stream, const std::string& path)
{
  std::ofstream fout(path, std::ios::binary | std::ios::trunc);
  if (!fout)
  {
    throw io_failure("failed to open " + path);
  }
  std::vector<uint8_t> chunk(stream_chunk_size);
  int64_t total = 0;
  while (true)
  {
    size_t n = stream.read(chunk.data(), chunk.size());
    if (n == 0)
    {
      break;
    }
    fout.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(n));
    if (!fout)
    {
      throw io_failure("failed to write " + path);
    }
    total += static_cast<int64_t>(n);
  }
  fout.close();
  if (!fout)
  {
    throw io_failure("failed to write " + path);
  }
  return total;
}

} // namespace

const char* retrieval_mode_name(retrieval_mode mode)
{
  return mode == retrieval_mode::chunked ? "download-chunked" : "download";
}

Azure::Nullable<retrieval_mode> parse_retrieval_mode(const std::string& selector)
{
  if (selector == "download")
  {
    return retrieval_mode::whole;
  }
  if (selector == "download-chunked")
  {
    return retrieval_mode::chunked;
  }
  return Azure::Nullable<retrieval_mode>();
}

const char* transfer_operation_name(transfer_operation operation)
{
  switch (operation)
  {
    case transfer_operation::download:
      return "download";
    case transfer_operation::download_chunked:
      return "download-chunked";
    case transfer_operation::upload:
      return "upload";
    case transfer_operation::generate:
      return "generate";
    case transfer_operation::remove:
      return "delete";
  }
  return "unknown";
}

bool is_success_status(int status_code) { return status_code >= 200 && status_code < 300; }

bool step_outcome::succeeded() const
{
  if (!error.empty())
  {
    return false;
  }
  if (operation == transfer_operation::generate)
  {
    return true;
  }
  return status_code.HasValue() && is_success_status(status_code.Value());
}

transfer_client::transfer_client(std::shared_ptr<::session> session, std::string work_dir)
    : m_session(std::move(session)), m_work_dir(std::move(work_dir))
{
}

std::string transfer_client::artifact_path(const std::string& name) const
{
  return join_path(m_work_dir, name);
}

step_outcome transfer_client::probe_or_download(retrieval_mode mode, const std::string& name)
{
  step_outcome ret;
  ret.operation = mode == retrieval_mode::chunked ? transfer_operation::download_chunked
                                                  : transfer_operation::download;

  session_request request;
  request.method = http_method::get;
  request.path = download_path(mode, name);
  request.stream_response = mode == retrieval_mode::chunked;

  auto start = std::chrono::steady_clock::now();
  try
  {
    session_response response = m_session->send(request);
    ret.status_code = response.status_code;
    if (is_success_status(response.status_code))
    {
      const std::string path = artifact_path(name);
      if (response.body_stream)
      {
        ret.bytes = write_streamed_body(*response.body_stream, path);
      }
      else
      {
        write_file(path, response.body.data(), response.body.size());
        ret.bytes = static_cast<int64_t>(response.body.size());
      }
    }
  }
  catch (transport_failure& e)
  {
    ret.status_code.Reset();
    ret.error = e.what();
    spdlog::debug(e.what());
  }
  auto end = std::chrono::steady_clock::now();
  ret.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
  return ret;
}

step_outcome transfer_client::upload(const std::string& name)
{
  step_outcome ret;
  ret.operation = transfer_operation::upload;

  auto start = std::chrono::steady_clock::now();
  const std::vector<uint8_t> content = read_file(artifact_path(name));

  const uint64_t boundary_seed = static_cast<uint64_t>(start.time_since_epoch().count())
      + (++m_request_counter);
  const std::string boundary = make_multipart_boundary(boundary_seed);

  session_request request;
  request.method = http_method::post;
  request.path = upload_path;
  request.content_type = "multipart/form-data; boundary=" + boundary;
  request.body = make_multipart_form(boundary, upload_field_name, name, content);
  try
  {
    session_response response = m_session->send(request);
    ret.status_code = response.status_code;
    ret.bytes = static_cast<int64_t>(content.size());
  }
  catch (transport_failure& e)
  {
    ret.error = e.what();
    spdlog::debug(e.what());
  }
  auto end = std::chrono::steady_clock::now();
  ret.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
  return ret;
}

step_outcome transfer_client::remove(const std::string& name)
{
  step_outcome ret;
  ret.operation = transfer_operation::remove;

  session_request request;
  request.method = http_method::del;
  request.path = name;

  auto start = std::chrono::steady_clock::now();
  try
  {
    session_response response = m_session->send(request);
    ret.status_code = response.status_code;
  }
  catch (transport_failure& e)
  {
    ret.error = e.what();
    spdlog::debug(e.what());
  }
  auto end = std::chrono::steady_clock::now();
  ret.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
  return ret;
}
