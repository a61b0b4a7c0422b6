#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <azure/core/nullable.hpp>

#include "session.hh"

enum class retrieval_mode
{
  whole,
  chunked,
};

const char* retrieval_mode_name(retrieval_mode mode);
// Accepts the command line selectors "download" and "download-chunked".
Azure::Nullable<retrieval_mode> parse_retrieval_mode(const std::string& selector);

enum class transfer_operation
{
  download,
  download_chunked,
  upload,
  generate,
  remove,
};

const char* transfer_operation_name(transfer_operation operation);

struct step_outcome
{
  transfer_operation operation = transfer_operation::download;
  // Empty when the request never produced an HTTP status.
  Azure::Nullable<int> status_code;
  std::chrono::microseconds elapsed{0};
  int64_t bytes = 0;
  std::string error;

  bool succeeded() const;
};

bool is_success_status(int status_code);

class transfer_client {
public:
  transfer_client(std::shared_ptr<::session> session, std::string work_dir);

  // A 2xx response is written over the local artifact; anything else means the
  // object is absent on the server and leaves the artifact alone.
  step_outcome probe_or_download(retrieval_mode mode, const std::string& name);
  // Throws io_failure when the local artifact cannot be read.
  step_outcome upload(const std::string& name);
  step_outcome remove(const std::string& name);

  std::string artifact_path(const std::string& name) const;

private:
  std::shared_ptr<::session> m_session;
  std::string m_work_dir;
  uint64_t m_request_counter = 0;
};
