#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <azure/core/nullable.hpp>

#undef SPDLOG_FMT_EXTERNAL
#include <spdlog/spdlog.h>

// Local filesystem read/write error. Fatal for a lifecycle run.
struct io_failure : std::runtime_error
{
  using std::runtime_error::runtime_error;
};

void fill_text_buffer(uint8_t* buffer, size_t size, uint64_t seed);

void check_build_environment();
bool is_object_name_valid(const std::string& name);

std::string join_path(const std::string& directory, const std::string& name);
Azure::Nullable<int64_t> get_file_size(const std::string& path);
std::vector<uint8_t> read_file(const std::string& path);
void write_file(const std::string& path, const uint8_t* data, size_t size);
std::string sha256_hex(const std::vector<uint8_t>& data);

std::string make_multipart_boundary(uint64_t seed);
std::vector<uint8_t> make_multipart_form(
    const std::string& boundary,
    const std::string& field_name,
    const std::string& file_name,
    const std::vector<uint8_t>& content);

struct libcurl_raii
{
  libcurl_raii();
  ~libcurl_raii();
};

struct logger_raii
{
  logger_raii(
      spdlog::level::level_enum level,
      const std::string& log_filename,
      bool log_to_stderr = false);
  ~logger_raii();
};
