#include "utilities.hh"

#ifdef _WIN32
#include <intrin.h>
#endif

#include <sys/stat.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <numeric>

#include <azure/core/internal/cryptography/sha_hash.hpp>
#include <curl/curl.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "constants.hh"

namespace {

uint64_t rand_int(uint64_t offset)
{
#ifdef _WIN32
  uint64_t high_part = 0x12e15e35b500f16e;
  uint64_t low_part = 0x2e714eb2b37916a5;
  return __umulh(low_part, offset) + high_part * offset;
#else
  using uint128_t = __uint128_t;
  constexpr uint128_t mult = static_cast<uint128_t>(0x12e15e35b500f16e) << 64 | 0x2e714eb2b37916a5;
  uint128_t product = offset * mult;
  return product >> 64;
#endif
}

std::string to_hex(const std::vector<uint8_t>& bytes)
{
  return std::accumulate(
      bytes.begin(), bytes.end(), std::string(), [](const std::string& lhs, uint8_t rhs) {
        static const char t[16]
            = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
        return lhs + t[rhs >> 4] + t[rhs & 0x0f];
      });
}

std::string errno_message(const std::string& what, const std::string& path)
{
  return what + " " + path + ": " + std::strerror(errno);
}

} // namespace

void fill_text_buffer(uint8_t* buffer, size_t size, uint64_t seed)
{
  for (size_t i = 0; i < size; ++i)
  {
    buffer[i] = static_cast<uint8_t>(
        content_alphabet[rand_int(seed + i + 1) % content_alphabet_size]);
  }
}

void check_build_environment()
{
  spdlog::info("OS: {}", BUILD_OS_VERSION);
  spdlog::info("compiler: {}", BUILD_COMPILER_VERSION);
  spdlog::info("libcurl version: {}", curl_version());
  spdlog::info(
      "spdlog version: {}.{}.{}", SPDLOG_VER_MAJOR, SPDLOG_VER_MINOR, SPDLOG_VER_PATCH);
}

bool is_object_name_valid(const std::string& name)
{
  if (name.empty() || name == "." || name == "..")
  {
    return false;
  }
  for (char c : name)
  {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
        || c == '.' || c == '_' || c == '~' || c == '-';
    if (!ok)
    {
      return false;
    }
  }
  return true;
}

std::string join_path(const std::string& directory, const std::string& name)
{
  if (directory.empty())
  {
    return name;
  }
  if (directory.back() == '/')
  {
    return directory + name;
  }
  return directory + "/" + name;
}

Azure::Nullable<int64_t> get_file_size(const std::string& path)
{
  struct stat st;
  if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
  {
    return Azure::Nullable<int64_t>();
  }
  return static_cast<int64_t>(st.st_size);
}

std::vector<uint8_t> read_file(const std::string& path)
{
  std::ifstream fin(path, std::ios::binary);
  if (!fin)
  {
    throw io_failure(errno_message("failed to open", path));
  }
  std::vector<uint8_t> content(
      (std::istreambuf_iterator<char>(fin)), std::istreambuf_iterator<char>());
  if (fin.bad())
  {
    throw io_failure(errno_message("failed to read", path));
  }
  return content;
}

void write_file(const std::string& path, const uint8_t* data, size_t size)
{
  std::ofstream fout(path, std::ios::binary | std::ios::trunc);
  if (!fout)
  {
    throw io_failure(errno_message("failed to open", path));
  }
  fout.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
  fout.close();
  if (!fout)
  {
    throw io_failure(errno_message("failed to write", path));
  }
}

std::string sha256_hex(const std::vector<uint8_t>& data)
{
  return to_hex(Azure::Core::Cryptography::_internal::Sha256Hash().Final(data.data(), data.size()));
}

std::string make_multipart_boundary(uint64_t seed)
{
  std::string boundary = "----lifecycle-perf-";
  std::string suffix(24, '0');
  fill_text_buffer(reinterpret_cast<uint8_t*>(&suffix[0]), suffix.size(), seed);
  return boundary + suffix;
}

std::vector<uint8_t> make_multipart_form(
    const std::string& boundary,
    const std::string& field_name,
    const std::string& file_name,
    const std::vector<uint8_t>& content)
{
  const std::string head = "--" + boundary + "\r\n"
      + "Content-Disposition: form-data; name=\"" + field_name + "\"; filename=\"" + file_name
      + "\"\r\n" + "Content-Type: application/octet-stream\r\n\r\n";
  const std::string tail = "\r\n--" + boundary + "--\r\n";

  std::vector<uint8_t> body;
  body.reserve(head.size() + content.size() + tail.size());
  body.insert(body.end(), head.begin(), head.end());
  body.insert(body.end(), content.begin(), content.end());
  body.insert(body.end(), tail.begin(), tail.end());
  return body;
}

libcurl_raii::libcurl_raii() { curl_global_init(CURL_GLOBAL_DEFAULT); }
libcurl_raii::~libcurl_raii() { curl_global_cleanup(); }

logger_raii::logger_raii(
    spdlog::level::level_enum level,
    const std::string& log_filename,
    bool log_to_stderr)
{
  if (log_to_stderr)
  {
    spdlog::set_default_logger(spdlog::stderr_color_mt("stderr"));
  }
  if (!log_filename.empty())
  {
    try
    {
      auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_filename);
      spdlog::default_logger()->sinks().push_back(file_sink);
    }
    catch (spdlog::spdlog_ex& e)
    {
      spdlog::warn("failed to open log file {}, logging to console only", log_filename);
      spdlog::warn(e.what());
    }
  }
  spdlog::default_logger()->set_pattern("%+", spdlog::pattern_time_type::utc);
  spdlog::set_level(level);
}

logger_raii::~logger_raii() { spdlog::default_logger()->flush(); }
