#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <azure/core/nullable.hpp>

#include "transfer_client.hh"
#include "utilities.hh"

struct usage_error : std::runtime_error
{
  using std::runtime_error::runtime_error;
};

enum class report_format
{
  text,
  json,
};

struct run_configuration
{
  std::string name;
  int64_t size = 0;
  std::string server_url;
  retrieval_mode mode = retrieval_mode::whole;

  std::chrono::milliseconds timeout;
  std::string work_dir = ".";
  Azure::Nullable<uint64_t> seed;
  bool skip_probe = false;
  report_format report = report_format::text;
  spdlog::level::level_enum log_level = spdlog::level::info;
  std::string log_file;
  bool show_help = false;

  run_configuration();
};

// args excludes the program name. Throws usage_error.
run_configuration parse_options(const std::vector<std::string>& args);
std::string usage_text(const std::string& program);
