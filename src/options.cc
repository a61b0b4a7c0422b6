#include "options.hh"

#include <algorithm>
#include <cctype>

#include <azure/core/url.hpp>

#include "constants.hh"

namespace {

uint64_t parse_unsigned(const std::string& what, const std::string& value)
{
  auto is_digit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };
  if (value.empty() || !std::all_of(value.begin(), value.end(), is_digit))
  {
    throw usage_error("invalid " + what + ": " + value);
  }
  try
  {
    return std::stoull(value);
  }
  catch (std::out_of_range&)
  {
    throw usage_error(what + " out of range: " + value);
  }
}

std::string normalize_server_url(const std::string& url)
{
  if (url.compare(0, 7, "http://") != 0 && url.compare(0, 8, "https://") != 0)
  {
    throw usage_error("server URL must start with http:// or https://: " + url);
  }
  std::string ret = url;
  while (!ret.empty() && ret.back() == '/')
  {
    ret.pop_back();
  }
  if (ret.find("://") == std::string::npos)
  {
    throw usage_error("server URL has no host: " + url);
  }
  const auto authority_begin = ret.find("://") + 3;
  const std::string authority
      = ret.substr(authority_begin, ret.find_first_of("/?#", authority_begin) - authority_begin);
  auto port_separator = authority.rfind(':');
  if (!authority.empty() && authority.back() == ']')
  {
    port_separator = std::string::npos;
  }
  const std::string host = authority.substr(0, port_separator);
  if (host.empty())
  {
    throw usage_error("server URL has no host: " + url);
  }
  if (port_separator != std::string::npos)
  {
    const std::string port = authority.substr(port_separator + 1);
    auto is_digit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };
    if (port.empty() || port.size() > 5 || !std::all_of(port.begin(), port.end(), is_digit)
        || std::stoul(port) == 0 || std::stoul(port) > 65535)
    {
      throw usage_error("server URL has an invalid port: " + url);
    }
  }
  try
  {
    Azure::Core::Url parsed(ret);
    if (parsed.GetHost().empty())
    {
      throw usage_error("server URL has no host: " + url);
    }
  }
  catch (std::invalid_argument& e)
  {
    throw usage_error("invalid server URL " + url + ": " + e.what());
  }
  catch (std::out_of_range& e)
  {
    throw usage_error("invalid server URL " + url + ": " + e.what());
  }
  return ret;
}

} // namespace

run_configuration::run_configuration() : timeout(default_request_timeout) {}

run_configuration parse_options(const std::vector<std::string>& args)
{
  run_configuration config;
  std::vector<std::string> positional;

  for (size_t i = 0; i < args.size(); ++i)
  {
    const std::string& arg = args[i];
    auto next_value = [&]() -> const std::string& {
      if (i + 1 >= args.size())
      {
        throw usage_error("missing value for " + arg);
      }
      return args[++i];
    };

    if (arg == "-h" || arg == "--help")
    {
      config.show_help = true;
      return config;
    }
    else if (arg == "--timeout-ms")
    {
      config.timeout = std::chrono::milliseconds(parse_unsigned("timeout", next_value()));
    }
    else if (arg == "--work-dir")
    {
      config.work_dir = next_value();
      if (config.work_dir.empty())
      {
        throw usage_error("work directory must not be empty");
      }
    }
    else if (arg == "--seed")
    {
      config.seed = parse_unsigned("seed", next_value());
    }
    else if (arg == "--skip-probe")
    {
      config.skip_probe = true;
    }
    else if (arg == "--report")
    {
      const std::string& value = next_value();
      if (value == "text")
      {
        config.report = report_format::text;
      }
      else if (value == "json")
      {
        config.report = report_format::json;
      }
      else
      {
        throw usage_error("unknown report format: " + value);
      }
    }
    else if (arg == "--log-level")
    {
      const std::string& value = next_value();
      config.log_level = spdlog::level::from_str(value);
      if (config.log_level == spdlog::level::off && value != "off")
      {
        throw usage_error("unknown log level: " + value);
      }
    }
    else if (arg == "--log-file")
    {
      config.log_file = next_value();
    }
    else if (arg.size() > 1 && arg[0] == '-')
    {
      throw usage_error("unknown option: " + arg);
    }
    else
    {
      positional.push_back(arg);
    }
  }

  if (positional.size() < 3)
  {
    throw usage_error("expected <name> <size> <server-url>");
  }
  if (positional.size() > 4)
  {
    throw usage_error("too many arguments");
  }

  config.name = positional[0];
  if (!is_object_name_valid(config.name))
  {
    throw usage_error("object name must be non-empty and URL-safe: " + config.name);
  }
  const uint64_t size = parse_unsigned("size", positional[1]);
  if (size > static_cast<uint64_t>(INT64_MAX))
  {
    throw usage_error("size out of range: " + positional[1]);
  }
  config.size = static_cast<int64_t>(size);
  config.server_url = normalize_server_url(positional[2]);
  if (positional.size() == 4)
  {
    auto mode = parse_retrieval_mode(positional[3]);
    if (!mode.HasValue())
    {
      throw usage_error("retrieval mode must be download or download-chunked: " + positional[3]);
    }
    config.mode = mode.Value();
  }
  return config;
}

std::string usage_text(const std::string& program)
{
  return "usage: " + program
      + " [options] <name> <size> <server-url> [download|download-chunked]\n"
        "\n"
        "  --timeout-ms N     per-request deadline in milliseconds, 0 disables (default 60000)\n"
        "  --work-dir DIR     directory holding the local artifact (default .)\n"
        "  --seed N           seed for the generated content (default random)\n"
        "  --skip-probe       always generate, upload, fetch and delete\n"
        "  --report FORMAT    text or json (default text)\n"
        "  --log-level LEVEL  trace, debug, info, warn, err, critical or off (default info)\n"
        "  --log-file PATH    also write the log to PATH\n"
        "  -h, --help         show this message\n";
}
