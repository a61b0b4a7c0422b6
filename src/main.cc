#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "content_generator.hh"
#include "lifecycle.hh"
#include "options.hh"
#include "report_sink.hh"
#include "session.hh"
#include "transfer_client.hh"
#include "utilities.hh"

int main(int argc, char** argv)
{
  const std::string program = argc > 0 ? argv[0] : "lifecycle_perf";

  run_configuration config;
  try
  {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
      args.push_back(argv[i]);
    }
    config = parse_options(args);
  }
  catch (usage_error& e)
  {
    std::cerr << e.what() << std::endl << usage_text(program);
    return 2;
  }
  if (config.show_help)
  {
    std::cout << usage_text(program);
    return 0;
  }

  libcurl_raii libcurl_raii_instance;
  logger_raii logger_raii_instance(
      config.log_level, config.log_file, config.report == report_format::json);

  spdlog::info("started");
  check_build_environment();

  uint64_t seed = 0;
  if (config.seed.HasValue())
  {
    seed = config.seed.Value();
  }
  else
  {
    std::random_device rd;
    seed = (static_cast<uint64_t>(rd()) << 32) | rd();
  }

  spdlog::info("server: {}", config.server_url);
  spdlog::info(
      "object: {}, size: {} bytes, mode: {}",
      config.name,
      config.size,
      retrieval_mode_name(config.mode));
  spdlog::info(
      "timeout: {}ms, work dir: {}, content seed: {}",
      config.timeout.count(),
      config.work_dir,
      seed);

  auto http_session = std::make_shared<curl_session>(config.server_url, config.timeout);
  transfer_client client(http_session, config.work_dir);
  content_generator generator(config.work_dir, seed);

  std::unique_ptr<report_sink> sink;
  if (config.report == report_format::json)
  {
    sink = std::make_unique<json_report_sink>(std::cout);
  }
  else
  {
    sink = std::make_unique<log_report_sink>();
  }

  lifecycle_configuration lifecycle_config;
  lifecycle_config.name = config.name;
  lifecycle_config.size = config.size;
  lifecycle_config.mode = config.mode;
  lifecycle_config.skip_probe = config.skip_probe;

  lifecycle_orchestrator orchestrator(client, generator, *sink);
  lifecycle_result result;
  try
  {
    result = orchestrator.run(lifecycle_config);
  }
  catch (io_failure& e)
  {
    spdlog::error("run aborted: {}", e.what());
    return 3;
  }

  if (result.round_trip_match.HasValue() && !result.round_trip_match.Value())
  {
    spdlog::error("fetched content of {} differs from the uploaded content", config.name);
  }
  spdlog::info("exited");
  return result.succeeded() ? 0 : 1;
}
