#include "lifecycle.hh"

#include <exception>

#include "utilities.hh"

namespace {

transfer_operation download_operation(retrieval_mode mode)
{
  return mode == retrieval_mode::chunked ? transfer_operation::download_chunked
                                         : transfer_operation::download;
}

} // namespace

int lifecycle_result::failed_steps() const
{
  int count = 0;
  for (const auto& s : steps)
  {
    if (s.step != lifecycle_step::probe && !s.outcome.succeeded())
    {
      ++count;
    }
  }
  return count;
}

bool lifecycle_result::succeeded() const
{
  if (round_trip_match.HasValue() && !round_trip_match.Value())
  {
    return false;
  }
  return failed_steps() == 0;
}

lifecycle_orchestrator::lifecycle_orchestrator(
    transfer_client& client,
    content_generator& generator,
    report_sink& sink)
    : m_client(client), m_generator(generator), m_sink(sink)
{
}

template <class Func>
step_outcome lifecycle_orchestrator::perform(
    lifecycle_result& result,
    lifecycle_step step,
    transfer_operation operation,
    const std::string& name,
    Func&& func)
{
  auto start = std::chrono::steady_clock::now();
  try
  {
    step_outcome outcome = func();
    m_sink.record(step, name, outcome);
    result.steps.push_back({step, outcome});
    return outcome;
  }
  catch (io_failure& e)
  {
    step_outcome failed;
    failed.operation = operation;
    failed.error = e.what();
    failed.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    m_sink.record(step, name, failed);
    result.steps.push_back({step, failed});
    throw;
  }
}

lifecycle_result lifecycle_orchestrator::run(const lifecycle_configuration& config)
{
  lifecycle_result result;
  std::exception_ptr fatal;

  spdlog::info(
      "starting lifecycle of {} ({} bytes, {})",
      config.name,
      config.size,
      retrieval_mode_name(config.mode));
  auto start = std::chrono::steady_clock::now();

  try
  {
    bool present = false;
    if (!config.skip_probe)
    {
      auto probe = perform(
          result, lifecycle_step::probe, download_operation(config.mode), config.name, [&]() {
            return m_client.probe_or_download(config.mode, config.name);
          });
      present = probe.succeeded();
    }
    if (present)
    {
      result.probe_hit = true;
      spdlog::info("{} already exists on the server, skipping upload", config.name);
    }
    else
    {
      create_and_fetch(config, result);
    }
  }
  catch (io_failure& e)
  {
    spdlog::error("local I/O failure, skipping to cleanup: {}", e.what());
    fatal = std::current_exception();
  }

  perform(result, lifecycle_step::cleanup, transfer_operation::remove, config.name, [&]() {
    return m_client.remove(config.name);
  });

  result.total_elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start);
  spdlog::info(
      "lifecycle of {} finished in {}ms, {} failed step(s)",
      config.name,
      std::chrono::duration_cast<std::chrono::milliseconds>(result.total_elapsed).count(),
      result.failed_steps());

  if (fatal)
  {
    std::rethrow_exception(fatal);
  }
  return result;
}

void lifecycle_orchestrator::create_and_fetch(
    const lifecycle_configuration& config,
    lifecycle_result& result)
{
  // The hashes are taken inside the recorded steps so a failed read still gets its line.
  std::string generated_hash;
  perform(result, lifecycle_step::generate, transfer_operation::generate, config.name, [&]() {
    step_outcome outcome;
    outcome.operation = transfer_operation::generate;
    auto start = std::chrono::steady_clock::now();
    bool written = m_generator.ensure_content(config.name, config.size);
    auto end = std::chrono::steady_clock::now();
    outcome.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
    outcome.bytes = config.size;
    if (!written)
    {
      spdlog::debug("reused existing {}", m_generator.artifact_path(config.name));
    }
    generated_hash = sha256_hex(read_file(m_client.artifact_path(config.name)));
    return outcome;
  });

  perform(result, lifecycle_step::upload, transfer_operation::upload, config.name, [&]() {
    return m_client.upload(config.name);
  });

  std::string fetched_hash;
  auto fetch = perform(
      result, lifecycle_step::fetch, download_operation(config.mode), config.name, [&]() {
        step_outcome outcome = m_client.probe_or_download(config.mode, config.name);
        if (outcome.succeeded())
        {
          fetched_hash = sha256_hex(read_file(m_client.artifact_path(config.name)));
        }
        return outcome;
      });

  if (fetch.succeeded())
  {
    result.round_trip_match = fetched_hash == generated_hash;
    if (result.round_trip_match.Value())
    {
      spdlog::info("round trip of {} verified, sha256 {}", config.name, fetched_hash);
    }
    else
    {
      spdlog::warn(
          "round trip of {} mismatched, uploaded sha256 {}, fetched sha256 {}",
          config.name,
          generated_hash,
          fetched_hash);
    }
  }
}
