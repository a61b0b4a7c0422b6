#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <azure/core/nullable.hpp>

#include "content_generator.hh"
#include "report_sink.hh"
#include "transfer_client.hh"

struct lifecycle_configuration
{
  std::string name;
  int64_t size = 0;
  retrieval_mode mode = retrieval_mode::whole;
  // Start at generate, as if the probe had missed.
  bool skip_probe = false;
};

struct recorded_step
{
  lifecycle_step step;
  step_outcome outcome;
};

struct lifecycle_result
{
  std::vector<recorded_step> steps;
  bool probe_hit = false;
  // Set only when content was uploaded and fetched back successfully.
  Azure::Nullable<bool> round_trip_match;
  std::chrono::microseconds total_elapsed{0};

  // A missed probe is the designed "not found" branch and does not count.
  int failed_steps() const;
  bool succeeded() const;
};

// Drives probe -> generate -> upload -> fetch -> cleanup. Cleanup runs exactly once
// per run, whatever happened before it.
class lifecycle_orchestrator {
public:
  lifecycle_orchestrator(transfer_client& client, content_generator& generator, report_sink& sink);

  // io_failure from a local step is rethrown after cleanup has been attempted.
  lifecycle_result run(const lifecycle_configuration& config);

private:
  template <class Func>
  step_outcome perform(
      lifecycle_result& result,
      lifecycle_step step,
      transfer_operation operation,
      const std::string& name,
      Func&& func);

  void create_and_fetch(const lifecycle_configuration& config, lifecycle_result& result);

  transfer_client& m_client;
  content_generator& m_generator;
  report_sink& m_sink;
};
