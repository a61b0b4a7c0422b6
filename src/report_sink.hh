#pragma once

#include <memory>
#include <ostream>
#include <string>

#include "transfer_client.hh"
#include "utilities.hh"

enum class lifecycle_step
{
  probe,
  generate,
  upload,
  fetch,
  cleanup,
};

const char* lifecycle_step_name(lifecycle_step step);

std::string format_step_line(
    lifecycle_step step,
    const std::string& name,
    const step_outcome& outcome);

class report_sink {
public:
  virtual void record(lifecycle_step step, const std::string& name, const step_outcome& outcome)
      = 0;
  virtual ~report_sink() {}
};

// One spdlog line per step; failed steps are logged as warnings.
class log_report_sink : public report_sink {
public:
  log_report_sink(std::shared_ptr<spdlog::logger> logger = spdlog::default_logger())
      : m_logger(std::move(logger))
  {
  }

  void record(lifecycle_step step, const std::string& name, const step_outcome& outcome)
      override;

private:
  std::shared_ptr<spdlog::logger> m_logger;
};

// One JSON object per line.
class json_report_sink : public report_sink {
public:
  json_report_sink(std::ostream& os) : m_os(os) {}

  void record(lifecycle_step step, const std::string& name, const step_outcome& outcome)
      override;

private:
  std::ostream& m_os;
};
