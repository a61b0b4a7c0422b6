#include "report_sink.hh"

#include <nlohmann/json.hpp>

#include "utilities.hh"

namespace {

double to_milliseconds(std::chrono::microseconds elapsed)
{
  return std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(elapsed).count();
}

std::string format_status(const step_outcome& outcome)
{
  if (outcome.operation == transfer_operation::generate)
  {
    return outcome.error.empty() ? "ok" : "failed (" + outcome.error + ")";
  }
  if (!outcome.status_code.HasValue())
  {
    return "no status (" + outcome.error + ")";
  }
  std::string ret = "status " + std::to_string(outcome.status_code.Value());
  if (!outcome.error.empty())
  {
    ret += " (" + outcome.error + ")";
  }
  return ret;
}

} // namespace

const char* lifecycle_step_name(lifecycle_step step)
{
  switch (step)
  {
    case lifecycle_step::probe:
      return "probe";
    case lifecycle_step::generate:
      return "generate";
    case lifecycle_step::upload:
      return "upload";
    case lifecycle_step::fetch:
      return "fetch";
    case lifecycle_step::cleanup:
      return "cleanup";
  }
  return "unknown";
}

std::string format_step_line(
    lifecycle_step step,
    const std::string& name,
    const step_outcome& outcome)
{
  return fmt::format(
      "{} {} ({}): {}, {} bytes, {:.2f}ms",
      lifecycle_step_name(step),
      name,
      transfer_operation_name(outcome.operation),
      format_status(outcome),
      outcome.bytes,
      to_milliseconds(outcome.elapsed));
}

void log_report_sink::record(
    lifecycle_step step,
    const std::string& name,
    const step_outcome& outcome)
{
  if (outcome.succeeded())
  {
    m_logger->info(format_step_line(step, name, outcome));
  }
  else
  {
    m_logger->warn(format_step_line(step, name, outcome));
  }
}

void json_report_sink::record(
    lifecycle_step step,
    const std::string& name,
    const step_outcome& outcome)
{
  nlohmann::json line;
  line["step"] = lifecycle_step_name(step);
  line["operation"] = transfer_operation_name(outcome.operation);
  line["name"] = name;
  if (outcome.status_code.HasValue())
  {
    line["status"] = outcome.status_code.Value();
  }
  else
  {
    line["status"] = nullptr;
  }
  line["success"] = outcome.succeeded();
  line["elapsed_ms"] = to_milliseconds(outcome.elapsed);
  line["bytes"] = outcome.bytes;
  line["error"] = outcome.error;
  m_os << line.dump() << std::endl;
}
