#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "content_generator.hh"
#include "fake_session.hh"
#include "lifecycle.hh"
#include "report_sink.hh"
#include "test_utilities.hh"
#include "transfer_client.hh"
#include "utilities.hh"

namespace {

class recording_sink : public report_sink {
public:
  void record(lifecycle_step step, const std::string& name, const step_outcome& outcome)
      override
  {
    steps.push_back(step);
    names.push_back(name);
    outcomes.push_back(outcome);
  }

  int count(lifecycle_step step) const
  {
    int n = 0;
    for (auto s : steps)
    {
      if (s == step)
      {
        ++n;
      }
    }
    return n;
  }

  std::vector<lifecycle_step> steps;
  std::vector<std::string> names;
  std::vector<step_outcome> outcomes;
};

} // namespace

class LifecycleTest : public ::testing::Test {
protected:
  LifecycleTest()
      : m_server(std::make_shared<fake_session>()), m_client(m_server, m_dir.path()),
        m_generator(m_dir.path(), 99), m_orchestrator(m_client, m_generator, m_sink)
  {
  }

  lifecycle_configuration config(const std::string& name, int64_t size, retrieval_mode mode)
  {
    lifecycle_configuration c;
    c.name = name;
    c.size = size;
    c.mode = mode;
    return c;
  }

  temp_directory m_dir;
  std::shared_ptr<fake_session> m_server;
  transfer_client m_client;
  content_generator m_generator;
  recording_sink m_sink;
  lifecycle_orchestrator m_orchestrator;
};

TEST_F(LifecycleTest, AbsentObjectIsCreatedFetchedAndDeleted)
{
  auto result = m_orchestrator.run(config("fresh", 2048, retrieval_mode::whole));

  std::vector<lifecycle_step> expected_steps = {
      lifecycle_step::probe,
      lifecycle_step::generate,
      lifecycle_step::upload,
      lifecycle_step::fetch,
      lifecycle_step::cleanup};
  EXPECT_EQ(expected_steps, m_sink.steps);
  EXPECT_EQ(404, m_sink.outcomes[0].status_code.Value());
  EXPECT_EQ(2048, m_sink.outcomes[1].bytes);
  EXPECT_EQ(200, m_sink.outcomes[2].status_code.Value());
  EXPECT_EQ(200, m_sink.outcomes[3].status_code.Value());
  EXPECT_EQ(2048, m_sink.outcomes[3].bytes);
  EXPECT_EQ(200, m_sink.outcomes[4].status_code.Value());
  for (const auto& name : m_sink.names)
  {
    EXPECT_EQ("fresh", name);
  }

  std::vector<std::string> expected_requests
      = {"GET fresh", "POST upload", "GET fresh", "DELETE fresh"};
  EXPECT_EQ(expected_requests, m_server->requests);

  EXPECT_FALSE(result.probe_hit);
  ASSERT_TRUE(result.round_trip_match.HasValue());
  EXPECT_TRUE(result.round_trip_match.Value());
  EXPECT_EQ(0, result.failed_steps());
  EXPECT_TRUE(result.succeeded());
  EXPECT_FALSE(m_server->has("fresh"));
  EXPECT_EQ(2048, get_file_size(m_dir.file("fresh")).Value());
}

TEST_F(LifecycleTest, PresentObjectTakesTheFastPath)
{
  m_server->put("existing", std::string(2048, 'q'));

  auto result = m_orchestrator.run(config("existing", 2048, retrieval_mode::chunked));

  std::vector<lifecycle_step> expected_steps = {lifecycle_step::probe, lifecycle_step::cleanup};
  EXPECT_EQ(expected_steps, m_sink.steps);
  std::vector<std::string> expected_requests
      = {"GET download-chunked/existing", "DELETE existing"};
  EXPECT_EQ(expected_requests, m_server->requests);
  EXPECT_TRUE(result.probe_hit);
  EXPECT_FALSE(result.round_trip_match.HasValue());
  EXPECT_TRUE(result.succeeded());
  EXPECT_EQ(std::string(2048, 'q'), read_text_file(m_dir.file("existing")));
}

TEST_F(LifecycleTest, UnreachableUploadStillFetchesAndCleansUp)
{
  m_server->unreachable.insert("POST upload");

  auto result = m_orchestrator.run(config("lost", 512, retrieval_mode::whole));

  ASSERT_EQ(5u, m_sink.steps.size());
  EXPECT_TRUE(m_sink.outcomes[1].succeeded());
  EXPECT_FALSE(m_sink.outcomes[2].status_code.HasValue());
  EXPECT_FALSE(m_sink.outcomes[2].error.empty());
  EXPECT_EQ(404, m_sink.outcomes[3].status_code.Value());
  EXPECT_EQ(lifecycle_step::cleanup, m_sink.steps[4]);
  EXPECT_EQ(1, m_server->count_requests("DELETE lost"));

  EXPECT_FALSE(result.round_trip_match.HasValue());
  EXPECT_EQ(3, result.failed_steps());
  EXPECT_FALSE(result.succeeded());
}

TEST_F(LifecycleTest, ZeroSizeObjectRunsNormally)
{
  auto result = m_orchestrator.run(config("empty", 0, retrieval_mode::chunked));

  ASSERT_EQ(5u, m_sink.steps.size());
  EXPECT_EQ(0, m_sink.outcomes[1].bytes);
  EXPECT_TRUE(m_sink.outcomes[2].succeeded());
  EXPECT_TRUE(m_sink.outcomes[3].succeeded());
  EXPECT_EQ(0, m_sink.outcomes[3].bytes);
  EXPECT_TRUE(m_sink.outcomes[4].succeeded());
  EXPECT_TRUE(result.succeeded());
  EXPECT_EQ(0, get_file_size(m_dir.file("empty")).Value());
}

TEST_F(LifecycleTest, WholeModeNeverUsesChunkedEndpoint)
{
  m_orchestrator.run(config("plain", 100, retrieval_mode::whole));

  EXPECT_EQ(2, m_server->count_requests("GET plain"));
  for (const auto& r : m_server->requests)
  {
    EXPECT_EQ(std::string::npos, r.find("download-chunked")) << r;
  }
}

TEST_F(LifecycleTest, ChunkedModeNeverUsesWholeEndpoint)
{
  m_orchestrator.run(config("streamed", 100, retrieval_mode::chunked));

  EXPECT_EQ(2, m_server->count_requests("GET download-chunked/streamed"));
  EXPECT_EQ(0, m_server->count_requests("GET streamed"));
}

TEST_F(LifecycleTest, CleanupRunsExactlyOnceWhateverFails)
{
  const std::vector<std::string> failure_points
      = {"GET subject", "POST upload", "DELETE subject"};
  for (int mask = 0; mask < (1 << failure_points.size()); ++mask)
  {
    auto server = std::make_shared<fake_session>();
    for (size_t i = 0; i < failure_points.size(); ++i)
    {
      if (mask & (1 << i))
      {
        server->unreachable.insert(failure_points[i]);
      }
    }
    temp_directory dir;
    transfer_client client(server, dir.path());
    content_generator generator(dir.path(), 1);
    recording_sink sink;
    lifecycle_orchestrator orchestrator(client, generator, sink);

    orchestrator.run(config("subject", 64, retrieval_mode::whole));

    EXPECT_EQ(1, sink.count(lifecycle_step::cleanup)) << "mask " << mask;
    EXPECT_EQ(lifecycle_step::cleanup, sink.steps.back()) << "mask " << mask;
    EXPECT_EQ(1, server->count_requests("DELETE subject")) << "mask " << mask;
  }
}

TEST_F(LifecycleTest, SkipProbeStartsAtGenerate)
{
  auto c = config("always", 300, retrieval_mode::whole);
  c.skip_probe = true;

  auto result = m_orchestrator.run(c);

  std::vector<lifecycle_step> expected_steps = {
      lifecycle_step::generate,
      lifecycle_step::upload,
      lifecycle_step::fetch,
      lifecycle_step::cleanup};
  EXPECT_EQ(expected_steps, m_sink.steps);
  EXPECT_EQ(1, m_server->count_requests("GET always"));
  EXPECT_TRUE(result.succeeded());
}

TEST_F(LifecycleTest, LocalFailureAbortsButStillCleansUp)
{
  auto server = std::make_shared<fake_session>();
  const std::string missing_dir = m_dir.file("does-not-exist");
  transfer_client client(server, missing_dir);
  content_generator generator(missing_dir, 1);
  recording_sink sink;
  lifecycle_orchestrator orchestrator(client, generator, sink);

  EXPECT_THROW(orchestrator.run(config("doomed", 10, retrieval_mode::whole)), io_failure);

  std::vector<lifecycle_step> expected_steps
      = {lifecycle_step::probe, lifecycle_step::generate, lifecycle_step::cleanup};
  EXPECT_EQ(expected_steps, sink.steps);
  EXPECT_FALSE(sink.outcomes[1].succeeded());
  EXPECT_FALSE(sink.outcomes[1].error.empty());
  EXPECT_EQ(0, server->count_requests("POST upload"));
  EXPECT_EQ(1, server->count_requests("DELETE doomed"));
}

TEST_F(LifecycleTest, CorruptedFetchFailsRoundTrip)
{
  m_server->corrupt_downloads = true;

  auto result = m_orchestrator.run(config("garbled", 128, retrieval_mode::whole));

  ASSERT_TRUE(result.round_trip_match.HasValue());
  EXPECT_FALSE(result.round_trip_match.Value());
  EXPECT_EQ(0, result.failed_steps());
  EXPECT_FALSE(result.succeeded());
}

TEST_F(LifecycleTest, UnreadableArtifactAfterGenerateIsReportedAsGenerateFailure)
{
  auto server = std::make_shared<fake_session>();
  transfer_client client(server, m_dir.file("not-created"));
  content_generator generator(m_dir.path(), 1);
  recording_sink sink;
  lifecycle_orchestrator orchestrator(client, generator, sink);

  EXPECT_THROW(orchestrator.run(config("split", 32, retrieval_mode::whole)), io_failure);

  std::vector<lifecycle_step> expected_steps
      = {lifecycle_step::probe, lifecycle_step::generate, lifecycle_step::cleanup};
  EXPECT_EQ(expected_steps, sink.steps);
  EXPECT_FALSE(sink.outcomes[1].succeeded());
  EXPECT_FALSE(sink.outcomes[1].error.empty());
  EXPECT_EQ(32, get_file_size(m_dir.file("split")).Value());
  EXPECT_EQ(0, server->count_requests("POST upload"));
  EXPECT_EQ(1, server->count_requests("DELETE split"));
}
