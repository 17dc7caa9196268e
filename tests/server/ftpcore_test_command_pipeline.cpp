// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for ordered server command execution

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>
#include "ftpcore_test_fake_context.hpp"

#include <atomic>
#include <thread>

using namespace ftpcore::server;
using ftpcore::core::CancellationToken;
using ftpcore::core::OperationCancelled;
using ftpcore::test::FakeCommandContext;
using ftpcore::test::waitFor;

namespace
{
/// Pipeline wired to a fake context, running on its own thread.
struct PipelineFixture
{
  FakeCommandContext context;
  std::unique_ptr<ServerCommandPipeline> pipeline;
  std::atomic<int> rejected{0};
  std::thread runner;
  std::exception_ptr failure;

  explicit PipelineFixture(std::size_t capacity = 16)
  {
    pipeline = std::make_unique<ServerCommandPipeline>(context, capacity);
    context.pipeline = [this](ServerCommand command)
    {
      bool ok = pipeline->enqueue(std::move(command));
      if (!ok)
      {
        rejected.fetch_add(1);
      }
      return ok;
    };
  }

  ~PipelineFixture() { finish(); }

  void start()
  {
    runner = std::thread(
      [this]()
      {
        try
        {
          pipeline->run(context.source.token());
        }
        catch (const std::exception &)
        {
          failure = std::current_exception();
        }
      });
  }

  void finish()
  {
    pipeline->close();
    if (runner.joinable())
    {
      runner.join();
    }
  }
};
} // namespace

TEST_CASE("Pipeline executes commands in enqueue order", "[pipeline][order]")
{
  PipelineFixture fixture;
  for (int code = 200; code < 210; ++code)
  {
    REQUIRE(fixture.pipeline->enqueue(SendResponse{FtpResponse(code, "ok")}));
  }
  REQUIRE(fixture.pipeline->pending() == 10);

  fixture.start();
  fixture.finish();

  REQUIRE_FALSE(fixture.failure);
  std::vector<int> expected{200, 201, 202, 203, 204, 205, 206, 207, 208, 209};
  REQUIRE(fixture.context.written() == expected);
}

TEST_CASE("Commands queued during a transfer run after it", "[pipeline][order][transfer]")
{
  PipelineFixture fixture;
  fixture.start();

  REQUIRE(fixture.pipeline->enqueue(OpenDataConnectionAndRun{
    FtpCommand::parse("LIST"),
    [&fixture](DataConnection &data, const CancellationToken &token) -> std::optional<FtpResponse>
    {
      fixture.context.enqueueServerCommand(SendResponse{FtpResponse(150, "Opening")});
      data.write("listing\r\n", token);
      return std::nullopt;
    },
    std::nullopt}));

  REQUIRE(waitFor([&]() { return fixture.context.written().size() == 2; }));
  fixture.finish();

  REQUIRE(fixture.context.written() == std::vector<int>{150, 226});
  REQUIRE(fixture.context.closed() == 1);
  REQUIRE(fixture.rejected.load() == 0);
}

TEST_CASE("A transfer reply that does not fit aborts the connection", "[pipeline][limits]")
{
  PipelineFixture fixture(1);
  fixture.start();

  REQUIRE(fixture.pipeline->enqueue(OpenDataConnectionAndRun{
    FtpCommand::parse("RETR a"),
    [](DataConnection &, const CancellationToken &) -> std::optional<FtpResponse>
    { return std::nullopt; },
    std::nullopt}));

  // CloseDataConnection fits, the 226 does not
  REQUIRE(waitFor([&]() { return fixture.context.aborts() == 1; }));
  fixture.finish();
  REQUIRE(fixture.rejected.load() == 1);
  REQUIRE(fixture.context.closed() == 1);
  REQUIRE(fixture.context.written().empty());
  REQUIRE_FALSE(fixture.failure);
}

TEST_CASE("Closed pipeline rejects commands", "[pipeline][close]")
{
  PipelineFixture fixture;
  fixture.pipeline->close();
  REQUIRE_FALSE(fixture.pipeline->enqueue(SendResponse{FtpResponse(200, "ok")}));
}

TEST_CASE("Pipeline stops on connection cancellation", "[pipeline][cancel]")
{
  PipelineFixture fixture;
  fixture.start();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  fixture.context.source.cancel();
  fixture.runner.join();

  REQUIRE(fixture.failure);
  REQUIRE_THROWS_AS(std::rethrow_exception(fixture.failure), OperationCancelled);
}

TEST_CASE("Pipeline surfaces transmission failures", "[pipeline][error]")
{
  PipelineFixture fixture;
  fixture.context.failWrites = true;
  fixture.pipeline->enqueue(SendResponse{FtpResponse(200, "ok")});
  fixture.pipeline->enqueue(SendResponse{FtpResponse(201, "never")});
  fixture.start();
  fixture.runner.join();

  REQUIRE(fixture.failure);
  REQUIRE_THROWS_AS(std::rethrow_exception(fixture.failure), ResponseTransmissionError);
  REQUIRE(fixture.pipeline->pending() == 1);
}
