// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// End-to-end tests of the FTP server over loopback sockets

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>
#include "ftpcore_test_net_utils.hpp"

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace ftpcore::server;
using ftpcore::core::CancellationToken;
using ftpcore::test::TempDirManager;
using ftpcore::test::waitFor;
using testnet::LoopbackClient;

namespace
{
ftpcore::fs::ByteSource fromString(const std::string &content)
{
  auto offset = std::make_shared<std::size_t>(0);
  return [content, offset](char *buffer, std::size_t capacity) -> std::size_t
  {
    std::size_t n = std::min(capacity, content.size() - *offset);
    std::copy(content.data() + *offset, content.data() + *offset + n, buffer);
    *offset += n;
    return n;
  };
}

std::string code(const std::string &reply) { return reply.substr(0, 3); }

/// Server on an ephemeral loopback port with the basic command set.
struct ServerFixture
{
  TempDirManager dir;
  FtpServerOptions options;
  std::unique_ptr<FtpServer> server;
  std::uint16_t port{0};

  explicit ServerFixture(std::function<void(FtpServerOptions &)> configure = {})
  {
    ftpcore::test::initializeTestLogging();
    options.address = "127.0.0.1";
    options.port = 0;
    options.threadPoolSize = 2;
    options.idleCheckInterval = std::chrono::milliseconds(50);
    options.fileSystemRoot = dir.filePath("root");
    if (configure)
    {
      configure(options);
    }
    auto registry = std::make_shared<CommandRegistry>();
    ftpcore::commands::registerBasicCommands(*registry);
    server = std::make_unique<FtpServer>(options, registry);
    port = server->start();
  }

  ~ServerFixture() { server->stop(); }

  /// Connected client that has consumed the banner.
  std::unique_ptr<LoopbackClient> connect()
  {
    auto client = std::make_unique<LoopbackClient>(port);
    REQUIRE(client->connected());
    REQUIRE(client->readReply() == "220 FTP Server Ready");
    return client;
  }

  std::unique_ptr<LoopbackClient> login()
  {
    auto client = connect();
    client->sendLine("USER anonymous");
    REQUIRE(code(client->readReply()) == "331");
    client->sendLine("PASS guest");
    REQUIRE(code(client->readReply()) == "230");
    return client;
  }

  /// Sends PASV and connects to the announced port.
  std::unique_ptr<LoopbackClient> passive(LoopbackClient &control)
  {
    control.sendLine("PASV");
    auto reply = control.readReply();
    REQUIRE(code(reply) == "227");
    auto data = std::make_unique<LoopbackClient>(testnet::passivePort(reply));
    REQUIRE(data->connected());
    return data;
  }
};
} // namespace

// ══════════════════════════════════════════════════════════════════════════════
// Session commands
// ══════════════════════════════════════════════════════════════════════════════

TEST_CASE("FtpServer session commands", "[ftp_server][session]")
{
  ServerFixture fixture;
  REQUIRE(fixture.port != 0);
  REQUIRE(fixture.server->isRunning());
  auto client = fixture.connect();

  SECTION("login")
  {
    client->sendLine("PASS early");
    REQUIRE(code(client->readReply()) == "503");
    client->sendLine("user anonymous");
    REQUIRE(client->readReply() == "331 User name okay, need password.");
    client->sendLine("PASS secret");
    REQUIRE(client->readReply() == "230 User logged in, proceed.");
  }

  SECTION("informational commands")
  {
    client->sendLine("SYST");
    REQUIRE(client->readReply() == "215 UNIX Type: L8");
    client->sendLine("NOOP");
    REQUIRE(code(client->readReply()) == "200");
    client->sendLine("TYPE I");
    REQUIRE(client->readReply() == "200 Type set to I.");
    client->sendLine("TYPE X");
    REQUIRE(code(client->readReply()) == "504");
    client->sendLine("USER");
    REQUIRE(code(client->readReply()) == "501");
  }

  SECTION("unknown verbs")
  {
    client->sendLine("XYZZY plugh");
    REQUIRE(client->readReply() == "502 Command not implemented.");
    client->sendLine("NOOP");
    REQUIRE(code(client->readReply()) == "200");
  }

  SECTION("working directory")
  {
    CancellationToken token;
    fixture.server->fileSystem().createDirectory("/", "pub", token);

    client->sendLine("PWD");
    REQUIRE(client->readReply() == "257 \"/\" is current directory.");
    client->sendLine("CWD pub");
    REQUIRE(client->readReply() == "250 Directory changed to /pub.");
    client->sendLine("PWD");
    REQUIRE(client->readReply() == "257 \"/pub\" is current directory.");
    client->sendLine("CWD missing");
    REQUIRE(code(client->readReply()) == "550");
    client->sendLine("CWD ..");
    REQUIRE(client->readReply() == "250 Directory changed to /.");
  }

  SECTION("quit")
  {
    client->sendLine("QUIT");
    REQUIRE(client->readReply() == "221 Service closing control connection.");
    REQUIRE(client->waitClosed());
    REQUIRE(waitFor([&]() { return fixture.server->connectionCount() == 0; }));
  }

  SECTION("ABOR without a transfer")
  {
    client->sendLine("ABOR");
    REQUIRE(client->readReply() == "225 No transfer to abort.");
  }

  SECTION("malformed PORT")
  {
    client->sendLine("PORT 1,2,3");
    REQUIRE(code(client->readReply()) == "501");
  }
}

// ══════════════════════════════════════════════════════════════════════════════
// Data transfers
// ══════════════════════════════════════════════════════════════════════════════

TEST_CASE("FtpServer passive transfers", "[ftp_server][transfer]")
{
  ServerFixture fixture;
  CancellationToken token;
  auto &fs = fixture.server->fileSystem();
  fs.createDirectory("/", "pub", token);
  fs.create("/pub", "readme.txt", fromString("hello over ftp\n"), token);
  fs.create("/pub", "data.bin", fromString(std::string(200000, 'z')), token);

  auto client = fixture.login();

  SECTION("NLST")
  {
    auto data = fixture.passive(*client);
    client->sendLine("NLST /pub");
    REQUIRE(code(client->readReply()) == "150");
    REQUIRE(data->readAll() == "data.bin\r\nreadme.txt\r\n");
    REQUIRE(client->readReply() == "226 Closing data connection.");
  }

  SECTION("LIST")
  {
    client->sendLine("CWD /pub");
    REQUIRE(code(client->readReply()) == "250");
    auto data = fixture.passive(*client);
    client->sendLine("LIST -la");
    REQUIRE(code(client->readReply()) == "150");
    auto listing = data->readAll();
    REQUIRE(listing.find("readme.txt\r\n") != std::string::npos);
    REQUIRE(listing.find("-rw") == 0);
    REQUIRE(code(client->readReply()) == "226");
  }

  SECTION("LIST of a missing directory")
  {
    client->sendLine("LIST /nowhere");
    REQUIRE(client->readReply() == "550 Directory not found.");
  }

  SECTION("RETR")
  {
    auto data = fixture.passive(*client);
    client->sendLine("RETR /pub/data.bin");
    REQUIRE(code(client->readReply()) == "150");
    REQUIRE(data->readAll() == std::string(200000, 'z'));
    REQUIRE(code(client->readReply()) == "226");
  }

  SECTION("RETR of a missing file")
  {
    client->sendLine("RETR /pub/none.txt");
    REQUIRE(client->readReply() == "550 File not found.");
  }

  SECTION("STOR")
  {
    auto data = fixture.passive(*client);
    client->sendLine("STOR /pub/upload.txt");
    REQUIRE(code(client->readReply()) == "150");
    REQUIRE(data->send("uploaded content"));
    data->close();
    REQUIRE(code(client->readReply()) == "226");

    REQUIRE(fixture.dir.readFile("root/pub/upload.txt") == "uploaded content");
  }

  SECTION("STOR into a missing directory")
  {
    client->sendLine("STOR /missing/file.txt");
    REQUIRE(code(client->readReply()) == "553");
  }

  SECTION("transfer without PASV or PORT")
  {
    client->sendLine("RETR /pub/readme.txt");
    REQUIRE(code(client->readReply()) == "425");
  }

  SECTION("commands keep working after a transfer")
  {
    auto data = fixture.passive(*client);
    client->sendLine("RETR /pub/readme.txt");
    REQUIRE(code(client->readReply()) == "150");
    REQUIRE(data->readAll() == "hello over ftp\n");
    REQUIRE(code(client->readReply()) == "226");
    client->sendLine("NOOP");
    REQUIRE(code(client->readReply()) == "200");
  }
}

TEST_CASE("FtpServer ABOR cancels a running transfer", "[ftp_server][transfer][abort]")
{
  ServerFixture fixture;
  auto client = fixture.login();

  auto data = fixture.passive(*client);
  client->sendLine("STOR stalled.bin");
  REQUIRE(code(client->readReply()) == "150");
  REQUIRE(data->send("partial"));

  client->sendLine("ABOR");
  REQUIRE(code(client->readReply()) == "426");
  REQUIRE(client->readReply() == "226 Abort command successful.");
  REQUIRE(data->waitClosed());

  client->sendLine("NOOP");
  REQUIRE(code(client->readReply()) == "200");
}

TEST_CASE("FtpServer ABOR right behind RETR keeps the session", "[ftp_server][transfer][abort]")
{
  ServerFixture fixture;
  CancellationToken token;
  fixture.server->fileSystem().create("/", "big.bin", fromString(std::string(4000000, 'q')),
                                      token);
  auto client = fixture.login();

  auto data = fixture.passive(*client);
  // both commands in one segment so ABOR lands while the transfer starts
  REQUIRE(client->send("RETR big.bin\r\nABOR\r\n"));

  std::string reply;
  do
  {
    reply = client->readReply();
    REQUIRE_FALSE(reply.empty());
  } while (code(reply) != "225" && reply != "226 Abort command successful.");
  data->close();

  client->sendLine("NOOP");
  do
  {
    reply = client->readReply();
    REQUIRE_FALSE(reply.empty());
  } while (code(reply) != "200");
}

// ══════════════════════════════════════════════════════════════════════════════
// Connection management
// ══════════════════════════════════════════════════════════════════════════════

TEST_CASE("FtpServer evicts idle connections", "[ftp_server][idle]")
{
  ServerFixture fixture([](FtpServerOptions &opts)
                        { opts.connection.inactivityTimeout = std::chrono::milliseconds(200); });
  auto idle = fixture.connect();
  auto busy = fixture.connect();
  REQUIRE(waitFor([&]() { return fixture.server->connectionCount() == 2; }));

  for (int i = 0; i < 6; ++i)
  {
    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    busy->sendLine("NOOP");
    REQUIRE(code(busy->readReply()) == "200");
  }

  REQUIRE(idle->waitClosed(std::chrono::seconds(2)));
  REQUIRE(waitFor([&]() { return fixture.server->connectionCount() == 1; }));
  busy->sendLine("NOOP");
  REQUIRE(code(busy->readReply()) == "200");
}

TEST_CASE("FtpServer connection limit", "[ftp_server][limits]")
{
  ServerFixture fixture([](FtpServerOptions &opts) { opts.maxConnections = 1; });
  auto first = fixture.connect();
  REQUIRE(waitFor([&]() { return fixture.server->connectionCount() == 1; }));

  LoopbackClient second(fixture.port);
  REQUIRE(second.connected());
  REQUIRE(second.readReply() == "421 Too many connections.");
  REQUIRE(second.waitClosed());

  first->sendLine("NOOP");
  REQUIRE(code(first->readReply()) == "200");
}

TEST_CASE("FtpServer pause and resume", "[ftp_server][lifecycle]")
{
  ServerFixture fixture;
  auto existing = fixture.connect();

  fixture.server->pause();
  REQUIRE(fixture.server->isPaused());
  REQUIRE(fixture.server->port() == fixture.port);
  {
    LoopbackClient refused(fixture.port);
    REQUIRE_FALSE(refused.connected());
  }
  existing->sendLine("NOOP");
  REQUIRE(code(existing->readReply()) == "200");

  fixture.server->resume();
  REQUIRE_FALSE(fixture.server->isPaused());
  auto later = fixture.connect();
  later->sendLine("NOOP");
  REQUIRE(code(later->readReply()) == "200");
}

TEST_CASE("FtpServer stop closes every connection", "[ftp_server][lifecycle]")
{
  ServerFixture fixture;
  auto a = fixture.connect();
  auto b = fixture.connect();

  fixture.server->stop();
  REQUIRE_FALSE(fixture.server->isRunning());
  REQUIRE(a->waitClosed());
  REQUIRE(b->waitClosed());
  REQUIRE(fixture.server->connectionCount() == 0);
  fixture.server->stop();
}

TEST_CASE("FtpServer per-connection operations", "[ftp_server][connections]")
{
  ServerFixture fixture;
  auto client = fixture.connect();
  REQUIRE(waitFor([&]() { return fixture.server->connectionCount() == 1; }));

  auto status = fixture.server->connectionStatus();
  REQUIRE(status.size() == 1);
  REQUIRE(status[0].isAlive);
  const auto id = status[0].id;
  REQUIRE(fixture.server->checkAlive(id));

  SECTION("status document")
  {
    auto json = fixture.server->statusJson();
    REQUIRE(json["port"].get<int>() == fixture.port);
    REQUIRE(json["running"].get<bool>());
    REQUIRE_FALSE(json["paused"].get<bool>());
    REQUIRE(json["connectionCount"].get<int>() == 1);
    REQUIRE(json["connections"][0]["id"].get<std::string>() == id);
  }

  SECTION("events")
  {
    std::mutex mutex;
    std::vector<std::string> seen;
    auto subscription = fixture.server->subscribe(
      id,
      [&](const ConnectionEvent &event)
      {
        if (auto *received = std::get_if<CommandReceivedEvent>(&event))
        {
          std::lock_guard<std::mutex> lock(mutex);
          seen.push_back(received->command.name);
        }
      });
    client->sendLine("NOOP");
    REQUIRE(code(client->readReply()) == "200");
    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(seen == std::vector<std::string>{"NOOP"});
  }

  SECTION("server commands")
  {
    REQUIRE(fixture.server->enqueueServerCommand(id, SendResponse{FtpResponse(200, "pushed")}));
    REQUIRE(client->readReply() == "200 pushed");
    REQUIRE(fixture.server->abortBackgroundTask(id) == nullptr);
  }

  SECTION("unknown ids")
  {
    REQUIRE_THROWS_AS(fixture.server->connection("no-such-id"), std::out_of_range);
    REQUIRE_THROWS_AS(fixture.server->checkAlive("no-such-id"), std::out_of_range);
    REQUIRE_THROWS_AS(fixture.server->publish("no-such-id", ConnectionClosedEvent{}),
                      std::out_of_range);
    REQUIRE_THROWS_AS(fixture.server->abortBackgroundTask("no-such-id"), std::out_of_range);
  }
}

TEST_CASE("FtpServer requires a command registry", "[ftp_server][error]")
{
  FtpServerOptions options;
  TempDirManager dir;
  options.fileSystemRoot = dir.path();
  REQUIRE_THROWS_AS(FtpServer(options, nullptr), std::invalid_argument);
}
