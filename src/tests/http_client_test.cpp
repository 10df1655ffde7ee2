#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <iterator>
#include <string>
#include <boost/asio.hpp>
#include "client/client.hpp"
#include "test_http_server.hpp"
#include "test_utils.hpp"

using namespace backuper;
using namespace backuper::client;
using backuper::test::TestHttpServer;
using boost::beast::http::verb;

class HttpClientTest : public ::testing::Test {
protected:
  TestHttpServer server;
  test::TempDir dir{"http_client_test"};
  boost::asio::io_context io_context;

  void SetUp() override {
    test::init_test_logging();
  }

  network::ClientConfig config_for(const std::string& url,
                                   std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    return network::ClientConfig(url, timeout);
  }

  void reply(unsigned status, const std::string& body) {
    TestHttpServer::Reply canned;
    canned.status = status;
    canned.body = body;
    server.set_reply(canned);
  }
};

TEST_F(HttpClientTest, SubmitEndToEnd) {
  const auto path = dir.write_file("data.txt", "1234123412341234123412341234123412341234");
  reply(200, R"({"size":40,"data_shards":2,"parity_shards":1,"hashes":["123","456"]})");

  Client client(io_context, config_for(server.address()));
  const SubmitOutcome outcome = client.submit("some/file", path);

  EXPECT_EQ(outcome.local_digest, "80b61beab398c37f21cdb80c4fa4c75fa4d54f916fe3c42e6445ed27bbc4b2ed");
  EXPECT_EQ(outcome.total_size, 40u);
  EXPECT_EQ(outcome.data_shard_count, 2);
  EXPECT_EQ(outcome.parity_shard_count, 1);
  ASSERT_EQ(outcome.content_hashes.size(), 2u);

  ASSERT_EQ(server.request_count(), 1u);
  const auto request = server.last_request();
  EXPECT_EQ(request.method, verb::post);
  EXPECT_EQ(request.target, "/submit_data");
  EXPECT_EQ(request.host, server.address());
  EXPECT_EQ(request.content_type.rfind("multipart/form-data; boundary=", 0), 0u);
  EXPECT_NE(request.body.find("name=\"filename\"\r\n\r\nsome/file\r\n"), std::string::npos);
  EXPECT_NE(request.body.find("1234123412341234123412341234123412341234\r\n--"), std::string::npos);
}

TEST_F(HttpClientTest, SubmitLargeFile) {
  const std::string content = test::patterned_data(300000);
  const auto path = dir.write_file("large.bin", content);
  reply(200, R"({"size":300000,"data_shards":4,"parity_shards":2,"hashes":[]})");

  Client client(io_context, config_for(server.address()));
  client.submit("large", path);

  EXPECT_NE(server.last_request().body.find(content), std::string::npos);
}

TEST_F(HttpClientTest, RetrieveLargeBody) {
  const std::string content = test::patterned_data(200000);
  reply(200, content);
  const auto target = dir.path() / "restored.bin";

  Client client(io_context, config_for(server.address()));
  client.retrieve("archive name", target);

  EXPECT_EQ(test::read_file(target), content);
  EXPECT_EQ(server.last_request().method, verb::get);
  EXPECT_EQ(server.last_request().target, "/retrieve_data/archive%20name");
  // Only the target is left behind
  EXPECT_EQ(std::distance(std::filesystem::directory_iterator(dir.path()), std::filesystem::directory_iterator()), 1);
}

TEST_F(HttpClientTest, RetrieveKeepsUnrelatedPartFile) {
  const auto user_file = dir.write_file("out.bin.backuper-part", "precious user data");
  reply(200, "downloaded");
  const auto target = dir.path() / "out.bin";

  Client client(io_context, config_for(server.address()));
  client.retrieve("x", target);

  EXPECT_EQ(test::read_file(target), "downloaded");
  EXPECT_EQ(test::read_file(user_file), "precious user data");
}

TEST_F(HttpClientTest, RetrieveNotFoundLeavesNoFiles) {
  reply(400, "File missing not found!");
  const auto target = dir.path() / "restored.bin";

  Client client(io_context, config_for(server.address()));
  try {
    client.retrieve("missing", target);
    FAIL() << "Expected OperationError";
  } catch (const OperationError& e) {
    EXPECT_TRUE(e.is_caller_fault());
    EXPECT_EQ(std::string(e.what()), "File missing not found!");
  }

  EXPECT_TRUE(std::filesystem::is_empty(dir.path()));
}

TEST_F(HttpClientTest, CheckAndList) {
  Client client(io_context, config_for(server.address()));

  reply(200, R"({"name":"f","lmod":"2024-05-01","health":"GOOD","hashes":["a"]})");
  const StatusReport report = client.check("f");
  EXPECT_EQ(report.health, "GOOD");
  EXPECT_EQ(server.last_request().target, "/check_data/f");

  reply(200, R"({"files":[{"name":"f","lmod":"2024-05-01","uuid":"u","sha256":"s"}]})");
  const FileListing listing = client.list();
  ASSERT_EQ(listing.files.size(), 1u);
  EXPECT_EQ(listing.files[0].uuid, "u");
  EXPECT_EQ(server.last_request().target, "/list_data");
  EXPECT_EQ(server.request_count(), 2u);
}

TEST_F(HttpClientTest, CheckServerError) {
  reply(500, "Internal Server Error");

  Client client(io_context, config_for(server.address()));
  try {
    client.check("f");
    FAIL() << "Expected OperationError";
  } catch (const OperationError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::remote_fault);
    EXPECT_EQ(e.status(), 500u);
    EXPECT_EQ(std::string(e.what()), "Internal Server Error");
  }
}

TEST_F(HttpClientTest, Repair) {
  reply(200, R"({"name":"f","status":"GOOD"})");

  Client client(io_context, config_for(server.address()));
  EXPECT_TRUE(client.repair("f").is_good());
  EXPECT_EQ(server.last_request().target, "/repair_data/f");
}

TEST_F(HttpClientTest, BasePathPrefixesEndpoints) {
  reply(200, R"({"files":[]})");

  Client client(io_context, config_for("http://" + server.address() + "/backup/"));
  EXPECT_TRUE(client.list().empty());
  EXPECT_EQ(server.last_request().target, "/backup/list_data");
}

TEST_F(HttpClientTest, UnansweredRequestTimesOut) {
  TestHttpServer::Reply silent;
  silent.respond = false;
  server.set_reply(silent);

  Client client(io_context, config_for(server.address(), std::chrono::milliseconds(300)));
  const auto started = std::chrono::steady_clock::now();
  try {
    client.list();
    FAIL() << "Expected OperationError";
  } catch (const OperationError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::remote_fault);
    EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos);
  }
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(3));
}

TEST_F(HttpClientTest, ConnectionRefused) {
  // Grab a free port and release it so nothing listens there
  unsigned short port = 0;
  {
    boost::asio::io_context scratch_context;
    boost::asio::ip::tcp::acceptor scratch(scratch_context, {boost::asio::ip::make_address("127.0.0.1"), 0});
    port = scratch.local_endpoint().port();
  }

  Client client(io_context, config_for("127.0.0.1:" + std::to_string(port)));
  try {
    client.list();
    FAIL() << "Expected OperationError";
  } catch (const OperationError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::remote_fault);
    EXPECT_EQ(e.status(), 0u);
  }
}
