#include <gtest/gtest.h>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>
#include <boost/log/core.hpp>
#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "test_http_server.hpp"
#include "test_utils.hpp"

using namespace backuper;
using namespace backuper::cli;

//==============================================
// COMMAND LINE PARSING
//==============================================

TEST(ParseCommandLineTest, SubmitWithDefaults) {
  const ProgramOptions options = parse_command_line({"submit-data", "name", "./file.txt"});

  ASSERT_TRUE(options.valid) << options.error;
  EXPECT_EQ(options.command, Command::submit_data);
  EXPECT_EQ(options.arguments, (std::vector<std::string>{"name", "./file.txt"}));
  EXPECT_EQ(options.server_url, "localhost:44987");
  EXPECT_EQ(options.timeout_seconds, 5);
  EXPECT_FALSE(options.debug);
  EXPECT_FALSE(options.loose_tls);
  EXPECT_TRUE(options.log_file.empty());
}

TEST(ParseCommandLineTest, OptionsAnywhere) {
  const ProgramOptions options = parse_command_line(
    {"retrieve-data", "-s", "https://backup.local", "name", "--timeout", "10", "out.bin", "--debug", "-k"});

  ASSERT_TRUE(options.valid) << options.error;
  EXPECT_EQ(options.command, Command::retrieve_data);
  EXPECT_EQ(options.arguments, (std::vector<std::string>{"name", "out.bin"}));
  EXPECT_EQ(options.server_url, "https://backup.local");
  EXPECT_EQ(options.timeout_seconds, 10);
  EXPECT_TRUE(options.debug);
  EXPECT_TRUE(options.loose_tls);
}

TEST(ParseCommandLineTest, InlineValuesAndNoDebug) {
  const ProgramOptions options = parse_command_line(
    {"list-data", "--server-url=127.0.0.1:9000", "--timeout=2", "--debug", "--no-debug", "--log-file=out.log"});

  ASSERT_TRUE(options.valid) << options.error;
  EXPECT_EQ(options.server_url, "127.0.0.1:9000");
  EXPECT_EQ(options.timeout_seconds, 2);
  EXPECT_FALSE(options.debug);
  EXPECT_EQ(options.log_file, "out.log");
}

TEST(ParseCommandLineTest, DoubleDashEndsOptions) {
  const ProgramOptions options = parse_command_line({"check-data", "--", "-strange-name"});

  ASSERT_TRUE(options.valid) << options.error;
  EXPECT_EQ(options.arguments, (std::vector<std::string>{"-strange-name"}));
}

TEST(ParseCommandLineTest, Help) {
  EXPECT_TRUE(parse_command_line({"--help"}).help);
  EXPECT_TRUE(parse_command_line({"-h"}).valid);
  EXPECT_TRUE(parse_command_line({"check-data", "-h"}).help);
}

TEST(ParseCommandLineTest, RepairCommand) {
  const ProgramOptions options = parse_command_line({"repair-data", "f"});
  ASSERT_TRUE(options.valid);
  EXPECT_EQ(options.command, Command::repair_data);
}

TEST(ParseCommandLineTest, Rejections) {
  EXPECT_FALSE(parse_command_line({}).valid);
  EXPECT_FALSE(parse_command_line({"upload"}).valid);
  EXPECT_FALSE(parse_command_line({"check-data"}).valid);
  EXPECT_FALSE(parse_command_line({"list-data", "extra"}).valid);
  EXPECT_FALSE(parse_command_line({"submit-data", "only-name"}).valid);
  EXPECT_FALSE(parse_command_line({"list-data", "--bogus"}).valid);
  EXPECT_FALSE(parse_command_line({"list-data", "-s"}).valid);
  EXPECT_FALSE(parse_command_line({"list-data", "-t", "0"}).valid);
  EXPECT_FALSE(parse_command_line({"list-data", "-t", "-3"}).valid);
  EXPECT_FALSE(parse_command_line({"list-data", "-t", "abc"}).valid);
  EXPECT_FALSE(parse_command_line({"list-data", "--debug=yes"}).valid);
}

TEST(ParseCommandLineTest, ErrorNamesProblem) {
  const ProgramOptions options = parse_command_line({"list-data", "--bogus"});
  EXPECT_NE(options.error.find("--bogus"), std::string::npos);
}

TEST(PrintUsageTest, ListsCommands) {
  std::ostringstream out;
  print_usage(out, "backuper");

  const std::string usage = out.str();
  for (const char* command : {"submit-data", "retrieve-data", "check-data", "list-data", "repair-data"}) {
    EXPECT_NE(usage.find(command), std::string::npos) << command;
  }
  EXPECT_NE(usage.find("localhost:44987"), std::string::npos);
}


//==============================================
// RUNNING COMMANDS
//==============================================

class CLIRunTest : public ::testing::Test {
protected:
  test::TestHttpServer server;
  test::TempDir dir{"cli_test"};
  std::ostringstream out;
  std::ostringstream err;
  CLI cli{out, err};

  void SetUp() override {
    test::init_test_logging();
  }

  ProgramOptions options_for(const std::vector<std::string>& args) {
    std::vector<std::string> full = args;
    full.push_back("--server-url");
    full.push_back(server.address());
    ProgramOptions options = parse_command_line(full);
    EXPECT_TRUE(options.valid) << options.error;
    return options;
  }

  void reply(unsigned status, const std::string& body) {
    test::TestHttpServer::Reply canned;
    canned.status = status;
    canned.body = body;
    server.set_reply(canned);
  }
};

TEST_F(CLIRunTest, SubmitPrintsOutcome) {
  const auto path = dir.write_file("data.txt", "1234123412341234123412341234123412341234");
  reply(200, R"({"size":40,"data_shards":2,"parity_shards":1,"hashes":["123","456"]})");

  EXPECT_EQ(cli.run(options_for({"submit-data", "some/file", path.string()})), EXIT_OK);

  const std::string text = out.str();
  EXPECT_NE(text.find("sha256: 80b61beab398c37f21cdb80c4fa4c75fa4d54f916fe3c42e6445ed27bbc4b2ed"), std::string::npos);
  EXPECT_NE(text.find("Status: SUCCESS"), std::string::npos);
  EXPECT_NE(text.find("hashes: [123, 456]"), std::string::npos);
  EXPECT_TRUE(err.str().empty());
}

TEST_F(CLIRunTest, MissingFileIsClientError) {
  const auto missing = dir.path() / "missing.txt";

  EXPECT_EQ(cli.run(options_for({"submit-data", "f", missing.string()})), EXIT_OPERATION_FAILED);
  EXPECT_EQ(err.str(), "Client error: " + missing.string() + " does not exist!\n");
  EXPECT_EQ(server.request_count(), 0u);
}

TEST_F(CLIRunTest, RetrieveWritesFile) {
  reply(200, "archived bytes");
  const auto target = dir.path() / "restored.txt";

  EXPECT_EQ(cli.run(options_for({"retrieve-data", "f", target.string()})), EXIT_OK);
  EXPECT_EQ(test::read_file(target), "archived bytes");
  EXPECT_NE(out.str().find("Downloaded \"f\""), std::string::npos);
}

TEST_F(CLIRunTest, CheckServerErrorIsServerError) {
  reply(500, "Internal Server Error");

  EXPECT_EQ(cli.run(options_for({"check-data", "f"})), EXIT_OPERATION_FAILED);
  EXPECT_EQ(err.str(), "Server error: Internal Server Error\n");
}

TEST_F(CLIRunTest, CheckNotFoundIsClientError) {
  reply(404, "");

  EXPECT_EQ(cli.run(options_for({"check-data", "gone"})), EXIT_OPERATION_FAILED);
  EXPECT_EQ(err.str(), "Client error: File gone not found!\n");
}

TEST_F(CLIRunTest, EmptyList) {
  reply(200, R"({"files":[]})");

  EXPECT_EQ(cli.run(options_for({"list-data"})), EXIT_OK);
  EXPECT_EQ(out.str(), "No files!\n");
}

TEST_F(CLIRunTest, Repair) {
  reply(200, R"({"name":"f","status":"GOOD"})");

  EXPECT_EQ(cli.run(options_for({"repair-data", "f"})), EXIT_OK);
  EXPECT_NE(out.str().find("status: GOOD"), std::string::npos);
}

TEST_F(CLIRunTest, BadServerAddressIsUsageError) {
  ProgramOptions options = parse_command_line({"list-data", "-s", "localhost:99999"});
  ASSERT_TRUE(options.valid);

  EXPECT_EQ(cli.run(options), EXIT_USAGE);
  EXPECT_EQ(err.str().rfind("Error: ", 0), 0u);
}

TEST_F(CLIRunTest, FaultsAreNotRepeatedInTheLog) {
  const auto log_path = dir.path() / "run.log";
  logging::init_logging(false, log_path.string());

  reply(500, "Internal Server Error");
  EXPECT_EQ(cli.run(options_for({"check-data", "f"})), EXIT_OPERATION_FAILED);
  const auto missing = dir.path() / "missing.txt";
  EXPECT_EQ(cli.run(options_for({"submit-data", "f", missing.string()})), EXIT_OPERATION_FAILED);

  boost::log::core::get()->flush();
  const std::string log = test::read_file(log_path);
  boost::log::core::get()->remove_all_sinks();
  test::init_test_logging();

  EXPECT_EQ(log.find("[error]"), std::string::npos) << log;
  EXPECT_EQ(log.find("[warning]"), std::string::npos) << log;
  EXPECT_EQ(err.str(), "Server error: Internal Server Error\n"
                       "Client error: " + missing.string() + " does not exist!\n");
}
