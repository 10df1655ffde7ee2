#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include "cli/renderer.hpp"

using namespace backuper;
using backuper::cli::Renderer;

class RendererTest : public ::testing::Test {
protected:
  std::ostringstream out;
  Renderer renderer{out};
  const std::string separator = std::string(80, '=') + "\n";
};

TEST_F(RendererTest, SubmitOutcome) {
  client::SubmitOutcome outcome;
  outcome.total_size = 40;
  outcome.data_shard_count = 2;
  outcome.parity_shard_count = 1;
  outcome.content_hashes = {"123", "456"};
  outcome.local_digest = "80b61bea";
  outcome.source_path = "data.txt";

  renderer.render(outcome);

  EXPECT_EQ(out.str(),
            separator +
            "Uploaded file: data.txt\n"
            "sha256: 80b61bea\n" +
            separator +
            "Status: SUCCESS\n"
            "size: 40\n"
            "data_shards: 2\n"
            "parity_shards: 1\n"
            "hashes: [123, 456]\n");
}

TEST_F(RendererTest, Retrieved) {
  renderer.render_retrieved("archive", "out.bin");
  EXPECT_EQ(out.str(), "Downloaded \"archive\" to \"out.bin\"\n");
}

TEST_F(RendererTest, StatusReport) {
  client::StatusReport report;
  report.name = "f";
  report.last_modified = "2024-05-01";
  report.health = "DAMAGED";

  renderer.render(report);

  EXPECT_EQ(out.str(),
            separator +
            "name: f\n"
            "last modified: 2024-05-01\n"
            "health: DAMAGED\n"
            "hashes: []\n");
}

TEST_F(RendererTest, EmptyListing) {
  renderer.render(client::FileListing{});
  EXPECT_EQ(out.str(), "No files!\n");
}

TEST_F(RendererTest, ListingBlocks) {
  client::FileListing listing;
  listing.files.push_back({"a", "t1", "u1", "s1"});
  listing.files.push_back({"b", "t2", "u2", "s2"});

  renderer.render(listing);

  const std::string text = out.str();
  EXPECT_NE(text.find(separator + "name: a\nlast modified: t1\nuuid: u1\nsha256sum: s1\n"), std::string::npos);
  EXPECT_NE(text.find(separator + "name: b\nlast modified: t2\nuuid: u2\nsha256sum: s2\n"), std::string::npos);
}

TEST_F(RendererTest, RepairReport) {
  client::RepairReport report;
  report.name = "f";
  report.status = "GOOD";

  renderer.render(report);
  EXPECT_EQ(out.str(), separator + "name: f\nstatus: GOOD\n");
}

TEST_F(RendererTest, Errors) {
  renderer.render_error(client::caller_fault("/tmp/x does not exist!"));
  renderer.render_error(client::remote_fault("Internal Server Error", 500));

  EXPECT_EQ(out.str(),
            "Client error: /tmp/x does not exist!\n"
            "Server error: Internal Server Error\n");
}
