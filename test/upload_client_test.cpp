#include "error.hpp"
#include "test_helpers.hpp"
#include "upload_client.hpp"

#include <yaml-cpp/yaml.h>

#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace Pkgdepot;

TEST(UploadClientTest, Endpoint)
{
    EXPECT_EQ("http://host/api/upload/initiate",
              UploadClient::endpoint("http://host/api", "upload/initiate"));
    EXPECT_EQ("http://host/api/upload/initiate",
              UploadClient::endpoint("http://host/api/", "/upload/initiate"));
    EXPECT_EQ("http://host/api/upload/x",
              UploadClient::endpoint("http://host/api//", "upload/x"));
}

TEST(UploadClientTest, BaseUrlFromConfig)
{
    Pkgdepot::Test::ScratchDir dir("client");
    Config config = Pkgdepot::Test::testConfig(dir.path());
    config.clientUrl = "http://repo.example.org/api/packages";

    UploadClient client(config);
    EXPECT_EQ("http://repo.example.org/api/packages", client.getBaseUrl());
    client.setBaseUrl("http://localhost:3000/api/packages");
    EXPECT_EQ("http://localhost:3000/api/packages", client.getBaseUrl());
}

TEST(UploadClientTest, InitiateBody)
{
    std::string body = UploadClient::initiateBody("foo-1.0-1-x86_64.pkg.tar.zst", 3145728,
                                                  std::string(64, 'e'),
                                                  PartitionKey{"core", "x86_64"}, 1048576);
    EXPECT_EQ('{', body.front());

    YAML::Node node = YAML::Load(body);
    ASSERT_TRUE(node.IsMap());
    EXPECT_EQ("foo-1.0-1-x86_64.pkg.tar.zst", node["filename"].as<std::string>());
    EXPECT_EQ(3145728u, node["size"].as<std::uint64_t>());
    EXPECT_EQ(std::string(64, 'e'), node["sha256"].as<std::string>());
    EXPECT_EQ("core", node["repo"].as<std::string>());
    EXPECT_EQ("x86_64", node["arch"].as<std::string>());
    EXPECT_EQ(1048576u, node["chunk_size"].as<std::uint64_t>());
}

TEST(UploadClientTest, ParseInitiateResponse)
{
    UploadPlan plan = UploadClient::parseInitiateResponse(
        "{\"upload_id\": \"5f3c\", \"chunk_size\": 1048576, \"total_chunks\": 3, "
        "\"expires_at\": \"2026-10-20T12:00:00Z\"}");
    EXPECT_EQ("5f3c", plan.uploadId);
    EXPECT_EQ(1048576u, plan.chunkSize);
    EXPECT_EQ(3u, plan.totalChunks);
    EXPECT_EQ("2026-10-20T12:00:00Z", plan.expiresAt);

    UploadPlan minimal = UploadClient::parseInitiateResponse(
        "{\"upload_id\": \"a\", \"chunk_size\": 10, \"total_chunks\": 1}");
    EXPECT_TRUE(minimal.expiresAt.empty());
}

TEST(UploadClientTest, RejectsBadInitiateResponses)
{
    EXPECT_THROW(UploadClient::parseInitiateResponse("<html>Bad Gateway</html>"), TransportError);
    EXPECT_THROW(UploadClient::parseInitiateResponse("{\"upload_id\": \"a\""), TransportError);
    EXPECT_THROW(UploadClient::parseInitiateResponse(
                     "{\"chunk_size\": 10, \"total_chunks\": 1}"),
                 TransportError);
    EXPECT_THROW(UploadClient::parseInitiateResponse(
                     "{\"upload_id\": \"a\", \"chunk_size\": \"big\", \"total_chunks\": 1}"),
                 TransportError);
    EXPECT_THROW(UploadClient::parseInitiateResponse(
                     "{\"upload_id\": \"a\", \"chunk_size\": 0, \"total_chunks\": 1}"),
                 TransportError);
}

TEST(UploadClientTest, ParseChunkResponse)
{
    ChunkReceipt receipt = UploadClient::parseChunkResponse(
        "{\"chunk_number\": 2, \"checksum\": \"900150983cd24fb0d6963f7d28e17f72\"}");
    EXPECT_EQ(2u, receipt.chunkNumber);
    EXPECT_EQ("900150983cd24fb0d6963f7d28e17f72", receipt.checksum);

    EXPECT_THROW(UploadClient::parseChunkResponse("{\"chunk_number\": 2}"), TransportError);
    EXPECT_THROW(UploadClient::parseChunkResponse("[]"), TransportError);
}

TEST(UploadClientTest, CompleteBody)
{
    std::vector<ChunkReceipt> chunks(2);
    chunks[0].chunkNumber = 1;
    chunks[0].checksum = "aaaa";
    chunks[1].chunkNumber = 2;
    chunks[1].checksum = "bbbb";

    YAML::Node node = YAML::Load(UploadClient::completeBody(chunks));
    const YAML::Node list = node["chunks"];
    ASSERT_TRUE(list.IsSequence());
    ASSERT_EQ(2u, list.size());
    EXPECT_EQ(1u, list[0]["chunk_number"].as<unsigned>());
    EXPECT_EQ("aaaa", list[0]["checksum"].as<std::string>());
    EXPECT_EQ(2u, list[1]["chunk_number"].as<unsigned>());
    EXPECT_EQ("bbbb", list[1]["checksum"].as<std::string>());

    EXPECT_EQ(0u, YAML::Load(UploadClient::completeBody({}))["chunks"].size());
}

TEST(UploadClientTest, PushFailsBeforeContactingServer)
{
    Pkgdepot::Test::ScratchDir dir("client");
    Config config = Pkgdepot::Test::testConfig(dir.path());
    UploadClient client(config);

    EXPECT_THROW(client.push(dir / "absent.pkg.tar.gz", PartitionKey{"default", "x86_64"}),
                 IoError);
    EXPECT_THROW(client.push(dir / "absent.pkg.tar.gz", PartitionKey{"..", "x86_64"}),
                 InputError);
}

TEST(UploadClientTest, PushToUnreachableServer)
{
    Pkgdepot::Test::ScratchDir dir("client");
    Config config = Pkgdepot::Test::testConfig(dir.path());
    UploadClient client(config);
    // Port 1 on loopback refuses connections.
    client.setBaseUrl("http://127.0.0.1:1/api/packages");

    auto archive = Pkgdepot::Test::buildPackage(dir.path(), "foo", "1.0.0", "1", "x86_64");
    EXPECT_THROW(client.push(archive, PartitionKey{"default", "x86_64"}), TransportError);
}
