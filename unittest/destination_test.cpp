#include <gtest/gtest.h>
#include "destination/destination.hpp"
#include "test_support.hpp"

class DestinationTest : public ::testing::Test {
protected:
    TempDir dir_{"destinations"};
};

TEST_F(DestinationTest, LoadFromFile) {
    std::string path = dir_.file("destinations.json", R"([
        {"id": "local1", "name": "Local Disk", "type": "Local", "path": "/backup"},
        {"id": "sftp1", "name": "Offsite", "type": "SFTP", "host": "backup.example.com",
         "path": "/srv/backups", "disabled": true, "credentials": {"user": "bk", "port": 22}}
    ])");

    DestinationRegistry registry;
    ASSERT_TRUE(registry.loadFromFile(path)) << registry.getLastError();
    ASSERT_EQ(registry.getDestinations().size(), 2u);

    auto local = registry.findById("local1");
    ASSERT_TRUE(local.has_value());
    EXPECT_TRUE(local->isLocal());
    EXPECT_TRUE(local->enabled);
    EXPECT_EQ(local->describe(), "Destination: Local Disk");

    auto remote = registry.findById("sftp1");
    ASSERT_TRUE(remote.has_value());
    EXPECT_FALSE(remote->isLocal());
    EXPECT_EQ(remote->normalizedType(), "sftp");
    EXPECT_FALSE(remote->enabled);
    EXPECT_EQ(remote->describe(), "Host: backup.example.com");
    EXPECT_EQ(remote->credentials.at("user"), "bk");
    EXPECT_EQ(remote->credentials.at("port"), "22");

    ASSERT_EQ(registry.getEnabledDestinations().size(), 1u);
    EXPECT_FALSE(registry.findById("nope").has_value());
}

// Test rejection of unreadable or malformed files
TEST_F(DestinationTest, LoadFailures) {
    DestinationRegistry registry;
    EXPECT_FALSE(registry.loadFromFile(dir_.sub("missing.json")));
    EXPECT_FALSE(registry.getLastError().empty());
    EXPECT_FALSE(registry.loadFromFile(dir_.file("object.json", R"({"id": "x"})")));
    EXPECT_FALSE(registry.loadFromFile(dir_.file("noid.json", R"([{"name": "x"}])")));
}

TEST_F(DestinationTest, AddDestinationUpserts) {
    DestinationRegistry registry;
    Destination d;
    d.id = "d1";
    d.name = "First";
    registry.addDestination(d);
    d.name = "Renamed";
    registry.addDestination(d);
    ASSERT_EQ(registry.getDestinations().size(), 1u);
    EXPECT_EQ(registry.findById("d1")->name, "Renamed");
}

TEST_F(DestinationTest, JsonRoundTripKeepsFields) {
    Destination d;
    d.id = "s3";
    d.name = "Bucket";
    d.type = "s3";
    d.enabled = false;
    d.path = "acct";
    d.credentials["bucket"] = "b";

    nlohmann::json j = d;
    Destination back = j.get<Destination>();
    EXPECT_EQ(back.id, "s3");
    EXPECT_EQ(back.type, "s3");
    EXPECT_FALSE(back.enabled);
    EXPECT_EQ(back.credentials.at("bucket"), "b");
}
