#include <gtest/gtest.h>
#include "server_harness.hpp"
#include "simplemcp/error.hpp"

using namespace simplemcp;

class ResourcesE2ETest : public ::testing::Test {
protected:
    std::unique_ptr<test::ServerHarness> harness_;

    void SetUp() override {
        ServerBuilder builder("resource-server");
        builder.options().page_size = 2;

        builder.resource("file:///readme.md", "readme", "Project readme", "text/markdown",
                         [](const std::string& uri) {
                             return text_resource(uri, "text/markdown", "# Hello");
                         });
        builder.resource("config://app", "config", "App config", "application/json",
                         [](const std::string& uri) {
                             return text_resource(uri, "application/json", R"({"debug":true})");
                         });
        builder.resource("mem://placeholder", "placeholder");

        harness_ = std::make_unique<test::ServerHarness>(builder.build());
        harness_->initialize();
    }
};

TEST_F(ResourcesE2ETest, ListResourcesPaged) {
    auto first = harness_->request(1, "resources/list");
    const auto& page1 = first["result"]["resources"];
    ASSERT_EQ(page1.size(), 2u);
    EXPECT_EQ(page1[0]["uri"], "file:///readme.md");
    EXPECT_EQ(page1[0]["mimeType"], "text/markdown");
    EXPECT_EQ(page1[1]["uri"], "config://app");
    ASSERT_TRUE(first["result"].contains("nextCursor"));

    auto second = harness_->request(2, "resources/list", {{"cursor", first["result"]["nextCursor"]}});
    const auto& page2 = second["result"]["resources"];
    ASSERT_EQ(page2.size(), 1u);
    EXPECT_EQ(page2[0]["uri"], "mem://placeholder");
    EXPECT_EQ(page2[0]["mimeType"], "text/plain");
    EXPECT_FALSE(second["result"].contains("nextCursor"));
}

TEST_F(ResourcesE2ETest, ReadResource) {
    auto resp = harness_->request(3, "resources/read", {{"uri", "file:///readme.md"}});
    const auto& contents = resp["result"]["contents"];
    ASSERT_EQ(contents.size(), 1u);
    EXPECT_EQ(contents[0]["uri"], "file:///readme.md");
    EXPECT_EQ(contents[0]["text"], "# Hello");
}

TEST_F(ResourcesE2ETest, ReadStaticResource) {
    auto resp = harness_->request(4, "resources/read", {{"uri", "mem://placeholder"}});
    ASSERT_FALSE(resp.contains("error"));
    EXPECT_EQ(resp["result"]["contents"][0]["uri"], "mem://placeholder");
    EXPECT_EQ(resp["result"]["contents"][0]["text"], "");
}

TEST_F(ResourcesE2ETest, ReadUnknownResource) {
    auto resp = harness_->request(5, "resources/read", {{"uri", "file:///nope"}});
    EXPECT_EQ(resp["id"], 5);
    EXPECT_EQ(resp["error"]["code"], error::NotFound);
}

TEST_F(ResourcesE2ETest, ReadWithoutUri) {
    auto resp = harness_->request(6, "resources/read");
    EXPECT_EQ(resp["error"]["code"], error::InvalidParams);
}
