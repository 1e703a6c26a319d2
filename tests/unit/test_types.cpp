#include <gtest/gtest.h>
#include "simplemcp/types.hpp"

using namespace simplemcp;

TEST(Types, ToolDefinitionDefaultSchema) {
    ToolDefinition def;
    def.name = "echo";
    def.description = "Echo text";

    nlohmann::json j = def;
    EXPECT_EQ(j["name"], "echo");
    EXPECT_EQ(j["description"], "Echo text");
    EXPECT_EQ(j["inputSchema"]["type"], "object");
    EXPECT_TRUE(j["inputSchema"]["properties"].is_object());
    EXPECT_FALSE(j.contains("title"));
}

TEST(Types, ToolDefinitionRoundTrip) {
    ToolDefinition def;
    def.name = "add";
    def.description = "Add numbers";
    def.title = "Adder";
    def.input_schema = nlohmann::json{{"type", "object"}, {"required", {"a", "b"}}};

    nlohmann::json j = def;
    EXPECT_EQ(j.get<ToolDefinition>(), def);
}

TEST(Types, PromptDefinitionOmitsEmptyArguments) {
    PromptDefinition def{"greet", "Say hello", {}};
    nlohmann::json j = def;
    EXPECT_FALSE(j.contains("arguments"));

    def.arguments.push_back({"name", std::string("Who to greet"), true});
    j = def;
    ASSERT_EQ(j["arguments"].size(), 1u);
    EXPECT_EQ(j["arguments"][0]["required"], true);
    EXPECT_EQ(j.get<PromptDefinition>(), def);
}

TEST(Types, ResourceDefinitionMimeType) {
    ResourceDefinition def{"file:///notes.md", "notes", "Notes", "text/markdown"};
    nlohmann::json j = def;
    EXPECT_EQ(j["mimeType"], "text/markdown");
    EXPECT_EQ(j.get<ResourceDefinition>(), def);

    auto parsed = nlohmann::json{{"uri", "mem://x"}, {"name", "x"}}.get<ResourceDefinition>();
    EXPECT_EQ(parsed.mime_type, "text/plain");
}

TEST(Types, CapabilitiesAreBooleans) {
    ServerCapabilities caps;
    caps.tools = true;
    nlohmann::json j = caps;
    EXPECT_EQ(j, (nlohmann::json{{"tools", true}, {"prompts", false}, {"resources", false}}));

    auto back = j.get<ServerCapabilities>();
    EXPECT_EQ(back, caps);
}

TEST(Types, CapabilitiesAcceptObjects) {
    auto caps = nlohmann::json{{"tools", {{"listChanged", false}}}, {"prompts", false}}
                    .get<ServerCapabilities>();
    EXPECT_TRUE(caps.tools);
    EXPECT_FALSE(caps.prompts);
    EXPECT_FALSE(caps.resources);
}

TEST(Types, InitializeResult) {
    InitializeResult r;
    r.protocol_version = "2025-06-18";
    r.capabilities.resources = true;
    r.server_info = {"srv", "0.1"};
    r.instructions = "Be nice";

    nlohmann::json j = r;
    EXPECT_EQ(j["protocolVersion"], "2025-06-18");
    EXPECT_EQ(j["serverInfo"]["name"], "srv");
    EXPECT_EQ(j["instructions"], "Be nice");
    EXPECT_EQ(j["capabilities"]["resources"], true);
    EXPECT_EQ(j["capabilities"]["tools"], false);

    auto back = j.get<InitializeResult>();
    EXPECT_EQ(back.server_info, r.server_info);
    EXPECT_EQ(back.capabilities, r.capabilities);
}

TEST(Types, ContentHelpers) {
    auto content = text_content("hi");
    ASSERT_TRUE(content.is_array());
    EXPECT_EQ(content[0]["type"], "text");
    EXPECT_EQ(content[0]["text"], "hi");

    auto msg = prompt_message("user", "hello");
    EXPECT_EQ(msg["role"], "user");
    EXPECT_EQ(msg["content"]["text"], "hello");

    auto res = text_resource("mem://a", "text/plain", "body");
    EXPECT_EQ(res[0]["uri"], "mem://a");
    EXPECT_EQ(res[0]["mimeType"], "text/plain");
    EXPECT_EQ(res[0]["text"], "body");
}
