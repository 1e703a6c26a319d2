/// Full-featured MCP server demonstrating tools, prompts, resources and
/// file-based configuration.
/// Usage: ./full_featured_server [config.json]

#include <simplemcp/simplemcp.hpp>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

namespace {

const auto g_started = std::chrono::steady_clock::now();

} // anonymous namespace

int main(int argc, char** argv) {
    simplemcp::ServerConfig config;
    config.server.server_info = {"full-featured-server", "1.0.0"};
    config.server.instructions = "A full-featured MCP server demonstrating all capabilities.";
    try {
        if (argc > 1) config = simplemcp::load_server_config(argv[1]);
        simplemcp::logging::configure(config.logging);
    } catch (const simplemcp::McpError& e) {
        std::fprintf(stderr, "full_featured_server: %s\n", e.what());
        return 1;
    }

    simplemcp::ServerBuilder builder;
    builder.with_options(config.server);

    // ---- Tools ----

    simplemcp::ToolDefinition echo_def;
    echo_def.name = "echo";
    echo_def.description = "Echo text back";
    echo_def.input_schema = {
        {"type", "object"},
        {"properties", {{"text", {{"type", "string"}}}}},
        {"required", {"text"}}
    };
    builder.tool(echo_def, [](const nlohmann::json& args) { return args.at("text"); });

    simplemcp::ToolDefinition add_def;
    add_def.name = "add";
    add_def.title = "Adder";
    add_def.description = "Add two numbers";
    add_def.input_schema = {
        {"type", "object"},
        {"properties", {{"a", {{"type", "number"}}}, {"b", {{"type", "number"}}}}},
        {"required", {"a", "b"}},
        {"additionalProperties", false}
    };
    builder.tool(add_def, [](const nlohmann::json& args) {
        double sum = args.at("a").get<double>() + args.at("b").get<double>();
        return simplemcp::text_content(std::to_string(sum));
    });

    simplemcp::ToolDefinition weather_def;
    weather_def.name = "get_weather";
    weather_def.description = "Get weather for a location";
    weather_def.input_schema = {
        {"type", "object"},
        {"properties", {
            {"location", {{"type", "string"}}},
            {"units", {{"type", "string"}, {"enum", {"celsius", "fahrenheit"}}}}
        }},
        {"required", {"location"}}
    };
    builder.tool(weather_def, [](const nlohmann::json& args) {
        std::string location = args.at("location").get<std::string>();
        bool fahrenheit = args.value("units", "celsius") == "fahrenheit";
        return nlohmann::json{
            {"location", location},
            {"temperature", fahrenheit ? 71.6 : 22.0},
            {"condition", "Sunny"}
        };
    });

    // ---- Resources ----

    builder.resource("app://status", "Server Status", "Uptime and version", "application/json",
                     [](const std::string& uri) {
                         auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
                             std::chrono::steady_clock::now() - g_started);
                         nlohmann::json status = {
                             {"status", "running"},
                             {"uptime_seconds", uptime.count()},
                             {"version", std::string(simplemcp::LIBRARY_VERSION)}
                         };
                         return simplemcp::text_resource(uri, "application/json", status.dump());
                     });
    builder.resource("app://time", "Server Time", "Current UNIX time", "text/plain",
                     [](const std::string& uri) {
                         return simplemcp::text_resource(uri, "text/plain",
                                                         std::to_string(std::time(nullptr)));
                     });
    builder.resource("app://readme", "Readme", "Placeholder without a handler");

    // ---- Prompts ----

    simplemcp::PromptDefinition assist_def;
    assist_def.name = "assistant";
    assist_def.description = "Ask the assistant a question";
    assist_def.arguments = {{"query", std::string("Your question"), true}};
    builder.prompt(assist_def, [](const nlohmann::json& args) {
        return nlohmann::json::array({
            simplemcp::prompt_message("user", args.at("query").get<std::string>())
        });
    });

    SIMPLEMCP_LOG_INFO("full-featured server starting");
    builder.run();
    return 0;
}
