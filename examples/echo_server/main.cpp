/// Echo server: minimal MCP server demonstrating tool registration.
/// Usage: ./echo_server
/// Communicates over stdio (newline-delimited JSON-RPC).

#include <simplemcp/simplemcp.hpp>

int main() {
    simplemcp::ToolDefinition echo_tool;
    echo_tool.name = "echo";
    echo_tool.description = "Echo the input text back to the caller";
    echo_tool.input_schema = {
        {"type", "object"},
        {"properties", {
            {"text", {{"type", "string"}, {"description", "The text to echo"}}}
        }},
        {"required", {"text"}}
    };

    // Serve over stdio; blocks until the client disconnects
    simplemcp::ServerBuilder("echo-server")
        .with_server_info("echo-server", "1.0.0")
        .with_instructions("A simple echo server that returns whatever you send it.")
        .tool(echo_tool, [](const nlohmann::json& args) { return args.at("text"); })
        .run();
    return 0;
}
