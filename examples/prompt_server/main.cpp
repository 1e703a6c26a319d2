/// Prompt server: code review and translation prompts.
/// Usage: ./prompt_server

#include <simplemcp/simplemcp.hpp>
#include <string>

int main() {
    simplemcp::ServerBuilder builder("prompt-server");
    builder.with_server_info("prompt-server", "1.0.0")
           .with_instructions("A server providing code review and translation prompts.");

    simplemcp::PromptDefinition code_review_def;
    code_review_def.name = "code_review";
    code_review_def.description = "Generate a code review prompt";
    code_review_def.arguments = {
        {"code", std::string("The code to review"), true},
        {"language", std::string("Programming language"), false}
    };
    builder.prompt(code_review_def, [](const nlohmann::json& args) {
        std::string code = args.at("code").get<std::string>();
        std::string lang = args.value("language", "");

        std::string prompt_text = "Please review the following";
        if (!lang.empty()) prompt_text += " " + lang;
        prompt_text += " code:\n\n```\n" + code + "\n```\n\n";
        prompt_text += "Focus on correctness, performance and readability.";

        return nlohmann::json::array({simplemcp::prompt_message("user", prompt_text)});
    });

    simplemcp::PromptDefinition translate_def;
    translate_def.name = "translate";
    translate_def.description = "Translate text to another language";
    translate_def.arguments = {
        {"text", std::string("Text to translate"), true},
        {"target_language", std::string("Target language"), true}
    };
    builder.prompt(translate_def, [](const nlohmann::json& args) {
        std::string text = args.at("text").get<std::string>();
        std::string target = args.at("target_language").get<std::string>();
        return nlohmann::json::array({
            simplemcp::prompt_message("user", "Translate the following text to " + target + ":\n\n" + text)
        });
    });

    builder.prompt("commit_message", "Draft a commit message for a diff", [](const nlohmann::json& args) {
        std::string diff = args.value("diff", "");
        return nlohmann::json::array({
            simplemcp::prompt_message("user", "Write a concise commit message for this diff:\n\n" + diff)
        });
    });

    builder.run();
    return 0;
}
