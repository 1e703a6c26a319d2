#include <gtest/gtest.h>
#include "simplemcp/session.hpp"
#include "simplemcp/error.hpp"

using namespace simplemcp;

TEST(Session, InitialState) {
    Session s({"server", "1.0"});
    EXPECT_EQ(s.state(), SessionState::Uninitialized);
    EXPECT_FALSE(s.is_initialized());
    EXPECT_EQ(s.server_info().name, "server");
    EXPECT_FALSE(s.client_info().has_value());
}

TEST(Session, MarkInitialized) {
    Session s({"server", "1.0"});
    s.mark_initialized(Implementation{"client", "2.0"}, "2025-06-18",
                       nlohmann::json{{"roots", {{"listChanged", true}}}});
    EXPECT_EQ(s.state(), SessionState::Initialized);
    EXPECT_TRUE(s.is_initialized());
    ASSERT_TRUE(s.client_info().has_value());
    EXPECT_EQ(s.client_info()->name, "client");
    EXPECT_EQ(s.protocol_version(), "2025-06-18");
    EXPECT_TRUE(s.client_capabilities().contains("roots"));
}

TEST(Session, SecondInitializeRejected) {
    Session s({"server", "1.0"});
    s.mark_initialized(std::nullopt, "2025-06-18");
    try {
        s.mark_initialized(std::nullopt, "2024-11-05");
        FAIL() << "expected McpProtocolError";
    } catch (const McpProtocolError& e) {
        EXPECT_EQ(e.code, error::InvalidRequest);
    }
    EXPECT_EQ(s.protocol_version(), "2025-06-18");
}

TEST(Session, CloseIsTerminal) {
    Session s({"server", "1.0"});
    s.mark_initialized(std::nullopt, "2025-06-18");
    s.close();
    EXPECT_EQ(s.state(), SessionState::Closed);
    EXPECT_FALSE(s.is_initialized());
    EXPECT_THROW(s.mark_initialized(std::nullopt, "2025-06-18"), McpProtocolError);
    s.close();
    EXPECT_EQ(s.state(), SessionState::Closed);
}

TEST(Session, CloseBeforeInitialize) {
    Session s({"server", "1.0"});
    s.close();
    EXPECT_EQ(s.state(), SessionState::Closed);
    EXPECT_THROW(s.mark_initialized(std::nullopt, "2025-06-18"), McpProtocolError);
}

TEST(SessionState, ToString) {
    EXPECT_STREQ(to_string(SessionState::Uninitialized), "uninitialized");
    EXPECT_STREQ(to_string(SessionState::Initialized), "initialized");
    EXPECT_STREQ(to_string(SessionState::Closed), "closed");
}
