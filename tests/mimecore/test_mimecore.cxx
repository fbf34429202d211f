#include <gtest/gtest.h>

#include <mimecore.hxx>

using namespace mimecore;

TEST(MimecoreTest, InitDoesNotThrow) {
    mimecore_cfg_t cfg{};

    EXPECT_NO_THROW(init(cfg));
}

#ifdef MIMECORE_USE_LOGGING_IMPL
TEST(MimecoreTest, InitAppliesLoggerLevel) {
    mimecore_cfg_t cfg{};

    cfg.m_logger.m_level = e_log_level::error;

    init(cfg);

    EXPECT_FALSE(g_logging->enabled(e_log_level::warning));
    EXPECT_TRUE(g_logging->enabled(e_log_level::error));

    cfg.m_logger.m_level = e_log_level::none;

    init(cfg);

    EXPECT_FALSE(g_logging->enabled(e_log_level::critical));
}

TEST(MimecoreTest, LibraryLogsSkippedQuality) {
    mimecore_cfg_t cfg{};

    cfg.m_logger.m_level = e_log_level::debug;

    init(cfg);

    std::vector<std::string> messages{};

    g_logging->set_sink([&](const shared::log_message_t& msg) { messages.push_back(msg.m_message); });

    [[maybe_unused]] auto mime_type = c_mime_type::parse("a/b;q=notanumber");

    g_logging->set_sink({});

    cfg.m_logger.m_level = e_log_level::none;

    init(cfg);

    ASSERT_EQ(messages.size(), 1u);

    EXPECT_NE(messages[0].find("notanumber"), std::string::npos);
}
#endif // MIMECORE_USE_LOGGING_IMPL
