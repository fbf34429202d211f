#ifdef MIMECORE_USE_LOGGING_IMPL

#include <gtest/gtest.h>

#include <mimecore.hxx>

using namespace shared;

TEST(LoggingTest, DisabledByDefault) {
    c_logging logger;

    EXPECT_FALSE(logger.enabled(e_log_level::critical));
}

TEST(LoggingTest, LevelFiltering) {
    c_logging logger;

    logger.init(e_log_level::warning);

    EXPECT_FALSE(logger.enabled(e_log_level::debug));
    EXPECT_FALSE(logger.enabled(e_log_level::info));

    EXPECT_TRUE(logger.enabled(e_log_level::warning));
    EXPECT_TRUE(logger.enabled(e_log_level::critical));
}

TEST(LoggingTest, SinkReceivesFormattedMessages) {
    c_logging logger;

    logger.init(e_log_level::info);

    std::vector<log_message_t> captured{};

    logger.set_sink([&](const log_message_t& msg) { captured.push_back(msg); });

    logger.log(e_log_level::debug, "dropped {}", 1);
    logger.log(e_log_level::info, "kept {} {}", "a", 2);
    logger.log(e_log_level::error, "also kept");

    ASSERT_EQ(captured.size(), 2u);

    EXPECT_EQ(captured[0].m_level, e_log_level::info);
    EXPECT_EQ(captured[0].m_message, "kept a 2");

    EXPECT_EQ(captured[1].m_level, e_log_level::error);
    EXPECT_EQ(captured[1].m_message, "also kept");
}

TEST(LoggingTest, SinkMayLogAndReplaceItself) {
    c_logging logger;

    logger.init(e_log_level::info);

    std::vector<std::string> captured{};

    logger.set_sink([&](const log_message_t& msg) {
        captured.push_back(msg.m_message);

        if (captured.size() == 1u)
            logger.log(e_log_level::info, "nested");
        else
            logger.set_sink([&](const log_message_t& replaced) { captured.push_back("replaced: " + replaced.m_message); });
    });

    logger.log(e_log_level::info, "outer");
    logger.log(e_log_level::info, "after");

    EXPECT_EQ(captured, (std::vector<std::string>{"outer", "nested", "replaced: after"}));
}

TEST(LoggingTest, StdoutLogDoesNotThrow) {
    c_logging logger;

    logger.init(e_log_level::debug, true);

    EXPECT_NO_THROW({ logger.log(e_log_level::info, "Stdout log test: {}", 123); });
}

TEST(LoggingTest, LogLevelToString) {
    c_logging logger;

    EXPECT_STREQ(logger.lvl_to_str(e_log_level::debug), "DEBUG");
    EXPECT_STREQ(logger.lvl_to_str(e_log_level::info), "INFO");
    EXPECT_STREQ(logger.lvl_to_str(e_log_level::warning), "WARNING");
    EXPECT_STREQ(logger.lvl_to_str(e_log_level::error), "ERROR");
    EXPECT_STREQ(logger.lvl_to_str(e_log_level::critical), "CRITICAL");
    EXPECT_STREQ(logger.lvl_to_str(e_log_level::none), "UNKNOWN");
}

#endif // MIMECORE_USE_LOGGING_IMPL
