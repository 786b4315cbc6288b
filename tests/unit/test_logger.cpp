#include <gtest/gtest.h>
#include "Logger.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace voicegraph;

TEST(LoggerTest, SingleThreadedPushPop) {
    AudioLogger logger;

    EXPECT_TRUE(logger.log_message("TEST", "Hello World"));
    EXPECT_TRUE(logger.log_event("VALUE", 42.0f));

    auto entry1 = logger.pop_entry();
    ASSERT_TRUE(entry1.has_value());
    EXPECT_EQ(entry1->type, LogEntry::Type::Message);
    EXPECT_STREQ(entry1->tag, "TEST");
    EXPECT_STREQ(entry1->message, "Hello World");

    auto entry2 = logger.pop_entry();
    ASSERT_TRUE(entry2.has_value());
    EXPECT_EQ(entry2->type, LogEntry::Type::Event);
    EXPECT_STREQ(entry2->tag, "VALUE");
    EXPECT_EQ(entry2->value, 42.0f);
    EXPECT_EQ(entry2->sequence, entry1->sequence + 1);

    EXPECT_FALSE(logger.pop_entry().has_value());
}

TEST(LoggerTest, LongTextIsTruncated) {
    AudioLogger logger;
    const std::string long_tag(100, 't');
    const std::string long_msg(200, 'm');
    logger.log_message(long_tag.c_str(), long_msg.c_str());

    auto entry = logger.pop_entry();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(std::string(entry->tag), long_tag.substr(0, sizeof(entry->tag) - 1));
    EXPECT_EQ(std::string(entry->message), long_msg.substr(0, sizeof(entry->message) - 1));
}

TEST(LoggerTest, FullQueueDropsAndCounts) {
    AudioLogger logger(4);
    for (int i = 0; i < 4; ++i) {
        EXPECT_TRUE(logger.log_event("FILL", static_cast<float>(i)));
    }
    EXPECT_FALSE(logger.log_event("FILL", 99.0f));
    EXPECT_FALSE(logger.log_message("FILL", "lost"));
    EXPECT_EQ(logger.dropped(), 2u);

    // Oldest entries survive
    auto first = logger.pop_entry();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->value, 0.0f);
}

TEST(LoggerTest, MultiThreadedCapture) {
    AudioLogger logger;

    std::atomic<bool> running{true};
    std::vector<LogEntry> captured;

    // "Background" thread (Consumer)
    std::thread consumer([&]() {
        while (true) {
            if (auto entry = logger.pop_entry()) {
                captured.push_back(*entry);
            } else if (!running.load()) {
                break;
            } else {
                std::this_thread::yield();
            }
        }
    });

    // "Audio" thread (Producer)
    std::thread producer([&]() {
        for (int i = 0; i < 100; ++i) {
            logger.log_event("ITER", static_cast<float>(i));
        }
    });

    producer.join();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    running = false;
    consumer.join();

    ASSERT_EQ(captured.size(), 100u);
    EXPECT_STREQ(captured[0].tag, "ITER");
    EXPECT_EQ(captured[0].value, 0.0f);
    EXPECT_EQ(captured.back().value, 99.0f);
    EXPECT_EQ(logger.dropped(), 0u);
}
