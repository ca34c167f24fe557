#include <gtest/gtest.h>

#include <atomic>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "../../src/logging/logger.h"
#include "../test_helpers.h"

using namespace chunkslice;

TEST(LoggerTest, SingleNamedInstance) {
    const auto a = log::logger();
    const auto b = log::logger();
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a->name(), "chunkslice");
}

TEST(LoggerTest, SetLevelByName) {
    const auto previous = log::logger()->level();
    EXPECT_TRUE(log::set_level("debug"));
    EXPECT_EQ(log::logger()->level(), spdlog::level::debug);
    EXPECT_TRUE(log::set_level("warning"));
    EXPECT_EQ(log::logger()->level(), spdlog::level::warn);
    EXPECT_TRUE(log::set_level("off"));
    EXPECT_EQ(log::logger()->level(), spdlog::level::off);

    EXPECT_FALSE(log::set_level("chatty"));
    EXPECT_EQ(log::logger()->level(), spdlog::level::off);
    log::logger()->set_level(previous);
}

TEST(LoggerTest, FileSinkReceivesMessages) {
    const ScopedTestFile file;
    const auto previous = log::logger()->level();
    const auto sink = log::add_log_file(file.path());
    ASSERT_TRUE(log::set_level("error"));
    log::logger()->error("chunk {} unreadable", 42);
    log::logger()->info("not written at error level");
    log::logger()->flush();

    log::remove_log_sink(sink);
    log::logger()->error("after removal");
    log::logger()->flush();
    log::logger()->set_level(previous);

    std::ifstream in(file.path());
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("chunk 42 unreadable"), std::string::npos);
    EXPECT_EQ(contents.str().find("not written"), std::string::npos);
    EXPECT_EQ(contents.str().find("after removal"), std::string::npos);
}

TEST(LoggerTest, FileSinksChangeWhileOtherThreadsLog) {
    const ScopedTestFile file;
    const auto previous = log::logger()->level();
    ASSERT_TRUE(log::set_level("info"));

    std::atomic<bool> stop{false};
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&stop, t] {
            while (!stop.load()) {
                log::logger()->debug("writer {} busy", t);
            }
        });
    }
    for (int i = 0; i < 50; ++i) {
        const auto sink = log::add_log_file(file.path());
        log::logger()->info("attached {}", i);
        log::remove_log_sink(sink);
    }
    stop = true;
    for (auto& writer : writers) {
        writer.join();
    }
    log::logger()->set_level(previous);

    std::ifstream in(file.path());
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("attached 49"), std::string::npos);
    EXPECT_EQ(contents.str().find("busy"), std::string::npos);
}
