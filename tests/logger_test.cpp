/**
 * @file logger_test.cpp
 * @brief Logger, sinks and level parsing.
 */

#include <gtest/gtest.h>

#include "logger.hpp"

TEST(LoggerTest, ChildSharesSinksUnderItsOwnName) {
    auto sink = std::make_shared<VectorSink>();
    auto root = std::make_shared<Logger>("Worker");
    root->add_sink(sink);
    auto child = root->child("node1:echo_service:03");

    root->info("pool starting");
    child->warning("task T1: conversion failed");

    auto lines = sink->get_lines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "[INFO] Worker: pool starting");
    EXPECT_EQ(lines[1], "[WARNING] node1:echo_service:03: task T1: conversion failed");
    EXPECT_EQ(child->name(), "node1:echo_service:03");
}

TEST(LoggerTest, SinkLevelFiltersMessages) {
    auto sink = std::make_shared<VectorSink>();
    sink->set_level(LogLevel::Warning);
    Logger logger("Worker");
    logger.add_sink(sink);

    logger.debug("noise");
    logger.info("still noise");
    logger.error("boom");

    EXPECT_EQ(sink->size(), 1u);
    EXPECT_EQ(sink->count(LogLevel::Error), 1u);
    EXPECT_EQ(logger.get_lines(0, 10).size(), 1u);
}

TEST(LoggerTest, GetLinesPagesThroughHistory) {
    auto sink = std::make_shared<VectorSink>();
    Logger logger("Worker");
    logger.add_sink(sink);
    for (int i = 0; i < 5; ++i) logger.info("line " + std::to_string(i));

    auto page = sink->get_lines(3);
    ASSERT_EQ(page.size(), 2u);
    EXPECT_EQ(page[0], "[INFO] Worker: line 3");
    EXPECT_TRUE(sink->get_lines(9).empty());
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warning);
    EXPECT_EQ(parse_log_level("Critical"), LogLevel::Critical);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
    EXPECT_EQ(to_string(LogLevel::Error), "ERROR");
}
