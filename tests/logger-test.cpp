/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#include "test-common.h"

TEST(LoggerTest, SeverityPrefixes) {
	test::Capture capture;
	capture.logger.info(L"plain ", 5);
	capture.logger.warn(L"careful");
	capture.logger.error(L"broken");
	EXPECT_EQ(capture.text(), L"plain 5\ntest: warning: careful\ntest: error: broken\n");
}

TEST(LoggerTest, VerbosityThreshold) {
	test::Capture capture;
	capture.logger.debug(L"hidden");
	capture.logger.verbose(L"hidden");
	EXPECT_EQ(capture.text(), L"");

	capture.logger.verbosity(subarg::Level::debug);
	capture.logger.debug(L"a");
	capture.logger.verbose(L"b");
	EXPECT_EQ(capture.text(), L"a\nb\n");
}

TEST(LoggerTest, QuietSilencesEverything) {
	test::Capture capture;
	capture.logger.verbosity(subarg::Level::quiet);
	capture.logger.info(L"x");
	capture.logger.warn(L"x");
	capture.logger.error(L"x");
	EXPECT_EQ(capture.text(), L"");
	EXPECT_FALSE(capture.logger.enabled(subarg::Level::error));
}

TEST(LoggerTest, TerminalColors) {
	std::wostringstream stream;
	subarg::Logger logger{ stream, subarg::LogFlags{ .name = L"prog" } };
	logger.warn(L"x");
	EXPECT_EQ(stream.str(), L"\x1b[33mprog: warning: x\x1b[39m\n");

	/* info is never colored */
	stream.str(L"");
	logger.info(L"y");
	EXPECT_EQ(stream.str(), L"y\n");
}

TEST(LoggerTest, UnnamedLogger) {
	std::wostringstream stream;
	subarg::Logger logger{ stream, subarg::LogFlags{ .useTermColors = false } };
	logger.error(L"x");
	EXPECT_EQ(stream.str(), L"error: x\n");
}
