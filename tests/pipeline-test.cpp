/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#include "test-common.h"

namespace {
	struct Recorder {
		std::vector<std::wstring> calls;

		subarg::PostProcessor process(std::wstring name) {
			return subarg::PostProcessor{ [this, name](subarg::ArgMap&, subarg::Logger&) { calls.push_back(name); } };
		}
		subarg::Validator check(std::wstring name, bool result = true) {
			return subarg::Validator{ [this, name, result](subarg::ArgMap&, const subarg::Logger&) {
				calls.push_back(name);
				return result;
			} };
		}
	};
}

TEST(PipelineTest, RootBeforeSubcommand) {
	Recorder rec;
	subarg::Config config{
		rec.check(L"root-check"),
		rec.process(L"root-process"),
		subarg::Command{ L"sub", rec.check(L"sub-check"), rec.process(L"sub-process") }
	};

	ASSERT_TRUE(test::Run(config, { L"sub" }).has_value());
	EXPECT_EQ(rec.calls, (std::vector<std::wstring>{ L"root-process", L"root-check", L"sub-process", L"sub-check" }));

	/* subcommand callbacks only run if the subcommand is selected */
	rec.calls.clear();
	ASSERT_TRUE(test::Run(config, {}).has_value());
	EXPECT_EQ(rec.calls, (std::vector<std::wstring>{ L"root-process", L"root-check" }));
}

TEST(PipelineTest, StopsAtFirstFailedValidator) {
	Recorder rec;
	subarg::Config config{
		rec.check(L"first"),
		rec.check(L"second", false),
		rec.check(L"third"),
		subarg::Command{ L"sub", rec.process(L"sub-process") }
	};

	EXPECT_FALSE(test::Run(config, { L"sub" }).has_value());
	EXPECT_EQ(rec.calls, (std::vector<std::wstring>{ L"first", L"second" }));
}

TEST(PipelineTest, PostProcessorsMutateArguments) {
	subarg::Config config{
		subarg::Parameter{ L"-count", subarg::ValueType{ subarg::Primitive::inum }, subarg::Default{ 2 } },
		subarg::PostProcessor{ [](subarg::ArgMap& args, subarg::Logger&) { args.set(L"double", subarg::Value{ args.inum(L"count") * 2 }); } },
		subarg::Validator{ [](subarg::ArgMap& args, const subarg::Logger& logger) {
			if (args.inum(L"double") <= 10)
				return true;
			logger.error(L"Count is too large");
			return false;
		} }
	};

	std::optional<subarg::ArgMap> args = test::Run(config, { L"-count", L"4" });
	ASSERT_TRUE(args.has_value());
	EXPECT_EQ(args->inum(L"double"), 8);

	test::Capture capture;
	EXPECT_FALSE(subarg::Parse({ L"-count", L"6" }, config, capture.logger).has_value());
	EXPECT_EQ(capture.text(), L"test: error: Count is too large\n");
}

TEST(PipelineTest, GroupCallbacksAreMergedIntoCommand) {
	Recorder rec;
	subarg::Config config{
		rec.process(L"before"),
		subarg::Group{ subarg::Parameter{ L"-flag", subarg::Mode{ subarg::Kind::enable } }, rec.process(L"group") },
		rec.process(L"after")
	};
	ASSERT_TRUE(test::Run(config, {}).has_value());
	EXPECT_EQ(rec.calls, (std::vector<std::wstring>{ L"before", L"group", L"after" }));
}

TEST(PipelineTest, VerbosityPreset) {
	subarg::Config config{ subarg::VerbosityFlags() };

	test::Capture capture;
	std::optional<subarg::ArgMap> args = subarg::Parse({}, config, capture.logger);
	ASSERT_TRUE(args.has_value());
	EXPECT_EQ(args->inum(subarg::VerbosityKey), int64_t(subarg::Level::info));
	EXPECT_EQ(capture.logger.flags().verbosity, subarg::Level::info);

	args = subarg::Parse({ L"-V", L"-debug" }, config, capture.logger);
	ASSERT_TRUE(args.has_value());
	EXPECT_EQ(args->inum(subarg::VerbosityKey), int64_t(subarg::Level::debug));
	EXPECT_EQ(capture.logger.flags().verbosity, subarg::Level::debug);

	args = subarg::Parse({ L"-verbose", L"-debug", L"-q" }, config, capture.logger);
	ASSERT_TRUE(args.has_value());
	EXPECT_EQ(args->inum(subarg::VerbosityKey), int64_t(subarg::Level::quiet));
	EXPECT_EQ(capture.logger.flags().verbosity, subarg::Level::quiet);
}

TEST(PipelineTest, VerbosityAffectsLaterValidators) {
	subarg::Config config{
		subarg::VerbosityFlags(),
		subarg::Command{ L"sub", subarg::Validator{ [](subarg::ArgMap&, const subarg::Logger& logger) {
			logger.verbose(L"checking");
			return true;
		} } }
	};

	test::Capture capture;
	ASSERT_TRUE(subarg::Parse({ L"sub" }, config, capture.logger).has_value());
	EXPECT_EQ(capture.text(), L"");
	ASSERT_TRUE(subarg::Parse({ L"-V", L"sub" }, config, capture.logger).has_value());
	EXPECT_EQ(capture.text(), L"checking\n");
}

TEST(PipelineTest, InvokeSelectsHandler) {
	std::wstring called;
	subarg::Config config{
		subarg::Handler{ [&](const subarg::ArgMap&, subarg::Logger&) { called = L"root"; } },
		subarg::Command{ L"sub", subarg::Handler{ [&](const subarg::ArgMap&, subarg::Logger&) { called = L"sub"; } } },
		subarg::Command{ L"empty" }
	};

	test::Capture capture;
	std::optional<subarg::ArgMap> args = subarg::Parse({ L"sub" }, config, capture.logger);
	ASSERT_TRUE(args.has_value());
	EXPECT_TRUE(subarg::Invoke(*args, config, capture.logger));
	EXPECT_EQ(called, L"sub");

	args = subarg::Parse({}, config, capture.logger);
	ASSERT_TRUE(args.has_value());
	EXPECT_TRUE(subarg::Invoke(*args, config, capture.logger));
	EXPECT_EQ(called, L"root");

	args = subarg::Parse({ L"empty" }, config, capture.logger);
	ASSERT_TRUE(args.has_value());
	EXPECT_FALSE(subarg::Invoke(*args, config, capture.logger));
}
