/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#include "test-common.h"

namespace {
	subarg::Config DelayConfig() {
		return subarg::Config{
			subarg::Program{ L"test" },
			subarg::Parameter{ L"-unit", subarg::Shorthand{ L"-u" }, subarg::Choices{ L"millisecond", L"second", L"minute", L"ms", L"s" }, subarg::Default{ L"ms" } },
			subarg::Parameter{ L"-exclusive", subarg::Shorthand{ L"-x" }, subarg::Mode{ subarg::Kind::enable } },
			subarg::Parameter{ L"delay", subarg::ValueType{ subarg::Primitive::inum } }
		};
	}
	subarg::Config ListConfig() {
		return subarg::Config{
			subarg::Program{ L"test" },
			subarg::Parameter{ L"-files", subarg::Mode{ subarg::Kind::multiple } },
			subarg::Parameter{ L"-level", subarg::Mode{ subarg::Kind::optional }, subarg::ValueType{ subarg::Primitive::inum }, subarg::Default{ 2 } },
			subarg::Parameter{ L"-label", subarg::Mode{ subarg::Kind::optional } },
			subarg::Parameter{ L"-name" },
			subarg::Parameter{ L"-x", subarg::Mode{ subarg::Kind::enable } }
		};
	}
	subarg::Config SubcommandConfig() {
		return subarg::Config{
			subarg::Program{ L"test" },
			subarg::Parameter{ L"-verbose", subarg::Mode{ subarg::Kind::enable } },
			subarg::Command{ L"delay",
				subarg::Parameter{ L"-inner", subarg::Mode{ subarg::Kind::enable } },
				subarg::Parameter{ L"delay", subarg::ValueType{ subarg::Primitive::inum } }
			},
			subarg::Command{ L"copy", subarg::Parameter{ L"what" } },
			subarg::Command{ L"dummy" }
		};
	}
}

TEST(ParserTest, PairFlagPositionalAndSwitch) {
	std::optional<subarg::ArgMap> args = test::Run(DelayConfig(), { L"-unit:s", L"120", L"-exclusive" });
	ASSERT_TRUE(args.has_value());
	EXPECT_EQ(args->str(L"unit"), L"s");
	EXPECT_EQ(args->inum(L"delay"), 120);
	EXPECT_TRUE(args->boolean(L"exclusive"));
	EXPECT_TRUE(args->get(subarg::SubcommandKey).isNull());
	EXPECT_FALSE(args->subcommand().has_value());
}

TEST(ParserTest, InvalidPositionalValue) {
	EXPECT_EQ(test::ErrorOf(DelayConfig(), { L"two" }), subarg::Error::invalidValue);
}

TEST(ParserTest, SecondSubcommandIsPositional) {
	EXPECT_EQ(test::ErrorOf(SubcommandConfig(), { L"delay", L"100", L"dummy" }), subarg::Error::tooManyPositionals);

	/* with a pending positional, the subcommand name is an ordinary value */
	std::optional<subarg::ArgMap> args = test::Run(SubcommandConfig(), { L"copy", L"dummy" });
	ASSERT_TRUE(args.has_value());
	EXPECT_EQ(args->str(L"what"), L"dummy");
	EXPECT_EQ(args->subcommand(), std::optional<std::wstring>{ L"copy" });
}

TEST(ParserTest, MutuallyExclusiveFlags) {
	subarg::Config config{
		subarg::Group{
			subarg::Parameter{ L"-a", subarg::Mode{ subarg::Kind::enable } },
			subarg::Parameter{ L"-b", subarg::Mode{ subarg::Kind::enable } },
			subarg::Exclusive{}
		}
	};
	EXPECT_EQ(test::ErrorOf(config, { L"-a", L"-b" }), subarg::Error::conflictingFlags);
	EXPECT_EQ(test::ErrorOf(config, { L"-b", L"-a" }), subarg::Error::conflictingFlags);
	EXPECT_EQ(test::MessageOf(config, { L"-b", L"-a" }), L"The following flags conflict: -a, -b.");
	EXPECT_TRUE(test::Run(config, { L"-a" }).has_value());
}

TEST(ParserTest, TooManyPositionals) {
	subarg::Config config{ subarg::Parameter{ L"-x", subarg::Mode{ subarg::Kind::enable } } };
	EXPECT_EQ(test::ErrorOf(config, { L"extra" }), subarg::Error::tooManyPositionals);
	EXPECT_EQ(test::ErrorOf(DelayConfig(), { L"1", L"2" }), subarg::Error::tooManyPositionals);
}

TEST(ParserTest, InvalidChoice) {
	EXPECT_EQ(test::ErrorOf(DelayConfig(), { L"-unit", L"pico", L"1" }), subarg::Error::invalidChoice);
}

TEST(ParserTest, SiSuffixesAreNotScaled) {
	EXPECT_EQ(test::ErrorOf(DelayConfig(), { L"1k" }), subarg::Error::invalidValue);
	EXPECT_FALSE(subarg::detail::IsNumber(L"-2k"));
	EXPECT_TRUE(subarg::detail::IsNumber(L"-2.5"));
}

TEST(ParserTest, NegativeNumbersArePositionals) {
	std::optional<subarg::ArgMap> args = test::Run(DelayConfig(), { L"-100" });
	ASSERT_TRUE(args.has_value());
	EXPECT_EQ(args->inum(L"delay"), -100);

	/* an open flag absorbs the negative number */
	args = test::Run(ListConfig(), { L"-name", L"-2.5" });
	ASSERT_TRUE(args.has_value());
	EXPECT_EQ(args->str(L"name"), L"-2.5");
}

TEST(ParserTest, ShorthandAndSeparators) {
	std::optional<subarg::ArgMap> args = test::Run(DelayConfig(), { L"-u", L"minute", L"-x", L"5" });
	ASSERT_TRUE(args.has_value());
	EXPECT_EQ(args->str(L"unit"), L"minute");
	EXPECT_TRUE(args->boolean(L"exclusive"));
	EXPECT_EQ(args->inum(L"delay"), 5);

	args = test::Run(DelayConfig(), { L"-u=second", L"5" });
	ASSERT_TRUE(args.has_value());
	EXPECT_EQ(args->str(L"unit"), L"second");
}

TEST(ParserTest, DefaultsAreMerged) {
	std::optional<subarg::ArgMap> args = test::Run(DelayConfig(), { L"5" });
	ASSERT_TRUE(args.has_value());
	EXPECT_EQ(args->str(L"unit"), L"ms");
	EXPECT_FALSE(args->boolean(L"exclusive"));
	EXPECT_EQ(args->size(), 4u);
}

TEST(ParserTest, RoundTripDefaults) {
	subarg::Config config{
		subarg::Parameter{ L"-count", subarg::ValueType{ subarg::Primitive::inum }, subarg::Default{ L"42" } },
		subarg::Parameter{ L"-ratio", subarg::ValueType{ subarg::Primitive::real }, subarg::Default{ 2.5 } },
		subarg::Parameter{ L"-size", subarg::ValueType{ subarg::Primitive::unum }, subarg::Default{ 7 } },
		subarg::Parameter{ L"-check", subarg::ValueType{ subarg::Primitive::boolean }, subarg::Default{ L"true" } },
		subarg::Parameter{ L"-text", subarg::Default{ L"abc" } },
		subarg::Parameter{ L"-enable", subarg::Mode{ subarg::Kind::enable } },
		subarg::Parameter{ L"-disable", subarg::Mode{ subarg::Kind::disable } }
	};
	std::optional<subarg::ArgMap> args = test::Run(config, {});
	ASSERT_TRUE(args.has_value());
	EXPECT_EQ(args->inum(L"count"), 42);
	EXPECT_DOUBLE_EQ(args->real(L"ratio"), 2.5);
	EXPECT_EQ(args->inum(L"size"), 7);
	EXPECT_TRUE(args->boolean(L"check"));
	EXPECT_EQ(args->str(L"text"), L"abc");
	EXPECT_FALSE(args->boolean(L"enable"));
	EXPECT_TRUE(args->boolean(L"disable"));

	/* supplied switches flip the defaults */
	args = test::Run(config, { L"-enable", L"-disable", L"-count", L"-3" });
	ASSERT_TRUE(args.has_value());
	EXPECT_TRUE(args->boolean(L"enable"));
	EXPECT_FALSE(args->boolean(L"disable"));
	EXPECT_EQ(args->inum(L"count"), -3);
}

TEST(ParserTest, IdempotentDefaultCoercion) {
	subarg::detail::Parameter param{ L"-count" };
	param.type = subarg::Primitive::inum;
	param.defValue = subarg::Value{ L"12" };

	std::optional<subarg::Value> once = subarg::detail::CoerceDefault(param);
	ASSERT_TRUE(once.has_value());
	EXPECT_EQ(once->inum(), 12);

	param.defValue = *once;
	std::optional<subarg::Value> twice = subarg::detail::CoerceDefault(param);
	ASSERT_TRUE(twice.has_value());
	EXPECT_TRUE(*once == *twice);

	param.type = subarg::Primitive::real;
	param.defValue = subarg::Value{ 1.5 };
	EXPECT_TRUE(*subarg::detail::CoerceDefault(param) == subarg::Value{ 1.5 });
}

TEST(ParserTest, MultipleAccumulation) {
	std::optional<subarg::ArgMap> args = test::Run(ListConfig(), { L"-files", L"a", L"b", L"c", L"-x" });
	ASSERT_TRUE(args.has_value());
	const subarg::Tuple& files = args->tuple(L"files");
	ASSERT_EQ(files.size(), 3u);
	EXPECT_EQ(files[0].str(), L"a");
	EXPECT_EQ(files[1].str(), L"b");
	EXPECT_EQ(files[2].str(), L"c");
	EXPECT_TRUE(args->boolean(L"x"));

	/* repeated occurrences and pair-lists accumulate */
	args = test::Run(ListConfig(), { L"-files", L"a", L"-x", L"-files:b;c" });
	ASSERT_TRUE(args.has_value());
	EXPECT_EQ(args->tuple(L"files").size(), 3u);
	EXPECT_EQ(args->tuple(L"files")[2].str(), L"c");
}

TEST(ParserTest, MultipleRequiresValues) {
	EXPECT_EQ(test::ErrorOf(ListConfig(), { L"-files" }), subarg::Error::invalidValue);
	EXPECT_EQ(test::ErrorOf(ListConfig(), { L"-files", L"-x" }), subarg::Error::invalidValue);
	EXPECT_EQ(test::MessageOf(ListConfig(), { L"-files" }), L"Flag [-files] requires at least one value.");
}

TEST(ParserTest, OptionalKinds) {
	std::optional<subarg::ArgMap> args = test::Run(ListConfig(), { L"-level", L"-label" });
	ASSERT_TRUE(args.has_value());
	EXPECT_EQ(args->inum(L"level"), 2);
	EXPECT_EQ(args->str(L"label"), L"");

	args = test::Run(ListConfig(), { L"-level", L"5", L"-label", L"text" });
	ASSERT_TRUE(args.has_value());
	EXPECT_EQ(args->inum(L"level"), 5);
	EXPECT_EQ(args->str(L"label"), L"text");

	/* not supplied at all */
	args = test::Run(ListConfig(), {});
	ASSERT_TRUE(args.has_value());
	EXPECT_EQ(args->inum(L"level"), 2);
	EXPECT_FALSE(args->contains(L"label"));
}

TEST(ParserTest, BareOptionalKeepsTypeAndChoices) {
	subarg::Config config{
		subarg::Parameter{ L"-level", subarg::Mode{ subarg::Kind::optional }, subarg::ValueType{ subarg::Primitive::inum }, subarg::Default{ 3 } },
		subarg::Parameter{ L"-mode", subarg::Mode{ subarg::Kind::optional }, subarg::Choices{ L"a", L"b" }, subarg::Default{ L"b" } }
	};
	std::optional<subarg::ArgMap> args = test::Run(config, { L"-level", L"-mode" });
	ASSERT_TRUE(args.has_value());
	EXPECT_EQ(args->inum(L"level"), 3);
	EXPECT_EQ(args->str(L"mode"), L"b");
	EXPECT_EQ(test::ErrorOf(config, { L"-mode", L"c" }), subarg::Error::invalidChoice);

	/* without a default, a bare occurrence could not satisfy the type or the choices */
	subarg::Config typed{ subarg::Parameter{ L"-level", subarg::Mode{ subarg::Kind::optional }, subarg::ValueType{ subarg::Primitive::inum } } };
	EXPECT_THROW(test::Run(typed, { L"-level" }), subarg::ConfigException);
	subarg::Config choices{ subarg::Parameter{ L"-mode", subarg::Mode{ subarg::Kind::optional }, subarg::Choices{ L"a", L"b" } } };
	EXPECT_THROW(test::Run(choices, { L"-mode" }), subarg::ConfigException);
}

TEST(ParserTest, ValueFlagErrors) {
	EXPECT_EQ(test::ErrorOf(ListConfig(), { L"-name" }), subarg::Error::invalidValue);
	EXPECT_EQ(test::ErrorOf(ListConfig(), { L"-name", L"a", L"-name", L"b" }), subarg::Error::invalidValue);
	EXPECT_EQ(test::ErrorOf(ListConfig(), { L"-name:" }), subarg::Error::invalidValue);
	EXPECT_EQ(test::ErrorOf(ListConfig(), { L"-other" }), subarg::Error::unknownFlag);
	EXPECT_EQ(test::ErrorOf(DelayConfig(), { L"-delay", L"5" }), subarg::Error::positionalUsedAsFlag);
}

TEST(ParserTest, StdinSentinelIsPositional) {
	subarg::Config config{ subarg::Parameter{ L"input" } };
	std::optional<subarg::ArgMap> args = test::Run(config, { L"-" });
	ASSERT_TRUE(args.has_value());
	EXPECT_EQ(args->str(L"input"), L"-");
}

TEST(ParserTest, ColonInPositional) {
	subarg::Config config{ subarg::Parameter{ L"input" } };
	std::optional<subarg::ArgMap> args = test::Run(config, { L"a.srt:#1-#5" });
	ASSERT_TRUE(args.has_value());
	EXPECT_EQ(args->str(L"input"), L"a.srt:#1-#5");
}

TEST(ParserTest, MissingPositionals) {
	EXPECT_EQ(test::ErrorOf(DelayConfig(), {}), subarg::Error::missingPositional);
	EXPECT_EQ(test::MessageOf(DelayConfig(), {}), L"No value provided for positional argument [delay].");

	subarg::Config config{
		subarg::Parameter{ L"first" },
		subarg::Parameter{ L"second", subarg::ValueType{ subarg::Primitive::inum }, subarg::Default{ 100 } },
		subarg::Parameter{ L"third", subarg::Mode{ subarg::Kind::optional } }
	};
	std::optional<subarg::ArgMap> args = test::Run(config, { L"a" });
	ASSERT_TRUE(args.has_value());
	EXPECT_EQ(args->str(L"first"), L"a");
	EXPECT_EQ(args->inum(L"second"), 100);
	EXPECT_FALSE(args->contains(L"third"));
}

TEST(ParserTest, MultiplePositional) {
	subarg::Config config{
		subarg::Parameter{ L"input", subarg::Mode{ subarg::Kind::multiple } },
		subarg::Parameter{ L"-long", subarg::Mode{ subarg::Kind::enable } }
	};
	std::optional<subarg::ArgMap> args = test::Run(config, { L"a", L"b", L"-long" });
	ASSERT_TRUE(args.has_value());
	EXPECT_EQ(args->tuple(L"input").size(), 2u);
	EXPECT_TRUE(args->boolean(L"long"));
}

TEST(ParserTest, SubcommandsAreRegisteredLazily) {
	std::optional<subarg::ArgMap> args = test::Run(SubcommandConfig(), { L"-verbose", L"delay", L"-inner", L"-5" });
	ASSERT_TRUE(args.has_value());
	EXPECT_EQ(args->subcommand(), std::optional<std::wstring>{ L"delay" });
	EXPECT_TRUE(args->boolean(L"verbose"));
	EXPECT_TRUE(args->boolean(L"inner"));
	EXPECT_EQ(args->inum(L"delay"), -5);

	/* flags of the subcommand are unknown before it has been selected */
	EXPECT_EQ(test::ErrorOf(SubcommandConfig(), { L"-inner", L"delay", L"5" }), subarg::Error::unknownFlag);

	/* flags of unselected subcommands are not part of the result */
	args = test::Run(SubcommandConfig(), { L"copy", L"x" });
	ASSERT_TRUE(args.has_value());
	EXPECT_FALSE(args->contains(L"inner"));
}

TEST(ParserTest, RequiredGroup) {
	subarg::Config config{
		subarg::Group{
			subarg::Parameter{ L"-output" },
			subarg::Parameter{ L"-overwrite", subarg::Mode{ subarg::Kind::enable } },
			subarg::Exclusive{},
			subarg::Required{}
		}
	};
	EXPECT_EQ(test::ErrorOf(config, {}), subarg::Error::missingFlag);
	EXPECT_EQ(test::ErrorOf(config, { L"-output", L"a", L"-overwrite" }), subarg::Error::conflictingFlags);

	std::optional<subarg::ArgMap> args = test::Run(config, { L"-output", L"a" });
	ASSERT_TRUE(args.has_value());
	EXPECT_EQ(args->str(L"output"), L"a");
	EXPECT_FALSE(args->boolean(L"overwrite"));
}

TEST(ParserTest, CustomDecoder) {
	subarg::Decoder even = [](const std::wstring& value) -> std::optional<subarg::Value> {
		if (value.empty() || (value.back() - L'0') % 2 != 0)
			return std::nullopt;
		return subarg::Value{ subarg::Custom{ value } };
	};
	subarg::Config config{ subarg::Parameter{ L"-even", subarg::ValueType{ even } } };

	std::optional<subarg::ArgMap> args = test::Run(config, { L"-even", L"12" });
	ASSERT_TRUE(args.has_value());
	EXPECT_EQ(args->custom<std::wstring>(L"even"), L"12");
	EXPECT_EQ(test::ErrorOf(config, { L"-even", L"13" }), subarg::Error::invalidValue);
}

TEST(ParserTest, PrepareSplitsLines) {
	EXPECT_EQ(subarg::Prepare(std::wstring{ L"delay 'a b.srt' -u s" }), (std::vector<std::wstring>{ L"delay", L"a b.srt", L"-u", L"s" }));
	EXPECT_EQ(subarg::Prepare(std::wstring{ L"x\\ y \"z\"" }), (std::vector<std::wstring>{ L"x y", L"z" }));

	const char* argv[] = { "program", "delay", "-5" };
	EXPECT_EQ(subarg::Prepare(3, argv), (std::vector<std::wstring>{ L"delay", L"-5" }));
}
