/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#include "test-common.h"

namespace {
	void ExpectConfigError(const subarg::Config& config) {
		EXPECT_THROW(test::Run(config, {}), subarg::ConfigException);
	}
}

TEST(VerifyTest, PositionalConstraints) {
	ExpectConfigError(subarg::Config{ subarg::Parameter{ L"input", subarg::Mode{ subarg::Kind::enable } } });
	ExpectConfigError(subarg::Config{ subarg::Parameter{ L"input", subarg::Shorthand{ L"-i" } } });
	ExpectConfigError(subarg::Config{
		subarg::Group{ subarg::Parameter{ L"input" }, subarg::Parameter{ L"-flag" }, subarg::Exclusive{} }
	});
}

TEST(VerifyTest, FlagNames) {
	ExpectConfigError(subarg::Config{ subarg::Parameter{ L"-" } });
	ExpectConfigError(subarg::Config{ subarg::Parameter{ L"" } });
	ExpectConfigError(subarg::Config{ subarg::Parameter{ L"-subcmd" } });
	ExpectConfigError(subarg::Config{ subarg::Parameter{ L"-flag", subarg::Shorthand{ L"f" } } });
}

TEST(VerifyTest, DuplicateNames) {
	ExpectConfigError(subarg::Config{ subarg::Parameter{ L"-flag" }, subarg::Parameter{ L"--flag" } });
	ExpectConfigError(subarg::Config{
		subarg::Parameter{ L"-first", subarg::Shorthand{ L"-f" } },
		subarg::Parameter{ L"-second", subarg::Shorthand{ L"-f" } }
	});
	ExpectConfigError(subarg::Config{
		subarg::Parameter{ L"-output" },
		subarg::Command{ L"sub", subarg::Parameter{ L"-output" } }
	});

	/* separate subcommands may reuse names */
	subarg::Config config{
		subarg::Command{ L"a", subarg::Parameter{ L"-output" } },
		subarg::Command{ L"b", subarg::Parameter{ L"-output" } }
	};
	EXPECT_NO_THROW(test::Run(config, {}));
}

TEST(VerifyTest, DefaultValues) {
	ExpectConfigError(subarg::Config{ subarg::Parameter{ L"-unit", subarg::Choices{ L"ms", L"s" }, subarg::Default{ L"h" } } });
	ExpectConfigError(subarg::Config{ subarg::Parameter{ L"-count", subarg::ValueType{ subarg::Primitive::inum }, subarg::Default{ L"abc" } } });
	ExpectConfigError(subarg::Config{ subarg::Parameter{ L"-flag", subarg::Mode{ subarg::Kind::enable }, subarg::Default{ true } } });
}

TEST(VerifyTest, OptionalDefaults) {
	ExpectConfigError(subarg::Config{ subarg::Parameter{ L"-level", subarg::Mode{ subarg::Kind::optional }, subarg::ValueType{ subarg::Primitive::real } } });
	ExpectConfigError(subarg::Config{ subarg::Parameter{ L"-mode", subarg::Mode{ subarg::Kind::optional }, subarg::Choices{ L"a" } } });

	/* untyped optional flags and optional positionals may omit the default */
	EXPECT_NO_THROW(test::Run(subarg::Config{ subarg::Parameter{ L"-label", subarg::Mode{ subarg::Kind::optional } } }, {}));
	EXPECT_NO_THROW(test::Run(subarg::Config{ subarg::Parameter{ L"count", subarg::Mode{ subarg::Kind::optional }, subarg::ValueType{ subarg::Primitive::inum } } }, {}));
}

TEST(VerifyTest, Subcommands) {
	ExpectConfigError(subarg::Config{ subarg::Command{ L"-sub" } });
	ExpectConfigError(subarg::Config{ subarg::Command{ L"sub" }, subarg::Command{ L"sub" } });
	ExpectConfigError(subarg::Config{ subarg::Parameter{ L"-value", subarg::ValueType{ subarg::Decoder{} } } });

	/* broken subcommands are rejected even when they are not selected */
	subarg::Config config{
		subarg::Command{ L"good" },
		subarg::Command{ L"bad", subarg::Parameter{ L"-x" }, subarg::Parameter{ L"-x" } }
	};
	EXPECT_THROW(test::Run(config, { L"good" }), subarg::ConfigException);
}

TEST(VerifyTest, EmptyCallbacks) {
	ExpectConfigError(subarg::Config{ subarg::Validator{ subarg::Check{} } });
	ExpectConfigError(subarg::Config{ subarg::PostProcessor{ subarg::Process{} } });
}
