/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include "subarg-argmap.h"
#include "subarg-config.h"
#include "subarg-logger.h"

namespace subarg {
	/* key under which the selected verbosity is stored by subarg::ApplyVerbosity */
	static constexpr const wchar_t* VerbosityKey = L"verbosity";

	/* select the verbosity of the flags added by subarg::VerbosityFlags (quiet overrides debug overrides verbose) */
	inline subarg::Level SelectVerbosity(const subarg::ArgMap& args) {
		if (args.boolean(L"quiet"))
			return subarg::Level::quiet;
		if (args.boolean(L"debug"))
			return subarg::Level::debug;
		if (args.boolean(L"verbose"))
			return subarg::Level::verbose;
		return subarg::Level::info;
	}

	/* post-processor storing the selected verbosity as integer and reconfiguring the logger accordingly */
	inline void ApplyVerbosity(subarg::ArgMap& args, subarg::Logger& logger) {
		subarg::Level level = subarg::SelectVerbosity(args);
		args.set(subarg::VerbosityKey, subarg::Value{ int(level) });
		logger.verbosity(level);
	}

	/* reusable group of the verbosity flags */
	inline subarg::Group VerbosityFlags() {
		return subarg::Group{
			subarg::Parameter{ L"-verbose", L"Enable verbose feedback", subarg::Shorthand{ L"-V" }, subarg::Mode{ subarg::Kind::enable } },
			subarg::Parameter{ L"-debug", L"Enable debug feedback", subarg::Mode{ subarg::Kind::enable } },
			subarg::Parameter{ L"-quiet", L"Print no output; use this if you batch commands", subarg::Shorthand{ L"-q" }, subarg::Mode{ subarg::Kind::enable } },
			subarg::PostProcessor{ subarg::ApplyVerbosity }
		};
	}
}
