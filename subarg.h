/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include "subarg-common.h"
#include "subarg-value.h"
#include "subarg-argmap.h"
#include "subarg-logger.h"
#include "subarg-config.h"
#include "subarg-verify.h"
#include "subarg-pool.h"
#include "subarg-parser.h"
#include "subarg-pipeline.h"
#include "subarg-help.h"
#include "subarg-presets.h"

namespace subarg {
	/* convenience function to prepare the arguments (the program name is not part of the arguments) */
	inline std::vector<std::wstring> Prepare(int argc, const str::IsChar auto* const* argv) {
		std::vector<std::wstring> args;
		for (int i = 1; i < argc; ++i)
			args.push_back(str::wd::To(argv[i]));
		return args;
	}

	/* split the argument line into the list of separate arguments (honors quotes and backslash-escapes) */
	inline std::vector<std::wstring> Prepare(const str::IsStr auto& line) {
		using ChType = str::StringChar<decltype(line)>;
		std::vector<std::wstring> args;
		std::basic_string_view<ChType> view{ line };

		wchar_t inStr = 0;
		bool lastWhitespace = true;
		for (size_t i = 0; i < view.size(); ++i) {
			/* whitespace either separates arguments or is part of a quoted string */
			if (std::iswspace(view[i])) {
				if (inStr != 0)
					args.back().push_back(view[i]);
				else
					lastWhitespace = true;
				continue;
			}
			if (lastWhitespace)
				args.emplace_back();
			lastWhitespace = false;

			if (view[i] == L'\\') {
				if (++i >= view.size())
					break;
				args.back().push_back(view[i]);
			}
			else if (inStr != L'\0') {
				if (view[i] == inStr)
					inStr = L'\0';
				else
					args.back().push_back(view[i]);
			}
			else if (view[i] == L'\'' || view[i] == L'\"')
				inStr = view[i];
			else
				args.back().push_back(view[i]);
		}
		return args;
	}

	/* convenience functions for parsing from a single command-line */
	inline std::optional<subarg::ArgMap> Parse(const str::IsStr auto& line, const subarg::Config& config, subarg::Logger& logger, size_t lineLength = subarg::NumCharsHelp) {
		return subarg::Parse(subarg::Prepare(line), config, logger, lineLength);
	}

	/* convenience functions for parsing from the process arguments */
	inline std::optional<subarg::ArgMap> Parse(int argc, const str::IsChar auto* const* argv, const subarg::Config& config, subarg::Logger& logger, size_t lineLength = subarg::NumCharsHelp) {
		return subarg::Parse(subarg::Prepare(argc, argv), config, logger, lineLength);
	}

	/* invoke the handler of the selected subcommand or the root (returns false if no handler exists) */
	inline bool Invoke(const subarg::ArgMap& args, const subarg::Config& config, subarg::Logger& logger) {
		const detail::Config& burned = detail::ConfigBurner::GetBurned(config);
		const detail::Command* command = &burned;

		if (std::optional<std::wstring> name = args.subcommand(); name.has_value()) {
			command = burned.find(*name);
			if (command == nullptr)
				throw subarg::ConfigException{ L"Subcommand [", *name, L"] is not part of the configuration." };
		}

		if (!command->handler)
			return false;
		command->handler(args, logger);
		return true;
	}
}
