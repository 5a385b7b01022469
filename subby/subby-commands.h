/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include "subarg.h"
#include "subby-filerange.h"

namespace subby {
	static constexpr const wchar_t* ProgramName = L"subby";

	/* reusable schema fragments of the subcommands */
	subarg::Group SingleInput();
	subarg::Group ManyInputs();
	subarg::Group OutputFile();

	/* post-processors converting the raw inputs to file-ranges (malformed ranges stay raw strings and are reported by the validators) */
	void ParsePromisedFileRange(subarg::ArgMap& args, subarg::Logger& logger);
	void ParseManyPromisedFileRanges(subarg::ArgMap& args, subarg::Logger& logger);
	bool ValidateInputFileType(subarg::ArgMap& args, const subarg::Logger& logger);
	bool ValidateManyInputFileTypes(subarg::ArgMap& args, const subarg::Logger& logger);

	/* trim range option: decoded to the tuple (provided, text) and post-processed to a file-range */
	std::optional<subarg::Value> DecodeRangeOption(const std::wstring& value);
	void ParseTrimRange(subarg::ArgMap& args, subarg::Logger& logger);
	bool ValidateTrimRange(subarg::ArgMap& args, const subarg::Logger& logger);
	bool ValidateNoRangeConflict(subarg::ArgMap& args, const subarg::Logger& logger);

	/* delay in milliseconds based on the selected unit (empty if it cannot be represented) */
	std::optional<int64_t> DelayInMilliseconds(const subarg::ArgMap& args);
	bool ValidateDelayRange(subarg::ArgMap& args, const subarg::Logger& logger);

	subarg::Command DelayCommand();
	subarg::Command TrimCommand();
	subarg::Command ExtendCommand();
	subarg::Command DisplayCommand();

	/* complete configuration of the subby program */
	subarg::Config MakeConfig();
}
