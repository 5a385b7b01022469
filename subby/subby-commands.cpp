/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#include "subby-commands.h"

static bool CheckSrtFile(const std::wstring& filename, const subarg::Logger& logger) {
	if (filename.ends_with(L".srt"))
		return true;
	logger.error(L"'", filename, L"' is not an srt file");
	if (filename.find(L':') != std::wstring::npos)
		logger.warn(L"If you specified a range, use -R to enable range parsing");
	return false;
}
static subarg::Value ToFileRange(const std::wstring& raw, bool useRanges, const subarg::Logger& logger) {
	if (!useRanges)
		return subarg::Value{ subarg::Custom{ subby::FileRange{ raw, std::nullopt, std::nullopt } } };

	/* keep the raw string as marker for the validator */
	std::optional<subby::FileRange> range = subby::DecodeFileRange(raw);
	if (!range.has_value()) {
		logger.debug(L"Range of [", raw, L"] could not be decoded");
		return subarg::Value{ raw };
	}
	return subarg::Value{ subarg::Custom{ *range } };
}
static bool CheckFileRange(const subarg::Value& value, const subarg::Logger& logger) {
	if (value.isStr()) {
		logger.error(L"Range of '", value.str(), L"' needs to be formatted as hh:mm:ss,mmm-hh:mm:ss,mmm or #n-#n");
		return false;
	}
	return CheckSrtFile(value.custom<subby::FileRange>().filename, logger);
}
static void ReportOutput(const subarg::ArgMap& args, const subby::FileRange& input, subarg::Logger& logger) {
	if (args.boolean(L"overwrite"))
		logger.info(L"Overwriting '", input.filename, L"'");
	else
		logger.info(L"Writing to '", args.str(L"output"), L"'");
}

static void Delay(const subarg::ArgMap& args, subarg::Logger& logger) {
	const subby::FileRange& input = args.custom<subby::FileRange>(L"input");
	logger.info(L"Reading '", input.filename, L"'");
	logger.info(L"Delaying ", subby::Describe(input), L" by ", *subby::DelayInMilliseconds(args), L"ms");
	if (args.boolean(L"exclusive"))
		logger.verbose(L"Only the specified range will be encoded");
	ReportOutput(args, input, logger);
}
static void Trim(const subarg::ArgMap& args, subarg::Logger& logger) {
	subby::FileRange input = args.custom<subby::FileRange>(L"input");
	logger.info(L"Reading '", input.filename, L"'");

	/* the explicit range replaces the range of the input */
	const subarg::Value& range = args.get(L"range");
	if (range.isCustom()) {
		std::wstring filename = input.filename;
		input = range.custom<subby::FileRange>();
		input.filename = filename;
		logger.info(L"Using provided range: ", subby::Describe(input));
	}
	logger.info(L"Trimming to ", subby::Describe(input));
	ReportOutput(args, input, logger);
}
static void Extend(const subarg::ArgMap& args, subarg::Logger& logger) {
	logger.warn(L"The extend subcommand is experimental so remember to have backups");
	const subby::FileRange& input = args.custom<subby::FileRange>(L"input");
	logger.info(L"Reading '", input.filename, L"'");
	logger.info(L"Extending ", subby::Describe(input), L" by ", args.inum(L"extend"), L"ms with a threshold of ", args.inum(L"gap"), L"ms");
	ReportOutput(args, input, logger);
}
static void Display(const subarg::ArgMap& args, subarg::Logger& logger) {
	const subarg::Tuple& inputs = args.tuple(L"input");
	if (inputs.size() > 1)
		logger.info(L"Displaying information for ", inputs.size(), L" files");

	for (const auto& value : inputs) {
		const subby::FileRange& input = value.custom<subby::FileRange>();
		if (input.linerange.has_value() || input.timerange.has_value())
			logger.warn(L"Ignoring provided range for ", input.filename, L"...");
		if (args.boolean(L"dbg1"))
			logger.debug(L"Decoding [", input.filename, L"] as utf-8 only");
		logger.info(L"srt subtitles: ", input.filename);
		if (args.boolean(L"long"))
			logger.verbose(L"Detailed information requested for ", input.filename);
		if (args.boolean(L"missing"))
			logger.warn(L"Utility for determining missing line numbers not yet implemented");
	}
}

subarg::Group subby::SingleInput() {
	return subarg::Group{
		subarg::Parameter{ L"input", L"The input file" },
		subarg::Parameter{ L"-use-ranges", L"Enable parsing for ranges of lines or timestamps", subarg::Shorthand{ L"-R" }, subarg::Mode{ subarg::Kind::enable } },
		subarg::PostProcessor{ subby::ParsePromisedFileRange },
		subarg::Validator{ subby::ValidateInputFileType }
	};
}
subarg::Group subby::ManyInputs() {
	return subarg::Group{
		subarg::Parameter{ L"input", L"Input files for command", subarg::Mode{ subarg::Kind::multiple } },
		subarg::Parameter{ L"-use-ranges", L"Enable parsing for ranges of lines or timestamps", subarg::Shorthand{ L"-R" }, subarg::Mode{ subarg::Kind::enable } },
		subarg::PostProcessor{ subby::ParseManyPromisedFileRanges },
		subarg::Validator{ subby::ValidateManyInputFileTypes }
	};
}
subarg::Group subby::OutputFile() {
	return subarg::Group{
		subarg::Parameter{ L"-output", L"The output file", subarg::Shorthand{ L"-o" }, subarg::DisplayName{ L"output_file" } },
		subarg::Parameter{ L"-overwrite", L"Overwrite input file", subarg::Shorthand{ L"-O" }, subarg::Mode{ subarg::Kind::enable } },
		subarg::Exclusive{},
		subarg::Required{}
	};
}

void subby::ParsePromisedFileRange(subarg::ArgMap& args, subarg::Logger& logger) {
	std::wstring raw = args.str(L"input");
	args.set(L"input", ToFileRange(raw, args.boolean(L"use-ranges"), logger));
}
void subby::ParseManyPromisedFileRanges(subarg::ArgMap& args, subarg::Logger& logger) {
	subarg::Tuple out;
	for (const auto& value : args.tuple(L"input"))
		out.push_back(ToFileRange(value.str(), args.boolean(L"use-ranges"), logger));
	args.set(L"input", subarg::Value{ std::move(out) });
}
bool subby::ValidateInputFileType(subarg::ArgMap& args, const subarg::Logger& logger) {
	return CheckFileRange(args.get(L"input"), logger);
}
bool subby::ValidateManyInputFileTypes(subarg::ArgMap& args, const subarg::Logger& logger) {
	for (const auto& value : args.tuple(L"input")) {
		if (!CheckFileRange(value, logger))
			return false;
	}
	return true;
}

std::optional<subarg::Value> subby::DecodeRangeOption(const std::wstring& value) {
	return subarg::Value{ subarg::Tuple{ true, value } };
}
void subby::ParseTrimRange(subarg::ArgMap& args, subarg::Logger& logger) {
	const subarg::Value& range = args.get(L"range");
	if (!range.isTuple() || range.tuple().size() != 2)
		return;

	/* default range selects the entire input */
	if (!range.tuple()[0].boolean()) {
		args.set(L"range", subarg::Value{});
		return;
	}

	/* leave the tuple as marker for the validator */
	std::wstring text = range.tuple()[1].str();
	std::optional<subby::FileRange> decoded = subby::DecodeFileRange(L":" + text);
	if (!decoded.has_value()) {
		logger.debug(L"Range [", text, L"] could not be decoded");
		return;
	}
	args.set(L"range", subarg::Value{ subarg::Custom{ *decoded } });
}
bool subby::ValidateTrimRange(subarg::ArgMap& args, const subarg::Logger& logger) {
	const subarg::Value& range = args.get(L"range");
	if (!range.isTuple())
		return true;
	logger.error(L"Unknown range: '", range.tuple()[1].str(), L"'");
	logger.warn(L"Range needs to be formatted as hh:mm:ss,mmm-hh:mm:ss,mmm or #n-#n");
	return false;
}
bool subby::ValidateNoRangeConflict(subarg::ArgMap& args, const subarg::Logger& logger) {
	if (!args.get(L"range").isCustom() || !args.boolean(L"use-ranges"))
		return true;
	logger.error(L"Cannot have conflicting ranges");
	return false;
}

std::optional<int64_t> subby::DelayInMilliseconds(const subarg::ArgMap& args) {
	const std::wstring& unit = args.str(L"unit");
	int64_t delay = args.inum(L"delay");
	if (unit == L"minute")
		return subby::ScaleTime(delay, subby::Minutes);
	if (unit == L"second" || unit == L"s")
		return subby::ScaleTime(delay, subby::Seconds);
	return delay;
}
bool subby::ValidateDelayRange(subarg::ArgMap& args, const subarg::Logger& logger) {
	if (subby::DelayInMilliseconds(args).has_value())
		return true;
	logger.error(L"Delay of ", args.inum(L"delay"), L" ", args.str(L"unit"), L" is out of range");
	return false;
}

subarg::Command subby::DelayCommand() {
	return subarg::Command{ L"delay",
		subarg::Description{ L"Delay a range of subtitles by a specified amount" },
		subby::OutputFile(),
		subarg::Parameter{ L"-unit", L"Specify unit of delay", subarg::Shorthand{ L"-u" }, subarg::Choices{ L"millisecond", L"second", L"minute", L"ms", L"s" }, subarg::Default{ L"ms" } },
		subarg::Parameter{ L"-exclusive", L"Encode only the specified range", subarg::Shorthand{ L"-x" }, subarg::Mode{ subarg::Kind::enable } },
		subby::SingleInput(),
		subarg::Parameter{ L"delay", L"Amount of units (see -u) to delay by", subarg::DisplayName{ L"delay_by" }, subarg::ValueType{ subarg::Primitive::inum } },
		subarg::Validator{ subby::ValidateDelayRange },
		subarg::Handler{ Delay }
	};
}
subarg::Command subby::TrimCommand() {
	return subarg::Command{ L"trim",
		subarg::Description{ L"Trim to specified range of lines or timestamps" },
		subby::OutputFile(),
		subby::SingleInput(),
		subarg::Parameter{ L"range", L"A range of lines or timestamps", subarg::ValueType{ subby::DecodeRangeOption }, subarg::Default{ subarg::Tuple{ false, L"start-end" } } },
		subarg::PostProcessor{ subby::ParseTrimRange },
		subarg::Validator{ subby::ValidateTrimRange },
		subarg::Validator{ subby::ValidateNoRangeConflict },
		subarg::Handler{ Trim }
	};
}
subarg::Command subby::ExtendCommand() {
	return subarg::Command{ L"extend",
		subarg::Description{ L"Extend subtitle duration" },
		subby::OutputFile(),
		subby::SingleInput(),
		subarg::Parameter{ L"extend", L"Amount of milliseconds to extend by", subarg::DisplayName{ L"extend_by" }, subarg::ValueType{ subarg::Primitive::inum } },
		subarg::Parameter{ L"gap", L"Threshold between subtitle lines", subarg::DisplayName{ L"threshold" }, subarg::ValueType{ subarg::Primitive::inum }, subarg::Mode{ subarg::Kind::optional }, subarg::Default{ 100 } },
		subarg::Handler{ Extend }
	};
}
subarg::Command subby::DisplayCommand() {
	return subarg::Command{ L"display",
		subarg::Description{ L"Display information about subtitle file" },
		subarg::Parameter{ L"-long", L"Display detailed information", subarg::Mode{ subarg::Kind::enable } },
		subarg::Parameter{ L"-missing", L"Not implemented", subarg::Mode{ subarg::Kind::enable } },
		subarg::Parameter{ L"-dbg1", L"Decode the input as utf-8 only", subarg::Mode{ subarg::Kind::enable } },
		subby::ManyInputs(),
		subarg::Handler{ Display }
	};
}

subarg::Config subby::MakeConfig() {
	return subarg::Config{
		subarg::Program{ subby::ProgramName },
		subarg::Description{ L"Subtitle Editor" },
		subarg::VerbosityFlags(),
		subby::DisplayCommand(),
		subby::DelayCommand(),
		subby::TrimCommand(),
		subby::ExtendCommand()
	};
}
