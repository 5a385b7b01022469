/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include <ustring/ustring.h>
#include <string>
#include <optional>
#include <cinttypes>
#include <limits>

namespace subby {
	static constexpr int64_t Seconds = 1000;
	static constexpr int64_t Minutes = 60 * subby::Seconds;
	static constexpr int64_t Hours = 60 * subby::Minutes;

	/* range of subtitle line indices (end of -1 denotes the end of the file) */
	struct LineRange {
		int64_t start = 0;
		int64_t end = -1;
	};

	/* range of timestamps in milliseconds (end of -1 denotes the end of the file) */
	struct TimeRange {
		int64_t begin = 0;
		int64_t end = -1;
	};

	/* command-line representation of a subtitle file, optionally restricted to a range of lines or timestamps */
	struct FileRange {
		std::wstring filename;
		std::optional<subby::TimeRange> timerange;
		std::optional<subby::LineRange> linerange;
	};

	/* multiply/add durations (empty optional if the result cannot be represented) */
	std::optional<int64_t> ScaleTime(int64_t value, int64_t factor);
	std::optional<int64_t> AddTime(int64_t a, int64_t b);

	/* parse a timestamp of the form hh:mm:ss,mmm to milliseconds */
	std::optional<int64_t> ParseTime(const std::wstring& time);

	/* format milliseconds as hh:mm:ss,mmm */
	std::wstring TimeToString(int64_t value);

	/* decode name[:range] with the range as a-b of line indices (optionally prefixed by #, start, end) or timestamps
	*	Note: returns an empty optional if a range is present but malformed */
	std::optional<subby::FileRange> DecodeFileRange(const std::wstring& value);

	std::wstring Describe(const subby::FileRange& range);
}
