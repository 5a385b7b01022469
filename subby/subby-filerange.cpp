/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#include "subby-filerange.h"

#include <vector>
#include <utility>

static std::optional<int64_t> ParseInteger(const std::wstring& value) {
	if (value.empty())
		return {};
	auto [num, len, res] = str::ParseNum<int64_t>(value, 10, str::PrefixMode::overwrite);
	if (res != str::NumResult::valid || len != value.size())
		return {};
	return num;
}
static std::vector<std::wstring> Split(const std::wstring& value, wchar_t separator) {
	std::vector<std::wstring> out;
	size_t begin = 0;
	while (true) {
		size_t end = value.find(separator, begin);
		out.push_back(value.substr(begin, end - begin));
		if (end == std::wstring::npos)
			return out;
		begin = end + 1;
	}
}

static std::optional<subby::LineRange> ToLineRange(std::wstring start, std::wstring end) {
	if (start.starts_with(L"#"))
		start = start.substr(1);
	if (end.starts_with(L"#"))
		end = end.substr(1);

	subby::LineRange out;
	if (!str::View{ start }.icompare(L"start")) {
		std::optional<int64_t> value = ParseInteger(start);
		if (!value.has_value())
			return {};
		out.start = *value;
	}
	if (!str::View{ end }.icompare(L"end")) {
		std::optional<int64_t> value = ParseInteger(end);
		if (!value.has_value())
			return {};
		out.end = *value;
	}
	return out;
}
static std::optional<subby::TimeRange> ToTimeRange(const std::wstring& start, const std::wstring& end) {
	subby::TimeRange out;
	if (!str::View{ start }.icompare(L"start")) {
		std::optional<int64_t> value = subby::ParseTime(start);
		if (!value.has_value())
			return {};
		out.begin = *value;
	}
	if (!str::View{ end }.icompare(L"end")) {
		std::optional<int64_t> value = subby::ParseTime(end);
		if (!value.has_value())
			return {};
		out.end = *value;
	}
	return out;
}

std::optional<int64_t> subby::ScaleTime(int64_t value, int64_t factor) {
	if (factor <= 0)
		return {};
	if (value > 0 ? (value > std::numeric_limits<int64_t>::max() / factor) : (value < std::numeric_limits<int64_t>::min() / factor))
		return {};
	return value * factor;
}
std::optional<int64_t> subby::AddTime(int64_t a, int64_t b) {
	if (b > 0 ? (a > std::numeric_limits<int64_t>::max() - b) : (a < std::numeric_limits<int64_t>::min() - b))
		return {};
	return a + b;
}

std::optional<int64_t> subby::ParseTime(const std::wstring& time) {
	std::vector<std::wstring> parts = Split(time, L':');
	if (parts.size() != 3)
		return {};
	std::vector<std::wstring> seconds = Split(parts[2], L',');
	if (seconds.size() != 2)
		return {};

	std::optional<int64_t> hour = ParseInteger(parts[0]), minute = ParseInteger(parts[1]);
	std::optional<int64_t> second = ParseInteger(seconds[0]), millisecond = ParseInteger(seconds[1]);
	if (!hour.has_value() || !minute.has_value() || !second.has_value() || !millisecond.has_value())
		return {};

	/* accumulate the components without overflowing */
	std::optional<int64_t> total = *millisecond;
	std::pair<int64_t, int64_t> components[] = { { *second, subby::Seconds }, { *minute, subby::Minutes }, { *hour, subby::Hours } };
	for (const auto& [value, factor] : components) {
		std::optional<int64_t> scaled = subby::ScaleTime(value, factor);
		if (!scaled.has_value())
			return {};
		if (!(total = subby::AddTime(*total, *scaled)).has_value())
			return {};
	}
	return total;
}
std::wstring subby::TimeToString(int64_t value) {
	int64_t hour = value / subby::Hours;
	value %= subby::Hours;
	int64_t minute = value / subby::Minutes;
	value %= subby::Minutes;
	return str::wd::Format(L"{:02}:{:02}:{:02},{:03}", hour, minute, value / subby::Seconds, value % subby::Seconds);
}

std::optional<subby::FileRange> subby::DecodeFileRange(const std::wstring& value) {
	/* check if no range has been attached */
	size_t colon = value.find(L':');
	if (colon == std::wstring::npos)
		return subby::FileRange{ value, std::nullopt, std::nullopt };
	std::wstring filename = value.substr(0, colon);

	/* split the range into its two bounds */
	std::vector<std::wstring> bounds = Split(value.substr(colon + 1), L'-');
	if (bounds.size() != 2)
		return {};

	/* line ranges take precedence over time ranges */
	if (std::optional<subby::LineRange> lines = ToLineRange(bounds[0], bounds[1]); lines.has_value())
		return subby::FileRange{ filename, std::nullopt, lines };
	if (std::optional<subby::TimeRange> times = ToTimeRange(bounds[0], bounds[1]); times.has_value())
		return subby::FileRange{ filename, times, std::nullopt };
	return {};
}

std::wstring subby::Describe(const subby::FileRange& range) {
	if (range.linerange.has_value()) {
		std::wstring end = (range.linerange->end < 0 ? L"end" : str::wd::Build(L'#', range.linerange->end));
		return str::wd::Build(range.filename, L" [lines #", range.linerange->start, L" to ", end, L']');
	}
	if (range.timerange.has_value()) {
		std::wstring end = (range.timerange->end < 0 ? L"end" : subby::TimeToString(range.timerange->end));
		return str::wd::Build(range.filename, L" [", subby::TimeToString(range.timerange->begin), L" to ", end, L']');
	}
	return range.filename;
}
