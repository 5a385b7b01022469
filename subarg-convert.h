/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include "subarg-common.h"
#include "subarg-value.h"
#include "subarg-config.h"

namespace subarg::detail {
	/* convert the raw string to the given type (empty optional if the string does not describe a valid value) */
	inline std::optional<subarg::Value> Convert(const subarg::Type& type, const std::wstring& raw) {
		/* check if a custom decoder is to be used */
		if (std::holds_alternative<subarg::Decoder>(type)) {
			const subarg::Decoder& decoder = std::get<subarg::Decoder>(type);
			if (!decoder)
				return {};
			return decoder(raw);
		}

		/* validate the expected type and found value */
		switch (std::get<subarg::Primitive>(type)) {
		case subarg::Primitive::inum: {
			auto [num, len, res] = str::ParseNum<int64_t>(raw, 10, str::PrefixMode::overwrite);
			if (res != str::NumResult::valid || len != raw.size())
				return {};
			return subarg::Value{ num };
		}
		case subarg::Primitive::unum: {
			auto [num, len, res] = str::ParseNum<uint64_t>(raw, 10, str::PrefixMode::overwrite);
			if (res != str::NumResult::valid || len != raw.size() || num > uint64_t(std::numeric_limits<int64_t>::max()))
				return {};
			return subarg::Value{ num };
		}
		case subarg::Primitive::real: {
			auto [num, len, res] = str::ParseNum<double>(raw, 10, str::PrefixMode::overwrite);
			if (res != str::NumResult::valid || len != raw.size())
				return {};
			return subarg::Value{ num };
		}
		case subarg::Primitive::boolean: {
			if (str::View{ raw }.icompare(L"true") || raw == L"1")
				return subarg::Value{ true };
			if (str::View{ raw }.icompare(L"false") || raw == L"0")
				return subarg::Value{ false };
			return {};
		}
		case subarg::Primitive::any:
		default:
			break;
		}
		return subarg::Value{ raw };
	}

	/* check if the token describes a numeric literal (integer or real, optionally signed) */
	inline bool IsNumber(const std::wstring& token) {
		if (token.empty())
			return false;
		auto [num, len, res] = str::ParseNum<double>(token, 10, str::PrefixMode::overwrite);
		return (res == str::NumResult::valid && len == token.size());
	}

	/* coerce a single already present value to the type (strings are converted, typed values are only verified, which makes the coercion idempotent) */
	inline std::optional<subarg::Value> CoerceSingle(const subarg::Type& type, const subarg::Value& value) {
		if (value.isStr())
			return detail::Convert(type, value.str());

		/* decoded values are opaque and can only be accepted as they are */
		if (std::holds_alternative<subarg::Decoder>(type))
			return value;

		switch (std::get<subarg::Primitive>(type)) {
		case subarg::Primitive::inum:
			if (!value.isINum())
				return {};
			return value;
		case subarg::Primitive::unum:
			if (!value.isUNum())
				return {};
			return value;
		case subarg::Primitive::real:
			if (!value.isReal())
				return {};
			return subarg::Value{ value.real() };
		case subarg::Primitive::boolean:
			if (!value.isBool())
				return {};
			return value;
		case subarg::Primitive::any:
		default:
			break;
		}
		return value;
	}

	/* coerce the default value of the parameter (multiple-kinds always produce a tuple) */
	inline std::optional<subarg::Value> CoerceDefault(const detail::Parameter& param) {
		if (!param.defValue.has_value())
			return {};
		const subarg::Value& value = *param.defValue;

		/* check if the default values must be in the list of choices */
		auto inChoices = [&](const subarg::Value& v) -> bool {
			if (param.choices.empty() || !v.isStr())
				return true;
			return (std::find(param.choices.begin(), param.choices.end(), v.str()) != param.choices.end());
		};

		/* check if a single value is expected */
		if (param.kind != subarg::Kind::multiple) {
			if (!inChoices(value))
				return {};
			return detail::CoerceSingle(param.type, value);
		}

		/* convert all values of the tuple */
		subarg::Tuple out;
		const subarg::Tuple single{ value };
		for (const subarg::Value& v : (value.isTuple() ? value.tuple() : single)) {
			if (!inChoices(v))
				return {};
			std::optional<subarg::Value> next = detail::CoerceSingle(param.type, v);
			if (!next.has_value())
				return {};
			out.push_back(std::move(*next));
		}
		return subarg::Value{ std::move(out) };
	}
}
