/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include "subarg-common.h"

namespace subarg {
	using Tuple = std::vector<subarg::Value>;

	/* wrapper for any value produced by a custom decoder or post-processor (for example a file-range) */
	struct Custom {
		std::any value;
	};

	/* representation of a single argument value (performs primitive type-conversions when accessing values) */
	struct Value : private std::variant<std::monostate, bool, int64_t, double, std::wstring, subarg::Tuple, subarg::Custom> {
	private:
		using Parent = std::variant<std::monostate, bool, int64_t, double, std::wstring, subarg::Tuple, subarg::Custom>;

	public:
		Value() : Parent{ std::monostate{} } {}
		Value(subarg::Value&&) = default;
		Value(const subarg::Value&) = default;
		subarg::Value& operator=(subarg::Value&&) = default;
		subarg::Value& operator=(const subarg::Value&) = default;

	public:
		Value(bool v) : Parent{ v } {}
		Value(double v) : Parent{ v } {}
		Value(std::wstring&& v) : Parent{ std::move(v) } {}
		Value(const std::wstring& v) : Parent{ v } {}
		Value(subarg::Tuple&& v) : Parent{ std::move(v) } {}
		Value(const subarg::Tuple& v) : Parent{ v } {}
		Value(subarg::Custom&& v) : Parent{ std::move(v) } {}
		Value(const subarg::Custom& v) : Parent{ v } {}

	public:
		/* convenience */
		Value(int v) : Parent{ int64_t(v) } {}
		Value(long v) : Parent{ int64_t(v) } {}
		Value(long long v) : Parent{ int64_t(v) } {}
		Value(unsigned int v) : Parent{ int64_t(v) } {}
		Value(unsigned long v) : Parent{ int64_t(v) } {}
		Value(unsigned long long v) : Parent{ int64_t(v) } {}
		Value(const wchar_t* s) : Parent{ std::wstring(s) } {}

	public:
		constexpr bool isNull() const {
			return std::holds_alternative<std::monostate>(*this);
		}
		constexpr bool isBool() const {
			return std::holds_alternative<bool>(*this);
		}
		constexpr bool isINum() const {
			return std::holds_alternative<int64_t>(*this);
		}
		constexpr bool isUNum() const {
			return (std::holds_alternative<int64_t>(*this) && std::get<int64_t>(*this) >= 0);
		}
		constexpr bool isReal() const {
			if (std::holds_alternative<double>(*this))
				return true;
			return std::holds_alternative<int64_t>(*this);
		}
		constexpr bool isStr() const {
			return std::holds_alternative<std::wstring>(*this);
		}
		constexpr bool isTuple() const {
			return std::holds_alternative<subarg::Tuple>(*this);
		}
		constexpr bool isCustom() const {
			return std::holds_alternative<subarg::Custom>(*this);
		}

	public:
		bool boolean() const {
			if (std::holds_alternative<bool>(*this))
				return std::get<bool>(*this);
			throw subarg::TypeException{ L"subarg::Value is not a boolean." };
		}
		int64_t inum() const {
			if (std::holds_alternative<int64_t>(*this))
				return std::get<int64_t>(*this);
			throw subarg::TypeException{ L"subarg::Value is not a signed-number." };
		}
		uint64_t unum() const {
			if (isUNum())
				return uint64_t(std::get<int64_t>(*this));
			throw subarg::TypeException{ L"subarg::Value is not an unsigned-number." };
		}
		double real() const {
			if (std::holds_alternative<double>(*this))
				return std::get<double>(*this);
			if (std::holds_alternative<int64_t>(*this))
				return double(std::get<int64_t>(*this));
			throw subarg::TypeException{ L"subarg::Value is not a real." };
		}
		const std::wstring& str() const {
			if (std::holds_alternative<std::wstring>(*this))
				return std::get<std::wstring>(*this);
			throw subarg::TypeException{ L"subarg::Value is not a string." };
		}
		const subarg::Tuple& tuple() const {
			if (std::holds_alternative<subarg::Tuple>(*this))
				return std::get<subarg::Tuple>(*this);
			throw subarg::TypeException{ L"subarg::Value is not a tuple." };
		}
		template <class Type>
		const Type& custom() const {
			if (std::holds_alternative<subarg::Custom>(*this)) {
				const Type* out = std::any_cast<Type>(&std::get<subarg::Custom>(*this).value);
				if (out != nullptr)
					return *out;
			}
			throw subarg::TypeException{ L"subarg::Value is not a custom value of the requested type." };
		}

	public:
		/* custom values never compare equal, as their content is opaque */
		bool operator==(const subarg::Value& other) const {
			if (Parent::index() != static_cast<const Parent&>(other).index())
				return false;
			if (isNull())
				return true;
			if (isBool())
				return (boolean() == other.boolean());
			if (isINum())
				return (inum() == other.inum());
			if (std::holds_alternative<double>(*this))
				return (real() == other.real());
			if (isStr())
				return (str() == other.str());
			if (isTuple())
				return (tuple() == other.tuple());
			return false;
		}
	};

	/* create the printable representation of the value (used for help-defaults and logging) */
	inline std::wstring ToString(const subarg::Value& value) {
		std::wstring out;
		if (value.isNull())
			out = L"none";
		else if (value.isStr())
			out = value.str();
		else if (value.isBool())
			out = (value.boolean() ? L"true" : L"false");
		else if (value.isINum())
			str::IntTo(out, value.inum());
		else if (value.isReal())
			str::FloatTo(out, value.real());
		else if (value.isCustom())
			out = L"<custom>";
		else {
			out.push_back(L'(');
			const subarg::Tuple& list = value.tuple();
			for (size_t i = 0; i < list.size(); ++i)
				out.append(i == 0 ? L"" : L", ").append(subarg::ToString(list[i]));
			out.push_back(L')');
		}
		return out;
	}
}
