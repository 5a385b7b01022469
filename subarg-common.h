/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include <ustring/ustring.h>
#include <string>
#include <functional>
#include <map>
#include <vector>
#include <deque>
#include <cwctype>
#include <variant>
#include <optional>
#include <set>
#include <type_traits>
#include <concepts>
#include <cinttypes>
#include <algorithm>
#include <any>
#include <limits>
#include <typeinfo>

namespace subarg {
	class ArgMap;
	class Logger;
	struct Value;

	/* reserved key of the argument-map, which holds the name of the matched subcommand (or null) */
	static constexpr const wchar_t* SubcommandKey = L"subcmd";

	/* kind of a parameter, which defines how many values it consumes */
	enum class Kind : uint8_t {
		value,
		enable,
		disable,
		optional,
		multiple
	};

	enum class Primitive : uint8_t {
		any,
		inum,
		unum,
		real,
		boolean
	};

	/* custom value-decoder (empty optional signals that the value could not be decoded) */
	using Decoder = std::function<std::optional<subarg::Value>(const std::wstring&)>;
	using Type = std::variant<subarg::Primitive, subarg::Decoder>;

	using Check = std::function<bool(subarg::ArgMap&, const subarg::Logger&)>;
	using Process = std::function<void(subarg::ArgMap&, subarg::Logger&)>;
	using Callback = std::function<void(const subarg::ArgMap&, subarg::Logger&)>;

	/* structural errors, which can occur while parsing */
	enum class Error : uint8_t {
		unknownFlag,
		positionalUsedAsFlag,
		tooManyPositionals,
		missingPositional,
		missingFlag,
		conflictingFlags,
		invalidChoice,
		invalidValue
	};

	/* base exception of all exceptions thrown by subarg */
	class Exception {
	private:
		std::wstring pMessage;

	public:
		template <class... Args>
		Exception(const Args&... args) : pMessage{ str::wd::Build(args...) } {}

	public:
		constexpr const std::wstring& what() const {
			return pMessage;
		}
	};

	/* exception thrown when a malformed configuration is used */
	struct ConfigException : public subarg::Exception {
		template <class... Args>
		ConfigException(const Args&... args) : subarg::Exception{ args... } {}
	};

	/* exception thrown when accessing a subarg::Value or subarg::ArgMap entry as a certain type, which it is not */
	struct TypeException : public subarg::Exception {
		template <class... Args>
		TypeException(const Args&... args) : subarg::Exception{ args... } {}
	};

	/* exception thrown when malformed or invalid arguments are encountered */
	struct ParsingException : public subarg::Exception {
	private:
		subarg::Error pError;

	public:
		template <class... Args>
		ParsingException(subarg::Error error, const Args&... args) : subarg::Exception{ args... }, pError{ error } {}

	public:
		constexpr subarg::Error error() const {
			return pError;
		}
	};

	/* exception thrown when only a message should be printed but no parsing is to be performed */
	struct PrintMessage : public subarg::Exception {
		template <class... Args>
		PrintMessage(const Args&... args) : subarg::Exception{ args... } {}
	};

	/* strip all leading markers of the name */
	inline std::wstring Canonical(const std::wstring& name) {
		size_t i = 0;
		while (i < name.size() && name[i] == L'-')
			++i;
		return name.substr(i);
	}
}
