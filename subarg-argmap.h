/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include "subarg-common.h"
#include "subarg-value.h"

namespace subarg {
	namespace detail {
		class Parser;
	}

	/* represents the parsed results of the arguments (mutable by post-processors) */
	class ArgMap {
		friend class detail::Parser;
	private:
		std::map<std::wstring, subarg::Value> pValues;

	public:
		bool contains(const std::wstring& name) const {
			return pValues.contains(name);
		}
		size_t size() const {
			return pValues.size();
		}
		const subarg::Value& get(const std::wstring& name) const {
			auto it = pValues.find(name);
			if (it == pValues.end())
				throw subarg::TypeException{ L"Argument [", name, L"] does not exist." };
			return it->second;
		}
		std::optional<subarg::Value> find(const std::wstring& name) const {
			auto it = pValues.find(name);
			if (it == pValues.end())
				return {};
			return it->second;
		}
		void set(const std::wstring& name, subarg::Value value) {
			pValues[name] = std::move(value);
		}
		bool erase(const std::wstring& name) {
			return (pValues.erase(name) > 0);
		}
		const std::map<std::wstring, subarg::Value>& values() const {
			return pValues;
		}

	public:
		/* typed accessors (throw subarg::TypeException if the argument is missing or of another type) */
		const std::wstring& str(const std::wstring& name) const {
			const subarg::Value& value = get(name);
			if (!value.isStr())
				throw subarg::TypeException{ L"Argument [", name, L"] is not a string." };
			return value.str();
		}
		bool boolean(const std::wstring& name) const {
			const subarg::Value& value = get(name);
			if (!value.isBool())
				throw subarg::TypeException{ L"Argument [", name, L"] is not a boolean." };
			return value.boolean();
		}
		int64_t inum(const std::wstring& name) const {
			const subarg::Value& value = get(name);
			if (!value.isINum())
				throw subarg::TypeException{ L"Argument [", name, L"] is not a signed-number." };
			return value.inum();
		}
		double real(const std::wstring& name) const {
			const subarg::Value& value = get(name);
			if (!value.isReal())
				throw subarg::TypeException{ L"Argument [", name, L"] is not a real." };
			return value.real();
		}
		const subarg::Tuple& tuple(const std::wstring& name) const {
			const subarg::Value& value = get(name);
			if (!value.isTuple())
				throw subarg::TypeException{ L"Argument [", name, L"] is not a tuple." };
			return value.tuple();
		}
		template <class Type>
		const Type& custom(const std::wstring& name) const {
			return get(name).custom<Type>();
		}

	public:
		/* name of the matched subcommand (empty if no subcommand has been selected) */
		std::optional<std::wstring> subcommand() const {
			auto it = pValues.find(subarg::SubcommandKey);
			if (it == pValues.end() || it->second.isNull())
				return {};
			return it->second.str();
		}
	};
}
