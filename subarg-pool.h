/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include "subarg-common.h"
#include "subarg-config.h"
#include "subarg-convert.h"

namespace subarg {
	/* membership of a registered group (by canonical name) */
	struct PoolGroup {
		std::vector<std::wstring> members;
		bool exclusive = false;
		bool required = false;
	};

	/* queryable index of the parameters of the root command and the selected subcommand
	*	Note: constructed fresh for every parse and extended once the subcommand is known */
	class ArgumentPool {
	private:
		std::map<std::wstring, const detail::Parameter*> pByName;
		std::map<std::wstring, std::wstring> pShorthands;
		std::deque<const detail::Parameter*> pPositionals;
		std::vector<subarg::PoolGroup> pGroups;

	private:
		std::wstring fInsert(const detail::Parameter& param) {
			std::wstring canonical = param.canonical();
			if (canonical.empty())
				throw subarg::ConfigException{ L"Parameter [", param.name, L"] has an empty name." };
			if (pByName.contains(canonical) || pShorthands.contains(canonical))
				throw subarg::ConfigException{ L"Parameter [", param.name, L"] is registered multiple times." };

			/* register the shorthand as reverse alias */
			if (!param.shorthand.empty()) {
				std::wstring shorthand = subarg::Canonical(param.shorthand);
				if (pByName.contains(shorthand) || pShorthands.contains(shorthand))
					throw subarg::ConfigException{ L"Shorthand [", param.shorthand, L"] of [", param.name, L"] is registered multiple times." };
				pShorthands.insert({ shorthand, canonical });
			}

			pByName.insert({ canonical, &param });
			if (param.positional())
				pPositionals.push_back(&param);
			return canonical;
		}

	public:
		void pool(const detail::Parameter& param) {
			fInsert(param);
		}
		void pool(const detail::Group& group) {
			subarg::PoolGroup& next = pGroups.emplace_back();
			next.exclusive = group.exclusive;
			next.required = group.required;
			for (const auto& param : group.parameters)
				next.members.push_back(fInsert(param));
		}
		void pool(const detail::Command& command) {
			for (const auto& entry : command.entries) {
				if (std::holds_alternative<detail::Parameter>(entry))
					pool(std::get<detail::Parameter>(entry));
				else
					pool(std::get<detail::Group>(entry));
			}
		}

	public:
		/* pop the next positional to be filled (throws subarg::ParsingException if none are left) */
		const detail::Parameter& nextPositional(const std::wstring& token) {
			if (pPositionals.empty())
				throw subarg::ParsingException{ subarg::Error::tooManyPositionals, L"Unrecognized argument [", token, L"] encountered (too many positional arguments)." };
			const detail::Parameter* next = pPositionals.front();
			pPositionals.pop_front();
			return *next;
		}
		bool hasPositionals() const {
			return !pPositionals.empty();
		}

		/* resolve the flag token to its parameter (throws subarg::ParsingException if the flag is unknown or a positional) */
		const detail::Parameter& resolve(const std::wstring& token) const {
			std::wstring name = subarg::Canonical(token);
			if (auto it = pShorthands.find(name); it != pShorthands.end())
				name = it->second;

			auto it = pByName.find(name);
			if (it == pByName.end())
				throw subarg::ParsingException{ subarg::Error::unknownFlag, L"Unknown flag [", token, L"] encountered." };
			if (it->second->positional())
				throw subarg::ParsingException{ subarg::Error::positionalUsedAsFlag, L"[", token, L"] is a positional argument and cannot be used as a flag." };
			return *it->second;
		}

		/* lookup the parameter by its canonical name (nullptr if it has not been registered) */
		const detail::Parameter* find(const std::wstring& canonical) const {
			auto it = pByName.find(canonical);
			return (it == pByName.end() ? nullptr : it->second);
		}

		/* collect the default values of all registered flags (switches are always defaulted) */
		std::map<std::wstring, subarg::Value> defaults() const {
			std::map<std::wstring, subarg::Value> out;
			for (const auto& [name, param] : pByName) {
				if (param->positional())
					continue;
				if (param->kind == subarg::Kind::enable)
					out.insert({ name, subarg::Value{ false } });
				else if (param->kind == subarg::Kind::disable)
					out.insert({ name, subarg::Value{ true } });
				else if (param->defValue.has_value()) {
					std::optional<subarg::Value> value = detail::CoerceDefault(*param);
					if (!value.has_value())
						throw subarg::ConfigException{ L"Default value of [", param->name, L"] cannot be converted to its type." };
					out.insert({ name, std::move(*value) });
				}
			}
			return out;
		}

		std::vector<const subarg::PoolGroup*> mutuallyExclusiveGroups() const {
			std::vector<const subarg::PoolGroup*> out;
			for (const auto& group : pGroups) {
				if (group.exclusive)
					out.push_back(&group);
			}
			return out;
		}
		std::vector<const subarg::PoolGroup*> requiredGroups() const {
			std::vector<const subarg::PoolGroup*> out;
			for (const auto& group : pGroups) {
				if (group.required)
					out.push_back(&group);
			}
			return out;
		}

		/* drain all positionals, which have not been consumed */
		std::vector<const detail::Parameter*> remainingPositionals() {
			std::vector<const detail::Parameter*> out{ pPositionals.begin(), pPositionals.end() };
			pPositionals.clear();
			return out;
		}
	};
}
