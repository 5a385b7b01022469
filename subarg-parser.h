/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include "subarg-argmap.h"
#include "subarg-config.h"
#include "subarg-convert.h"
#include "subarg-verify.h"
#include "subarg-pool.h"
#include "subarg-pipeline.h"
#include "subarg-help.h"
#include "subarg-logger.h"

namespace subarg {
	namespace detail {
		class Parser {
		private:
			const std::vector<std::wstring>& pArgs;
			const detail::Config& pConfig;
			subarg::ArgumentPool pPool;
			std::map<std::wstring, std::vector<std::wstring>> pIntermediates;
			std::vector<std::wstring> pCurrentValues;
			const detail::Parameter* pCurrent = nullptr;
			const detail::Command* pSubcommand = nullptr;
			bool pPrintHelp = false;

		public:
			Parser(const std::vector<std::wstring>& args, const detail::Config& config) : pArgs{ args }, pConfig{ config } {
				pPool.pool(pConfig);
			}

		private:
			static bool fIsHelp(const std::wstring& token) {
				return (token == L"-h" || token == L"-help" || token == L"--help");
			}
			void fStore(const detail::Parameter& param, const std::vector<std::wstring>& values) {
				std::wstring name = param.canonical();

				/* check if the parameter is supplied for the first time */
				auto it = pIntermediates.find(name);
				if (it == pIntermediates.end()) {
					pIntermediates.insert({ name, values });
					return;
				}

				/* only multiple-kinds accumulate over multiple occurrences (repeated switches are idempotent) */
				if (param.kind == subarg::Kind::enable || param.kind == subarg::Kind::disable)
					return;
				if (param.kind != subarg::Kind::multiple)
					throw subarg::ParsingException{ subarg::Error::invalidValue, L"Flag [", param.name, L"] cannot be supplied more than once." };
				it->second.insert(it->second.end(), values.begin(), values.end());
			}
			void fCloseCurrent() {
				if (pCurrent == nullptr)
					return;
				fStore(*pCurrent, pCurrentValues);
				pCurrent = nullptr;
				pCurrentValues.clear();
			}
			void fAddValue(const std::wstring& token) {
				/* route the value to the open flag or the next pending positional */
				if (pCurrent == nullptr)
					pCurrent = &pPool.nextPositional(token);
				pCurrentValues.push_back(token);

				/* only multiple-kinds keep absorbing values */
				if (pCurrent->kind != subarg::Kind::multiple)
					fCloseCurrent();
			}
			void fSelectSubcommand(const detail::Command& command) {
				fCloseCurrent();
				pSubcommand = &command;
				pPool.pool(command);
			}
			void fAddPair(const std::wstring& token, size_t separator) {
				fCloseCurrent();
				std::wstring value = token.substr(separator + 1);
				if (value.empty())
					throw subarg::ParsingException{ subarg::Error::invalidValue, L"Value cannot be blank in pair [", token, L"]." };
				const detail::Parameter& param = pPool.resolve(token.substr(0, separator));

				/* check if the value consists of a list of values */
				if (param.kind != subarg::Kind::multiple) {
					fStore(param, { value });
					return;
				}
				std::vector<std::wstring> values;
				for (size_t begin = 0; begin <= value.size();) {
					size_t end = std::min<size_t>(value.find(L';', begin), value.size());
					if (end > begin)
						values.push_back(value.substr(begin, end - begin));
					begin = end + 1;
				}
				if (values.empty())
					throw subarg::ParsingException{ subarg::Error::invalidValue, L"Value cannot be blank in pair [", token, L"]." };
				fStore(param, values);
			}
			void fAddFlag(const std::wstring& token) {
				fCloseCurrent();
				const detail::Parameter& param = pPool.resolve(token);

				/* switches are fully resolved immediately */
				if (param.kind == subarg::Kind::enable || param.kind == subarg::Kind::disable)
					fStore(param, {});
				else
					pCurrent = &param;
			}

		private:
			subarg::Value fConvert(const detail::Parameter& param, const std::wstring& raw) const {
				if (!param.choices.empty() && std::find(param.choices.begin(), param.choices.end(), raw) == param.choices.end()) {
					std::wstring choices;
					for (size_t i = 0; i < param.choices.size(); ++i)
						choices.append(i == 0 ? L"" : L", ").append(param.choices[i]);
					throw subarg::ParsingException{ subarg::Error::invalidChoice, L"Invalid choice [", raw, L"] for [", param.name, L"] (choose from ", choices, L")." };
				}

				std::optional<subarg::Value> value = detail::Convert(param.type, raw);
				if (!value.has_value())
					throw subarg::ParsingException{ subarg::Error::invalidValue, L"Invalid value [", raw, L"] for [", param.display(), L"] encountered." };
				return *value;
			}
			subarg::Value fCoerce(const detail::Parameter& param, const std::vector<std::wstring>& values) const {
				switch (param.kind) {
				case subarg::Kind::enable:
					return subarg::Value{ true };
				case subarg::Kind::disable:
					return subarg::Value{ false };
				case subarg::Kind::optional:
					if (values.empty()) {
						std::optional<subarg::Value> value = detail::CoerceDefault(param);
						return (value.has_value() ? *value : subarg::Value{ std::wstring{} });
					}
					return fConvert(param, values.front());
				case subarg::Kind::multiple: {
					if (values.empty())
						throw subarg::ParsingException{ subarg::Error::invalidValue, L"Flag [", param.name, L"] requires at least one value." };
					subarg::Tuple out;
					for (const auto& value : values)
						out.push_back(fConvert(param, value));
					return subarg::Value{ std::move(out) };
				}
				case subarg::Kind::value:
				default:
					break;
				}

				if (values.empty())
					throw subarg::ParsingException{ subarg::Error::invalidValue, L"Flag [", param.name, L"] requires a value." };
				return fConvert(param, values.front());
			}
			void fCheckGroups() const {
				/* check the mutually exclusive groups */
				for (const subarg::PoolGroup* group : pPool.mutuallyExclusiveGroups()) {
					std::wstring conflicts;
					size_t count = 0;
					for (const auto& name : group->members) {
						if (!pIntermediates.contains(name))
							continue;
						conflicts.append(count++ == 0 ? L"" : L", ").append(pPool.find(name)->name);
					}
					if (count > 1)
						throw subarg::ParsingException{ subarg::Error::conflictingFlags, L"The following flags conflict: ", conflicts, L"." };
				}

				/* check the required groups */
				for (const subarg::PoolGroup* group : pPool.requiredGroups()) {
					std::wstring names;
					bool found = false;
					for (size_t i = 0; i < group->members.size(); ++i) {
						found = (found || pIntermediates.contains(group->members[i]));
						names.append(i == 0 ? L"" : L" | ").append(pPool.find(group->members[i])->name);
					}
					if (!found)
						throw subarg::ParsingException{ subarg::Error::missingFlag, L"One of the flags [", names, L"] is required." };
				}
			}

		public:
			/* classify all tokens and collect the raw intermediate values */
			void tokenize() {
				/* check if the help menu has been requested, in which case only the subcommand is of interest */
				if (std::find_if(pArgs.begin(), pArgs.end(), fIsHelp) != pArgs.end()) {
					pPrintHelp = true;
					for (const auto& next : pArgs) {
						if ((pSubcommand = pConfig.find(next)) != nullptr)
							break;
					}
					return;
				}

				for (const auto& next : pArgs) {
					/* numbers are always values (allows negative numbers to be passed) */
					if (detail::IsNumber(next)) {
						fAddValue(next);
						continue;
					}

					/* check if its the first subcommand */
					if (pSubcommand == nullptr) {
						if (const detail::Command* command = pConfig.find(next); command != nullptr) {
							fSelectSubcommand(*command);
							continue;
						}
					}

					/* check if its a positional value (a single hyphen denotes stdin/stdout) */
					if (!next.starts_with(L"-") || next == L"-") {
						fAddValue(next);
						continue;
					}

					/* check if its a flag-value pair or a bare flag */
					if (size_t separator = next.find_first_of(L":="); separator != std::wstring::npos)
						fAddPair(next, separator);
					else
						fAddFlag(next);
				}

				/* finalize the last flag with whatever it has */
				fCloseCurrent();
			}

			/* resolve the intermediates to the final argument-map */
			subarg::ArgMap resolve() {
				subarg::ArgMap out;
				fCheckGroups();

				/* install the defaults of the missing positionals */
				std::map<std::wstring, subarg::Value> coerced;
				for (const detail::Parameter* param : pPool.remainingPositionals()) {
					if (param->defValue.has_value()) {
						std::optional<subarg::Value> value = detail::CoerceDefault(*param);
						if (!value.has_value())
							throw subarg::ConfigException{ L"Default value of [", param->name, L"] cannot be converted to its type." };
						coerced.insert({ param->canonical(), std::move(*value) });
					}
					else if (param->kind != subarg::Kind::optional)
						throw subarg::ParsingException{ subarg::Error::missingPositional, L"No value provided for positional argument [", param->display(), L"]." };
				}

				/* coerce all supplied values */
				for (const auto& [name, values] : pIntermediates)
					coerced.insert_or_assign(name, fCoerce(*pPool.find(name), values));

				/* merge the values onto the defaults */
				out.pValues = pPool.defaults();
				for (auto& [name, value] : coerced)
					out.pValues.insert_or_assign(name, std::move(value));
				out.pValues.insert_or_assign(subarg::SubcommandKey, (pSubcommand == nullptr ? subarg::Value{} : subarg::Value{ pSubcommand->name }));
				return out;
			}

		public:
			const detail::Command* subcommand() const {
				return pSubcommand;
			}
			bool printHelp() const {
				return pPrintHelp;
			}
		};
	}

	/* parse the arguments (excluding the program name) and run the pipeline of the root and the selected subcommand
	*	Note: returns an empty optional if a validator rejected the arguments
	*	Note: throws subarg::ParsingException, subarg::PrintMessage, or subarg::ConfigException */
	inline std::optional<subarg::ArgMap> Parse(const std::vector<std::wstring>& args, const subarg::Config& config, subarg::Logger& logger, size_t lineLength = subarg::NumCharsHelp) {
		const detail::Config& burned = detail::ConfigBurner::GetBurned(config);

		/* validate the entire configuration upfront */
		detail::ValidateConfig(burned);

		detail::Parser parser{ args, burned };
		parser.tokenize();
		if (parser.printHelp())
			throw subarg::PrintMessage{ detail::HelpBuilder{ burned, parser.subcommand(), lineLength }.buildHelpString() };

		subarg::ArgMap out = parser.resolve();
		if (!subarg::Pipeline{ logger }.run(burned, parser.subcommand(), out))
			return std::nullopt;
		return out;
	}
}
