/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include "subarg-common.h"
#include "subarg-config.h"
#include "subarg-value.h"

namespace subarg {
	static constexpr size_t NumCharsHelp = 100;
	static constexpr size_t NumCharsHelpLeft = 32;
	static constexpr size_t MinNumCharsRight = 8;
	static constexpr size_t IndentInformation = 4;
	static constexpr size_t AutoIndentLongText = 2;

	namespace detail {
		class HelpBuilder {
		private:
			std::wstring pBuffer;
			const detail::Config& pConfig;
			const detail::Command* pSubcommand = nullptr;
			size_t pPosition = 0;
			size_t pNumChars = 0;
			size_t pOpenWhiteSpace = 0;

		public:
			HelpBuilder(const detail::Config& config, const detail::Command* subcommand, size_t numChars) : pConfig{ config }, pSubcommand{ subcommand } {
				pNumChars = std::max(subarg::NumCharsHelpLeft + subarg::MinNumCharsRight, numChars);
			}

		private:
			void fAddNewLine(bool emptyLine) {
				if (pBuffer.empty())
					return;
				if (pBuffer.back() != L'\n')
					pBuffer.push_back(L'\n');
				if (emptyLine)
					pBuffer.push_back(L'\n');
				pPosition = 0;
				pOpenWhiteSpace = 0;
			}
			void fAddToken(const std::wstring& add) {
				if (pPosition > 0 && pPosition + add.size() > pNumChars) {
					pBuffer.push_back(L'\n');
					pPosition = 0;
				}

				pBuffer.append(add);
				pPosition += add.size();
				pOpenWhiteSpace = 0;
			}
			void fAddSpacedToken(const std::wstring& add) {
				if (pPosition > 0) {
					if (pPosition + 1 + add.size() > pNumChars) {
						pBuffer.push_back(L'\n');
						pPosition = 0;
					}
					else {
						pBuffer.push_back(L' ');
						++pPosition;
					}
				}
				fAddToken(add);
			}
			void fAddString(const std::wstring& add, size_t offset = 0, size_t indentAutoBreaks = 0) {
				std::wstring tokenPrint;
				bool isWhitespace = true;

				/* ensure the initial indentation is valid */
				if (offset > 0) {
					if (pPosition + pOpenWhiteSpace >= offset) {
						pBuffer.push_back(L'\n');
						pPosition = 0;
					}
					pBuffer.append(offset - pPosition, L' ');
					pPosition = offset;
					offset += indentAutoBreaks;
				}
				pOpenWhiteSpace = 0;

				/* collect the printable tokens and flush them whenever a whitespace or the end is reached, while
				*	breaking the line if the token would exceed it (user-placed whitespace after a newline is kept) */
				for (size_t i = 0; i <= add.size(); ++i) {
					if (i < add.size() && !std::iswspace(add[i])) {
						isWhitespace = false;
						tokenPrint.push_back(add[i]);
						continue;
					}

					if (!isWhitespace) {
						if ((pPosition > offset || pOpenWhiteSpace > 0) && pPosition + pOpenWhiteSpace + tokenPrint.size() > pNumChars)
							pBuffer.append(1, L'\n').append(pPosition = offset, L' ');
						else {
							pBuffer.append(pOpenWhiteSpace, L' ');
							pPosition += pOpenWhiteSpace;
						}
						pBuffer.append(tokenPrint);
						pPosition += tokenPrint.size();
						pOpenWhiteSpace = 0;
						tokenPrint.clear();
					}
					if (i >= add.size())
						break;

					isWhitespace = true;
					if (add[i] == L'\n')
						pBuffer.append(1, L'\n').append(pPosition = offset, L' ');
					else if (add[i] == L'\t')
						pOpenWhiteSpace += 4;
					else
						++pOpenWhiteSpace;
				}
			}

		private:
			const wchar_t* fTypeString(const subarg::Type& type) const {
				if (std::holds_alternative<subarg::Decoder>(type))
					return L"";
				subarg::Primitive actual = std::get<subarg::Primitive>(type);
				if (actual == subarg::Primitive::boolean)
					return L" [bool]";
				if (actual == subarg::Primitive::unum)
					return L" [uint]";
				if (actual == subarg::Primitive::inum)
					return L" [int]";
				if (actual == subarg::Primitive::real)
					return L" [real]";
				return L"";
			}
			std::wstring fFlagToken(const detail::Parameter& param) const {
				return (param.shorthand.empty() ? param.name : param.shorthand);
			}
			std::wstring fPositionalToken(const detail::Parameter& param) const {
				std::wstring token = str::wd::Build(L'<', param.display(), L'>');
				if (param.kind == subarg::Kind::multiple)
					token.append(L"...");
				if (param.kind == subarg::Kind::optional || param.defValue.has_value())
					token = L"[" + token + L']';
				return token;
			}

			/* iterate over the parameters of the root and the selected subcommand in declaration order */
			void fForEach(const auto& fn) const {
				auto visit = [&](const detail::Command& command) {
					for (const auto& entry : command.entries) {
						if (std::holds_alternative<detail::Parameter>(entry))
							fn(std::get<detail::Parameter>(entry), nullptr);
						else for (const auto& param : std::get<detail::Group>(entry).parameters)
							fn(param, &std::get<detail::Group>(entry));
					}
				};
				visit(pConfig);
				if (pSubcommand != nullptr)
					visit(*pSubcommand);
			}
			void fForEachGroup(const auto& fn) const {
				auto visit = [&](const detail::Command& command) {
					for (const auto& entry : command.entries) {
						if (std::holds_alternative<detail::Group>(entry))
							fn(std::get<detail::Group>(entry));
					}
				};
				visit(pConfig);
				if (pSubcommand != nullptr)
					visit(*pSubcommand);
			}
			std::wstring fGroupUsage(const detail::Group& group) const {
				std::wstring out;
				for (const auto& param : group.parameters)
					out.append(out.empty() ? L"" : L" | ").append(fFlagToken(param));
				if (group.exclusive)
					return L"[" + out + L"]";
				return L"{" + out + L"}";
			}

		private:
			void fBuildUsage() {
				fAddToken(L"Usage: ");
				fAddToken(pConfig.program);
				if (pSubcommand != nullptr)
					fAddSpacedToken(pSubcommand->name);
				else if (!pConfig.commands.empty())
					fAddSpacedToken(L"[command]");

				/* add all positionals in the order of consumption */
				bool hasFlags = false;
				fForEach([&](const detail::Parameter& param, const detail::Group* group) {
					if (param.positional())
						fAddSpacedToken(fPositionalToken(param));
					else if (group == nullptr || !(group->exclusive || group->required))
						hasFlags = true;
				});

				/* add the exclusive and required groups explicitly */
				fForEachGroup([&](const detail::Group& group) {
					if (group.exclusive || group.required)
						fAddSpacedToken(fGroupUsage(group));
				});
				if (hasFlags)
					fAddSpacedToken(L"[options...]");
			}
			void fBuildCommands() {
				if (pSubcommand != nullptr || pConfig.commands.empty())
					return;

				fAddNewLine(true);
				fAddString(L"Commands:");
				for (const auto& command : pConfig.commands) {
					fAddNewLine(false);
					fAddString(str::wd::Build(L"  ", command.name, L"    "));
					if (!command.description.empty())
						fAddString(command.description, subarg::NumCharsHelpLeft, subarg::AutoIndentLongText);
				}
			}
			void fBuildParameter(const detail::Parameter& param) {
				fAddNewLine(false);

				/* add the name and shorthand (append white space for visual separation) */
				std::wstring temp = L"  ";
				if (param.positional())
					temp.append(param.display()).append(fTypeString(param.type));
				else {
					if (!param.shorthand.empty())
						temp.append(param.shorthand).append(L", ");
					temp.append(param.name);
					if (param.kind != subarg::Kind::enable && param.kind != subarg::Kind::disable) {
						bool optional = (param.kind == subarg::Kind::optional);
						temp.append(optional ? L"[=<" : L"=<").append(param.displayName.empty() ? param.canonical() : param.displayName);
						temp.append(fTypeString(param.type)).append(optional ? L">]" : L">");
						if (param.kind == subarg::Kind::multiple)
							temp.append(L"...");
					}
				}
				temp.append(L"    ");
				fAddString(temp);

				/* add the default value and the description */
				temp.clear();
				if (param.defValue.has_value())
					temp = str::wd::Build(L"[Default: ", subarg::ToString(*param.defValue), L']');
				if (!param.description.empty())
					temp.append((temp.empty() ? 0 : 1), L' ').append(param.description);
				fAddString(temp, subarg::NumCharsHelpLeft, subarg::AutoIndentLongText);

				/* add the list of choices */
				for (const auto& choice : param.choices) {
					fAddNewLine(false);
					fAddString(str::wd::Build(L" - ", choice), subarg::NumCharsHelpLeft, 3);
				}
			}
			void fBuildParameters(bool positionals) {
				bool header = false;
				fForEach([&](const detail::Parameter& param, const detail::Group*) {
					if (param.positional() != positionals)
						return;
					if (!header) {
						fAddNewLine(true);
						fAddString(positionals ? L"Positional Arguments:" : L"Flags:");
						header = true;
					}
					fBuildParameter(param);
				});
			}
			void fBuildGroups() {
				fForEachGroup([&](const detail::Group& group) {
					if (!group.exclusive && !group.required && group.description.empty())
						return;
					fAddNewLine(true);
					fAddString(str::wd::Build(group.exclusive ? L"Exclusive: " : L"Group: ", fGroupUsage(group), group.required ? L" (required)" : L""));
					if (!group.description.empty())
						fAddString(group.description, subarg::NumCharsHelpLeft, subarg::AutoIndentLongText);
				});
			}

		public:
			std::wstring buildHelpString() {
				/* add the example-usage descriptive line */
				fBuildUsage();

				/* add the program description or the description of the selected subcommand */
				const std::wstring& description = (pSubcommand == nullptr ? pConfig.description : pSubcommand->description);
				if (!description.empty()) {
					fAddNewLine(true);
					fAddString(description, subarg::IndentInformation);
				}

				/* add the subcommands, the positionals, the flags, and the groups */
				fBuildCommands();
				fBuildParameters(true);
				fBuildParameters(false);
				fBuildGroups();
				if (pSubcommand == nullptr && !pConfig.commands.empty()) {
					fAddNewLine(true);
					fAddString(str::wd::Build(L"Use '", pConfig.program, L" <command> --help' for the help of a command."));
				}

				std::wstring out;
				std::swap(out, pBuffer);
				return out;
			}
		};
	}

	/* construct help-hint suggesting to use the help flag */
	inline std::wstring HelpHint(const subarg::Config& config) {
		const detail::Config& burned = detail::ConfigBurner::GetBurned(config);
		return str::wd::Build(L"Try '", burned.program, L" --help' for more information.");
	}
}
