/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include "subarg-common.h"
#include "subarg-config.h"
#include "subarg-value.h"
#include "subarg-convert.h"

namespace subarg::detail {
	struct ValidationState {
		std::set<std::wstring> names;
		std::set<std::wstring> shorthands;
	};

	inline void ValidateType(const subarg::Type& type) {
		if (std::holds_alternative<subarg::Decoder>(type) && !std::get<subarg::Decoder>(type))
			throw subarg::ConfigException{ L"Custom value-type must not be an empty decoder." };
	}
	inline void ValidateDefValue(const detail::Parameter& param) {
		/* a bare optional flag produces its default, which must exist unless an empty string is a valid value */
		if (!param.defValue.has_value()) {
			if (param.kind != subarg::Kind::optional || param.positional())
				return;
			bool untyped = (std::holds_alternative<subarg::Primitive>(param.type) && std::get<subarg::Primitive>(param.type) == subarg::Primitive::any);
			if (!untyped || !param.choices.empty())
				throw subarg::ConfigException{ L"Optional flag [", param.name, L"] with a value-type or choices requires a default value." };
			return;
		}

		/* switches are implicitly defaulted */
		if (param.kind == subarg::Kind::enable || param.kind == subarg::Kind::disable)
			throw subarg::ConfigException{ L"Default values are not allowed for switch [", param.name, L"]." };
		if (!detail::CoerceDefault(param).has_value())
			throw subarg::ConfigException{ L"Default value of [", param.name, L"] cannot be converted to its type or is not a valid choice." };
	}
	inline void ValidateParameter(detail::ValidationState& state, const detail::Parameter& param) {
		if (param.name.empty())
			throw subarg::ConfigException{ L"Parameter name must not be empty." };
		std::wstring canonical = param.canonical();

		/* validate the positional/flag specific constraints */
		if (param.positional()) {
			if (param.kind == subarg::Kind::enable || param.kind == subarg::Kind::disable)
				throw subarg::ConfigException{ L"Positional [", param.name, L"] cannot be a switch." };
			if (!param.shorthand.empty())
				throw subarg::ConfigException{ L"Positional [", param.name, L"] cannot have a shorthand." };
		}
		else if (canonical.empty())
			throw subarg::ConfigException{ L"Flag [", param.name, L"] must have at least one character besides the marker." };

		/* validate the uniqueness of the name and shorthand */
		if (canonical == subarg::SubcommandKey)
			throw subarg::ConfigException{ L"Parameter [", param.name, L"] uses the reserved name [", subarg::SubcommandKey, L"]." };
		if (state.names.contains(canonical) || state.shorthands.contains(canonical))
			throw subarg::ConfigException{ L"Parameter [", param.name, L"] is defined multiple times." };
		state.names.insert(canonical);
		if (!param.shorthand.empty()) {
			std::wstring shorthand = subarg::Canonical(param.shorthand);
			if (shorthand.empty() || !param.shorthand.starts_with(L"-"))
				throw subarg::ConfigException{ L"Shorthand [", param.shorthand, L"] of [", param.name, L"] must consist of a marker and at least one character." };
			if (state.names.contains(shorthand) || state.shorthands.contains(shorthand))
				throw subarg::ConfigException{ L"Shorthand [", param.shorthand, L"] of [", param.name, L"] is already in use." };
			state.shorthands.insert(shorthand);
		}

		/* validate the choices and the type */
		for (const auto& choice : param.choices) {
			if (choice.empty())
				throw subarg::ConfigException{ L"Choices of [", param.name, L"] must not be empty." };
		}
		detail::ValidateType(param.type);
		detail::ValidateDefValue(param);
	}
	inline void ValidateGroup(detail::ValidationState& state, const detail::Group& group) {
		if (group.parameters.empty())
			throw subarg::ConfigException{ L"Group must contain at least one parameter." };
		for (const auto& param : group.parameters) {
			if ((group.exclusive || group.required) && param.positional())
				throw subarg::ConfigException{ L"Exclusive or required group cannot contain positional [", param.name, L"]." };
			detail::ValidateParameter(state, param);
		}
	}
	inline void ValidateCommand(detail::ValidationState& state, const detail::Command& command) {
		for (const auto& entry : command.entries) {
			if (std::holds_alternative<detail::Parameter>(entry))
				detail::ValidateParameter(state, std::get<detail::Parameter>(entry));
			else
				detail::ValidateGroup(state, std::get<detail::Group>(entry));
		}
		for (const auto& check : command.validators) {
			if (!check)
				throw subarg::ConfigException{ L"Validator must not be empty." };
		}
		for (const auto& process : command.postProcessors) {
			if (!process)
				throw subarg::ConfigException{ L"Post-processor must not be empty." };
		}
	}

	/* validate the root and every subcommand (each subcommand is validated against the names of the root) */
	inline void ValidateConfig(const detail::Config& config) {
		detail::ValidationState root;
		detail::ValidateCommand(root, config);

		std::set<std::wstring> commands;
		for (const auto& command : config.commands) {
			if (command.name.empty() || command.name.starts_with(L"-"))
				throw subarg::ConfigException{ L"Subcommand name [", command.name, L"] must not be empty or start with a marker." };
			if (commands.contains(command.name))
				throw subarg::ConfigException{ L"Subcommand [", command.name, L"] is defined multiple times." };
			commands.insert(command.name);

			detail::ValidationState state = root;
			detail::ValidateCommand(state, command);
		}
	}
}
