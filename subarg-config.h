/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include "subarg-common.h"
#include "subarg-value.h"

namespace subarg {
	struct Config;

	namespace detail {
		struct Configurator {};

		struct Program {
			std::wstring program;
		};
		struct Description {
			std::wstring description;
		};
		struct Pipeline {
			std::vector<subarg::Check> validators;
			std::vector<subarg::Process> postProcessors;
		};
		struct HandlerEntry {
			subarg::Callback handler;
		};
		struct Exclusion {
			bool exclusive = false;
			bool required = false;
		};

		struct Parameter :
			public detail::Description {
			std::optional<subarg::Value> defValue;
			std::vector<std::wstring> choices;
			std::wstring name;
			std::wstring shorthand;
			std::wstring displayName;
			subarg::Type type = subarg::Primitive::any;
			subarg::Kind kind = subarg::Kind::value;
			Parameter(std::wstring name) : name{ name } {}

			/* parameters without a leading marker are positionals */
			bool positional() const {
				return !name.starts_with(L"-");
			}
			std::wstring canonical() const {
				return subarg::Canonical(name);
			}
			const std::wstring& display() const {
				return (displayName.empty() ? name : displayName);
			}
		};
		struct ParameterList {
			std::vector<detail::Parameter> parameters;
		};

		struct Group :
			public detail::ParameterList,
			public detail::Description,
			public detail::Pipeline,
			public detail::Exclusion {
		};

		using Entry = std::variant<detail::Parameter, detail::Group>;
		struct EntryList {
			std::vector<detail::Entry> entries;
		};

		struct Command :
			public detail::EntryList,
			public detail::Description,
			public detail::Pipeline,
			public detail::HandlerEntry {
			std::wstring name;
			Command(std::wstring name) : name{ name } {}
		};
		struct CommandList {
			std::vector<detail::Command> commands;
		};

		struct Config :
			public detail::Command,
			public detail::CommandList,
			public detail::Program {
			Config() : detail::Command{ L"" } {}

			const detail::Command* find(const std::wstring& name) const {
				for (const auto& command : commands) {
					if (command.name == name)
						return &command;
				}
				return nullptr;
			}
		};

		struct ConfigBurner {
			template <class Base>
			static constexpr void Apply(Base& base) {}
			template <class Base, class Config, class... Configs>
			static constexpr void Apply(Base& base, const Config& config, const Configs&... configs) {
				config.burnConfig(base);
				detail::ConfigBurner::Apply<Base, Configs...>(base, configs...);
			}

			template <class Base, class Config>
			static decltype(std::declval<Config>().burnConfig(std::declval<Base&>()), std::true_type{}) CanBurn(int) { return {}; }
			template <class, class>
			static std::false_type CanBurn(...) { return {}; }

			static const detail::Config& GetBurned(const subarg::Config& config);
		};
	}

	template <class Type, class Base>
	concept IsConfig = std::is_base_of_v<detail::Configurator, Type>&& decltype(detail::ConfigBurner::CanBurn<Base, Type>(0))::value;

	/* general subarg-configuration to be parsed (describes the root command and all subcommands) */
	struct Config {
		friend struct detail::ConfigBurner;
	private:
		detail::Config pConfig;

	public:
		Config(const subarg::IsConfig<detail::Config> auto&... configs) {
			detail::ConfigBurner::Apply(pConfig, configs...);
		}
		subarg::Config& add(const subarg::IsConfig<detail::Config> auto&... configs) {
			detail::ConfigBurner::Apply(pConfig, configs...);
			return *this;
		}
	};

	/* parameter of a command or group (names with a leading hyphen are flags, all others are positionals)
	*	Note: positionals are consumed in the order of declaration
	*	Note: the key in the parsed argument-map is the name without the leading hyphens */
	struct Parameter : public detail::Configurator {
		friend struct detail::ConfigBurner;
	public:
		detail::Parameter pParameter;

	public:
		Parameter(std::wstring name, const subarg::IsConfig<detail::Parameter> auto&... configs) : pParameter{ name } {
			detail::ConfigBurner::Apply(pParameter, configs...);
		}
		Parameter(std::wstring name, std::wstring desc, const subarg::IsConfig<detail::Parameter> auto&... configs) : pParameter{ name } {
			pParameter.description = desc;
			detail::ConfigBurner::Apply(pParameter, configs...);
		}
		subarg::Parameter& add(const subarg::IsConfig<detail::Parameter> auto&... configs) {
			detail::ConfigBurner::Apply(pParameter, configs...);
			return *this;
		}

	private:
		void burnConfig(detail::EntryList& base) const {
			base.entries.emplace_back(pParameter);
		}
		void burnConfig(detail::ParameterList& base) const {
			base.parameters.push_back(pParameter);
		}
	};

	/* logical group of parameters (optionally mutually exclusive and/or required)
	*	Note: validators and post-processors of the group are appended to the owning command */
	struct Group : public detail::Configurator {
		friend struct detail::ConfigBurner;
	public:
		detail::Group pGroup;

	public:
		Group(const subarg::IsConfig<detail::Group> auto&... configs) {
			detail::ConfigBurner::Apply(pGroup, configs...);
		}
		subarg::Group& add(const subarg::IsConfig<detail::Group> auto&... configs) {
			detail::ConfigBurner::Apply(pGroup, configs...);
			return *this;
		}

	private:
		void burnConfig(detail::Command& base) const {
			base.entries.emplace_back(pGroup);
			base.validators.insert(base.validators.end(), pGroup.validators.begin(), pGroup.validators.end());
			base.postProcessors.insert(base.postProcessors.end(), pGroup.postProcessors.begin(), pGroup.postProcessors.end());
		}
	};

	/* subcommand of the configuration, which is selected by its name (at most one subcommand can be selected per parse) */
	struct Command : public detail::Configurator {
		friend struct detail::ConfigBurner;
	public:
		detail::Command pCommand;

	public:
		Command(std::wstring name, const subarg::IsConfig<detail::Command> auto&... configs) : pCommand{ name } {
			detail::ConfigBurner::Apply(pCommand, configs...);
		}
		subarg::Command& add(const subarg::IsConfig<detail::Command> auto&... configs) {
			detail::ConfigBurner::Apply(pCommand, configs...);
			return *this;
		}

	private:
		void burnConfig(detail::CommandList& base) const {
			base.commands.push_back(pCommand);
		}
	};

	/* program name used for the help and log output */
	struct Program : public detail::Configurator {
		friend struct detail::ConfigBurner;
	private:
		std::wstring pProgram;

	public:
		Program(std::wstring program) : pProgram{ program } {}

	private:
		void burnConfig(detail::Program& base) const {
			base.program = pProgram;
		}
	};

	/* description of the corresponding object */
	struct Description : public detail::Configurator {
		friend struct detail::ConfigBurner;
	private:
		std::wstring pDescription;

	public:
		Description(std::wstring desc) : pDescription{ desc } {}

	private:
		void burnConfig(detail::Description& base) const {
			base.description = pDescription;
		}
	};

	/* shorthand alias of a flag (for example -u for -unit) */
	struct Shorthand : public detail::Configurator {
		friend struct detail::ConfigBurner;
	private:
		std::wstring pShorthand;

	public:
		Shorthand(std::wstring shorthand) : pShorthand{ shorthand } {}

	private:
		void burnConfig(detail::Parameter& base) const {
			base.shorthand = pShorthand;
		}
	};

	/* name used for the parameter in the help menu */
	struct DisplayName : public detail::Configurator {
		friend struct detail::ConfigBurner;
	private:
		std::wstring pName;

	public:
		DisplayName(std::wstring name) : pName{ name } {}

	private:
		void burnConfig(detail::Parameter& base) const {
			base.displayName = pName;
		}
	};

	/* kind of the parameter (defaults to a single value) */
	struct Mode : public detail::Configurator {
		friend struct detail::ConfigBurner;
	private:
		subarg::Kind pKind = subarg::Kind::value;

	public:
		constexpr Mode(subarg::Kind kind) : pKind{ kind } {}

	private:
		constexpr void burnConfig(detail::Parameter& base) const {
			base.kind = pKind;
		}
	};

	/* restrict the raw values of the parameter to the given set of strings */
	struct Choices : public detail::Configurator {
		friend struct detail::ConfigBurner;
	private:
		std::vector<std::wstring> pChoices;

	public:
		Choices(std::initializer_list<std::wstring> choices) : pChoices{ choices } {}

	private:
		void burnConfig(detail::Parameter& base) const {
			base.choices.insert(base.choices.end(), pChoices.begin(), pChoices.end());
		}
	};

	/* type to convert the raw values of the parameter to (defaults to strings) */
	struct ValueType : public detail::Configurator {
		friend struct detail::ConfigBurner;
	private:
		subarg::Type pType;

	public:
		ValueType(subarg::Primitive type) : pType{ type } {}
		ValueType(subarg::Decoder decoder) : pType{ decoder } {}

	private:
		void burnConfig(detail::Parameter& base) const {
			base.type = pType;
		}
	};

	/* default value of the parameter, which is used if it is not supplied
	*	Note: string defaults are converted by the value-type, typed defaults are used as-is */
	struct Default : public detail::Configurator {
		friend struct detail::ConfigBurner;
	private:
		subarg::Value pDefValue;

	public:
		Default(subarg::Value defValue) : pDefValue{ defValue } {}

	private:
		void burnConfig(detail::Parameter& base) const {
			base.defValue = pDefValue;
		}
	};

	/* mark a group as mutually exclusive (at most one member may be supplied) */
	struct Exclusive : public detail::Configurator {
		friend struct detail::ConfigBurner;
	private:
		bool pExclusive = true;

	public:
		constexpr Exclusive(bool exclusive = true) : pExclusive{ exclusive } {}

	private:
		constexpr void burnConfig(detail::Exclusion& base) const {
			base.exclusive = pExclusive;
		}
	};

	/* mark a group as required (at least one member must be supplied) */
	struct Required : public detail::Configurator {
		friend struct detail::ConfigBurner;
	private:
		bool pRequired = true;

	public:
		constexpr Required(bool required = true) : pRequired{ required } {}

	private:
		constexpr void burnConfig(detail::Exclusion& base) const {
			base.required = pRequired;
		}
	};

	/* add a validator to be executed if the corresponding command is selected (returning false stops the processing)
	*	Note: the validator is responsible for logging the reason of the failure */
	struct Validator : public detail::Configurator {
		friend struct detail::ConfigBurner;
	private:
		subarg::Check pCheck;

	public:
		Validator(subarg::Check check) : pCheck{ check } {}

	private:
		void burnConfig(detail::Pipeline& base) const {
			base.validators.push_back(pCheck);
		}
	};

	/* add a post-processor to be executed if the corresponding command is selected (runs before the validators) */
	struct PostProcessor : public detail::Configurator {
		friend struct detail::ConfigBurner;
	private:
		subarg::Process pProcess;

	public:
		PostProcessor(subarg::Process process) : pProcess{ process } {}

	private:
		void burnConfig(detail::Pipeline& base) const {
			base.postProcessors.push_back(pProcess);
		}
	};

	/* handler to be invoked with the final arguments, if the corresponding command is selected */
	struct Handler : public detail::Configurator {
		friend struct detail::ConfigBurner;
	private:
		subarg::Callback pHandler;

	public:
		Handler(subarg::Callback handler) : pHandler{ handler } {}

	private:
		void burnConfig(detail::HandlerEntry& base) const {
			base.handler = pHandler;
		}
	};

	inline const detail::Config& detail::ConfigBurner::GetBurned(const subarg::Config& config) {
		return config.pConfig;
	}
}
