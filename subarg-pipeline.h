/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include "subarg-argmap.h"
#include "subarg-config.h"
#include "subarg-logger.h"

namespace subarg {
	/* executes the post-processors and validators of the root and the selected subcommand */
	class Pipeline {
	private:
		subarg::Logger& pLogger;

	public:
		Pipeline(subarg::Logger& logger) : pLogger{ logger } {}

	private:
		bool fRun(const detail::Command& command, subarg::ArgMap& args) {
			const std::wstring& name = (command.name.empty() ? L"root" : command.name);

			/* post-processors are trusted to not fail */
			pLogger.debug(L"Running ", command.postProcessors.size(), L" post-processors of [", name, L"]");
			for (const auto& fn : command.postProcessors)
				fn(args, pLogger);

			/* stop at the first failed validation (validator is responsible for reporting the reason) */
			pLogger.debug(L"Running ", command.validators.size(), L" validators of [", name, L"]");
			for (const auto& fn : command.validators) {
				if (!fn(args, pLogger))
					return false;
			}
			return true;
		}

	public:
		bool run(const detail::Command& root, const detail::Command* subcommand, subarg::ArgMap& args) {
			if (!fRun(root, args))
				return false;
			return (subcommand == nullptr || fRun(*subcommand, args));
		}
	};
}
