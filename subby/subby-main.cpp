/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#include "subby-commands.h"

#include <iostream>

int main(int argc, char** argv) {
	subarg::Logger logger{ std::wcout, subarg::LogFlags{ .name = subby::ProgramName } };
	subarg::Config config = subby::MakeConfig();

	try {
		std::optional<subarg::ArgMap> args = subarg::Parse(argc, argv, config, logger);

		/* validators have already reported the failure */
		if (!args.has_value())
			return 1;

		if (!subarg::Invoke(*args, config, logger)) {
			logger.error(L"No command given");
			std::wcerr << subarg::HelpHint(config) << std::endl;
			return 1;
		}
	}
	catch (const subarg::PrintMessage& e) {
		std::wcout << e.what() << std::endl;
	}
	catch (const subarg::ParsingException& e) {
		logger.error(e.what());
		std::wcerr << subarg::HelpHint(config) << std::endl;
		return 1;
	}
	catch (const subarg::ConfigException& e) {
		std::wcerr << L"Malformed configuration: " << e.what() << std::endl;
		return 1;
	}
	return 0;
}
