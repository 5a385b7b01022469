/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include "subarg-common.h"

#include <ostream>

namespace subarg {
	/* logging levels in ascending severity (quiet is only used as threshold to silence all output) */
	enum class Level : int8_t {
		debug = -2,
		verbose = -1,
		info = 0,
		warn = 1,
		error = 2,
		quiet = 3
	};

	struct LogFlags {
		std::wstring name;
		subarg::Level verbosity = subarg::Level::info;
		bool useTermColors = true;
	};

	namespace detail {
		static constexpr const wchar_t* TermGreen = L"\x1b[32m";
		static constexpr const wchar_t* TermYellow = L"\x1b[33m";
		static constexpr const wchar_t* TermRed = L"\x1b[31m";
		static constexpr const wchar_t* TermDefault = L"\x1b[39m";
	}

	/* explicit logging context, which is handed to all validators and post-processors
	*	Note: post-processors may reconfigure it, which affects all subsequent callbacks */
	class Logger {
	private:
		subarg::LogFlags pFlags;
		std::wostream* pStream = nullptr;

	public:
		Logger(std::wostream& stream, subarg::LogFlags flags = {}) : pFlags{ flags }, pStream{ &stream } {}

	private:
		void fWrite(subarg::Level level, const std::wstring& text) const {
			if (!enabled(level))
				return;

			/* select the color and the severity prefix */
			const wchar_t* color = nullptr;
			const wchar_t* prefix = nullptr;
			if (level == subarg::Level::debug)
				color = detail::TermGreen;
			else if (level == subarg::Level::warn) {
				color = detail::TermYellow;
				prefix = L"warning: ";
			}
			else if (level == subarg::Level::error) {
				color = detail::TermRed;
				prefix = L"error: ";
			}

			std::wstring line;
			if (pFlags.useTermColors && color != nullptr)
				line.append(color);
			if (prefix != nullptr) {
				if (!pFlags.name.empty())
					line.append(pFlags.name).append(L": ");
				line.append(prefix);
			}
			line.append(text);
			if (pFlags.useTermColors && color != nullptr)
				line.append(detail::TermDefault);
			line.push_back(L'\n');

			(*pStream) << line;
			pStream->flush();
		}

	public:
		bool enabled(subarg::Level level) const {
			return (level != subarg::Level::quiet && level >= pFlags.verbosity);
		}
		const subarg::LogFlags& flags() const {
			return pFlags;
		}
		void verbosity(subarg::Level level) {
			pFlags.verbosity = level;
		}

	public:
		void debug(const auto&... args) const {
			fWrite(subarg::Level::debug, str::wd::Build(args...));
		}
		void verbose(const auto&... args) const {
			fWrite(subarg::Level::verbose, str::wd::Build(args...));
		}
		void info(const auto&... args) const {
			fWrite(subarg::Level::info, str::wd::Build(args...));
		}
		void warn(const auto&... args) const {
			fWrite(subarg::Level::warn, str::wd::Build(args...));
		}
		void error(const auto&... args) const {
			fWrite(subarg::Level::error, str::wd::Build(args...));
		}
	};
}
