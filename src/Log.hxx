// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Leveled diagnostics on stderr.
 */

#pragma once

#include <fmt/core.h>

#include <string_view>
#include <utility>

/**
 * Messages with a level above this one are discarded.  0 disables
 * all output, 1 shows errors and warnings, 4 and up is debug output.
 */
void
SetLogLevel(unsigned level) noexcept;

[[gnu::pure]]
bool
IsLogLevelVisible(unsigned level) noexcept;

void
LogMessage(unsigned level, std::string_view domain,
	   std::string_view msg);

template<typename... Args>
void
LogFmt(unsigned level, std::string_view domain,
       fmt::format_string<Args...> format_str, Args&&... args)
{
	if (!IsLogLevelVisible(level))
		return;

	LogMessage(level, domain,
		   fmt::format(format_str, std::forward<Args>(args)...));
}
