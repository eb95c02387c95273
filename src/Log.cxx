// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Log.hxx"

#include <atomic>

#include <stdio.h>

static std::atomic_uint log_level{1};

void
SetLogLevel(unsigned level) noexcept
{
	log_level.store(level, std::memory_order_relaxed);
}

bool
IsLogLevelVisible(unsigned level) noexcept
{
	return level <= log_level.load(std::memory_order_relaxed);
}

void
LogMessage(unsigned level, std::string_view domain,
	   std::string_view msg)
{
	if (!IsLogLevelVisible(level))
		return;

	fmt::print(stderr, "{}: {}\n", domain, msg);
}
