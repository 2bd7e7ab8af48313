// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Logger.hxx"

#include <stdio.h>

static unsigned log_level = 1;

void
SetLogLevel(unsigned level) noexcept
{
	log_level = level;
}

bool
IsLogLevelVisible(unsigned level) noexcept
{
	return level <= log_level;
}

void
LogRaw(std::string_view domain, std::string_view msg)
{
	if (domain.empty())
		fmt::print(stderr, "{}\n", msg);
	else
		fmt::print(stderr, "{}: {}\n", domain, msg);
}

static void
AppendFullMessage(std::string &buffer, std::exception_ptr ep) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		buffer += e.what();

		try {
			std::rethrow_if_nested(e);
		} catch (...) {
			buffer += ": ";
			AppendFullMessage(buffer, std::current_exception());
		}
	} catch (const char *msg) {
		buffer += msg;
	} catch (...) {
		buffer += "Unknown exception";
	}
}

std::string
GetFullMessage(std::exception_ptr ep) noexcept
{
	std::string result;
	AppendFullMessage(result, ep);
	return result;
}

void
PrintException(std::exception_ptr ep)
{
	LogRaw({}, GetFullMessage(ep));
}
