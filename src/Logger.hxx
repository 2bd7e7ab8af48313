// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <fmt/format.h>

#include <exception>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

/**
 * Set the global verbosity.  Messages with a level above this are
 * discarded.  Level 1 is the default, 0 shows nothing.
 */
void
SetLogLevel(unsigned level) noexcept;

[[gnu::pure]]
bool
IsLogLevelVisible(unsigned level) noexcept;

/**
 * Write one message to stderr, prefixed with its domain.  Does not
 * check the log level.
 */
void
LogRaw(std::string_view domain, std::string_view msg);

/**
 * Obtain the message of the given exception and all nested
 * exceptions, separated by ": ".
 */
std::string
GetFullMessage(std::exception_ptr ep) noexcept;

/**
 * Print the full message of the given exception to stderr.
 */
void
PrintException(std::exception_ptr ep);

namespace LoggerDetail {

template<typename T>
inline void
AppendArg(std::string &buffer, const T &value)
{
	fmt::format_to(std::back_inserter(buffer), "{}", value);
}

inline void
AppendArg(std::string &buffer, std::string_view value)
{
	buffer.append(value);
}

inline void
AppendArg(std::string &buffer, const char *value)
{
	buffer.append(value);
}

} // namespace LoggerDetail

/**
 * Concatenate all arguments and log them if the level is visible.
 */
template<typename... Args>
void
LogConcat(unsigned level, std::string_view domain, const Args&... args)
{
	if (!IsLogLevelVisible(level))
		return;

	std::string msg;
	(LoggerDetail::AppendArg(msg, args), ...);
	LogRaw(domain, msg);
}

template<typename... Args>
void
LogFmt(unsigned level, std::string_view domain,
       fmt::format_string<Args...> format_str, Args&&... args)
{
	if (!IsLogLevelVisible(level))
		return;

	LogRaw(domain, fmt::format(format_str, std::forward<Args>(args)...));
}

/**
 * A logger for one domain (usually a subsystem or an object).
 */
class Logger {
	const std::string domain;

public:
	explicit Logger(std::string_view _domain)
		:domain(_domain) {}

	template<typename... Args>
	void operator()(unsigned level, const Args&... args) const {
		LogConcat(level, domain, args...);
	}

	template<typename... Args>
	void Fmt(unsigned level, fmt::format_string<Args...> format_str,
		 Args&&... args) const {
		LogFmt(level, domain, format_str, std::forward<Args>(args)...);
	}
};
