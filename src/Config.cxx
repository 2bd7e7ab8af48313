// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Config.hxx"
#include "escape/Backslash.hxx"
#include "escape/Class.hxx"
#include "escape/Dup.hxx"
#include "escape/LineProtocol.hxx"

#include <fmt/format.h>

#include <exception>
#include <stdexcept>

#include <string.h>

using std::string_view_literals::operator""sv;

static bool
ParseBool(const char *s)
{
	if (strcmp(s, "yes") == 0)
		return true;
	else if (strcmp(s, "no") == 0)
		return false;
	else
		throw std::runtime_error("Failed to parse boolean value");
}

LpEscapeConfig::LpEscapeConfig() noexcept
	:cls(&line_protocol_key_escape_class)
{
}

void
LpEscapeConfig::SetClass(std::string_view name)
{
	const auto *c = FindLineProtocolEscapeClass(name);
	if (c == nullptr)
		throw std::runtime_error(fmt::format("Unknown escape class '{}'",
						     name));

	cls = c;
}

void
LpEscapeConfig::SetReserved(std::string_view chars)
{
	reserved = EscapeCharSet{chars};
}

void
LpEscapeConfig::HandleSet(std::string_view name, const char *value)
{
	if (name == "class"sv) {
		SetClass(value);
	} else if (name == "reserved"sv) {
		try {
			SetReserved(value);
		} catch (const std::invalid_argument &) {
			std::throw_with_nested(std::runtime_error("Invalid 'reserved' value"));
		}
	} else if (name == "unescape"sv) {
		unescape = ParseBool(value);
	} else if (name == "null_terminated"sv) {
		null_terminated = ParseBool(value);
	} else
		throw std::runtime_error("Unknown variable");
}

std::string
LpEscapeConfig::Apply(std::string_view src) const
{
	if (reserved) {
		const auto &set = *reserved;
		return unescape
			? UnescapeIf(src, set)
			: EscapeIf(src, set);
	}

	return unescape
		? unescape_dup(*cls, src)
		: escape_dup(*cls, src);
}
