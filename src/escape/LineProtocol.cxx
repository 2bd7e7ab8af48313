// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "LineProtocol.hxx"
#include "Class.hxx"
#include "lp-escape/LineProtocol.hxx"

[[gnu::const]]
static constexpr bool
IsReservedIn(std::string_view reserved, char32_t ch) noexcept
{
	/* all reserved characters are ASCII */
	return ch < 0x80 && reserved.find(static_cast<char>(ch)) != reserved.npos;
}

bool
IsLineProtocolKeyReserved(char32_t ch) noexcept
{
	return IsReservedIn(LpEscape::KEY_RESERVED, ch);
}

bool
IsLineProtocolMeasurementReserved(char32_t ch) noexcept
{
	return IsReservedIn(LpEscape::MEASUREMENT_RESERVED, ch);
}

bool
IsLineProtocolStringReserved(char32_t ch) noexcept
{
	return IsReservedIn(LpEscape::STRING_RESERVED, ch);
}

const struct escape_class line_protocol_key_escape_class = {
	"key",
	IsLineProtocolKeyReserved,
};

const struct escape_class line_protocol_measurement_escape_class = {
	"measurement",
	IsLineProtocolMeasurementReserved,
};

const struct escape_class line_protocol_string_escape_class = {
	"string",
	IsLineProtocolStringReserved,
};

static constexpr const struct escape_class *line_protocol_escape_classes[] = {
	&line_protocol_key_escape_class,
	&line_protocol_measurement_escape_class,
	&line_protocol_string_escape_class,
};

std::string
EscapeLineProtocolKey(std::string_view src)
{
	return EscapeIf(src, IsLineProtocolKeyReserved);
}

std::string
EscapeLineProtocolMeasurement(std::string_view src)
{
	return EscapeIf(src, IsLineProtocolMeasurementReserved);
}

std::string
EscapeLineProtocolString(std::string_view src)
{
	return EscapeIf(src, IsLineProtocolStringReserved);
}

std::string
UnescapeLineProtocolKey(std::string_view src)
{
	return UnescapeIf(src, IsLineProtocolKeyReserved);
}

const struct escape_class *
FindLineProtocolEscapeClass(std::string_view name) noexcept
{
	for (const auto *cls : line_protocol_escape_classes)
		if (name == cls->name)
			return cls;

	return nullptr;
}
