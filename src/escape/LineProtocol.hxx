// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <string>
#include <string_view>

struct escape_class;

/**
 * Escapes space, comma and equals sign.  For tag keys, tag values and
 * field keys.
 */
extern const struct escape_class line_protocol_key_escape_class;

/**
 * Escapes space and comma.  For measurement names.
 */
extern const struct escape_class line_protocol_measurement_escape_class;

/**
 * Escapes double quote and backslash.  For string field values (the
 * caller adds the surrounding quotes).
 */
extern const struct escape_class line_protocol_string_escape_class;

[[gnu::const]]
bool
IsLineProtocolKeyReserved(char32_t ch) noexcept;

[[gnu::const]]
bool
IsLineProtocolMeasurementReserved(char32_t ch) noexcept;

[[gnu::const]]
bool
IsLineProtocolStringReserved(char32_t ch) noexcept;

std::string
EscapeLineProtocolKey(std::string_view src);

std::string
EscapeLineProtocolMeasurement(std::string_view src);

std::string
EscapeLineProtocolString(std::string_view src);

std::string
UnescapeLineProtocolKey(std::string_view src);

/**
 * Look up one of the escape classes above by its name ("key",
 * "measurement" or "string").
 *
 * @return the class or nullptr if the name is unknown
 */
[[gnu::pure]]
const struct escape_class *
FindLineProtocolEscapeClass(std::string_view name) noexcept;
