// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <cassert>
#include <cstddef>
#include <string_view>

static constexpr char32_t UNICODE_REPLACEMENT_CHARACTER = 0xfffd;

/**
 * One character decoded from a UTF-8 string.
 */
struct UTF8Char {
	/**
	 * The Unicode scalar value.  This is
	 * #UNICODE_REPLACEMENT_CHARACTER if the byte sequence was
	 * malformed.
	 */
	char32_t value;

	/**
	 * The number of bytes occupied by this character (1 to 4).
	 */
	std::size_t length;
};

[[gnu::const]]
constexpr bool
IsContinuationUTF8(char ch) noexcept
{
	return (static_cast<unsigned char>(ch) & 0xc0) == 0x80;
}

/**
 * Decode the character at the beginning of the given non-empty
 * string.
 *
 * A byte which does not start a well-formed sequence (a stray
 * continuation byte, an overlong form, a surrogate, a value beyond
 * U+10FFFF or a truncated sequence) is returned as a one-byte
 * character with the value #UNICODE_REPLACEMENT_CHARACTER, so the
 * caller always makes progress and never splits a valid character.
 */
[[gnu::pure]]
constexpr UTF8Char
DecodeUTF8(std::string_view s) noexcept
{
	assert(!s.empty());

	const unsigned char lead = s.front();
	if (lead < 0x80) [[likely]]
		return {lead, 1};

	std::size_t length;
	char32_t value, min;
	if ((lead & 0xe0) == 0xc0) {
		length = 2;
		value = lead & 0x1f;
		min = 0x80;
	} else if ((lead & 0xf0) == 0xe0) {
		length = 3;
		value = lead & 0x0f;
		min = 0x800;
	} else if ((lead & 0xf8) == 0xf0) {
		length = 4;
		value = lead & 0x07;
		min = 0x10000;
	} else
		return {UNICODE_REPLACEMENT_CHARACTER, 1};

	if (s.size() < length)
		return {UNICODE_REPLACEMENT_CHARACTER, 1};

	for (std::size_t i = 1; i < length; ++i) {
		if (!IsContinuationUTF8(s[i]))
			return {UNICODE_REPLACEMENT_CHARACTER, 1};

		value = (value << 6) | (static_cast<unsigned char>(s[i]) & 0x3f);
	}

	if (value < min || value > 0x10ffff ||
	    (value >= 0xd800 && value <= 0xdfff))
		return {UNICODE_REPLACEMENT_CHARACTER, 1};

	return {value, length};
}
