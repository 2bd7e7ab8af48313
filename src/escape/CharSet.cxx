// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "CharSet.hxx"
#include "text/UTF8Sequence.hxx"
#include "lp-escape/LineProtocol.hxx"

#include <algorithm>
#include <stdexcept>

EscapeCharSet::EscapeCharSet(std::string_view _chars)
	:chars(_chars)
{
	if (_chars.empty())
		throw std::invalid_argument("Empty character set");

	while (!_chars.empty()) {
		const auto ch = DecodeUTF8(_chars);
		if (ch.value == UNICODE_REPLACEMENT_CHARACTER && ch.length == 1)
			throw std::invalid_argument("Malformed UTF-8 in character set");

		if (ch.value == static_cast<char32_t>(LpEscape::ESCAPE_MARKER))
			throw std::invalid_argument("The escape marker cannot be escaped");

		if (ch.value < 0x80)
			ascii.set(ch.value);
		else
			other.push_back(ch.value);

		_chars.remove_prefix(ch.length);
	}

	std::sort(other.begin(), other.end());
	other.erase(std::unique(other.begin(), other.end()), other.end());
}

bool
EscapeCharSet::Contains(char32_t ch) const noexcept
{
	return std::binary_search(other.begin(), other.end(), ch);
}
