// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

/*
 * Escaping by inserting a backslash before each character selected
 * by a predicate.
 *
 * The predicate is called with the Unicode scalar value of each
 * (UTF-8 encoded) character.  It must be a pure function: for the
 * duration of one call, it must return the same result for the same
 * character and must not have side effects.  This is not checked.
 */

#pragma once

#include "text/UTF8Sequence.hxx"
#include "lp-escape/LineProtocol.hxx"

#include <algorithm>
#include <cassert>
#include <concepts>
#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>

#include <string.h>

/**
 * The number of bytes EscapeIf() allocates in addition to the input
 * length.  Most strings which need escaping at all contain only very
 * few reserved characters, and this avoids reallocating for them.
 * This only affects performance, never the result.
 */
static constexpr std::size_t BACKSLASH_ESCAPE_SLACK = 8;

/**
 * Find the first character which must be escaped.
 *
 * @return the byte offset of this character or
 * std::string_view::npos if the string can be used as-is
 */
constexpr std::size_t
FindEscapeIf(std::string_view src,
	     const std::predicate<char32_t> auto &need_escape) noexcept
{
	for (std::size_t i = 0; i < src.size();) {
		const auto ch = DecodeUTF8(src.substr(i));
		if (need_escape(ch.value))
			return i;

		i += ch.length;
	}

	return src.npos;
}

/**
 * Measure the exact number of bytes EscapeIf() will write for the
 * given string.
 */
constexpr std::size_t
EscapeSizeIf(std::string_view src,
	     const std::predicate<char32_t> auto &need_escape) noexcept
{
	std::size_t size = src.size();

	for (std::size_t i = 0; i < src.size();) {
		const auto ch = DecodeUTF8(src.substr(i));
		if (need_escape(ch.value))
			++size;

		i += ch.length;
	}

	return size;
}

/**
 * Escape a string whose first character is known to need escaping
 * (as reported by FindEscapeIf()).  That first character is not
 * passed to the predicate again.
 */
template<typename O>
constexpr O
EscapeTailIf(std::string_view tail, O out,
	     const std::predicate<char32_t> auto &need_escape)
{
	assert(!tail.empty());

	auto ch = DecodeUTF8(tail);
	*out++ = LpEscape::ESCAPE_MARKER;
	out = std::copy_n(tail.data(), ch.length, out);
	tail.remove_prefix(ch.length);

	while (!tail.empty()) {
		ch = DecodeUTF8(tail);
		if (need_escape(ch.value))
			*out++ = LpEscape::ESCAPE_MARKER;

		out = std::copy_n(tail.data(), ch.length, out);
		tail.remove_prefix(ch.length);
	}

	return out;
}

/**
 * Escape the given string into a caller-provided buffer which must
 * be at least EscapeSizeIf() bytes large.
 *
 * @return the number of bytes written to the buffer
 */
std::size_t
EscapeIf(std::string_view src, char *dest,
	 const std::predicate<char32_t> auto &need_escape) noexcept
{
	assert(dest != nullptr);

	const std::size_t begin = FindEscapeIf(src, need_escape);
	if (begin == src.npos) {
		std::copy(src.begin(), src.end(), dest);
		return src.size();
	}

	char *q = std::copy_n(src.data(), begin, dest);
	q = EscapeTailIf(src.substr(begin), q, need_escape);
	return q - dest;
}

/**
 * Escape the given string into a newly allocated one.
 *
 * If no character needs escaping, this costs one scan and one copy.
 * Otherwise, the clean prefix is copied in bulk and only the rest of
 * the string is examined character by character; each character is
 * passed to the predicate exactly once.
 */
std::string
EscapeIf(std::string_view src,
	 const std::predicate<char32_t> auto &need_escape)
{
	const std::size_t begin = FindEscapeIf(src, need_escape);
	if (begin == src.npos)
		return std::string{src};

	std::string dest;
	dest.reserve(src.size() + BACKSLASH_ESCAPE_SLACK);
	dest.append(src.substr(0, begin));
	EscapeTailIf(src.substr(begin), std::back_inserter(dest),
		     need_escape);
	return dest;
}

/**
 * Find the first escape marker which is followed by a character
 * selected by the predicate, i.e. the first escape sequence
 * UnescapeIf() would collapse.
 *
 * @return the byte offset of the marker or std::string_view::npos
 */
constexpr std::size_t
FindUnescapeIf(std::string_view src,
	       const std::predicate<char32_t> auto &need_escape) noexcept
{
	for (std::size_t i = src.find(LpEscape::ESCAPE_MARKER);
	     i != src.npos;
	     i = src.find(LpEscape::ESCAPE_MARKER, i + 1)) {
		if (i + 1 < src.size() &&
		    need_escape(DecodeUTF8(src.substr(i + 1)).value))
			return i;
	}

	return src.npos;
}

/**
 * Unescape a string which begins with an escape sequence (as
 * reported by FindUnescapeIf()).  The output may overlap with the
 * input as long as it does not start after it.
 */
template<typename O>
constexpr O
UnescapeTailIf(std::string_view tail, O out,
	       const std::predicate<char32_t> auto &need_escape)
{
	while (true) {
		const auto marker = tail.find(LpEscape::ESCAPE_MARKER);
		if (marker == tail.npos)
			break;

		out = std::copy(tail.begin(), tail.begin() + marker, out);
		tail.remove_prefix(marker + 1);

		if (!tail.empty()) {
			const auto ch = DecodeUTF8(tail);
			if (need_escape(ch.value)) {
				out = std::copy(tail.begin(),
						tail.begin() + ch.length, out);
				tail.remove_prefix(ch.length);
				continue;
			}
		}

		/* not an escape sequence: keep the marker */
		*out++ = LpEscape::ESCAPE_MARKER;
	}

	return std::copy(tail.begin(), tail.end(), out);
}

/**
 * Reverse EscapeIf(): each escape marker followed by a character
 * selected by the predicate is removed.  Other markers (including a
 * trailing one) are copied verbatim.
 *
 * The buffer must be at least as large as the input; it may be the
 * input buffer itself.
 *
 * @return the number of bytes written to the buffer
 */
std::size_t
UnescapeIf(std::string_view src, char *dest,
	   const std::predicate<char32_t> auto &need_escape) noexcept
{
	assert(dest != nullptr);

	const std::size_t begin = FindUnescapeIf(src, need_escape);
	if (begin == src.npos) {
		if (!src.empty() && src.data() != dest)
			memmove(dest, src.data(), src.size());
		return src.size();
	}

	if (begin > 0 && src.data() != dest)
		memmove(dest, src.data(), begin);

	char *q = UnescapeTailIf(src.substr(begin), dest + begin,
				 need_escape);
	return q - dest;
}

/**
 * Reverse EscapeIf() into a newly allocated string.
 */
std::string
UnescapeIf(std::string_view src,
	   const std::predicate<char32_t> auto &need_escape)
{
	const std::size_t begin = FindUnescapeIf(src, need_escape);
	if (begin == src.npos)
		return std::string{src};

	std::string dest;
	dest.reserve(src.size() - 1);
	dest.append(src.substr(0, begin));
	UnescapeTailIf(src.substr(begin), std::back_inserter(dest),
		       need_escape);
	return dest;
}
