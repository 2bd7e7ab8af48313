// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Backslash.hxx"

#include <string_view>

#include <assert.h>
#include <stddef.h>

/**
 * Describes which characters are escaped with a backslash.  Instances
 * are immutable and can be selected at runtime.
 */
struct escape_class {
	/**
	 * A short identifier which allows selecting this class by name.
	 */
	const char *name;

	/**
	 * Does the given character need to be escaped?  This must be
	 * a pure function.
	 */
	bool (*need_escape)(char32_t ch) noexcept;
};

/**
 * Find the first character that must be unescaped.  Returns nullptr
 * when the string can be used as-is without unescaping.
 */
[[gnu::pure]]
static inline const char *
unescape_find(const struct escape_class *cls, std::string_view p) noexcept
{
	assert(cls != nullptr);
	assert(cls->need_escape != nullptr);

	const auto i = FindUnescapeIf(p, cls->need_escape);
	return i != p.npos
		? p.data() + i
		: nullptr;
}

/**
 * Unescape the given string into the output buffer, which must be
 * at least as large as the input.  Returns the number of characters
 * in the output buffer.
 */
static inline size_t
unescape_buffer(const struct escape_class *cls,
		std::string_view p, char *q) noexcept
{
	assert(cls != nullptr);
	assert(cls->need_escape != nullptr);
	assert(q != nullptr);

	size_t length2 = UnescapeIf(p, q, cls->need_escape);
	assert(length2 <= p.size());

	return length2;
}

static inline size_t
unescape_inplace(const struct escape_class *cls,
		 char *p, size_t length) noexcept
{
	assert(cls != nullptr);
	assert(cls->need_escape != nullptr);

	size_t length2 = UnescapeIf({p, length}, p, cls->need_escape);
	assert(length2 <= length);

	return length2;
}

/**
 * Find the first character that must be escaped.  Returns nullptr
 * when there are no such characters.
 */
[[gnu::pure]]
static inline const char *
escape_find(const struct escape_class *cls, std::string_view p) noexcept
{
	assert(cls != nullptr);
	assert(cls->need_escape != nullptr);

	const auto i = FindEscapeIf(p, cls->need_escape);
	return i != p.npos
		? p.data() + i
		: nullptr;
}

/**
 * Measure the minimum buffer size for escaping the given string.
 * Returns 0 when no escaping is needed.
 */
[[gnu::pure]]
static inline size_t
escape_size(const struct escape_class *cls, std::string_view p) noexcept
{
	assert(cls != nullptr);
	assert(cls->need_escape != nullptr);

	const auto i = FindEscapeIf(p, cls->need_escape);
	if (i == p.npos)
		return 0;

	return i + EscapeSizeIf(p.substr(i), cls->need_escape);
}

/**
 * Escape the given string into the output buffer, which must be at
 * least escape_size() (or the input length if that returned 0)
 * bytes large.  Returns the number of characters in the output
 * buffer.
 */
static inline size_t
escape_buffer(const struct escape_class *cls, std::string_view p, char *q) noexcept
{
	assert(cls != nullptr);
	assert(cls->need_escape != nullptr);
	assert(q != nullptr);

	size_t length2 = EscapeIf(p, q, cls->need_escape);
	assert(length2 >= p.size());

	return length2;
}
