// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Dup.hxx"
#include "Class.hxx"

#include <assert.h>

std::string
escape_dup(const struct escape_class &cls, std::string_view p)
{
	assert(cls.need_escape != nullptr);

	return EscapeIf(p, cls.need_escape);
}

std::string
unescape_dup(const struct escape_class &cls, std::string_view src)
{
	assert(cls.need_escape != nullptr);

	return UnescapeIf(src, cls.need_escape);
}
