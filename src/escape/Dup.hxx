// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <string>
#include <string_view>

struct escape_class;

/**
 * Escape the given string into a newly allocated one.  If nothing
 * needs to be escaped, the result is a plain copy.
 */
std::string
escape_dup(const struct escape_class &cls, std::string_view p);

/**
 * Like escape_dup(), but reverse the escaping.
 */
std::string
unescape_dup(const struct escape_class &cls, std::string_view src);
