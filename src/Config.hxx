// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "escape/CharSet.hxx"

#include <optional>
#include <string>
#include <string_view>

struct escape_class;

/**
 * Configuration of the lp-escape program.
 */
struct LpEscapeConfig {
	/**
	 * Selects the characters to be escaped unless #reserved is
	 * set.
	 */
	const struct escape_class *cls;

	/**
	 * A custom set of characters to be escaped; overrides #cls.
	 */
	std::optional<EscapeCharSet> reserved;

	bool unescape = false;

	/**
	 * Are input records terminated by a null byte instead of a
	 * newline?
	 */
	bool null_terminated = false;

	LpEscapeConfig() noexcept;

	/**
	 * Apply a "NAME=VALUE" setting.
	 *
	 * Throws std::runtime_error on error.
	 */
	void HandleSet(std::string_view name, const char *value);

	/**
	 * Throws std::runtime_error if the name is unknown.
	 */
	void SetClass(std::string_view name);

	/**
	 * Throws std::invalid_argument if the character set is
	 * invalid.
	 */
	void SetReserved(std::string_view chars);

	/**
	 * Escape (or unescape) one input record according to this
	 * configuration.
	 */
	std::string Apply(std::string_view src) const;
};
