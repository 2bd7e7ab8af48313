// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

/*
 * Definitions for escaping in the InfluxDB line protocol.
 */

#pragma once

namespace LpEscape {

/**
 * The character which is inserted before each reserved character.
 * It is never escaped by itself unless an escape class explicitly
 * selects it (string field values do).
 */
static constexpr char ESCAPE_MARKER = '\\';

/**
 * Characters which must be escaped in tag keys, tag values and field
 * keys.
 */
static constexpr char KEY_RESERVED[] = " ,=";

/**
 * Characters which must be escaped in measurement names.
 */
static constexpr char MEASUREMENT_RESERVED[] = " ,";

/**
 * Characters which must be escaped inside (double-quoted) string
 * field values.
 */
static constexpr char STRING_RESERVED[] = "\"\\";

} // namespace LpEscape
