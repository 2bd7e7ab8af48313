// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <forward_list>

struct LpEscapeConfig;

struct LpEscapeCmdLine {
	/**
	 * The non-option arguments, each one an input record.  If
	 * empty, records are read from stdin.
	 */
	std::forward_list<const char *> strings;
};

void
ParseCommandLine(LpEscapeCmdLine &cmdline, LpEscapeConfig &config,
		 int argc, char **argv);
