// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "CommandLine.hxx"
#include "Config.hxx"
#include "Logger.hxx"
#include "Records.hxx"
#include "escape/Class.hxx"

#include <fmt/core.h>

#include <stdexcept>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <errno.h>

static RecordStats
RunStrings(const LpEscapeConfig &config, const LpEscapeCmdLine &cmdline)
{
	RecordStats stats;

	for (const char *s : cmdline.strings) {
		const auto result = config.Apply(s);
		stats.Add(s, result);
		WriteRecord(stdout, result, '\n');
	}

	return stats;
}

int
main(int argc, char **argv)
try {
	LpEscapeConfig config;
	LpEscapeCmdLine cmdline;

	ParseCommandLine(cmdline, config, argc, argv);

	const Logger logger("lp-escape");

	if (config.reserved)
		logger(4, "escaping custom set '",
		       config.reserved->ToString(), "'");
	else
		logger(4, "escape class '", config.cls->name, "'");

	const RecordStats stats = cmdline.strings.empty()
		? TransformRecords(config, stdin, stdout)
		: RunStrings(config, cmdline);

	if (fflush(stdout) != 0)
		throw std::runtime_error(fmt::format("Failed to write: {}",
						     strerror(errno)));

	logger.Fmt(3, "{} records, {} {}",
		   stats.records, stats.changed,
		   config.unescape ? "unescaped" : "escaped");

	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
