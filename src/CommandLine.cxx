// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "CommandLine.hxx"
#include "Config.hxx"
#include "Logger.hxx"
#include "version.h"

#include <exception>
#include <stdexcept>
#include <string_view>

#include <stdio.h>
#include <stdlib.h>
#include <stdarg.h>
#include <getopt.h>
#include <string.h>

static void
PrintUsage()
{
	puts("usage: lp-escape [options] [STRING...]\n\n"
	     "Escapes each STRING (or each line read from stdin) for the\n"
	     "InfluxDB line protocol.\n\n"
	     "valid options:\n"
	     " -h, --help             help (this text)\n"
	     " -V, --version          show lp-escape version\n"
	     " -v, --verbose          be more verbose\n"
	     " -q, --quiet            be quiet\n"
	     " -c, --class NAME       select the escape class:\n"
	     "                        key (default), measurement, string\n"
	     " -r, --reserved CHARS   escape exactly these characters\n"
	     " -u, --unescape         reverse the escaping\n"
	     " -0, --null             records on stdin are terminated by\n"
	     "                        a null byte instead of a newline\n"
	     " -s, --set NAME=VALUE   tweak a configuration variable:\n"
	     "                        class, reserved, unescape, null_terminated\n"
	     "\n"
	     );
}

static void arg_error(const char *argv0, const char *fmt, ...)
	__attribute__ ((noreturn))
	__attribute__((format(printf,2,3)));
static void arg_error(const char *argv0, const char *fmt, ...) {
	if (fmt != nullptr) {
		va_list ap;

		fputs(argv0, stderr);
		fputs(": ", stderr);

		va_start(ap, fmt);
		vfprintf(stderr, fmt, ap);
		va_end(ap);

		putc('\n', stderr);
	}

	fprintf(stderr, "Try '%s --help' for more information.\n",
		argv0);
	exit(1);
}

static void
HandleSet(LpEscapeConfig &config,
	  const char *argv0, const char *p)
{
	const char *eq;

	eq = strchr(p, '=');
	if (eq == nullptr)
		arg_error(argv0, "No '=' found in --set argument");

	if (eq == p)
		arg_error(argv0, "No name found in --set argument");

	const std::string_view name(p, eq - p);
	const char *const value = eq + 1;

	try {
		config.HandleSet(name, value);
	} catch (const std::runtime_error &) {
		arg_error(argv0, "Error while parsing \"--set %.*s\": %s",
			  (int)name.size(), name.data(),
			  GetFullMessage(std::current_exception()).c_str());
	}
}

/** read configuration options from the command line */
void
ParseCommandLine(LpEscapeCmdLine &cmdline, LpEscapeConfig &config,
		 int argc, char **argv)
{
	int ret;
#ifdef __GLIBC__
	static constexpr struct option long_options[] = {
		{"help", 0, nullptr, 'h'},
		{"version", 0, nullptr, 'V'},
		{"verbose", 0, nullptr, 'v'},
		{"quiet", 0, nullptr, 'q'},
		{"class", 1, nullptr, 'c'},
		{"reserved", 1, nullptr, 'r'},
		{"unescape", 0, nullptr, 'u'},
		{"null", 0, nullptr, '0'},
		{"set", 1, nullptr, 's'},
		{nullptr, 0, nullptr, 0}
	};
#endif
	unsigned verbose = 1;

	while (1) {
#ifdef __GLIBC__
		int option_index = 0;

		ret = getopt_long(argc, argv,
				  "hVvqc:r:u0s:",
				  long_options, &option_index);
#else
		ret = getopt(argc, argv,
			     "hVvqc:r:u0s:");
#endif
		if (ret == -1)
			break;

		switch (ret) {
		case 'h':
			PrintUsage();
			exit(0);

		case 'V':
			printf("lp-escape v%s\n", VERSION);
			exit(0);

		case 'v':
			++verbose;
			break;

		case 'q':
			verbose = 0;
			break;

		case 'c':
			try {
				config.SetClass(optarg);
			} catch (const std::runtime_error &e) {
				arg_error(argv[0], "%s", e.what());
			}
			break;

		case 'r':
			try {
				config.SetReserved(optarg);
			} catch (const std::invalid_argument &e) {
				arg_error(argv[0], "Invalid --reserved argument: %s",
					  e.what());
			}
			break;

		case 'u':
			config.unescape = true;
			break;

		case '0':
			config.null_terminated = true;
			break;

		case 's':
			HandleSet(config, argv[0], optarg);
			break;

		case '?':
			arg_error(argv[0], nullptr);

		default:
			exit(1);
		}
	}

	SetLogLevel(verbose);

	/* the remaining arguments are input strings; keep their order */

	auto i = cmdline.strings.before_begin();
	for (; optind < argc; ++optind)
		i = cmdline.strings.insert_after(i, argv[optind]);
}
