// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <string>
#include <string_view>

#include <stddef.h>
#include <stdio.h>

struct LpEscapeConfig;

/**
 * Reads records delimited by a terminator byte from a stdio stream.
 */
class RecordReader {
	FILE *const file;
	const int terminator;

	char *buffer = nullptr;
	size_t capacity = 0;

public:
	RecordReader(FILE *_file, char _terminator) noexcept
		:file(_file), terminator((unsigned char)_terminator) {}

	~RecordReader() noexcept;

	RecordReader(const RecordReader &) = delete;
	RecordReader &operator=(const RecordReader &) = delete;

	/**
	 * Read the next record.  The terminator is not included.  A
	 * last record which is not terminated is returned just like
	 * the others.
	 *
	 * Throws on I/O error.
	 *
	 * @return the record or a view with a nullptr data pointer at
	 * the end of the stream
	 */
	std::string_view Next();
};

struct RecordStats {
	unsigned records = 0, changed = 0;

	void Add(std::string_view src, std::string_view dest) noexcept {
		++records;
		if (dest != src)
			++changed;
	}
};

/**
 * Write one record followed by the terminator.
 *
 * Throws on I/O error.
 */
void
WriteRecord(FILE *file, std::string_view record, char terminator);

/**
 * Transform each record read from #in and write it to #out, always
 * followed by the terminator (even if the last input record lacked
 * one).  The terminator is a null byte if
 * LpEscapeConfig::null_terminated is set, a newline otherwise.
 *
 * Throws on I/O error.
 */
RecordStats
TransformRecords(const LpEscapeConfig &config, FILE *in, FILE *out);
