// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Records.hxx"
#include "Config.hxx"

#include <fmt/format.h>

#include <stdexcept>

#include <stdlib.h>
#include <string.h>
#include <errno.h>

RecordReader::~RecordReader() noexcept
{
	free(buffer);
}

std::string_view
RecordReader::Next()
{
	const ssize_t nbytes = getdelim(&buffer, &capacity, terminator, file);
	if (nbytes < 0) {
		if (ferror(file))
			throw std::runtime_error(fmt::format("Failed to read: {}",
							     strerror(errno)));
		return {};
	}

	std::string_view record{buffer, size_t(nbytes)};
	if (!record.empty() && record.back() == char(terminator))
		record.remove_suffix(1);
	return record;
}

void
WriteRecord(FILE *file, std::string_view record, char terminator)
{
	if (fwrite(record.data(), 1, record.size(), file) != record.size() ||
	    putc(terminator, file) == EOF)
		throw std::runtime_error(fmt::format("Failed to write: {}",
						     strerror(errno)));
}

RecordStats
TransformRecords(const LpEscapeConfig &config, FILE *in, FILE *out)
{
	const char terminator = config.null_terminated ? '\0' : '\n';

	RecordStats stats;
	RecordReader reader(in, terminator);

	while (true) {
		const auto record = reader.Next();
		if (record.data() == nullptr)
			break;

		const auto result = config.Apply(record);
		stats.Add(record, result);
		WriteRecord(out, result, terminator);
	}

	return stats;
}
