#pragma once

#include "ingest/Record.h"
#include "ingest/SchemaRegistry.h"

#include <anemo/core/Result.hpp>

#include <cstdint>
#include <cstdio>
#include <string>

namespace io {

enum class HeaderMode : uint8_t {
	// Header written once from the schema at the first row. Rows written
	// after the schema grows are wider than the header.
	Compatible = 0,
	// Whenever the schema has grown, the file is rewritten with the current
	// header and every earlier row padded to the same width.
	Strict = 1,
};

/** Data log writer. Each row holds one field per column of the registry's
 * current schema, missing values left empty. */
class RecordWriter {
public:
	RecordWriter(std::string path, const ingest::SchemaRegistry &schema,
				 HeaderMode mode = HeaderMode::Compatible);
	~RecordWriter();

	RecordWriter(const RecordWriter &) = delete;
	RecordWriter &operator=(const RecordWriter &) = delete;

	anemo::Result open();
	anemo::Result write(const ingest::Record &r);
	void close();

	bool isOpen() const { return fp_ != nullptr; }
	bool headerWritten() const { return header_written_; }
	uint64_t rowsWritten() const { return rows_; }
	uint32_t headerRewrites() const { return header_rewrites_; }
	const std::string &path() const { return path_; }

private:
	anemo::Result writeLine_(const std::string &line);
	anemo::Result rewriteHeader_();
	std::string headerLine_() const;

	std::string path_;
	const ingest::SchemaRegistry &schema_;
	HeaderMode mode_;
	FILE *fp_ = nullptr;
	bool header_written_ = false;
	size_t header_width_ = 0;
	uint64_t rows_ = 0;
	uint32_t header_rewrites_ = 0;
};

} // namespace io
