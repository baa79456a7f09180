#include "io/RecordWriter.h"

#include <anemo/core/Log.hpp>
#include <anemo/core/Time.hpp>

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/types.h>
#include <utility>

namespace io {

using anemo::Errc;
using anemo::Result;

static size_t fieldCount(const std::string &line) {
	size_t n = 1;
	for (char c : line) {
		if (c == ',')
			++n;
	}
	return n;
}

RecordWriter::RecordWriter(std::string path,
						   const ingest::SchemaRegistry &schema,
						   HeaderMode mode)
	: path_(std::move(path)), schema_(schema), mode_(mode) {}

RecordWriter::~RecordWriter() { close(); }

Result RecordWriter::open() {
	close();
	fp_ = fopen(path_.c_str(), "w");
	if (!fp_)
		return Result::Fail(Errc::Io,
							"open " + path_ + ": " + strerror(errno));
	header_written_ = false;
	header_width_ = 0;
	rows_ = 0;
	return Result::Ok();
}

void RecordWriter::close() {
	if (fp_)
		fclose(fp_);
	fp_ = nullptr;
}

std::string RecordWriter::headerLine_() const {
	std::string line;
	const auto &cols = schema_.header();
	for (size_t i = 0; i < cols.size(); ++i) {
		if (i)
			line += ',';
		line += cols[i];
	}
	return line;
}

Result RecordWriter::writeLine_(const std::string &line) {
	if (fputs(line.c_str(), fp_) < 0 || fputc('\n', fp_) == EOF ||
		fflush(fp_) != 0)
		return Result::Fail(Errc::Io,
							"write " + path_ + ": " + strerror(errno));
	return Result::Ok();
}

Result RecordWriter::write(const ingest::Record &r) {
	if (!fp_)
		return Result::Fail(Errc::NotReady, "data log not open");

	if (!header_written_) {
		Result res = writeLine_(headerLine_());
		if (!res.ok())
			return res;
		header_written_ = true;
		header_width_ = schema_.size();
	} else if (mode_ == HeaderMode::Strict && schema_.size() > header_width_) {
		Result res = rewriteHeader_();
		if (!res.ok())
			return res;
	}

	std::string line;
	const auto &cols = schema_.header();
	for (size_t i = 0; i < cols.size(); ++i) {
		if (i)
			line += ',';
		if (i == 0) {
			line += anemo::core::Time::formatIso(r.ts_us);
			continue;
		}
		const std::string *v = r.fields.find(cols[i]);
		if (v)
			line += *v;
	}
	Result res = writeLine_(line);
	if (res.ok())
		++rows_;
	return res;
}

// Copies the data log to <path>.tmp under the new header, padding every row,
// then renames it over the original.
Result RecordWriter::rewriteHeader_() {
	close();
	const std::string tmp_path = path_ + ".tmp";
	const size_t width = schema_.size();

	FILE *in = fopen(path_.c_str(), "r");
	if (!in)
		return Result::Fail(Errc::Io, "reopen " + path_ + ": " + strerror(errno));
	FILE *out = fopen(tmp_path.c_str(), "w");
	if (!out) {
		const int err = errno;
		fclose(in);
		return Result::Fail(Errc::Io, "open " + tmp_path + ": " + strerror(err));
	}

	bool ok = fprintf(out, "%s\n", headerLine_().c_str()) >= 0;
	char *buf = nullptr;
	size_t cap = 0;
	bool first = true;
	ssize_t n = 0;
	while (ok && (n = getline(&buf, &cap, in)) >= 0) {
		std::string line(buf, (size_t)n);
		while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
			line.pop_back();
		if (first) {
			first = false;
			continue; // old header
		}
		for (size_t k = fieldCount(line); k < width; ++k)
			line += ',';
		ok = fprintf(out, "%s\n", line.c_str()) >= 0;
	}
	free(buf);
	const bool read_err = ferror(in) != 0;
	fclose(in);
	if (fclose(out) != 0)
		ok = false;
	if (!ok || read_err) {
		remove(tmp_path.c_str());
		return Result::Fail(Errc::Io, "rewrite " + path_ + " failed");
	}
	if (rename(tmp_path.c_str(), path_.c_str()) != 0)
		return Result::Fail(Errc::Io, "rename " + tmp_path + ": " + strerror(errno));

	fp_ = fopen(path_.c_str(), "a");
	if (!fp_)
		return Result::Fail(Errc::Io, "reopen " + path_ + ": " + strerror(errno));

	header_width_ = width;
	++header_rewrites_;
	ANEMO_LOGD("writer", "header rewritten columns=" + std::to_string(width) +
							 " rows=" + std::to_string(rows_));
	return Result::Ok();
}

} // namespace io
