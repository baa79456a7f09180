#pragma once

#include <anemo/core/Result.hpp>

#include <string>

namespace transport {

/** Line source feeding the ingestion loop.
 *
 * readLine() blocks for at most timeout_ms. It returns Ok with a line,
 * Timeout with an empty line when nothing arrived, and any other code when
 * the source is unusable (Closed at end of input, Io on failure). */
class ILineTransport {
public:
	virtual ~ILineTransport() = default;

	virtual anemo::Result readLine(int timeout_ms, std::string &out) = 0;
	virtual void close() = 0;
	virtual std::string describe() const = 0;
};

} // namespace transport
