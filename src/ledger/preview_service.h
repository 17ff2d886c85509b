#pragma once

#include <cstdint>
#include <string>

#include "interfaces.h"

namespace TagLedger {

struct PreviewResult {
	std::string full_tag;
	std::string prefix;
	int64_t tag_number = 0;
};

/**
 * Answers "what would Allocate return now" from a read snapshot.
 * Creates no row, moves no counter and holds no lock past the read, so the
 * answer can be stale as soon as it is returned.
 */
class PreviewService {
	public:
		explicit PreviewService(ILedgerStore& store);

		LedgerError Preview(const std::string& prefix, int padding, PreviewResult& result);

	private:
		ILedgerStore& store_;
};

} // namespace TagLedger
