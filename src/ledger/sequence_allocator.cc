#include "sequence_allocator.h"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

#include <glog/logging.h>

#include "tag_format.h"

namespace TagLedger {

SequenceAllocator::SequenceAllocator(ILedgerStore& store, const AllocatorOptions& options)
	: store_(store), options_(options) {
	options_.max_attempts = std::max(1, options_.max_attempts);
}

LedgerError SequenceAllocator::Allocate(const std::string& prefix, int padding, std::string& full_tag,
		int64_t* tag_number) {
	if (!IsValidPrefix(prefix)) {
		LOG(WARNING) << "Allocate rejected invalid prefix '" << prefix << "'";
		return ERR_VALIDATION_FAILURE;
	}
	if (!IsValidPadding(padding)) {
		LOG(WARNING) << "Allocate rejected padding " << padding << " for prefix " << prefix;
		return ERR_VALIDATION_FAILURE;
	}

	int attempts = 0;
	int busy_retries = 0;
	bool exhausted = false;
	while (attempts < options_.max_attempts) {
		TagRecord reserved;
		const int attempts_before = attempts;
		StoreStatus status = store_.Write([&](LedgerTxn& txn) -> StoreStatus {
			int64_t candidate = 0;
			StoreStatus s = txn.NextTagNumber(prefix, candidate);
			if (s != STORE_OK) return s;

			while (attempts < options_.max_attempts) {
				if (candidate > kMaxTagNumber) {
					exhausted = true;
					return STORE_OK;
				}
				++attempts;
				TagRecord record;
				record.prefix = prefix;
				record.tag_number = candidate;
				record.full_tag = FormatTag(prefix, candidate, padding);
				record.reserved_at = store_.NowMs();

				s = txn.InsertReserved(record);
				if (s == STORE_CONSTRAINT) {
					VLOG(1) << "Tag " << record.full_tag << " already taken, trying next number";
					++candidate;
					continue;
				}
				if (s != STORE_OK) return s;

				s = txn.SetNextTagNumber(prefix, candidate + 1, record.reserved_at);
				if (s == STORE_CONSTRAINT) {
					// Only the reservation insert can lose a race.
					LOG(ERROR) << "Counter for prefix " << prefix << " rejected " << candidate + 1;
					return STORE_ERROR;
				}
				if (s != STORE_OK) return s;
				reserved = std::move(record);
				return STORE_OK;
			}
			return STORE_CONSTRAINT;
		});

		if (status == STORE_OK && exhausted) {
			LOG(ERROR) << "Allocate for prefix " << prefix << " failed: tag numbers exhausted";
			return ERR_STORE_FAILURE;
		}
		if (status == STORE_OK) {
			full_tag = reserved.full_tag;
			if (tag_number != nullptr) {
				*tag_number = reserved.tag_number;
			}
			VLOG(1) << "Reserved " << full_tag << " after " << attempts << " attempt(s)";
			return ERR_NO_ERROR;
		}
		if (status == STORE_BUSY) {
			// A lock timeout before any insert still costs an attempt.
			if (attempts == attempts_before) {
				++attempts;
			}
			if (attempts >= options_.max_attempts) {
				break;
			}
			int64_t backoff_ms = options_.retry_backoff_ms << std::min(busy_retries, 10);
			++busy_retries;
			std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
			continue;
		}
		if (status == STORE_CONSTRAINT) {
			// Every candidate in this transaction collided.
			break;
		}
		LOG(ERROR) << "Allocate for prefix " << prefix << " failed: " << StoreStatusToString(status);
		return ERR_STORE_FAILURE;
	}

	LOG(WARNING) << "Allocate for prefix " << prefix << " gave up after " << attempts << " attempt(s)";
	return ERR_TRANSIENT_ALLOCATION_FAILURE;
}

} // namespace TagLedger
