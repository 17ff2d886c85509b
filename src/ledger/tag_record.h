#pragma once

#include <cstdint>
#include <string>

namespace TagLedger {

// Timestamps are milliseconds since the Unix epoch (UTC). 0 means absent.
using TimestampMs = int64_t;

struct TagRecord {
	std::string prefix;
	int64_t tag_number = 0;
	std::string full_tag;
	// Meaningful only when is_confirmed; any integer, 0 included, is a valid id.
	int64_t external_id = 0;
	TimestampMs reserved_at = 0;
	TimestampMs confirmed_at = 0;
	bool is_confirmed = false;

	bool confirmed() const { return is_confirmed; }
};

// Outcome recorded for every confirmation delivery.
enum class ConfirmationOutcome {
	CONFIRMED,
	DUPLICATE,
	CONFLICT,
	UNKNOWN_TAG
};

const char* ConfirmationOutcomeToString(ConfirmationOutcome outcome);
bool ParseConfirmationOutcome(const std::string& text, ConfirmationOutcome& outcome);

struct ConfirmationEvent {
	int64_t event_id = 0;
	std::string full_tag;
	int64_t external_id = 0;
	TimestampMs received_at = 0;
	ConfirmationOutcome outcome = ConfirmationOutcome::CONFIRMED;
};

} // namespace TagLedger
