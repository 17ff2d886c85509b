#include "tag_record.h"

namespace TagLedger {

const char* ConfirmationOutcomeToString(ConfirmationOutcome outcome) {
	switch (outcome) {
		case ConfirmationOutcome::CONFIRMED:
			return "confirmed";
		case ConfirmationOutcome::DUPLICATE:
			return "duplicate";
		case ConfirmationOutcome::CONFLICT:
			return "conflict";
		case ConfirmationOutcome::UNKNOWN_TAG:
			return "unknown";
	}
	return "unknown";
}

bool ParseConfirmationOutcome(const std::string& text, ConfirmationOutcome& outcome) {
	if (text == "confirmed") {
		outcome = ConfirmationOutcome::CONFIRMED;
	} else if (text == "duplicate") {
		outcome = ConfirmationOutcome::DUPLICATE;
	} else if (text == "conflict") {
		outcome = ConfirmationOutcome::CONFLICT;
	} else if (text == "unknown") {
		outcome = ConfirmationOutcome::UNKNOWN_TAG;
	} else {
		return false;
	}
	return true;
}

} // namespace TagLedger
