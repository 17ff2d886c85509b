#include "tag_format.h"

#include <cctype>
#include <limits>
#include <utility>

#include "../common/config.h"

namespace TagLedger {

bool IsValidPrefix(const std::string& prefix) {
	if (prefix.empty() || prefix.size() > kMaxPrefixLength) {
		return false;
	}
	for (char c : prefix) {
		unsigned char uc = static_cast<unsigned char>(c);
		if (c == kTagSeparator || std::isspace(uc) || !std::isprint(uc)) {
			return false;
		}
	}
	return true;
}

bool IsValidPadding(int padding) {
	return padding >= 0 && padding <= kMaxPaddingWidth;
}

std::string FormatTag(const std::string& prefix, int64_t tag_number, int padding) {
	std::string digits = std::to_string(tag_number);
	if (static_cast<int>(digits.size()) < padding) {
		digits.insert(0, static_cast<size_t>(padding) - digits.size(), '0');
	}
	std::string full_tag;
	full_tag.reserve(prefix.size() + 1 + digits.size());
	full_tag.append(prefix);
	full_tag.push_back(kTagSeparator);
	full_tag.append(digits);
	return full_tag;
}

bool ParseTag(const std::string& full_tag, std::string& prefix, int64_t& tag_number) {
	size_t sep = full_tag.rfind(kTagSeparator);
	if (sep == std::string::npos || sep == 0 || sep + 1 == full_tag.size()) {
		return false;
	}
	std::string candidate_prefix = full_tag.substr(0, sep);
	if (!IsValidPrefix(candidate_prefix)) {
		return false;
	}

	int64_t value = 0;
	for (size_t i = sep + 1; i < full_tag.size(); ++i) {
		char c = full_tag[i];
		if (c < '0' || c > '9') {
			return false;
		}
		int digit = c - '0';
		if (value > (std::numeric_limits<int64_t>::max() - digit) / 10) {
			return false;
		}
		value = value * 10 + digit;
	}
	if (value <= 0) {
		return false;
	}

	prefix = std::move(candidate_prefix);
	tag_number = value;
	return true;
}

} // namespace TagLedger
