#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "common/configuration.h"
#include "ledger_client.h"

namespace {

void PrintRecord(const TagLedger::TagRecord& record) {
	std::cout << record.full_tag
		<< "\treserved_at=" << record.reserved_at;
	if (record.confirmed()) {
		std::cout << "\texternal_id=" << record.external_id
			<< "\tconfirmed_at=" << record.confirmed_at;
	} else {
		std::cout << "\tunconfirmed";
	}
	std::cout << std::endl;
}

int Report(TagLedger::LedgerClient& client, TagLedger::LedgerError err) {
	if (err == TagLedger::ERR_NO_ERROR) {
		return EXIT_SUCCESS;
	}
	std::cerr << TagLedger::LedgerErrorToString(err) << ": " << client.last_message() << std::endl;
	return EXIT_FAILURE;
}

} // end of namespace

int main(int argc, char* argv[]) {
	google::InitGoogleLogging(argv[0]);

	TagLedger::Configuration& configuration = TagLedger::Configuration::getInstance();

	cxxopts::Options options("tagledger_cli",
			"Asset tag ledger client. Commands: preview, allocate, confirm, reset, stale, lookup, history");

	options.add_options()
		("command", "Command to run", cxxopts::value<std::string>())
		("s,server", "Ledger server address",
		 cxxopts::value<std::string>()->default_value(configuration.config().service.server_address.get()))
		("x,prefix", "Tag prefix (empty uses the server default)",
		 cxxopts::value<std::string>()->default_value(""))
		("t,tag", "Full tag for confirm, lookup and history", cxxopts::value<std::string>())
		("e,external_id", "External record id for confirm", cxxopts::value<int64_t>())
		("n,start", "New start number for reset", cxxopts::value<int64_t>())
		("force", "Allow a reset onto numbers already issued")
		("m,older_than_minutes", "Stale threshold in minutes (omit for the server's)",
		 cxxopts::value<int64_t>())
		("deadline_ms", "RPC deadline in milliseconds",
		 cxxopts::value<int>()->default_value(std::to_string(configuration.config().service.client_deadline_ms.get())))
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");
	options.parse_positional({"command"});

	auto arguments = options.parse(argc, argv);

	if (arguments.count("help") || !arguments.count("command")) {
		std::cout << options.help() << std::endl;
		return arguments.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1;

	TagLedger::LedgerClient client(arguments["server"].as<std::string>(),
			std::chrono::milliseconds(arguments["deadline_ms"].as<int>()));
	const std::string command = arguments["command"].as<std::string>();
	const std::string prefix = arguments["prefix"].as<std::string>();

	if (command == "preview") {
		TagLedger::PreviewResult result;
		TagLedger::LedgerError err = client.PreviewNextTag(prefix, result);
		if (err == TagLedger::ERR_NO_ERROR) {
			std::cout << result.full_tag << std::endl;
		}
		return Report(client, err);
	}

	if (command == "allocate") {
		std::string full_tag;
		TagLedger::LedgerError err = client.AllocateTag(prefix, full_tag);
		if (err == TagLedger::ERR_NO_ERROR) {
			std::cout << full_tag << std::endl;
		}
		return Report(client, err);
	}

	if (command == "confirm") {
		if (!arguments.count("tag") || !arguments.count("external_id")) {
			std::cerr << "confirm needs --tag and --external_id" << std::endl;
			return EXIT_FAILURE;
		}
		TagLedger::ConfirmationOutcome outcome = TagLedger::ConfirmationOutcome::UNKNOWN_TAG;
		TagLedger::LedgerError err = client.ConfirmTag(arguments["tag"].as<std::string>(),
				arguments["external_id"].as<int64_t>(), &outcome);
		if (err == TagLedger::ERR_NO_ERROR) {
			std::cout << TagLedger::ConfirmationOutcomeToString(outcome) << std::endl;
		}
		return Report(client, err);
	}

	if (command == "reset") {
		if (!arguments.count("start")) {
			std::cerr << "reset needs --start" << std::endl;
			return EXIT_FAILURE;
		}
		TagLedger::ResetResult result;
		TagLedger::LedgerError err = client.ResetSequence(prefix, arguments["start"].as<int64_t>(),
				arguments.count("force") > 0, result);
		if (err == TagLedger::ERR_NO_ERROR) {
			std::cout << "next tag " << result.next_tag << std::endl;
			if (result.collision_risk) {
				std::cerr << "warning: start is at or below the highest issued number "
					<< result.previous_max << "; issued numbers will be skipped" << std::endl;
			}
		}
		return Report(client, err);
	}

	if (command == "stale") {
		std::vector<TagLedger::TagRecord> stale;
		TagLedger::LedgerError err = arguments.count("older_than_minutes")
			? client.ListStaleReservations(
					std::chrono::minutes(arguments["older_than_minutes"].as<int64_t>()), prefix, stale)
			: client.ListStaleReservations(prefix, stale);
		for (const auto& record : stale) {
			PrintRecord(record);
		}
		return Report(client, err);
	}

	if (command == "lookup" || command == "history") {
		if (!arguments.count("tag")) {
			std::cerr << command << " needs --tag" << std::endl;
			return EXIT_FAILURE;
		}
		const std::string full_tag = arguments["tag"].as<std::string>();
		if (command == "lookup") {
			TagLedger::TagRecord record;
			TagLedger::LedgerError err = client.LookupTag(full_tag, record);
			if (err == TagLedger::ERR_NO_ERROR) {
				PrintRecord(record);
			}
			return Report(client, err);
		}
		std::vector<TagLedger::ConfirmationEvent> events;
		TagLedger::LedgerError err = client.ConfirmationHistory(full_tag, events);
		for (const auto& event : events) {
			std::cout << event.event_id << "\t" << event.received_at << "\t" << event.external_id
				<< "\t" << TagLedger::ConfirmationOutcomeToString(event.outcome) << std::endl;
		}
		return Report(client, err);
	}

	std::cerr << "Unknown command: " << command << std::endl << options.help() << std::endl;
	return EXIT_FAILURE;
}
