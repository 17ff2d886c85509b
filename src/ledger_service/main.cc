#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>
#include <grpcpp/grpcpp.h>

// Project includes
#include "common/configuration.h"
#include "ledger/sqlite_ledger_store.h"
#include "ledger/tag_manager.h"
#include "ledger_service.h"

namespace {

TagLedger::TagSettings SettingsFromConfig(const TagLedger::TagLedgerConfig& config) {
	TagLedger::TagSettings settings;
	settings.padding = config.tags.padding.get();
	settings.stale_after = std::chrono::minutes(config.auditor.stale_after_minutes.get());
	settings.allocator.max_attempts = config.allocator.max_attempts.get();
	settings.allocator.retry_backoff_ms = config.allocator.retry_backoff_ms.get();
	return settings;
}

int RunServer(const TagLedger::TagLedgerConfig& config) {
	TagLedger::SqliteStoreOptions store_options;
	store_options.path = config.store.path.get();
	store_options.busy_timeout_ms = config.store.busy_timeout_ms.get();
	store_options.journal_mode = config.store.journal_mode.get();

	std::unique_ptr<TagLedger::SqliteLedgerStore> store;
	try {
		store = std::make_unique<TagLedger::SqliteLedgerStore>(store_options);
	} catch (const std::exception& e) {
		LOG(ERROR) << "Failed to open ledger store: " << e.what();
		return EXIT_FAILURE;
	}

	TagLedger::TagManager manager(*store, SettingsFromConfig(config));
	TagLedger::LedgerServiceImpl service(manager, config.tags.default_prefix.get());

	const std::string server_address =
		config.service.listen_address.get() + ":" + std::to_string(config.service.port.get());

	grpc::ServerBuilder builder;
	builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
	builder.RegisterService(&service);

	std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
	if (!server) {
		LOG(ERROR) << "Failed to start the server on " << server_address;
		return EXIT_FAILURE;
	}

	LOG(INFO) << "Tag ledger listening on " << server_address << " (store " << store->path()
		<< ", default prefix " << config.tags.default_prefix.get() << ")";

	std::signal(SIGINT, [](int signal) {
			LOG(INFO) << "Received shutdown signal";
			exit(0);
			});

	server->Wait();
	return EXIT_SUCCESS;
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("tagledger_server", "Asset tag issuance and confirmation ledger");

	options.add_options()
		("f,config", "YAML configuration file", cxxopts::value<std::string>())
		("d,db", "Ledger database file", cxxopts::value<std::string>())
		("p,port", "Listen port", cxxopts::value<int>())
		("x,prefix", "Default tag prefix", cxxopts::value<std::string>())
		("w,padding", "Zero-pad width of tag numbers", cxxopts::value<int>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"))
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);

	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	TagLedger::Configuration& configuration = TagLedger::Configuration::getInstance();
	if (arguments.count("config")) {
		const std::string config_file = arguments["config"].as<std::string>();
		if (!configuration.loadFromFile(config_file)) {
			LOG(ERROR) << "Failed to load configuration from " << config_file;
			return EXIT_FAILURE;
		}
	}
	configuration.overrideFromCommandLine(argc, argv);

	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Configuration error: " << error;
		}
		return EXIT_FAILURE;
	}

	int rc = RunServer(configuration.config());
	LOG(INFO) << "Tag ledger terminating";
	return rc;
}
