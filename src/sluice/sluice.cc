#include <atomic>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "common/config.h"
#include "common/configuration.h"
#include "load_generator.h"
#include "../dispatcher/dispatcher.h"
#include "../dispatcher/synthetic_processor.h"

namespace {

std::atomic<bool> stop_requested{false};

void HandleStopSignal(int) {
	stop_requested.store(true);
}

// Command-line values win over the file; environment variables still win over both
void ApplyOverrides(const cxxopts::ParseResult& arguments, Sluice::SluiceConfig& config) {
	if (arguments.count("workers")) {
		config.dispatcher.worker_count.set(arguments["workers"].as<int>());
	}
	if (arguments.count("queue_capacity")) {
		config.dispatcher.queue_capacity.set(arguments["queue_capacity"].as<size_t>());
	}
	if (arguments.count("admission_limit")) {
		config.dispatcher.admission_limit.set(arguments["admission_limit"].as<size_t>());
	}
	if (arguments.count("reject")) {
		config.dispatcher.admission_policy.set("reject");
	}
	if (arguments.count("timeout_ms")) {
		config.dispatcher.per_request_timeout_ms.set(arguments["timeout_ms"].as<int64_t>());
	}
	if (arguments.count("grace_ms")) {
		config.dispatcher.shutdown_grace_period_ms.set(arguments["grace_ms"].as<int64_t>());
	}
	if (arguments.count("num_requests")) {
		config.workload.num_requests.set(arguments["num_requests"].as<int>());
	}
}

void PrintStats(const std::string& title, const Sluice::Stats& stats) {
	std::cout << "=== " << title << " ===\n" << stats.ToString() << std::endl;
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files

	cxxopts::Options options("sluice", "Bounded-concurrency request dispatcher under synthetic load");

	options.add_options()
		("config", "YAML configuration file", cxxopts::value<std::string>())
		("w,workers", "Number of worker threads", cxxopts::value<int>())
		("q,queue_capacity", "Work queue capacity", cxxopts::value<size_t>())
		("a,admission_limit", "Maximum requests in flight", cxxopts::value<size_t>())
		("reject", "Reject submissions beyond the admission limit instead of waiting")
		("n,num_requests", "Number of synthetic requests to submit", cxxopts::value<int>())
		("timeout_ms", "Per-request timeout in ms, 0 for none", cxxopts::value<int64_t>())
		("grace_ms", "Shutdown grace period in ms", cxxopts::value<int64_t>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}
	FLAGS_v = arguments["log_level"].as<int>();

	// *************** Configuration **********************
	Sluice::Configuration& config = Sluice::Configuration::getInstance();
	if (arguments.count("config")) {
		const std::string path = arguments["config"].as<std::string>();
		if (!config.loadFromFile(path)) {
			LOG(ERROR) << "Failed to load configuration from " << path;
			for (const auto& error : config.getValidationErrors()) {
				LOG(ERROR) << "  " << error;
			}
			return EXIT_FAILURE;
		}
	}
	ApplyOverrides(arguments, config.config());
	if (!config.validate()) {
		for (const auto& error : config.getValidationErrors()) {
			LOG(ERROR) << "Invalid configuration: " << error;
		}
		return EXIT_FAILURE;
	}

	const Sluice::DispatcherOptions dispatcher_options = Sluice::DispatcherOptions::FromConfig(config);
	const Sluice::WorkloadOptions workload = Sluice::WorkloadOptions::FromConfig(config);
	auto processor = std::make_shared<Sluice::SyntheticProcessor>(
			Sluice::SyntheticWorkload::FromConfig(config));

	std::signal(SIGINT, HandleStopSignal);
	std::signal(SIGTERM, HandleStopSignal);

	// *************** Run the workload **********************
	Sluice::Dispatcher dispatcher(dispatcher_options, processor);

	// Sized so the generator never blocks once the collector gives up
	Sluice::PendingReplyQueue pending(static_cast<size_t>(workload.num_requests) + 1);
	absl::Notification monitor_done;
	std::thread monitor(Sluice::MonitorDispatcher, std::cref(dispatcher), std::cref(workload),
			std::cref(monitor_done));

	Sluice::CollectorResult collected;
	std::thread collector([&pending, &workload, &collected]() {
		collected = Sluice::CollectResponses(pending, workload);
	});

	int submitted = Sluice::GenerateRequests(dispatcher, workload, pending, stop_requested);
	LOG(INFO) << "Submitted " << submitted << " requests";

	collector.join();
	monitor_done.Notify();
	monitor.join();

	LOG(INFO) << "Collected " << collected.received << " responses, "
		<< collected.succeeded << " succeeded"
		<< (collected.timed_out ? " (collector timed out)" : "");

	dispatcher.FlushStats();
	PrintStats("Statistics", dispatcher.StatsSnapshot());
	if (collected.latencies.Count() > 0) {
		std::cout << "Latency of successful requests: "
			<< collected.latencies.Summarize().ToString() << std::endl;
	}

	// *************** Shutdown **********************
	Sluice::ShutdownReport report = dispatcher.Shutdown();
	if (!report.drained) {
		LOG(WARNING) << report.abandoned << " requests were aborted at shutdown";
	}
	PrintStats("Final statistics", dispatcher.StatsSnapshot());

	LOG(INFO) << "Sluice terminating";
	return EXIT_SUCCESS;
}
