#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "../common/configuration.h"
#include "message_queue.h"
#include "weight_info.h"

namespace {

// Payload markers understood by SimulatedHandler
constexpr char kPermanentFailureMarker = 'P';
constexpr char kTemporaryFailureMarker = 'T';

/**
 * Charges base + per_byte * size and fails messages whose first byte is a
 * failure marker
 */
class SimulatedHandler : public Wharf::IMessageHandler {
	public:
		SimulatedHandler(Wharf::Weight base, Wharf::Weight per_byte) : base_(base), per_byte_(per_byte) {}

		Wharf::ProcessResult Process(const Wharf::MessageOrigin& origin,
				std::string_view message,
				Wharf::Weight weight_ceiling) override {
			const Wharf::Weight cost = base_ + per_byte_ * message.size();
			if (cost > weight_ceiling) {
				return Wharf::ProcessResult::InsufficientWeight(cost);
			}
			if (!message.empty() && message[0] == kPermanentFailureMarker) {
				return Wharf::ProcessResult::PermanentFailure("undecodable message", base_);
			}
			if (!message.empty() && message[0] == kTemporaryFailureMarker && !release_temporary_) {
				return Wharf::ProcessResult::TemporaryFailure("destination busy", base_);
			}
			VLOG(3) << "Processed " << message.size() << " bytes from " << origin;
			return Wharf::ProcessResult::Success(cost);
		}

		// Let messages that failed temporarily through from now on
		void ReleaseTemporary() { release_temporary_ = true; }

	private:
		Wharf::Weight base_;
		Wharf::Weight per_byte_;
		bool release_temporary_ = false;
};

std::string MakePayload(size_t size, size_t sequence, int permanent_every, int temporary_every) {
	std::string payload(size, 'm');
	if (payload.empty()) {
		return payload;
	}
	if (permanent_every > 0 && sequence % permanent_every == static_cast<size_t>(permanent_every - 1)) {
		payload[0] = kPermanentFailureMarker;
	} else if (temporary_every > 0 && sequence % temporary_every == static_cast<size_t>(temporary_every - 1)) {
		payload[0] = kTemporaryFailureMarker;
	}
	return payload;
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("wharf_sim", "Drive the weight-bounded message queue with synthetic traffic");
	options.allow_unrecognised_options();

	options.add_options()
		("c,config", "YAML configuration file", cxxopts::value<std::string>()->default_value(""))
		("o,origins", "Number of sibling origins", cxxopts::value<int>()->default_value("4"))
		("n,messages", "Messages per origin", cxxopts::value<int>()->default_value("100"))
		("s,size", "Payload size in bytes", cxxopts::value<size_t>()->default_value("64"))
		("b,blocks", "Service invocations to run", cxxopts::value<int>()->default_value("10"))
		("block_weight", "Budget per invocation, 0 uses the configured service weight",
		 cxxopts::value<uint64_t>()->default_value("0"))
		("message_base_weight", "Handler base weight per message", cxxopts::value<uint64_t>()->default_value("1000"))
		("message_byte_weight", "Handler weight per payload byte", cxxopts::value<uint64_t>()->default_value("10"))
		("permanent_every", "Every k-th message fails permanently, 0 for none", cxxopts::value<int>()->default_value("0"))
		("temporary_every", "Every k-th message fails temporarily, 0 for none", cxxopts::value<int>()->default_value("0"))
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"))
		("h,help", "Print usage");

	std::optional<cxxopts::ParseResult> parsed;
	try {
		parsed.emplace(options.parse(argc, argv));
	} catch (const std::exception& e) {
		LOG(ERROR) << "Invalid arguments: " << e.what();
		return EXIT_FAILURE;
	}
	const cxxopts::ParseResult& arguments = *parsed;
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	// *************** Configuration **********************
	Wharf::Configuration& configuration = Wharf::Configuration::getInstance();
	const std::string config_path = arguments["config"].as<std::string>();
	if (!config_path.empty() && !configuration.loadFromFile(config_path)) {
		LOG(ERROR) << "Could not load " << config_path;
		return EXIT_FAILURE;
	}
	configuration.overrideFromCommandLine(argc, argv);
	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Configuration error: " << error;
		}
		return EXIT_FAILURE;
	}

	// *************** Queue **********************
	auto handler = std::make_shared<SimulatedHandler>(
			arguments["message_base_weight"].as<uint64_t>(),
			arguments["message_byte_weight"].as<uint64_t>());
	auto weights = std::make_shared<Wharf::WeightTable>(
			Wharf::WeightTable::FromConfig(configuration.config().weights));

	std::unique_ptr<Wharf::MessageQueue> queue;
	try {
		queue = std::make_unique<Wharf::MessageQueue>(
				Wharf::QueueOptions::FromConfig(configuration.config()), handler, weights);
	} catch (const std::invalid_argument& e) {
		LOG(ERROR) << "Cannot build queue: " << e.what();
		return EXIT_FAILURE;
	}

	std::vector<Wharf::OverweightHandle> parked;
	queue->events().Subscribe<Wharf::MessageOverweightEvent>(
			Wharf::EventBus::EventType::MESSAGE_OVERWEIGHT,
			[&parked](const Wharf::MessageOverweightEvent& event) {
				parked.push_back(event.handle);
			});

	const int num_origins = arguments["origins"].as<int>();
	const int num_messages = arguments["messages"].as<int>();
	const size_t payload_size = arguments["size"].as<size_t>();
	const int permanent_every = arguments["permanent_every"].as<int>();
	const int temporary_every = arguments["temporary_every"].as<int>();

	size_t enqueued = 0;
	for (int m = 0; m < num_messages; ++m) {
		for (int o = 0; o < num_origins; ++o) {
			const auto origin = Wharf::MessageOrigin::Sibling(static_cast<uint32_t>(1000 + o));
			std::string payload = MakePayload(payload_size, m, permanent_every, temporary_every);
			Wharf::QueueError err = queue->Enqueue(origin, payload);
			if (err == Wharf::QueueError::kTooLarge) {
				queue->ParkOversized(origin, payload);
			} else if (err != Wharf::QueueError::kNone) {
				LOG(ERROR) << "Enqueue failed: " << Wharf::QueueErrorName(err);
				return EXIT_FAILURE;
			}
			++enqueued;
		}
	}
	LOG(INFO) << "Enqueued " << enqueued << " messages from " << num_origins << " origins";

	// *************** Service **********************
	const int blocks = arguments["blocks"].as<int>();
	const uint64_t block_weight = arguments["block_weight"].as<uint64_t>();
	for (int block = 0; block < blocks; ++block) {
		Wharf::ServiceReport report = block_weight == 0 ? queue->ServiceBlock() : queue->Service(block_weight);
		LOG(INFO) << "Block " << block << ": processed=" << report.processed
			<< " overweight=" << report.overweight
			<< " retries=" << report.temporary_failures
			<< " weight=" << report.weight_used
			<< " origins=" << report.origins_touched
			<< " stop=" << Wharf::StopReasonName(report.stop_reason);
		if (report.stop_reason == Wharf::StopReason::kRingEmpty) {
			break;
		}
	}

	// Parked messages get one manual attempt with an unbounded budget
	handler->ReleaseTemporary();
	for (Wharf::OverweightHandle handle : parked) {
		Wharf::Weight used = 0;
		Wharf::QueueError err = queue->ExecuteOverweight(handle, UINT64_MAX, used);
		LOG(INFO) << "Overweight " << handle << ": " << Wharf::QueueErrorName(err) << " (" << used << " weight)";
	}

	for (int o = 0; o < num_origins; ++o) {
		const auto origin = Wharf::MessageOrigin::Sibling(static_cast<uint32_t>(1000 + o));
		LOG(INFO) << origin << " footprint " << queue->Footprint(origin);
	}

	const auto errors = queue->CheckIntegrity();
	for (const auto& error : errors) {
		LOG(ERROR) << "Integrity violation: " << error;
	}
	return errors.empty() ? EXIT_SUCCESS : EXIT_FAILURE;
}
