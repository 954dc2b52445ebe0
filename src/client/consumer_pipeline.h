#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <ostream>
#include <string>

#include "delay_stats.h"
#include "post_process.h"
#include "../bridge/async_consumer.h"
#include "../bridge/blocking_bridge.h"
#include "../registry/serializer.h"

namespace SalKafka {

struct ConsumerOptions {
	// Messages to read; 0 reads until the process is terminated
	int64_t number = 10;
	// Report throughput and delays instead of printing every message
	bool time = false;
};

struct ConsumerResult {
	int64_t messages = 0;
	double elapsed_s = 0.0;
	// Counted from the end of the first message, so (messages - 1) / elapsed_s
	double messages_per_second = 0.0;
	DelayStats::Summary delays;
};

/**
 * Reads messages from one or more topics in delivery order: each one is
 * decoded, stamped with private_rcvStamp, added to the delay statistics and
 * post-processed before the next read is issued.
 *
 * Runs on the driver. Errors propagate out of io_context::run().
 */
class ConsumerPipeline {
public:
	using DoneHandler = std::function<void(const ConsumerResult&)>;
	// Sees every message after stamping; index is 1-based
	using MessageObserver = std::function<void(int64_t index, const TopicDescriptor& topic, const FieldMap& data)>;

	/**
	 * @param topics Subscribed topics keyed by wire name; must outlive the pipeline
	 * @param deserializer Resolves schema ids; unknown ids are fetched on admin_bridge
	 * @param admin_bridge Bridge for blocking schema lookups
	 * @param consumer Bridge-backed reader
	 * @param out Destination of the per-message lines
	 */
	ConsumerPipeline(std::map<std::string, const TopicDescriptor*> topics, Deserializer& deserializer,
			BlockingBridge& admin_bridge, PostProcessStrategy strategy, AsyncConsumer& consumer,
			ConsumerOptions options, std::ostream& out);

	void set_observer(MessageObserver observer) { observer_ = std::move(observer); }

	/**
	 * Subscribe, then read until the requested count
	 */
	void Start(DoneHandler done);

	int64_t received() const { return received_; }
	const DelayStats& delays() const { return delays_; }

private:
	void ReadNext();
	void OnMessage(std::unique_ptr<ConsumedMessage> message);
	void Process(const ConsumedMessage& message);
	void Finish();

	std::map<std::string, const TopicDescriptor*> topics_;
	Deserializer& deserializer_;
	BlockingBridge& admin_bridge_;
	PostProcessStrategy strategy_;
	AsyncConsumer& consumer_;
	ConsumerOptions options_;
	std::ostream& out_;
	MessageObserver observer_;
	DoneHandler done_;
	int64_t received_ = 0;
	DelayStats delays_;
	std::chrono::steady_clock::time_point start_;
};

} // namespace SalKafka
