#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "validation.h"
#include "../bridge/async_producer.h"
#include "../registry/serializer.h"

namespace SalKafka {

struct ProducerOptions {
	// Messages to publish
	int number = 1;
	// Value of private_index; ignored for non-indexed components
	int index = 0;
};

struct ProducerResult {
	int messages = 0;
	double elapsed_s = 0.0;
	double messages_per_second = 0.0;
};

/**
 * Publishes one topic's synthetic record N times, one message at a time:
 * each message is stamped, validated, serialized, published, and
 * acknowledged before the next one starts.
 *
 * Runs entirely on the driver. Errors raised while preparing a message or
 * reported by the bridge propagate out of io_context::run().
 */
class ProducerPipeline {
public:
	using DoneHandler = std::function<void(const ProducerResult&)>;

	/**
	 * @param topic Topic to publish to; must outlive the pipeline
	 * @param base_record Synthetic record with every field set
	 * @param strategy Validation applied to each message
	 * @param serializer Bound to the topic's registered schema id
	 * @param producer Bridge-backed publisher
	 */
	ProducerPipeline(const TopicDescriptor& topic, FieldMap base_record, ValidationStrategy strategy,
			Serializer serializer, AsyncProducer& producer, ProducerOptions options);

	/**
	 * Begin publishing; done runs on the driver after the last acknowledgement
	 */
	void Start(DoneHandler done);

	// Messages acknowledged so far
	int published() const { return published_; }

private:
	void PublishNext();
	void Finish();

	const TopicDescriptor& topic_;
	FieldMap data_;
	FieldMap scratch_;
	ValidationStrategy strategy_;
	Serializer serializer_;
	AsyncProducer& producer_;
	ProducerOptions options_;
	DoneHandler done_;
	int published_ = 0;
	std::chrono::steady_clock::time_point start_;
};

} // namespace SalKafka
