#include "consumer_pipeline.h"

#include <glog/logging.h>

#include "../common/clock.h"
#include "../common/errors.h"

namespace SalKafka {

ConsumerPipeline::ConsumerPipeline(std::map<std::string, const TopicDescriptor*> topics,
		Deserializer& deserializer, BlockingBridge& admin_bridge, PostProcessStrategy strategy,
		AsyncConsumer& consumer, ConsumerOptions options, std::ostream& out)
	: topics_(std::move(topics)),
	  deserializer_(deserializer),
	  admin_bridge_(admin_bridge),
	  strategy_(strategy),
	  consumer_(consumer),
	  options_(options),
	  out_(out) {}

void ConsumerPipeline::Start(DoneHandler done) {
	done_ = std::move(done);
	std::vector<std::string> names;
	for (const auto& [wire_name, topic] : topics_) names.push_back(wire_name);

	consumer_.AsyncSubscribe(names, [this](std::exception_ptr error) {
		if (error) {
			std::rethrow_exception(error);
		}
		LOG(INFO) << "Subscribed to " << topics_.size() << " topics; reading "
				  << (options_.number > 0 ? std::to_string(options_.number) : "unlimited") << " messages";
		ReadNext();
	});
}

void ConsumerPipeline::ReadNext() {
	consumer_.AsyncRead([this](std::exception_ptr error, std::unique_ptr<ConsumedMessage> message) {
		if (error) {
			LOG(ERROR) << "Read of message " << received_ + 1 << " failed";
			std::rethrow_exception(error);
		}
		if (!message) {
			// Consumer was shut down
			Finish();
			return;
		}
		OnMessage(std::move(message));
	});
}

void ConsumerPipeline::OnMessage(std::unique_ptr<ConsumedMessage> message) {
	const int32_t schema_id = Deserializer::PeekSchemaId(message->payload);
	if (deserializer_.HasSchema(schema_id)) {
		Process(*message);
		return;
	}
	// First sighting of this schema id: look it up off the driver
	std::shared_ptr<ConsumedMessage> pending(std::move(message));
	admin_bridge_.Dispatch(
		[this, schema_id]() { return deserializer_.FetchSchema(schema_id); },
		[this, pending](std::exception_ptr error, std::shared_ptr<const AvroSchema>) {
			if (error) {
				std::rethrow_exception(error);
			}
			Process(*pending);
		});
}

void ConsumerPipeline::Process(const ConsumedMessage& message) {
	auto it = topics_.find(message.topic);
	if (it == topics_.end()) {
		throw MessageError(message.topic, 0, "message from a topic that was not subscribed");
	}
	const TopicDescriptor& topic = *it->second;

	++received_;
	DeserializedMessage decoded = deserializer_.Deserialize(message.payload);
	FieldMap& data = decoded.data;
	const double now = UnixTimeSeconds();
	data[kRcvStampField] = now;

	auto snd = data.find(kSndStampField);
	if (snd == data.end() || !std::holds_alternative<double>(snd->second)) {
		throw MessageError(message.topic, 0, "message " + std::to_string(received_) + " has no " +
				kSndStampField);
	}
	delays_.Add(now - std::get<double>(snd->second));

	ProcessedMessage processed = ApplyPostProcess(strategy_, topic, data);
	if (!options_.time) {
		out_ << "read [" << received_ << "]: " << ToString(processed, topic, data) << std::endl;
	}
	if (observer_) observer_(received_, topic, data);

	if (options_.number > 0 && received_ >= options_.number) {
		Finish();
		return;
	}
	// Timing starts once the first message is fully processed
	if (received_ == 1) {
		start_ = std::chrono::steady_clock::now();
	}
	ReadNext();
}

void ConsumerPipeline::Finish() {
	ConsumerResult result;
	result.messages = received_;
	if (received_ > 1) {
		result.elapsed_s = SecondsSince(start_);
		if (result.elapsed_s > 0) {
			result.messages_per_second = (received_ - 1) / result.elapsed_s;
		}
	}
	result.delays = delays_.GetSummary();
	if (done_) done_(result);
}

} // namespace SalKafka
