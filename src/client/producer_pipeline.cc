#include "producer_pipeline.h"

#include <unistd.h>

#include <glog/logging.h>

#include "../common/clock.h"
#include "../common/errors.h"

namespace SalKafka {

ProducerPipeline::ProducerPipeline(const TopicDescriptor& topic, FieldMap base_record,
		ValidationStrategy strategy, Serializer serializer, AsyncProducer& producer, ProducerOptions options)
	: topic_(topic),
	  data_(std::move(base_record)),
	  strategy_(std::move(strategy)),
	  serializer_(std::move(serializer)),
	  producer_(producer),
	  options_(options) {
	data_[kOriginField] = static_cast<int64_t>(getpid());
	data_[kIdentityField] = topic_.is_indexed
		? topic_.component_name + ":" + std::to_string(options_.index)
		: topic_.component_name;
}

void ProducerPipeline::Start(DoneHandler done) {
	done_ = std::move(done);
	published_ = 0;
	LOG(INFO) << "Publish data: " << options_.number << " messages to " << topic_.wire_name;
	start_ = std::chrono::steady_clock::now();
	PublishNext();
}

void ProducerPipeline::PublishNext() {
	if (published_ >= options_.number) {
		Finish();
		return;
	}

	data_[kSeqNumField] = static_cast<int64_t>(published_ + 1);
	if (topic_.is_indexed) {
		data_[kIndexField] = static_cast<int64_t>(options_.index);
	}
	// Last, so the delay measured by the reader starts here
	data_[kSndStampField] = UnixTimeSeconds();

	std::string payload;
	try {
		payload = serializer_.Serialize(ApplyValidation(strategy_, data_, scratch_));
	} catch (const Error&) {
		LOG(ERROR) << "Message " << published_ + 1 << " of " << topic_.logical_name << " rejected";
		throw;
	}

	VLOG(2) << "Publishing seqNum " << published_ + 1 << " (" << payload.size() << " bytes)";
	producer_.AsyncPublish(topic_.wire_name, std::move(payload), [this](std::exception_ptr error) {
		if (error) {
			LOG(ERROR) << "Message " << published_ + 1 << " of " << topic_.logical_name << " not delivered";
			std::rethrow_exception(error);
		}
		++published_;
		PublishNext();
	});
}

void ProducerPipeline::Finish() {
	ProducerResult result;
	result.messages = published_;
	result.elapsed_s = SecondsSince(start_);
	result.messages_per_second = result.elapsed_s > 0 ? published_ / result.elapsed_s : 0.0;
	if (done_) done_(result);
}

} // namespace SalKafka
