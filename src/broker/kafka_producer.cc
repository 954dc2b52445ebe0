#include "kafka_producer.h"

#include <glog/logging.h>
#include <librdkafka/rdkafkacpp.h>

#include "../common/errors.h"

namespace SalKafka {

/**
 * Routes each delivery report to the callback passed with its message.
 * The callback travels as the message opaque and is freed here.
 */
class DeliveryDispatcher : public RdKafka::DeliveryReportCb {
public:
    void dr_cb(RdKafka::Message& message) override {
        std::unique_ptr<DeliveryCallback> callback(static_cast<DeliveryCallback*>(message.msg_opaque()));
        DeliveryReport report;
        report.topic = message.topic_name();
        if (message.err()) {
            report.error_code = static_cast<int>(message.err());
            report.error = message.errstr();
            VLOG(1) << "Message delivery to " << report.topic << " failed: " << report.error;
        }
        if (callback && *callback) (*callback)(report);
    }
};

namespace {

void SetOrThrow(RdKafka::Conf* conf, const std::string& name, const std::string& value) {
    std::string errstr;
    if (conf->set(name, value, errstr) != RdKafka::Conf::CONF_OK) {
        throw DeliveryError("<producer>", "invalid " + name + ": " + errstr);
    }
}

} // namespace

KafkaProducerClient::KafkaProducerClient(const std::string& bootstrap_servers,
        const std::string& acks, int message_max_bytes)
    : dispatcher_(std::make_unique<DeliveryDispatcher>()) {
    std::unique_ptr<RdKafka::Conf> conf(RdKafka::Conf::create(RdKafka::Conf::CONF_GLOBAL));
    SetOrThrow(conf.get(), "bootstrap.servers", bootstrap_servers);
    SetOrThrow(conf.get(), "acks", acks);
    SetOrThrow(conf.get(), "message.max.bytes", std::to_string(message_max_bytes));

    std::string errstr;
    if (conf->set("dr_cb", dispatcher_.get(), errstr) != RdKafka::Conf::CONF_OK) {
        throw DeliveryError("<producer>", "cannot install delivery callback: " + errstr);
    }

    producer_.reset(RdKafka::Producer::create(conf.get(), errstr));
    if (!producer_) {
        throw DeliveryError("<producer>", "failed to create producer: " + errstr);
    }
    LOG(INFO) << "Created producer " << producer_->name() << " (acks=" << acks << ")";
}

KafkaProducerClient::~KafkaProducerClient() {
    if (producer_ && producer_->outq_len() > 0) {
        LOG(WARNING) << producer_->outq_len() << " messages undelivered at producer shutdown";
    }
}

void KafkaProducerClient::Produce(const std::string& topic, const std::string& payload,
        DeliveryCallback on_delivery) {
    auto opaque = std::make_unique<DeliveryCallback>(std::move(on_delivery));
    RdKafka::ErrorCode err;
    while (true) {
        err = producer_->produce(
            topic,
            RdKafka::Topic::PARTITION_UA,
            RdKafka::Producer::RK_MSG_COPY,
            const_cast<char*>(payload.data()),
            payload.size(),
            NULL, 0,
            0,
            opaque.get()
        );
        if (err != RdKafka::ERR__QUEUE_FULL) break;
        producer_->poll(1);
    }
    if (err != RdKafka::ERR_NO_ERROR) {
        throw DeliveryError(topic, RdKafka::err2str(err));
    }
    // Owned by the delivery report from here on
    opaque.release();
}

int KafkaProducerClient::Flush(int timeout_ms) {
    RdKafka::ErrorCode err = producer_->flush(timeout_ms);
    if (err != RdKafka::ERR_NO_ERROR && err != RdKafka::ERR__TIMED_OUT) {
        LOG(WARNING) << "Flush failed: " << RdKafka::err2str(err);
    }
    return producer_->outq_len();
}

} // namespace SalKafka
