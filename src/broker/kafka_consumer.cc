#include "kafka_consumer.h"

#include <random>

#include <glog/logging.h>
#include <librdkafka/rdkafkacpp.h>

#include "../common/errors.h"

namespace SalKafka {

namespace {

void SetOrThrow(RdKafka::Conf* conf, const std::string& name, const std::string& value) {
    std::string errstr;
    if (conf->set(name, value, errstr) != RdKafka::Conf::CONF_OK) {
        throw MessageError("<consumer>", RdKafka::ERR__INVALID_ARG, "invalid " + name + ": " + errstr);
    }
}

} // namespace

std::string MakeRandomGroupId() {
    static constexpr char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    std::random_device rd;
    std::uniform_int_distribution<int> byte(0, 255);
    uint8_t bytes[12];
    for (auto& b : bytes) b = static_cast<uint8_t>(byte(rd));

    // 12 bytes encode to exactly 16 characters with no padding
    std::string out;
    out.reserve(16);
    for (size_t i = 0; i < sizeof(bytes); i += 3) {
        const uint32_t n = (bytes[i] << 16) | (bytes[i + 1] << 8) | bytes[i + 2];
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.push_back(kAlphabet[(n >> 6) & 0x3F]);
        out.push_back(kAlphabet[n & 0x3F]);
    }
    return out;
}

KafkaConsumerClient::KafkaConsumerClient(const std::string& bootstrap_servers,
        const std::string& group_id, const std::string& auto_offset_reset) {
    std::unique_ptr<RdKafka::Conf> conf(RdKafka::Conf::create(RdKafka::Conf::CONF_GLOBAL));
    SetOrThrow(conf.get(), "bootstrap.servers", bootstrap_servers);
    SetOrThrow(conf.get(), "group.id", group_id);
    SetOrThrow(conf.get(), "auto.offset.reset", auto_offset_reset);

    std::string errstr;
    consumer_.reset(RdKafka::KafkaConsumer::create(conf.get(), errstr));
    if (!consumer_) {
        throw MessageError("<consumer>", RdKafka::ERR__FAIL, "failed to create consumer: " + errstr);
    }
    LOG(INFO) << "Created consumer " << consumer_->name() << " in group " << group_id;
}

KafkaConsumerClient::~KafkaConsumerClient() {
    Close();
}

void KafkaConsumerClient::Subscribe(const std::vector<std::string>& topics) {
    RdKafka::ErrorCode err = consumer_->subscribe(topics);
    if (err) {
        throw MessageError(topics.empty() ? "<none>" : topics.front(), err,
                "failed to subscribe: " + RdKafka::err2str(err));
    }
}

std::unique_ptr<ConsumedMessage> KafkaConsumerClient::Poll(int timeout_ms) {
    std::unique_ptr<RdKafka::Message> message(consumer_->consume(timeout_ms));
    if (!message || message->err() == RdKafka::ERR__TIMED_OUT) {
        return nullptr;
    }
    auto consumed = std::make_unique<ConsumedMessage>();
    consumed->topic = message->topic_name();
    consumed->partition = message->partition();
    consumed->offset = message->offset();
    if (message->err()) {
        consumed->error_code = static_cast<int>(message->err());
        consumed->error = message->errstr();
        return consumed;
    }
    consumed->payload.assign(static_cast<const char*>(message->payload()), message->len());
    return consumed;
}

void KafkaConsumerClient::Close() {
    if (closed_ || !consumer_) return;
    closed_ = true;
    RdKafka::ErrorCode err = consumer_->close();
    if (err) {
        LOG(WARNING) << "Failed to close consumer: " << RdKafka::err2str(err);
    }
}

} // namespace SalKafka
