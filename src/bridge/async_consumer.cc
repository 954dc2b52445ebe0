#include "async_consumer.h"

#include <glog/logging.h>

#include "../common/errors.h"

namespace SalKafka {

void AsyncConsumer::AsyncSubscribe(std::vector<std::string> topics,
        std::function<void(std::exception_ptr)> handler) {
    bridge_.Dispatch(
        [this, topics = std::move(topics)]() {
            client_.Subscribe(topics);
            return true;
        },
        [handler = std::move(handler)](std::exception_ptr error, bool) { handler(error); });
}

void AsyncConsumer::AsyncRead(ReadHandler handler) {
    if (read_outstanding_) {
        throw Error("a read is already outstanding");
    }
    read_outstanding_ = true;

    auto blocking_read = [this]() -> std::unique_ptr<ConsumedMessage> {
        while (!shutdown_) {
            std::unique_ptr<ConsumedMessage> message = client_.Poll(poll_timeout_ms_);
            if (!message) continue;
            if (!message->ok()) {
                throw MessageError(message->topic, message->error_code, message->error);
            }
            return message;
        }
        VLOG(1) << "Read abandoned at shutdown";
        return nullptr;
    };

    bridge_.Dispatch(std::move(blocking_read),
        [this, handler = std::move(handler)](std::exception_ptr error,
                                             std::unique_ptr<ConsumedMessage> message) {
            read_outstanding_ = false;
            handler(error, std::move(message));
        });
}

} // namespace SalKafka
