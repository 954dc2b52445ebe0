#include "async_producer.h"

#include <chrono>
#include <future>
#include <memory>

#include <glog/logging.h>

#include "../common/errors.h"

namespace SalKafka {

void AsyncProducer::AsyncPublish(std::string topic, std::string payload, PublishHandler handler) {
    auto blocking_publish = [this, topic, payload = std::move(payload)]() {
        auto ack = std::make_shared<std::promise<void>>();
        std::future<void> acked = ack->get_future();
        client_.Produce(topic, payload, [ack](const DeliveryReport& report) {
            if (report.ok()) {
                ack->set_value();
            } else {
                ack->set_exception(std::make_exception_ptr(DeliveryError(report.topic, report.error)));
            }
        });
        int remaining = client_.Flush(flush_timeout_ms_);
        if (remaining > 0) {
            VLOG(1) << remaining << " messages still queued after flush of " << topic;
        }
        return acked;
    };

    bridge_.Dispatch(std::move(blocking_publish),
        [topic, handler = std::move(handler)](std::exception_ptr error, std::future<void> acked) {
            if (!error) {
                if (acked.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                    error = std::make_exception_ptr(DeliveryError(topic, "no delivery report after flush"));
                } else {
                    try {
                        acked.get();
                    } catch (const DeliveryError&) {
                        error = std::current_exception();
                    } catch (const std::future_error& e) {
                        // Client dropped the callback without reporting
                        error = std::make_exception_ptr(DeliveryError(topic, e.what()));
                    }
                }
            }
            handler(error);
        });
}

} // namespace SalKafka
