#include <gtest/gtest.h>
#include "../../src/bridge/async_consumer.h"
#include "../../src/common/errors.h"
#include "../fake_clients.h"

using namespace SalKafka;

class AsyncConsumerTest : public ::testing::Test {
protected:
    boost::asio::io_context io_;
    WorkerPool pool_{1, "consumer"};
    BlockingBridge bridge_{io_, pool_};
    testutil::FakeConsumerClient client_;
    AsyncConsumer consumer_{bridge_, client_, 10};
};

TEST_F(AsyncConsumerTest, SubscribeRunsOnPool) {
    bool handled = false;
    consumer_.AsyncSubscribe({"a", "b"}, [&](std::exception_ptr error) {
        EXPECT_FALSE(error);
        handled = true;
    });
    io_.run();
    EXPECT_TRUE(handled);
    EXPECT_EQ(client_.subscribed(), (std::vector<std::string>{"a", "b"}));
}

TEST_F(AsyncConsumerTest, SubscribeErrorReachesHandler) {
    client_.set_fail_subscribe(true);
    std::exception_ptr seen;
    consumer_.AsyncSubscribe({"a"}, [&](std::exception_ptr error) { seen = error; });
    io_.run();
    EXPECT_TRUE(seen);
}

TEST_F(AsyncConsumerTest, ReadsArriveInClientOrder) {
    for (int i = 0; i < 3; ++i) client_.Push("t", "m" + std::to_string(i));

    std::vector<std::string> payloads;
    std::function<void()> read_next = [&] {
        consumer_.AsyncRead([&](std::exception_ptr error, std::unique_ptr<ConsumedMessage> message) {
            ASSERT_FALSE(error);
            ASSERT_TRUE(message);
            EXPECT_FALSE(consumer_.read_outstanding());
            payloads.push_back(message->payload);
            if (payloads.size() < 3) read_next();
        });
    };
    read_next();
    io_.run();
    EXPECT_EQ(payloads, (std::vector<std::string>{"m0", "m1", "m2"}));
}

TEST_F(AsyncConsumerTest, SecondOutstandingReadThrows) {
    client_.Push("t", "m0");
    consumer_.AsyncRead([](std::exception_ptr, std::unique_ptr<ConsumedMessage>) {});
    EXPECT_TRUE(consumer_.read_outstanding());
    EXPECT_THROW(consumer_.AsyncRead([](std::exception_ptr, std::unique_ptr<ConsumedMessage>) {}), Error);
    io_.run();
    EXPECT_FALSE(consumer_.read_outstanding());
}

TEST_F(AsyncConsumerTest, BrokerErrorBecomesMessageError) {
    ConsumedMessage bad;
    bad.topic = "t";
    bad.error_code = 3;
    bad.error = "Broker: Unknown topic or partition";
    client_.Push(std::move(bad));

    std::exception_ptr seen;
    consumer_.AsyncRead([&](std::exception_ptr error, std::unique_ptr<ConsumedMessage> message) {
        seen = error;
        EXPECT_FALSE(message);
    });
    io_.run();
    ASSERT_TRUE(seen);
    try {
        std::rethrow_exception(seen);
    } catch (const MessageError& e) {
        EXPECT_EQ(e.code(), 3);
        EXPECT_EQ(e.topic(), "t");
    }
}

TEST_F(AsyncConsumerTest, ShutdownEndsIdleRead) {
    bool handled = false;
    consumer_.AsyncRead([&](std::exception_ptr error, std::unique_ptr<ConsumedMessage> message) {
        EXPECT_FALSE(error);
        EXPECT_FALSE(message);
        handled = true;
    });
    // Let the read spin on empty polls before asking it to stop
    while (client_.polls() < 3) std::this_thread::yield();
    consumer_.Shutdown();
    io_.run();
    EXPECT_TRUE(handled);
}
