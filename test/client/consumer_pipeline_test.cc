#include <gtest/gtest.h>
#include "../../src/client/consumer_pipeline.h"
#include "../../src/client/synthetic_data.h"
#include "../../src/common/clock.h"
#include "../../src/common/errors.h"
#include "../fake_clients.h"
#include "../test_component.h"

#include <sstream>

using namespace SalKafka;

class ConsumerPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        component_ = testutil::LoadTestComponent();
        scalars_ = &component_.topics.at("tel_scalars");
        arrays_ = &component_.topics.at("tel_arrays");
        scalars_id_ = registry_.RegisterSchema(scalars_->subject, *scalars_->schema);
        arrays_id_ = registry_.RegisterSchema(arrays_->subject, *arrays_->schema);
        topics_[scalars_->wire_name] = scalars_;
        topics_[arrays_->wire_name] = arrays_;
    }

    // Queue one message stamped slightly in the past
    void PushMessage(const TopicDescriptor* topic, int32_t schema_id, int64_t seq) {
        FieldMap data = DeriveSyntheticData(*topic);
        data[kSeqNumField] = seq;
        data[kSndStampField] = UnixTimeSeconds() - 0.01;
        client_.Push(topic->wire_name, Serializer(topic->schema, schema_id).Serialize(data));
    }

    void SeedSchemas() {
        deserializer_.AddSchema(scalars_id_, scalars_->schema);
        deserializer_.AddSchema(arrays_id_, arrays_->schema);
    }

    std::unique_ptr<ConsumerPipeline> MakePipeline(PostProcessType post, ConsumerOptions options) {
        return std::make_unique<ConsumerPipeline>(topics_, deserializer_, admin_bridge_,
                MakePostProcessStrategy(post), consumer_, options, out_);
    }

    ComponentDescriptor component_;
    const TopicDescriptor* scalars_;
    const TopicDescriptor* arrays_;
    int32_t scalars_id_ = 0;
    int32_t arrays_id_ = 0;
    std::map<std::string, const TopicDescriptor*> topics_;
    testutil::FakeSchemaRegistry registry_;
    Deserializer deserializer_{&registry_};
    std::ostringstream out_;

    boost::asio::io_context io_;
    WorkerPool consumer_pool_{1, "consumer"};
    WorkerPool admin_pool_{1, "admin"};
    BlockingBridge consumer_bridge_{io_, consumer_pool_};
    BlockingBridge admin_bridge_{io_, admin_pool_};
    testutil::FakeConsumerClient client_;
    AsyncConsumer consumer_{consumer_bridge_, client_, 10};
};

TEST_F(ConsumerPipelineTest, ReadsRequestedCountAndStamps) {
    SeedSchemas();
    for (int i = 1; i <= 4; ++i) PushMessage(i % 2 ? scalars_ : arrays_, i % 2 ? scalars_id_ : arrays_id_, i);

    auto pipeline = MakePipeline(PostProcessType::kDataclass, ConsumerOptions{3, false});
    std::vector<int64_t> seqs;
    pipeline->set_observer([&](int64_t index, const TopicDescriptor& topic, const FieldMap& data) {
        EXPECT_EQ(index, static_cast<int64_t>(seqs.size() + 1));
        EXPECT_EQ(&topic, index % 2 ? scalars_ : arrays_);
        EXPECT_GE(std::get<double>(data.at(kRcvStampField)), std::get<double>(data.at(kSndStampField)));
        seqs.push_back(std::get<int64_t>(data.at(kSeqNumField)));
    });
    ConsumerResult result;
    pipeline->Start([&](const ConsumerResult& r) { result = r; });
    io_.run();

    EXPECT_EQ(client_.subscribed(), (std::vector<std::string>{arrays_->wire_name, scalars_->wire_name}));
    EXPECT_EQ(seqs, (std::vector<int64_t>{1, 2, 3}));
    EXPECT_EQ(result.messages, 3);
    EXPECT_EQ(result.delays.count, 3u);
    EXPECT_GT(result.delays.min, 0.0);
    EXPECT_EQ(registry_.get_calls(), 0);

    const std::string printed = out_.str();
    EXPECT_NE(printed.find("read [1]: TopicRecord(scalars"), std::string::npos);
    EXPECT_NE(printed.find("read [2]: TopicRecord(arrays"), std::string::npos);
    EXPECT_EQ(printed.find("read [4]"), std::string::npos);
}

TEST_F(ConsumerPipelineTest, TimeModePrintsNothing) {
    SeedSchemas();
    for (int i = 1; i <= 2; ++i) PushMessage(scalars_, scalars_id_, i);
    auto pipeline = MakePipeline(PostProcessType::kNone, ConsumerOptions{2, true});
    ConsumerResult result;
    pipeline->Start([&](const ConsumerResult& r) { result = r; });
    io_.run();

    EXPECT_TRUE(out_.str().empty());
    EXPECT_EQ(result.messages, 2);
}

TEST_F(ConsumerPipelineTest, UnknownSchemaIsFetchedOnce) {
    for (int i = 1; i <= 3; ++i) PushMessage(scalars_, scalars_id_, i);
    auto pipeline = MakePipeline(PostProcessType::kNone, ConsumerOptions{3, false});
    int64_t received = 0;
    pipeline->Start([&](const ConsumerResult& r) { received = r.messages; });
    io_.run();

    EXPECT_EQ(received, 3);
    EXPECT_EQ(registry_.get_calls(), 1);
    EXPECT_TRUE(deserializer_.HasSchema(scalars_id_));
}

TEST_F(ConsumerPipelineTest, PostProcessingDoesNotChangeWhatIsObserved) {
    SeedSchemas();
    std::vector<FieldMap> seen[4];
    const PostProcessType types[] = {PostProcessType::kNone, PostProcessType::kDataclass,
                                     PostProcessType::kPydantic, PostProcessType::kSimpleNamespace};
    for (int t = 0; t < 4; ++t) {
        PushMessage(scalars_, scalars_id_, 7);
        AsyncConsumer consumer(consumer_bridge_, client_, 10);
        ConsumerPipeline pipeline(topics_, deserializer_, admin_bridge_, MakePostProcessStrategy(types[t]),
                consumer, ConsumerOptions{1, false}, out_);
        pipeline.set_observer([&seen, t](int64_t, const TopicDescriptor&, const FieldMap& data) {
            FieldMap copy = data;
            copy.erase(kRcvStampField);
            copy.erase(kSndStampField);
            seen[t].push_back(std::move(copy));
        });
        pipeline.Start([](const ConsumerResult&) {});
        io_.run();
        io_.restart();
    }
    for (int t = 0; t < 4; ++t) {
        ASSERT_EQ(seen[t].size(), 1u);
        EXPECT_EQ(seen[t][0], seen[0][0]);
    }
}

TEST_F(ConsumerPipelineTest, UnboundedReadEndsAtShutdown) {
    SeedSchemas();
    for (int i = 1; i <= 5; ++i) PushMessage(scalars_, scalars_id_, i);
    auto pipeline = MakePipeline(PostProcessType::kNone, ConsumerOptions{0, true});
    pipeline->set_observer([&](int64_t index, const TopicDescriptor&, const FieldMap&) {
        if (index == 5) consumer_.Shutdown();
    });
    ConsumerResult result;
    bool done = false;
    pipeline->Start([&](const ConsumerResult& r) {
        result = r;
        done = true;
    });
    io_.run();

    ASSERT_TRUE(done);
    EXPECT_EQ(result.messages, 5);
    EXPECT_EQ(result.delays.count, 5u);
}

TEST_F(ConsumerPipelineTest, MessageFromUnsubscribedTopicIsMessageError) {
    SeedSchemas();
    FieldMap data = DeriveSyntheticData(*scalars_);
    client_.Push("lsst.sal.Other.scalars", Serializer(scalars_->schema, scalars_id_).Serialize(data));
    auto pipeline = MakePipeline(PostProcessType::kNone, ConsumerOptions{1, false});
    pipeline->Start([](const ConsumerResult&) {});
    EXPECT_THROW(io_.run(), MessageError);
}

TEST_F(ConsumerPipelineTest, BrokerErrorEscapesRun) {
    ConsumedMessage bad;
    bad.topic = scalars_->wire_name;
    bad.error_code = 1;
    bad.error = "Broker: Offset out of range";
    client_.Push(std::move(bad));
    auto pipeline = MakePipeline(PostProcessType::kNone, ConsumerOptions{1, false});
    pipeline->Start([](const ConsumerResult&) {});
    EXPECT_THROW(io_.run(), MessageError);
}
