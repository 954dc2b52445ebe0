#include <gtest/gtest.h>
#include "../../src/client/producer_pipeline.h"
#include "../../src/client/synthetic_data.h"
#include "../../src/common/errors.h"
#include "../fake_clients.h"
#include "../test_component.h"

#include <unistd.h>

using namespace SalKafka;

class ProducerPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        component_ = testutil::LoadTestComponent();
        topic_ = &component_.topics.at("tel_scalars");
        deserializer_.AddSchema(kSchemaId, topic_->schema);
    }

    std::unique_ptr<ProducerPipeline> MakePipeline(ValidationType validation, ProducerOptions options) {
        return std::make_unique<ProducerPipeline>(*topic_, DeriveSyntheticData(*topic_),
                MakeValidationStrategy(validation, *topic_), Serializer(topic_->schema, kSchemaId),
                producer_, options);
    }

    // Decoded body of every delivered message
    std::vector<FieldMap> Delivered() {
        std::vector<FieldMap> out;
        for (const auto& [wire_name, payload] : client_.delivered()) {
            EXPECT_EQ(wire_name, topic_->wire_name);
            out.push_back(deserializer_.Deserialize(payload).data);
        }
        return out;
    }

    static constexpr int32_t kSchemaId = 11;

    ComponentDescriptor component_;
    const TopicDescriptor* topic_;
    Deserializer deserializer_{nullptr};
    boost::asio::io_context io_;
    WorkerPool pool_{1, "producer"};
    BlockingBridge bridge_{io_, pool_};
    testutil::FakeProducerClient client_;
    AsyncProducer producer_{bridge_, client_, 1000};
};

TEST_F(ProducerPipelineTest, PublishesSequencedMessages) {
    auto pipeline = MakePipeline(ValidationType::kDataclass, ProducerOptions{5, 3});
    ProducerResult result;
    bool done = false;
    pipeline->Start([&](const ProducerResult& r) {
        result = r;
        done = true;
    });
    io_.run();

    ASSERT_TRUE(done);
    EXPECT_EQ(result.messages, 5);
    EXPECT_EQ(pipeline->published(), 5);
    EXPECT_GT(result.messages_per_second, 0.0);

    std::vector<FieldMap> messages = Delivered();
    ASSERT_EQ(messages.size(), 5u);
    double previous_stamp = 0.0;
    for (size_t i = 0; i < messages.size(); ++i) {
        const FieldMap& m = messages[i];
        EXPECT_EQ(std::get<int64_t>(m.at(kSeqNumField)), static_cast<int64_t>(i + 1));
        EXPECT_EQ(std::get<int64_t>(m.at(kIndexField)), 3);
        EXPECT_EQ(std::get<int64_t>(m.at(kOriginField)), getpid());
        EXPECT_EQ(std::get<std::string>(m.at(kIdentityField)), "Test:3");
        EXPECT_EQ(std::get<std::string>(m.at("string0")), kSyntheticString);

        const double stamp = std::get<double>(m.at(kSndStampField));
        EXPECT_GE(stamp, previous_stamp);
        previous_stamp = stamp;
    }
}

TEST_F(ProducerPipelineTest, ZeroMessagesFinishesImmediately) {
    auto pipeline = MakePipeline(ValidationType::kNone, ProducerOptions{0, 0});
    bool done = false;
    pipeline->Start([&](const ProducerResult& r) {
        EXPECT_EQ(r.messages, 0);
        done = true;
    });
    EXPECT_TRUE(done);
    io_.run();
    EXPECT_TRUE(client_.delivered().empty());
}

TEST_F(ProducerPipelineTest, DeliveryFailureEscapesRun) {
    client_.set_mode(testutil::FakeProducerClient::Mode::kFail);
    auto pipeline = MakePipeline(ValidationType::kNone, ProducerOptions{3, 0});
    bool done = false;
    pipeline->Start([&](const ProducerResult&) { done = true; });
    EXPECT_THROW(io_.run(), DeliveryError);
    EXPECT_FALSE(done);
    EXPECT_EQ(pipeline->published(), 0);
}

TEST_F(ProducerPipelineTest, InvalidRecordIsRejectedBeforePublishing) {
    FieldMap base = DeriveSyntheticData(*topic_);
    base["int0"] = std::string("not a number");
    ProducerPipeline pipeline(*topic_, base, MakeValidationStrategy(ValidationType::kCustom, *topic_),
            Serializer(topic_->schema, kSchemaId), producer_, ProducerOptions{1, 0});
    EXPECT_THROW(pipeline.Start([](const ProducerResult&) {}), ValidationError);
    io_.run();
    EXPECT_TRUE(client_.delivered().empty());
}
