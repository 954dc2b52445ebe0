#include <gtest/gtest.h>
#include "../../src/registry/schema_registrar.h"
#include "../../src/common/errors.h"
#include "../fake_clients.h"
#include "../test_component.h"

using namespace SalKafka;

class SchemaRegistrarTest : public ::testing::Test {
protected:
    void SetUp() override {
        component_ = testutil::LoadTestComponent();
    }

    std::vector<const TopicDescriptor*> Topics(const std::vector<std::string>& names) {
        std::vector<const TopicDescriptor*> topics;
        for (const auto& name : names) topics.push_back(&component_.topics.at(name));
        return topics;
    }

    ComponentDescriptor component_;
    testutil::FakeSchemaRegistry registry_;
    SchemaRegistrar registrar_{registry_};
    boost::asio::io_context io_;
    WorkerPool pool_{1, "admin"};
    BlockingBridge bridge_{io_, pool_};
};

TEST_F(SchemaRegistrarTest, RegisterUsesTopicSubject) {
    const TopicDescriptor& topic = component_.topics.at("evt_scalars");
    SchemaRegistration registration = registrar_.Register(topic);
    EXPECT_EQ(registration.subject, "lsst.sal.Test.logevent_scalars-value");
    EXPECT_EQ(registration.schema_id, 1);
}

TEST_F(SchemaRegistrarTest, SameSchemaKeepsItsId) {
    const TopicDescriptor& topic = component_.topics.at("evt_scalars");
    const int32_t first = registrar_.Register(topic).schema_id;
    EXPECT_EQ(registrar_.Register(topic).schema_id, first);
    EXPECT_NE(registrar_.Register(component_.topics.at("tel_scalars")).schema_id, first);
}

TEST_F(SchemaRegistrarTest, AsyncRegisterAllIsSequential) {
    RegistrationMap result;
    bool done = false;
    registrar_.AsyncRegisterAll(bridge_, Topics({"tel_scalars", "evt_arrays", "cmd_setScalars"}),
        [&](std::exception_ptr error, RegistrationMap registrations) {
            EXPECT_FALSE(error);
            result = std::move(registrations);
            done = true;
        });
    io_.run();

    ASSERT_TRUE(done);
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result.at("tel_scalars").schema_id, 1);
    EXPECT_EQ(result.at("evt_arrays").schema_id, 2);
    EXPECT_EQ(result.at("cmd_setScalars").schema_id, 3);
    EXPECT_EQ(registry_.subjects(), (std::vector<std::string>{
        "lsst.sal.Test.scalars-value",
        "lsst.sal.Test.logevent_arrays-value",
        "lsst.sal.Test.command_setScalars-value"}));
}

TEST_F(SchemaRegistrarTest, EmptyListStillCompletes) {
    bool done = false;
    registrar_.AsyncRegisterAll(bridge_, {}, [&](std::exception_ptr error, RegistrationMap registrations) {
        EXPECT_FALSE(error);
        EXPECT_TRUE(registrations.empty());
        done = true;
    });
    EXPECT_FALSE(done);
    io_.run();
    EXPECT_TRUE(done);
}

TEST_F(SchemaRegistrarTest, FailureStopsAtFirstTopic) {
    registry_.set_fail(true);
    std::exception_ptr seen;
    registrar_.AsyncRegisterAll(bridge_, Topics({"tel_scalars", "evt_arrays"}),
        [&](std::exception_ptr error, RegistrationMap) { seen = error; });
    io_.run();

    ASSERT_TRUE(seen);
    EXPECT_THROW(std::rethrow_exception(seen), RegistryError);
    EXPECT_EQ(registry_.register_calls(), 1);
}
