#include <gtest/gtest.h>
#include "../../src/metadata/metadata_source.h"
#include "../../src/common/errors.h"
#include "../test_component.h"

using namespace SalKafka;

TEST(SalNameTest, MapsPrefixes) {
    EXPECT_EQ(SalNameFromLogicalName("evt_summaryState"), "logevent_summaryState");
    EXPECT_EQ(SalNameFromLogicalName("cmd_start"), "command_start");
    EXPECT_EQ(SalNameFromLogicalName("tel_scalars"), "scalars");
    EXPECT_EQ(SalNameFromLogicalName("ack_ackcmd"), "ackcmd");
    EXPECT_THROW(SalNameFromLogicalName("scalars"), ConfigurationError);
    EXPECT_THROW(SalNameFromLogicalName("ack_other"), ConfigurationError);
}

TEST(SalNameTest, WireNameAndSubject) {
    const std::string wire = MakeWireName("lsst.sal", "Test", "logevent_scalars");
    EXPECT_EQ(wire, "lsst.sal.Test.logevent_scalars");
    EXPECT_EQ(MakeSubject(wire), "lsst.sal.Test.logevent_scalars-value");
}

TEST(SalNameTest, FieldTypes) {
    EXPECT_EQ(FieldTypeFromSalType("short"), FieldType::kInt);
    EXPECT_EQ(FieldTypeFromSalType("unsigned short"), FieldType::kInt);
    EXPECT_EQ(FieldTypeFromSalType("long long"), FieldType::kLong);
    EXPECT_EQ(FieldTypeFromSalType("unsigned int"), FieldType::kLong);
    EXPECT_EQ(FieldTypeFromSalType("float"), FieldType::kFloat);
    EXPECT_EQ(FieldTypeFromSalType("map"), FieldType::kMap);
    EXPECT_THROW(FieldTypeFromSalType("quaternion"), ConfigurationError);
}

TEST(PrivateFieldsTest, IndexFieldOnlyWhenIndexed) {
    auto plain = MakePrivateFields(false);
    auto indexed = MakePrivateFields(true);
    ASSERT_EQ(plain.size(), 5u);
    ASSERT_EQ(indexed.size(), 6u);
    EXPECT_EQ(plain[0].name, kSndStampField);
    EXPECT_EQ(plain[0].units, "second");
    EXPECT_EQ(plain[2].units, "unitless");
    EXPECT_EQ(indexed.back().name, kIndexField);
}

class YamlMetadataSourceTest : public ::testing::Test {
protected:
    YamlMetadataSource source_{"/nonexistent", "lsst.sal"};
};

TEST_F(YamlMetadataSourceTest, LoadsShippedComponent) {
    ComponentDescriptor component = testutil::LoadTestComponent();
    EXPECT_EQ(component.name, "Test");
    EXPECT_TRUE(component.is_indexed);
    ASSERT_EQ(component.topics.count("evt_arrays"), 1u);

    const TopicDescriptor& arrays = component.topics.at("evt_arrays");
    EXPECT_EQ(arrays.sal_name, "logevent_arrays");
    EXPECT_EQ(arrays.wire_name, "lsst.sal.Test.logevent_arrays");
    EXPECT_EQ(arrays.subject, "lsst.sal.Test.logevent_arrays-value");
    EXPECT_EQ(arrays.fields.front().name, kSndStampField);
    ASSERT_NE(arrays.FindField(kIndexField), nullptr);

    const FieldDescriptor* float0 = arrays.FindField("float0");
    ASSERT_NE(float0, nullptr);
    EXPECT_EQ(float0->count, 5u);
    EXPECT_EQ(std::get<std::vector<double>>(*float0->default_value), std::vector<double>(5, 0.5));

    ASSERT_NE(arrays.schema, nullptr);
    EXPECT_EQ(arrays.schema->FullName(), "lsst.sal.Test.logevent_arrays");
    EXPECT_EQ(arrays.schema->fields().size(), arrays.fields.size());

    const TopicDescriptor& settings = component.topics.at("evt_settings");
    EXPECT_FALSE(settings.FindField("values")->default_value.has_value());
}

TEST_F(YamlMetadataSourceTest, UnknownComponentIsConfigurationError) {
    EXPECT_THROW(source_.LoadComponent("Missing"), ConfigurationError);
}

TEST_F(YamlMetadataSourceTest, ScalarDefaultIsReplicated) {
    auto component = source_.ParseComponent(R"(
component: Demo
topics:
  - name: tel_pos
    fields:
      - {name: xyz, type: int, count: 3, default: 7}
      - {name: label, type: string, default: home}
)");
    EXPECT_FALSE(component.is_indexed);
    const TopicDescriptor& pos = component.topics.at("tel_pos");
    EXPECT_EQ(pos.FindField(kIndexField), nullptr);
    EXPECT_EQ(std::get<std::vector<int64_t>>(*pos.FindField("xyz")->default_value),
              (std::vector<int64_t>{7, 7, 7}));
    EXPECT_EQ(std::get<std::string>(*pos.FindField("label")->default_value), "home");
}

TEST_F(YamlMetadataSourceTest, MalformedDefinitionsAreRejected) {
    // wrong default length
    EXPECT_THROW(source_.ParseComponent(R"(
component: Demo
topics:
  - name: tel_pos
    fields:
      - {name: xyz, type: int, count: 3, default: [1, 2]}
)"), ConfigurationError);

    // duplicate field
    EXPECT_THROW(source_.ParseComponent(R"(
component: Demo
topics:
  - name: tel_pos
    fields:
      - {name: x, type: int}
      - {name: x, type: double}
)"), ConfigurationError);

    // field shadowing a private field
    EXPECT_THROW(source_.ParseComponent(R"(
component: Demo
topics:
  - name: tel_pos
    fields:
      - {name: private_seqNum, type: int}
)"), ConfigurationError);

    // bad prefix
    EXPECT_THROW(source_.ParseComponent(R"(
component: Demo
topics:
  - name: pos
    fields: []
)"), ConfigurationError);

    EXPECT_THROW(source_.ParseComponent("component: [oops"), ConfigurationError);
}
