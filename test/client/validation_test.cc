#include <gtest/gtest.h>
#include "../../src/client/post_process.h"
#include "../../src/client/synthetic_data.h"
#include "../../src/client/validation.h"
#include "../../src/common/errors.h"
#include "../test_component.h"

using namespace SalKafka;

class ValidationTest : public ::testing::Test {
protected:
    void SetUp() override {
        component_ = testutil::LoadTestComponent();
        topic_ = &component_.topics.at("tel_scalars");
        data_ = DeriveSyntheticData(*topic_);
    }

    ComponentDescriptor component_;
    const TopicDescriptor* topic_;
    FieldMap data_;
    FieldMap scratch_;
};

TEST_F(ValidationTest, ParsesEveryName) {
    for (const auto& name : ValidationTypeNames()) {
        EXPECT_EQ(ValidationTypeName(ParseValidationType(name)), name);
    }
    EXPECT_EQ(ParseValidationType("pydantic_and_decode"), ValidationType::kPydanticAndDecode);
    EXPECT_THROW(ParseValidationType("strict"), ConfigurationError);
}

TEST_F(ValidationTest, EveryStrategyAcceptsSyntheticData) {
    for (const auto& name : ValidationTypeNames()) {
        auto strategy = MakeValidationStrategy(ParseValidationType(name), *topic_);
        const FieldMap& out = ApplyValidation(strategy, data_, scratch_);
        EXPECT_EQ(out, data_) << name;
    }
}

TEST_F(ValidationTest, NoneLetsAnythingThrough) {
    FieldMap junk;
    junk["whatever"] = true;
    auto strategy = MakeValidationStrategy(ValidationType::kNone, *topic_);
    EXPECT_EQ(&ApplyValidation(strategy, junk, scratch_), &junk);
}

TEST_F(ValidationTest, CustomRejectsWrongType) {
    data_["int0"] = 1.5;
    auto strategy = MakeValidationStrategy(ValidationType::kCustom, *topic_);
    EXPECT_THROW(ApplyValidation(strategy, data_, scratch_), ValidationError);
}

TEST_F(ValidationTest, DataclassRejectsMissingField) {
    data_.erase("string0");
    auto strategy = MakeValidationStrategy(ValidationType::kDataclass, *topic_);
    EXPECT_THROW(ApplyValidation(strategy, data_, scratch_), ValidationError);
}

TEST_F(ValidationTest, DecodeVariantsSendTheRederivedMessage) {
    data_["double0"] = int64_t{3};

    auto plain = MakeValidationStrategy(ValidationType::kPydantic, *topic_);
    EXPECT_EQ(&ApplyValidation(plain, data_, scratch_), &data_);

    auto decode = MakeValidationStrategy(ValidationType::kPydanticAndDecode, *topic_);
    const FieldMap& out = ApplyValidation(decode, data_, scratch_);
    EXPECT_EQ(&out, &scratch_);
    EXPECT_DOUBLE_EQ(std::get<double>(out.at("double0")), 3.0);

    // The strict record does not coerce
    auto record = MakeValidationStrategy(ValidationType::kDataclassAndDecode, *topic_);
    EXPECT_THROW(ApplyValidation(record, data_, scratch_), ValidationError);
}

TEST_F(ValidationTest, PostProcessNamesAndShapes) {
    for (const auto& name : PostProcessTypeNames()) {
        EXPECT_EQ(PostProcessTypeName(ParsePostProcessType(name)), name);
    }
    EXPECT_THROW(ParsePostProcessType("json"), ConfigurationError);

    ProcessedMessage none = ApplyPostProcess(MakePostProcessStrategy(PostProcessType::kNone), *topic_, data_);
    EXPECT_TRUE(std::holds_alternative<std::monostate>(none));
    EXPECT_EQ(ToString(none, *topic_, data_).rfind("private_sndStamp=1.1", 0), 0u);

    ProcessedMessage record = ApplyPostProcess(MakePostProcessStrategy(PostProcessType::kDataclass), *topic_, data_);
    ASSERT_TRUE(std::holds_alternative<TopicRecord>(record));
    EXPECT_EQ(std::get<TopicRecord>(record).ToFieldMap(), data_);

    ProcessedMessage model = ApplyPostProcess(MakePostProcessStrategy(PostProcessType::kPydantic), *topic_, data_);
    EXPECT_TRUE(std::holds_alternative<TopicModel>(model));

    ProcessedMessage bag = ApplyPostProcess(MakePostProcessStrategy(PostProcessType::kSimpleNamespace), *topic_, data_);
    ASSERT_TRUE(std::holds_alternative<AttributeBag>(bag));
    EXPECT_EQ(ToString(bag, *topic_, data_).rfind("namespace(", 0), 0u);
}
