#include <gtest/gtest.h>
#include "../../src/metadata/record_types.h"
#include "../../src/common/errors.h"
#include "../test_component.h"

using namespace SalKafka;

class RecordTypesTest : public ::testing::Test {
protected:
    void SetUp() override {
        component_ = testutil::LoadTestComponent();
        scalars_ = &component_.topics.at("tel_scalars");
        arrays_ = &component_.topics.at("tel_arrays");
        data_ = testutil::DefaultData(*scalars_);
        data_["int0"] = int64_t{3};
        data_["double0"] = 2.5;
        data_["string0"] = std::string("a short string");
    }

    ComponentDescriptor component_;
    const TopicDescriptor* scalars_;
    const TopicDescriptor* arrays_;
    FieldMap data_;
};

TEST_F(RecordTypesTest, ValidatorAcceptsValidAndPartialData) {
    FieldValidator validator(*scalars_);
    EXPECT_NO_THROW(validator.Validate(data_));

    FieldMap partial;
    partial["double0"] = int64_t{1};
    EXPECT_NO_THROW(validator.Validate(partial));
}

TEST_F(RecordTypesTest, ValidatorRejectsBadData) {
    FieldValidator validator(*scalars_);

    FieldMap wrong_type = data_;
    wrong_type["int0"] = std::string("three");
    try {
        validator.Validate(wrong_type);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.field(), "int0");
    }

    FieldMap unknown = data_;
    unknown["int1"] = int64_t{0};
    EXPECT_THROW(validator.Validate(unknown), ValidationError);

    FieldValidator array_validator(*arrays_);
    FieldMap short_array;
    short_array["int0"] = std::vector<int64_t>{1, 2};
    EXPECT_THROW(array_validator.Validate(short_array), ValidationError);
}

TEST_F(RecordTypesTest, RecordRequiresEveryDeclaredField) {
    TopicRecord record(*scalars_, data_);
    EXPECT_EQ(record.values().size(), scalars_->fields.size());
    EXPECT_EQ(record.ToFieldMap(), data_);

    FieldMap missing = data_;
    missing.erase("string0");
    EXPECT_THROW((TopicRecord{*scalars_, missing}), ValidationError);

    FieldMap extra = data_;
    extra["bogus"] = true;
    EXPECT_THROW((TopicRecord{*scalars_, extra}), ValidationError);
}

TEST_F(RecordTypesTest, RecordDoesNotCoerce) {
    FieldMap ints = data_;
    ints["double0"] = int64_t{2};
    EXPECT_THROW((TopicRecord{*scalars_, ints}), ValidationError);
}

TEST_F(RecordTypesTest, RecordRendersInDeclarationOrder) {
    const std::string text = TopicRecord(*scalars_, data_).ToString();
    EXPECT_EQ(text.rfind("TopicRecord(scalars, private_sndStamp=", 0), 0u);
    EXPECT_LT(text.find("int0=3"), text.find("double0=2.5"));
}

TEST_F(RecordTypesTest, ModelFillsDefaultsAndCoerces) {
    FieldMap partial;
    partial["double0"] = int64_t{4};
    partial["int0"] = 6.0;
    partial["boolean0"] = int64_t{1};
    partial["ignored"] = std::string("x");

    TopicModel model(*scalars_, partial);
    FieldMap out = model.ToFieldMap();
    EXPECT_EQ(out.size(), scalars_->fields.size());
    EXPECT_EQ(out.count("ignored"), 0u);
    EXPECT_DOUBLE_EQ(std::get<double>(out["double0"]), 4.0);
    EXPECT_EQ(std::get<int64_t>(out["int0"]), 6);
    EXPECT_TRUE(std::get<bool>(out["boolean0"]));
    EXPECT_EQ(std::get<std::string>(out["string0"]), "");
}

TEST_F(RecordTypesTest, ModelRejectsLossyCoercion) {
    FieldMap fractional;
    fractional["int0"] = 2.5;
    EXPECT_THROW((TopicModel{*scalars_, fractional}), ValidationError);

    FieldMap two;
    two["boolean0"] = int64_t{2};
    EXPECT_THROW((TopicModel{*scalars_, two}), ValidationError);

    FieldMap short_array;
    short_array["double0"] = std::vector<int64_t>{1, 2, 3};
    EXPECT_THROW((TopicModel{*arrays_, short_array}), ValidationError);
}

TEST_F(RecordTypesTest, ModelRequiresFieldsWithoutDefault) {
    const TopicDescriptor& settings = component_.topics.at("evt_settings");
    EXPECT_THROW((TopicModel{settings}), ValidationError);
}

TEST_F(RecordTypesTest, AttributeBagHoldsEveryKey) {
    AttributeBag bag(data_);
    EXPECT_EQ(bag.size(), data_.size());
    EXPECT_TRUE(bag.Has("int0"));
    EXPECT_EQ(bag.Get<int64_t>("int0"), 3);
    EXPECT_EQ(bag.Get<std::string>("string0"), "a short string");
    EXPECT_THROW(bag.Get<double>("int0"), std::bad_any_cast);
    EXPECT_THROW(bag.Get<int64_t>("nope"), std::out_of_range);

    const std::string text = bag.ToString();
    EXPECT_EQ(text.rfind("namespace(boolean0=false, double0=2.5", 0), 0u);
}
