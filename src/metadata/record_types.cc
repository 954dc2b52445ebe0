#include "record_types.h"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "../common/errors.h"

namespace SalKafka {

namespace {

std::string Describe(const FieldDescriptor& field) {
    std::string desc = FieldTypeName(field.type);
    if (field.is_array()) desc += "[" + std::to_string(field.count) + "]";
    return desc;
}

// Type and length check without coercion
void CheckValue(const FieldDescriptor& field, const FieldValue& value, bool allow_int_for_float) {
    bool matches = ValueMatchesType(value, field.type, field.is_array());
    if (!matches && allow_int_for_float && IsFloatingType(field.type)) {
        matches = field.is_array() ? std::holds_alternative<std::vector<int64_t>>(value)
                                   : std::holds_alternative<int64_t>(value);
    }
    if (!matches) {
        throw ValidationError(field.name, "expected " + Describe(field) + ", got " +
                SalKafka::ToString(value));
    }
    if (field.is_array() && ValueLength(value) != field.count) {
        throw ValidationError(field.name, "expected " + std::to_string(field.count) +
                " elements, got " + std::to_string(ValueLength(value)));
    }
}

bool IsIntegral(double d) {
    return std::isfinite(d) && std::floor(d) == d &&
           d >= -9.2233720368547758e18 && d < 9.2233720368547758e18;
}

std::optional<int64_t> ToInteger(const FieldValue& value) {
    if (auto* i = std::get_if<int64_t>(&value)) return *i;
    if (auto* b = std::get_if<bool>(&value)) return *b ? 1 : 0;
    if (auto* d = std::get_if<double>(&value)) {
        if (IsIntegral(*d)) return static_cast<int64_t>(*d);
    }
    return std::nullopt;
}

/**
 * Converts value to the alternative used by field, where this loses no
 * information: int <-> double, 0/1 -> bool, bool -> int.
 * Returns nullopt when no lossless conversion exists.
 */
std::optional<FieldValue> Coerce(const FieldDescriptor& field, const FieldValue& value) {
    if (ValueMatchesType(value, field.type, field.is_array())) return value;

    if (!field.is_array()) {
        if (IsFloatingType(field.type)) {
            if (auto* i = std::get_if<int64_t>(&value)) return FieldValue(static_cast<double>(*i));
        } else if (IsIntegerType(field.type)) {
            if (auto i = ToInteger(value)) return FieldValue(*i);
        } else if (field.type == FieldType::kBoolean) {
            if (auto* i = std::get_if<int64_t>(&value)) {
                if (*i == 0 || *i == 1) return FieldValue(*i == 1);
            }
        }
        return std::nullopt;
    }

    if (IsFloatingType(field.type)) {
        if (auto* ints = std::get_if<std::vector<int64_t>>(&value)) {
            return FieldValue(std::vector<double>(ints->begin(), ints->end()));
        }
    } else if (IsIntegerType(field.type)) {
        if (auto* doubles = std::get_if<std::vector<double>>(&value)) {
            std::vector<int64_t> ints;
            ints.reserve(doubles->size());
            for (double d : *doubles) {
                if (!IsIntegral(d)) return std::nullopt;
                ints.push_back(static_cast<int64_t>(d));
            }
            return FieldValue(std::move(ints));
        }
        if (auto* bools = std::get_if<std::vector<bool>>(&value)) {
            std::vector<int64_t> ints;
            ints.reserve(bools->size());
            for (bool b : *bools) ints.push_back(b ? 1 : 0);
            return FieldValue(std::move(ints));
        }
    } else if (field.type == FieldType::kBoolean) {
        if (auto* ints = std::get_if<std::vector<int64_t>>(&value)) {
            std::vector<bool> bools;
            bools.reserve(ints->size());
            for (int64_t i : *ints) {
                if (i != 0 && i != 1) return std::nullopt;
                bools.push_back(i == 1);
            }
            return FieldValue(std::move(bools));
        }
    }
    return std::nullopt;
}

std::string RenderSlots(const char* kind, const TopicDescriptor& topic,
        const std::vector<FieldValue>& values) {
    std::ostringstream out;
    out << kind << '(' << topic.sal_name;
    for (size_t i = 0; i < values.size(); ++i) {
        out << ", " << topic.fields[i].name << '=' << SalKafka::ToString(values[i]);
    }
    out << ')';
    return out.str();
}

FieldMap SlotsToFieldMap(const TopicDescriptor& topic, const std::vector<FieldValue>& values) {
    FieldMap data;
    data.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        data.emplace(topic.fields[i].name, values[i]);
    }
    return data;
}

// Recovers the FieldValue alternative held by an attribute
FieldValue FromAny(const std::any& value) {
    if (auto* v = std::any_cast<bool>(&value)) return *v;
    if (auto* v = std::any_cast<int64_t>(&value)) return *v;
    if (auto* v = std::any_cast<double>(&value)) return *v;
    if (auto* v = std::any_cast<std::string>(&value)) return *v;
    if (auto* v = std::any_cast<std::vector<bool>>(&value)) return *v;
    if (auto* v = std::any_cast<std::vector<int64_t>>(&value)) return *v;
    if (auto* v = std::any_cast<std::vector<double>>(&value)) return *v;
    return std::any_cast<std::vector<std::string>>(value);
}

} // namespace

// ---------------------------------------------------------------------------
// FieldValidator
// ---------------------------------------------------------------------------

void FieldValidator::Validate(const FieldMap& data) const {
    // Walk in declaration order so the first reported field is deterministic
    for (const auto& field : topic_->fields) {
        auto it = data.find(field.name);
        if (it != data.end()) CheckValue(field, it->second, true);
    }
    for (const auto& [name, value] : data) {
        if (!topic_->FindField(name)) throw ValidationError(name, "unknown field");
    }
}

// ---------------------------------------------------------------------------
// TopicRecord
// ---------------------------------------------------------------------------

TopicRecord::TopicRecord(const TopicDescriptor& topic, const FieldMap& data) : topic_(&topic) {
    values_.reserve(topic.fields.size());
    for (const auto& field : topic.fields) {
        auto it = data.find(field.name);
        if (it == data.end()) {
            throw ValidationError(field.name, "missing");
        }
        CheckValue(field, it->second, false);
        values_.push_back(it->second);
    }
    if (data.size() != topic.fields.size()) {
        for (const auto& [name, value] : data) {
            if (!topic.FindField(name)) throw ValidationError(name, "unexpected field");
        }
    }
}

FieldMap TopicRecord::ToFieldMap() const {
    return SlotsToFieldMap(*topic_, values_);
}

std::string TopicRecord::ToString() const {
    return RenderSlots("TopicRecord", *topic_, values_);
}

// ---------------------------------------------------------------------------
// TopicModel
// ---------------------------------------------------------------------------

TopicModel::TopicModel(const TopicDescriptor& topic) : TopicModel(topic, FieldMap{}) {}

TopicModel::TopicModel(const TopicDescriptor& topic, const FieldMap& data) : topic_(&topic) {
    values_.reserve(topic.fields.size());
    for (const auto& field : topic.fields) {
        auto it = data.find(field.name);
        if (it == data.end()) {
            if (!field.default_value) {
                throw ValidationError(field.name, "field required");
            }
            values_.push_back(*field.default_value);
            continue;
        }
        auto coerced = Coerce(field, it->second);
        if (!coerced) {
            throw ValidationError(field.name, "value " + SalKafka::ToString(it->second) +
                    " is not a valid " + Describe(field));
        }
        CheckValue(field, *coerced, false);
        values_.push_back(std::move(*coerced));
    }
}

FieldMap TopicModel::ToFieldMap() const {
    return SlotsToFieldMap(*topic_, values_);
}

std::string TopicModel::ToString() const {
    return RenderSlots("TopicModel", *topic_, values_);
}

// ---------------------------------------------------------------------------
// AttributeBag
// ---------------------------------------------------------------------------

AttributeBag::AttributeBag(const FieldMap& data) {
    attributes_.reserve(data.size());
    names_.reserve(data.size());
    for (const auto& [name, value] : data) {
        attributes_.emplace(name, std::visit([](const auto& v) { return std::any(v); }, value));
        names_.push_back(name);
    }
    std::sort(names_.begin(), names_.end());
}

std::string AttributeBag::ToString() const {
    std::ostringstream out;
    out << "namespace(";
    for (size_t i = 0; i < names_.size(); ++i) {
        if (i) out << ", ";
        out << names_[i] << '=' << SalKafka::ToString(FromAny(attributes_.at(names_[i])));
    }
    out << ')';
    return out.str();
}

} // namespace SalKafka
