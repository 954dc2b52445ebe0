#ifndef SALKAFKA_RECORD_TYPES_H_
#define SALKAFKA_RECORD_TYPES_H_

#include <any>
#include <stdexcept>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"

#include "topic_descriptor.h"

namespace SalKafka {

/**
 * Field-level validation of a message against its topic.
 * Raises on the first invalid field; never modifies the data.
 */
class FieldValidator {
public:
    explicit FieldValidator(const TopicDescriptor& topic) : topic_(&topic) {}

    /**
     * @param data Message to check; fields absent from data are not checked
     * @throws ValidationError on an unknown field, a value of the wrong type,
     *         or an array of the wrong length
     */
    void Validate(const FieldMap& data) const;

private:
    const TopicDescriptor* topic_;
};

/**
 * Structured record with one positional slot per declared field.
 * Construction requires exactly the declared fields and performs no
 * type coercion.
 */
class TopicRecord {
public:
    /**
     * @throws ValidationError if a declared field is missing, an undeclared
     *         field is present, or a value has the wrong type or length
     */
    TopicRecord(const TopicDescriptor& topic, const FieldMap& data);

    const TopicDescriptor& topic() const { return *topic_; }
    const std::vector<FieldValue>& values() const { return values_; }

    FieldMap ToFieldMap() const;
    std::string ToString() const;

private:
    const TopicDescriptor* topic_;
    std::vector<FieldValue> values_;
};

/**
 * Schema-validated model. Absent fields take their defaults, numeric
 * values are coerced to the declared type where that loses nothing, and
 * unknown keys are ignored.
 */
class TopicModel {
public:
    // Instance holding every field's default value
    explicit TopicModel(const TopicDescriptor& topic);

    /**
     * @throws ValidationError if a value cannot be coerced to its field's
     *         type, an array has the wrong length, or a field without a
     *         default is absent
     */
    TopicModel(const TopicDescriptor& topic, const FieldMap& data);

    const TopicDescriptor& topic() const { return *topic_; }

    FieldMap ToFieldMap() const;
    std::string ToString() const;

private:
    const TopicDescriptor* topic_;
    std::vector<FieldValue> values_;
};

/**
 * Dynamically typed copy of a message, one std::any per attribute.
 */
class AttributeBag {
public:
    explicit AttributeBag(const FieldMap& data);

    bool Has(const std::string& name) const { return attributes_.contains(name); }

    // Throws std::bad_any_cast if T is not the stored type, std::out_of_range
    // if the attribute is absent
    template <typename T>
    const T& Get(const std::string& name) const {
        auto it = attributes_.find(name);
        if (it == attributes_.end()) {
            throw std::out_of_range("no attribute " + name);
        }
        return std::any_cast<const T&>(it->second);
    }

    size_t size() const { return attributes_.size(); }

    std::string ToString() const;

private:
    absl::flat_hash_map<std::string, std::any> attributes_;
    std::vector<std::string> names_;
};

} // namespace SalKafka

#endif // SALKAFKA_RECORD_TYPES_H_
