#ifndef SALKAFKA_FIELD_VALUE_H_
#define SALKAFKA_FIELD_VALUE_H_

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "absl/container/flat_hash_map.h"

namespace SalKafka {

/**
 * Wire-level type of a topic field. kMap can be described by a component
 * definition but has no FieldValue form; synthetic data derivation and the
 * codec reject it.
 */
enum class FieldType {
    kBoolean,
    kInt,
    kLong,
    kFloat,
    kDouble,
    kString,
    kMap,
};

/**
 * Value of one field. Integer wire types (int, long) share int64_t and
 * floating wire types (float, double) share double.
 */
using FieldValue = std::variant<
    bool,
    int64_t,
    double,
    std::string,
    std::vector<bool>,
    std::vector<int64_t>,
    std::vector<double>,
    std::vector<std::string>>;

/// The single internal representation of a message: field name -> value.
using FieldMap = absl::flat_hash_map<std::string, FieldValue>;

const char* FieldTypeName(FieldType type);

inline bool IsIntegerType(FieldType type) {
    return type == FieldType::kInt || type == FieldType::kLong;
}

inline bool IsFloatingType(FieldType type) {
    return type == FieldType::kFloat || type == FieldType::kDouble;
}

bool IsArrayValue(const FieldValue& value);

// Number of elements; 1 for scalars
size_t ValueLength(const FieldValue& value);

// True if value holds the C++ alternative used for a field of this type
// and shape (array or scalar). No coercion.
bool ValueMatchesType(const FieldValue& value, FieldType type, bool is_array);

// Human readable rendering, e.g. 1.1 or [1, 1, 1]
std::string ToString(const FieldValue& value);

// Renders "name=value" pairs in the given field order; names missing from
// the map are skipped.
std::string ToString(const FieldMap& fields, const std::vector<std::string>& order);

} // namespace SalKafka

#endif // SALKAFKA_FIELD_VALUE_H_
