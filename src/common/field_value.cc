#include "field_value.h"

#include <sstream>

namespace SalKafka {

namespace {

template <typename T>
void AppendScalar(std::ostringstream& out, const T& value) {
    out << value;
}

void AppendScalar(std::ostringstream& out, bool value) {
    out << (value ? "true" : "false");
}

void AppendScalar(std::ostringstream& out, const std::string& value) {
    out << '"' << value << '"';
}

template <typename T>
void AppendArray(std::ostringstream& out, const std::vector<T>& values) {
    out << '[';
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) out << ", ";
        AppendScalar(out, static_cast<T>(values[i]));
    }
    out << ']';
}

} // namespace

const char* FieldTypeName(FieldType type) {
    switch (type) {
        case FieldType::kBoolean: return "boolean";
        case FieldType::kInt: return "int";
        case FieldType::kLong: return "long";
        case FieldType::kFloat: return "float";
        case FieldType::kDouble: return "double";
        case FieldType::kString: return "string";
        case FieldType::kMap: return "map";
    }
    return "unknown";
}

bool IsArrayValue(const FieldValue& value) {
    return value.index() >= 4;
}

size_t ValueLength(const FieldValue& value) {
    return std::visit([](const auto& v) -> size_t {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::vector<bool>> ||
                      std::is_same_v<T, std::vector<int64_t>> ||
                      std::is_same_v<T, std::vector<double>> ||
                      std::is_same_v<T, std::vector<std::string>>) {
            return v.size();
        } else {
            return 1;
        }
    }, value);
}

bool ValueMatchesType(const FieldValue& value, FieldType type, bool is_array) {
    switch (type) {
        case FieldType::kBoolean:
            return is_array ? std::holds_alternative<std::vector<bool>>(value)
                            : std::holds_alternative<bool>(value);
        case FieldType::kInt:
        case FieldType::kLong:
            return is_array ? std::holds_alternative<std::vector<int64_t>>(value)
                            : std::holds_alternative<int64_t>(value);
        case FieldType::kFloat:
        case FieldType::kDouble:
            return is_array ? std::holds_alternative<std::vector<double>>(value)
                            : std::holds_alternative<double>(value);
        case FieldType::kString:
            return is_array ? std::holds_alternative<std::vector<std::string>>(value)
                            : std::holds_alternative<std::string>(value);
        case FieldType::kMap:
            return false;
    }
    return false;
}

std::string ToString(const FieldValue& value) {
    std::ostringstream out;
    out.precision(15);
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::vector<bool>> ||
                      std::is_same_v<T, std::vector<int64_t>> ||
                      std::is_same_v<T, std::vector<double>> ||
                      std::is_same_v<T, std::vector<std::string>>) {
            AppendArray(out, v);
        } else {
            AppendScalar(out, v);
        }
    }, value);
    return out.str();
}

std::string ToString(const FieldMap& fields, const std::vector<std::string>& order) {
    std::ostringstream out;
    bool first = true;
    for (const auto& name : order) {
        auto it = fields.find(name);
        if (it == fields.end()) continue;
        if (!first) out << ", ";
        first = false;
        out << name << '=' << ToString(it->second);
    }
    return out.str();
}

} // namespace SalKafka
