#include "avro_schema.h"

#include <nlohmann/json.hpp>

#include "../common/errors.h"

namespace SalKafka {

namespace {

using nlohmann::json;

const char* AvroPrimitiveName(FieldType type) {
    // kMap is never a primitive; callers handle it separately.
    return FieldTypeName(type);
}

FieldType ParsePrimitive(const std::string& name, const std::string& field) {
    if (name == "boolean") return FieldType::kBoolean;
    if (name == "int") return FieldType::kInt;
    if (name == "long") return FieldType::kLong;
    if (name == "float") return FieldType::kFloat;
    if (name == "double") return FieldType::kDouble;
    if (name == "string") return FieldType::kString;
    throw CodecError("field " + field + ": unsupported Avro type " + name);
}

json ScalarToJson(const FieldValue& value) {
    return std::visit([](const auto& v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::vector<bool>>) {
            json arr = json::array();
            for (bool b : v) arr.push_back(b);
            return arr;
        } else {
            return json(v);
        }
    }, value);
}

std::optional<FieldValue> DefaultFromJson(const json& node, FieldType type, bool is_array,
        const std::string& field) {
    try {
        if (is_array) {
            switch (type) {
                case FieldType::kBoolean: return FieldValue(node.get<std::vector<bool>>());
                case FieldType::kInt:
                case FieldType::kLong: return FieldValue(node.get<std::vector<int64_t>>());
                case FieldType::kFloat:
                case FieldType::kDouble: return FieldValue(node.get<std::vector<double>>());
                case FieldType::kString: return FieldValue(node.get<std::vector<std::string>>());
                case FieldType::kMap: return std::nullopt;
            }
        }
        switch (type) {
            case FieldType::kBoolean: return FieldValue(node.get<bool>());
            case FieldType::kInt:
            case FieldType::kLong: return FieldValue(node.get<int64_t>());
            case FieldType::kFloat:
            case FieldType::kDouble: return FieldValue(node.get<double>());
            case FieldType::kString: return FieldValue(node.get<std::string>());
            case FieldType::kMap: return std::nullopt;
        }
    } catch (const json::exception& e) {
        throw CodecError("field " + field + ": bad default: " + e.what());
    }
    return std::nullopt;
}

} // namespace

AvroSchema::AvroSchema(std::string name, std::string name_space, std::vector<AvroField> fields)
    : name_(std::move(name)), name_space_(std::move(name_space)), fields_(std::move(fields)) {}

std::string AvroSchema::FullName() const {
    return name_space_.empty() ? name_ : name_space_ + "." + name_;
}

const AvroField* AvroSchema::FindField(const std::string& name) const {
    for (const auto& field : fields_) {
        if (field.name == name) return &field;
    }
    return nullptr;
}

std::string AvroSchema::ToJson() const {
    json fields = json::array();
    for (const auto& field : fields_) {
        json node;
        node["name"] = field.name;
        if (field.type == FieldType::kMap) {
            node["type"] = {{"type", "map"}, {"values", "string"}};
        } else if (field.is_array) {
            node["type"] = {{"type", "array"}, {"items", AvroPrimitiveName(field.type)}};
        } else {
            node["type"] = AvroPrimitiveName(field.type);
        }
        if (field.default_value.has_value()) {
            node["default"] = ScalarToJson(*field.default_value);
        }
        if (!field.doc.empty()) {
            node["doc"] = field.doc;
        }
        fields.push_back(std::move(node));
    }
    json schema = {
        {"type", "record"},
        {"name", name_},
        {"namespace", name_space_},
        {"fields", std::move(fields)},
    };
    return schema.dump();
}

AvroSchema AvroSchema::Parse(const std::string& text) {
    json schema;
    try {
        schema = json::parse(text);
    } catch (const json::parse_error& e) {
        throw CodecError(std::string("schema is not valid JSON: ") + e.what());
    }
    if (!schema.is_object() || schema.value("type", "") != "record") {
        throw CodecError("schema is not an Avro record");
    }
    if (!schema.contains("fields") || !schema["fields"].is_array()) {
        throw CodecError("record schema has no fields array");
    }

    std::vector<AvroField> fields;
    try {
        for (const auto& node : schema["fields"]) {
            AvroField field;
            field.name = node.value("name", "");
            if (field.name.empty()) {
                throw CodecError("record field without a name");
            }
            const json& type = node.at("type");
            if (type.is_string()) {
                field.type = ParsePrimitive(type.get<std::string>(), field.name);
            } else if (type.is_object() && type.value("type", "") == "array") {
                field.is_array = true;
                field.type = ParsePrimitive(type.value("items", ""), field.name);
            } else if (type.is_object() && type.value("type", "") == "map") {
                field.type = FieldType::kMap;
            } else {
                throw CodecError("field " + field.name + ": unsupported Avro type " + type.dump());
            }
            if (node.contains("default")) {
                field.default_value = DefaultFromJson(node["default"], field.type, field.is_array, field.name);
            }
            field.doc = node.value("doc", "");
            fields.push_back(std::move(field));
        }
    } catch (const json::exception& e) {
        throw CodecError(std::string("malformed record schema: ") + e.what());
    }
    return AvroSchema(schema.value("name", ""), schema.value("namespace", ""), std::move(fields));
}

} // namespace SalKafka
