#include "metadata_source.h"

#include <set>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "../common/errors.h"

namespace SalKafka {

namespace {

bool StartsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

FieldValue ZeroValue(FieldType type, size_t count) {
    const bool is_array = count > 1;
    switch (type) {
        case FieldType::kBoolean:
            return is_array ? FieldValue(std::vector<bool>(count, false)) : FieldValue(false);
        case FieldType::kInt:
        case FieldType::kLong:
            return is_array ? FieldValue(std::vector<int64_t>(count, 0)) : FieldValue(int64_t{0});
        case FieldType::kFloat:
        case FieldType::kDouble:
            return is_array ? FieldValue(std::vector<double>(count, 0.0)) : FieldValue(0.0);
        case FieldType::kString:
            return is_array ? FieldValue(std::vector<std::string>(count)) : FieldValue(std::string());
        case FieldType::kMap:
            break;
    }
    throw ConfigurationError("map fields have no zero value");
}

template <typename T>
FieldValue ParseDefaultAs(const YAML::Node& node, size_t count) {
    if (count <= 1) {
        return FieldValue(node.as<T>());
    }
    if (node.IsSequence()) {
        std::vector<T> values;
        for (const auto& item : node) values.push_back(item.as<T>());
        if (values.size() != count) {
            throw ConfigurationError("default has " + std::to_string(values.size()) +
                    " elements, expected " + std::to_string(count));
        }
        return FieldValue(std::move(values));
    }
    return FieldValue(std::vector<T>(count, node.as<T>()));
}

FieldValue ParseDefault(const YAML::Node& node, FieldType type, size_t count) {
    switch (type) {
        case FieldType::kBoolean: return ParseDefaultAs<bool>(node, count);
        case FieldType::kInt:
        case FieldType::kLong: return ParseDefaultAs<int64_t>(node, count);
        case FieldType::kFloat:
        case FieldType::kDouble: return ParseDefaultAs<double>(node, count);
        case FieldType::kString: return ParseDefaultAs<std::string>(node, count);
        case FieldType::kMap: break;
    }
    throw ConfigurationError("map fields cannot have a default");
}

FieldDescriptor MakeField(const std::string& name, FieldType type, const std::string& description) {
    FieldDescriptor field;
    field.name = name;
    field.type = type;
    field.default_value = ZeroValue(type, 1);
    field.description = description;
    return field;
}

} // namespace

std::string SalNameFromLogicalName(const std::string& logical_name) {
    if (logical_name == "ack_ackcmd") return "ackcmd";
    if (StartsWith(logical_name, "evt_")) return "logevent_" + logical_name.substr(4);
    if (StartsWith(logical_name, "cmd_")) return "command_" + logical_name.substr(4);
    if (StartsWith(logical_name, "tel_")) return logical_name.substr(4);
    throw ConfigurationError("topic name " + logical_name +
            " must start with evt_, cmd_ or tel_");
}

std::string MakeWireName(const std::string& topic_subname, const std::string& component,
        const std::string& sal_name) {
    return topic_subname + "." + component + "." + sal_name;
}

std::string MakeSubject(const std::string& wire_name) {
    return wire_name + "-value";
}

FieldType FieldTypeFromSalType(const std::string& sal_type) {
    if (sal_type == "boolean") return FieldType::kBoolean;
    if (sal_type == "byte" || sal_type == "short" || sal_type == "int" ||
        sal_type == "long" || sal_type == "unsigned short") {
        return FieldType::kInt;
    }
    if (sal_type == "long long" || sal_type == "unsigned int" || sal_type == "unsigned long") {
        return FieldType::kLong;
    }
    if (sal_type == "float") return FieldType::kFloat;
    if (sal_type == "double") return FieldType::kDouble;
    if (sal_type == "string" || sal_type == "char") return FieldType::kString;
    if (sal_type == "map") return FieldType::kMap;
    throw ConfigurationError("unknown SAL type " + sal_type);
}

std::vector<FieldDescriptor> MakePrivateFields(bool is_indexed) {
    std::vector<FieldDescriptor> fields = {
        MakeField(kSndStampField, FieldType::kDouble, "Time of instance publication"),
        MakeField(kRcvStampField, FieldType::kDouble, "Time of instance reception"),
        MakeField(kSeqNumField, FieldType::kInt, "Sequence number"),
        MakeField(kIdentityField, FieldType::kString, "Identity of publisher"),
        MakeField(kOriginField, FieldType::kInt, "Process ID of publisher"),
    };
    if (is_indexed) {
        fields.push_back(MakeField(kIndexField, FieldType::kInt, "SAL index"));
    }
    for (auto& field : fields) field.units = "unitless";
    fields[0].units = "second";
    fields[1].units = "second";
    return fields;
}

std::shared_ptr<const AvroSchema> MakeAvroSchema(const TopicDescriptor& topic,
        const std::string& topic_subname) {
    std::vector<AvroField> fields;
    fields.reserve(topic.fields.size());
    for (const auto& field : topic.fields) {
        AvroField avro_field;
        avro_field.name = field.name;
        avro_field.type = field.type;
        avro_field.is_array = field.is_array();
        avro_field.default_value = field.default_value;
        avro_field.doc = field.description;
        fields.push_back(std::move(avro_field));
    }
    return std::make_shared<const AvroSchema>(
            topic.sal_name, topic_subname + "." + topic.component_name, std::move(fields));
}

YamlMetadataSource::YamlMetadataSource(std::string directory, std::string topic_subname)
    : directory_(std::move(directory)), topic_subname_(std::move(topic_subname)) {}

ComponentDescriptor YamlMetadataSource::LoadComponent(const std::string& component_name) {
    const std::string path = directory_ + "/" + component_name + ".yaml";
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("cannot load component " + component_name + " from " + path +
                ": " + e.what());
    }
    ComponentDescriptor component = ParseNode(root);
    if (component.name != component_name) {
        throw ConfigurationError(path + " defines component " + component.name +
                ", expected " + component_name);
    }
    VLOG(1) << "Loaded component " << component.name << " with " << component.topics.size()
            << " topics from " << path;
    return component;
}

ComponentDescriptor YamlMetadataSource::ParseComponent(const std::string& yaml_content) const {
    try {
        return ParseNode(YAML::Load(yaml_content));
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("malformed component definition: ") + e.what());
    }
}

ComponentDescriptor YamlMetadataSource::ParseNode(const YAML::Node& root) const {
    ComponentDescriptor component;
    try {
        component.name = root["component"].as<std::string>();
        component.is_indexed = root["indexed"] ? root["indexed"].as<bool>() : false;

        for (const auto& topic_node : root["topics"]) {
            TopicDescriptor topic;
            topic.component_name = component.name;
            topic.logical_name = topic_node["name"].as<std::string>();
            topic.sal_name = SalNameFromLogicalName(topic.logical_name);
            topic.wire_name = MakeWireName(topic_subname_, component.name, topic.sal_name);
            topic.subject = MakeSubject(topic.wire_name);
            topic.is_indexed = component.is_indexed;
            if (topic_node["description"]) {
                topic.description = topic_node["description"].as<std::string>();
            }

            topic.fields = MakePrivateFields(component.is_indexed);
            std::set<std::string> names;
            for (const auto& field : topic.fields) names.insert(field.name);

            for (const auto& field_node : topic_node["fields"]) {
                FieldDescriptor field;
                field.name = field_node["name"].as<std::string>();
                if (!names.insert(field.name).second) {
                    throw ConfigurationError("topic " + topic.logical_name +
                            " declares field " + field.name + " twice");
                }
                field.type = FieldTypeFromSalType(field_node["type"].as<std::string>());
                field.count = field_node["count"] ? field_node["count"].as<size_t>() : 1;
                if (field.count == 0) {
                    throw ConfigurationError("field " + field.name + " has count 0");
                }
                if (field.type != FieldType::kMap) {
                    field.default_value = field_node["default"]
                            ? ParseDefault(field_node["default"], field.type, field.count)
                            : ZeroValue(field.type, field.count);
                }
                if (field_node["units"]) field.units = field_node["units"].as<std::string>();
                if (field_node["description"]) field.description = field_node["description"].as<std::string>();
                topic.fields.push_back(std::move(field));
            }

            topic.schema = MakeAvroSchema(topic, topic_subname_);
            const std::string key = topic.logical_name;
            if (!component.topics.emplace(key, std::move(topic)).second) {
                throw ConfigurationError("component " + component.name + " declares topic " +
                        key + " twice");
            }
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("component " + component.name + ": " + e.what());
    }
    return component;
}

} // namespace SalKafka
