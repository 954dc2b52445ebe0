#ifndef SALKAFKA_METADATA_SOURCE_H_
#define SALKAFKA_METADATA_SOURCE_H_

#include <string>
#include <vector>

#include "topic_descriptor.h"

namespace YAML {
class Node;
}

namespace SalKafka {

/**
 * Interface for the component-definition lookup
 */
class IMetadataSource {
public:
    virtual ~IMetadataSource() = default;

    /**
     * @param component_name SAL component name, e.g. Test
     * @throws ConfigurationError if the component is unknown or malformed
     */
    virtual ComponentDescriptor LoadComponent(const std::string& component_name) = 0;
};

/**
 * Reads component definitions from <directory>/<Component>.yaml
 */
class YamlMetadataSource : public IMetadataSource {
public:
    /**
     * @param directory Directory holding one YAML file per component
     * @param topic_subname Prefix of every wire topic name, e.g. lsst.sal
     */
    YamlMetadataSource(std::string directory, std::string topic_subname);

    ComponentDescriptor LoadComponent(const std::string& component_name) override;

    // Parse a component definition that is already in memory
    ComponentDescriptor ParseComponent(const std::string& yaml_content) const;

private:
    ComponentDescriptor ParseNode(const YAML::Node& root) const;

    std::string directory_;
    std::string topic_subname_;
};

/**
 * Maps evt_X -> logevent_X, cmd_X -> command_X, tel_X -> X, ack_ackcmd -> ackcmd
 * @throws ConfigurationError for any other prefix
 */
std::string SalNameFromLogicalName(const std::string& logical_name);

// <topic_subname>.<component>.<sal_name>
std::string MakeWireName(const std::string& topic_subname, const std::string& component,
        const std::string& sal_name);

// <wire_name>-value
std::string MakeSubject(const std::string& wire_name);

// SAL type name (boolean, short, unsigned int, ...) to wire type
FieldType FieldTypeFromSalType(const std::string& sal_type);

// Private fields every topic starts with
std::vector<FieldDescriptor> MakePrivateFields(bool is_indexed);

// Builds the Avro record schema of a fully populated topic
std::shared_ptr<const AvroSchema> MakeAvroSchema(const TopicDescriptor& topic,
        const std::string& topic_subname);

} // namespace SalKafka

#endif // SALKAFKA_METADATA_SOURCE_H_
