#pragma once

#include <cstdint>
#include <string>

#include "../codec/avro_schema.h"

namespace SalKafka {

/**
 * Interface for a Confluent-compatible schema registry
 */
class ISchemaRegistry {
public:
    virtual ~ISchemaRegistry() = default;

    /**
     * Register schema under subject. Registering the same schema under the
     * same subject again returns the same id.
     * @throws RegistryError on transport or protocol failure
     */
    virtual int32_t RegisterSchema(const std::string& subject, const AvroSchema& schema) = 0;

    /**
     * Look up a schema by id
     * @throws RegistryError if the id is unknown or the registry is unreachable
     */
    virtual AvroSchema GetSchema(int32_t schema_id) = 0;
};

/**
 * ISchemaRegistry over the registry's REST API. Each call opens one HTTP/1.1
 * connection and blocks until the response arrives or the timeout expires.
 */
class HttpSchemaRegistry : public ISchemaRegistry {
public:
    /**
     * @param url Base URL, e.g. http://schema-registry:8081
     * @param timeout_ms Upper bound for one request, connect included
     * @throws ConfigurationError if url is not an http:// URL
     */
    HttpSchemaRegistry(const std::string& url, int timeout_ms);

    int32_t RegisterSchema(const std::string& subject, const AvroSchema& schema) override;
    AvroSchema GetSchema(int32_t schema_id) override;

    const std::string& host() const { return host_; }
    const std::string& port() const { return port_; }
    const std::string& base_path() const { return base_path_; }

private:
    // Returns the response body of a 200 response
    std::string Request(bool post, const std::string& target, const std::string& body);

    std::string host_;
    std::string port_;
    std::string base_path_;
    int timeout_ms_;
};

} // namespace SalKafka
