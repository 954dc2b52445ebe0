#include "schema_registry.h"

#include <cctype>
#include <chrono>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <glog/logging.h>
#include <nlohmann/json.hpp>

#include "../common/errors.h"

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;
using json = nlohmann::json;

namespace SalKafka {

namespace {

constexpr char kContentType[] = "application/vnd.schemaregistry.v1+json";

// Escapes characters that are not allowed unencoded in a path segment
std::string EncodePathSegment(const std::string& segment) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : segment) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

json ParseBody(const std::string& body, const std::string& target) {
    try {
        return json::parse(body);
    } catch (const json::exception& e) {
        throw RegistryError("malformed response from " + target + ": " + e.what());
    }
}

} // namespace

HttpSchemaRegistry::HttpSchemaRegistry(const std::string& url, int timeout_ms)
    : timeout_ms_(timeout_ms) {
    static const std::string kScheme = "http://";
    if (url.compare(0, kScheme.size(), kScheme) != 0) {
        throw ConfigurationError("schema registry URL must start with http://: " + url);
    }
    std::string rest = url.substr(kScheme.size());
    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        base_path_ = rest.substr(slash);
        while (!base_path_.empty() && base_path_.back() == '/') base_path_.pop_back();
    }
    size_t colon = authority.rfind(':');
    if (colon == std::string::npos) {
        host_ = authority;
        port_ = "80";
    } else {
        host_ = authority.substr(0, colon);
        port_ = authority.substr(colon + 1);
    }
    if (host_.empty() || port_.empty()) {
        throw ConfigurationError("invalid schema registry URL: " + url);
    }
}

std::string HttpSchemaRegistry::Request(bool post, const std::string& target, const std::string& body) {
    const std::string path = base_path_ + target;
    try {
        boost::asio::io_context io;
        tcp::resolver resolver(io);
        beast::tcp_stream stream(io);
        stream.expires_after(std::chrono::milliseconds(timeout_ms_));
        stream.connect(resolver.resolve(host_, port_));

        http::request<http::string_body> request{post ? http::verb::post : http::verb::get, path, 11};
        request.set(http::field::host, host_);
        request.set(http::field::accept, kContentType);
        if (post) {
            request.set(http::field::content_type, kContentType);
            request.body() = body;
            request.prepare_payload();
        }
        http::write(stream, request);

        beast::flat_buffer buffer;
        http::response<http::string_body> response;
        http::read(stream, buffer, response);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);

        if (response.result() != http::status::ok) {
            throw RegistryError(std::string(post ? "POST " : "GET ") + path + " returned " +
                    std::to_string(response.result_int()) + ": " + response.body());
        }
        return response.body();
    } catch (const beast::system_error& e) {
        throw RegistryError("request to " + host_ + ":" + port_ + path + " failed: " + e.what());
    }
}

int32_t HttpSchemaRegistry::RegisterSchema(const std::string& subject, const AvroSchema& schema) {
    const std::string target = "/subjects/" + EncodePathSegment(subject) + "/versions";
    const json request = {{"schema", schema.ToJson()}};
    json response = ParseBody(Request(true, target, request.dump()), target);
    if (!response.contains("id") || !response["id"].is_number_integer()) {
        throw RegistryError("response from " + target + " has no schema id");
    }
    int32_t id = response["id"].get<int32_t>();
    VLOG(1) << "Registry returned id " << id << " for subject " << subject;
    return id;
}

AvroSchema HttpSchemaRegistry::GetSchema(int32_t schema_id) {
    const std::string target = "/schemas/ids/" + std::to_string(schema_id);
    json response = ParseBody(Request(false, target, ""), target);
    if (!response.contains("schema") || !response["schema"].is_string()) {
        throw RegistryError("response from " + target + " has no schema");
    }
    return AvroSchema::Parse(response["schema"].get<std::string>());
}

} // namespace SalKafka
