#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "../common/errors.h"

/**
 * Confluent wire framing shared by the serializer and deserializer:
 *
 *   byte 0      magic byte (0)
 *   bytes 1..4  schema id, big-endian
 *   bytes 5..   Avro binary body
 */

namespace SalKafka {
namespace wire {

// ============================================================================
// Constants
// ============================================================================

static constexpr uint8_t MAGIC_BYTE = 0;
static constexpr size_t HEADER_SIZE = 5;

// ============================================================================
// Framing helpers
// ============================================================================

struct FramedPayload {
    int32_t schema_id;
    std::string_view body;
};

// Message size is bounded by the broker's message.max.bytes, not here
inline constexpr bool IsValidFrameSize(size_t size) {
    return size >= HEADER_SIZE;
}

inline std::string Frame(int32_t schema_id, std::string_view body) {
    std::string out;
    out.reserve(HEADER_SIZE + body.size());
    const uint32_t id = static_cast<uint32_t>(schema_id);
    out.push_back(static_cast<char>(MAGIC_BYTE));
    out.push_back(static_cast<char>((id >> 24) & 0xFF));
    out.push_back(static_cast<char>((id >> 16) & 0xFF));
    out.push_back(static_cast<char>((id >> 8) & 0xFF));
    out.push_back(static_cast<char>(id & 0xFF));
    out.append(body.data(), body.size());
    return out;
}

/**
 * @brief Split a framed payload into schema id and body
 * @throws CodecError on a short payload or a wrong magic byte
 */
inline FramedPayload Unframe(std::string_view payload) {
    if (!IsValidFrameSize(payload.size())) {
        throw CodecError("framed payload has invalid size " + std::to_string(payload.size()));
    }
    if (static_cast<uint8_t>(payload[0]) != MAGIC_BYTE) {
        throw CodecError("unknown magic byte " + std::to_string(static_cast<uint8_t>(payload[0])));
    }
    const auto* p = reinterpret_cast<const uint8_t*>(payload.data());
    const uint32_t id = (static_cast<uint32_t>(p[1]) << 24) |
                        (static_cast<uint32_t>(p[2]) << 16) |
                        (static_cast<uint32_t>(p[3]) << 8) |
                        static_cast<uint32_t>(p[4]);
    return FramedPayload{static_cast<int32_t>(id), payload.substr(HEADER_SIZE)};
}

}  // namespace wire
}  // namespace SalKafka
