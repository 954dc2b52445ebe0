#pragma once

#include "../metadata/topic_descriptor.h"

namespace SalKafka {

inline constexpr char kSyntheticString[] = "a short string";
inline constexpr int64_t kSyntheticInteger = 1;
inline constexpr double kSyntheticFloat = 1.1;

/**
 * Builds the base record a producer run publishes: every field set to a
 * canonical non-default value of its type (1, 1.1, true, or a fixed
 * string), arrays filled element by element.
 * @throws ConfigurationError for map fields and string arrays
 */
FieldMap DeriveSyntheticData(const TopicDescriptor& topic);

} // namespace SalKafka
