#pragma once

#include <string>

namespace SalKafka {

/**
 * Load the YAML configuration file, if one is given, and validate the
 * result. Environment overrides apply either way.
 * @param path Configuration file; empty to keep the built-in defaults
 * @return false after logging every problem found
 */
bool LoadConfiguration(const std::string& path);

// value with a fixed number of decimals, e.g. 123.4
std::string FormatFixed(double value, int precision);

} // namespace SalKafka
