#include "cli_common.h"

#include <iomanip>
#include <sstream>

#include <glog/logging.h>

#include "../common/configuration.h"

namespace SalKafka {

bool LoadConfiguration(const std::string& path) {
	Configuration& config = Configuration::getInstance();
	bool ok = path.empty() ? config.validate() : config.loadFromFile(path);
	if (!ok) {
		LOG(ERROR) << "Invalid configuration" << (path.empty() ? "" : " in " + path);
		for (const auto& error : config.getValidationErrors()) {
			LOG(ERROR) << "  " << error;
		}
		return false;
	}
	if (!path.empty()) {
		LOG(INFO) << "Loaded configuration from " << path;
	}
	return true;
}

std::string FormatFixed(double value, int precision) {
	std::ostringstream ss;
	ss << std::fixed << std::setprecision(precision) << value;
	return ss.str();
}

} // namespace SalKafka
