#include "result_writer.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <glog/logging.h>

namespace fs = std::filesystem;

namespace SalKafka {

ResultWriter::ResultWriter(const std::string& directory, const std::string& file_name, bool record_result)
	: record_result_(record_result) {
	result_path_ = (fs::path(directory) / file_name).string();
	if (!record_result_) {
		return;
	}

	// Create output directory if it doesn't exist
	try {
		fs::create_directories(directory);
	} catch (const fs::filesystem_error& e) {
		LOG(ERROR) << "Failed to create result directory: " << e.what();
	}
}

ResultWriter::~ResultWriter() {
	if (!record_result_ || row_.empty()) {
		return;
	}

	try {
		// If this is the first run, write the header first
		std::error_code ec;
		bool headers_needed = !fs::exists(result_path_, ec) || fs::file_size(result_path_, ec) == 0;

		std::ofstream file;
		file.open(result_path_, std::ios::app);

		if (!file.is_open()) {
			LOG(ERROR) << "Error: Could not open file: " << result_path_ << " : " << strerror(errno);
			return;
		}

		if (headers_needed) {
			for (size_t i = 0; i < row_.size(); ++i) {
				file << row_[i].first << (i + 1 < row_.size() ? "," : "\n");
			}
			LOG(INFO) << "Created new result file with headers: " << result_path_;
		}
		for (size_t i = 0; i < row_.size(); ++i) {
			file << row_[i].second << (i + 1 < row_.size() ? "," : "\n");
		}

		file.close();
		LOG(INFO) << "Results written to: " << result_path_;
	} catch (const std::exception& e) {
		LOG(ERROR) << "Exception in ResultWriter destructor: " << e.what();
	}
}

void ResultWriter::Set(const std::string& column, const std::string& value) {
	for (auto& cell : row_) {
		if (cell.first == column) {
			cell.second = value;
			return;
		}
	}
	row_.emplace_back(column, value);
}

void ResultWriter::Set(const std::string& column, double value) {
	if (value == 0.0) {
		Set(column, std::string("0"));
		return;
	}
	std::stringstream ss;
	ss << std::fixed << std::setprecision(4) << value;
	Set(column, ss.str());
}

} // namespace SalKafka
