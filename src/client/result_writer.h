#pragma once

#include <string>
#include <utility>
#include <vector>

namespace SalKafka {

/**
 * Class for writing run results to a CSV file
 */
class ResultWriter {
public:
	/**
	 * Constructor
	 * @param directory Directory holding the result files, created if absent
	 * @param file_name CSV file name, e.g. write_kafka.csv
	 * @param record_result Whether anything is written at all
	 */
	ResultWriter(const std::string& directory, const std::string& file_name, bool record_result);

	/**
	 * Destructor - appends the row to the file
	 */
	~ResultWriter();

	/**
	 * Sets one column of the row; columns keep the order they were first set in
	 * @param column Header name
	 * @param value Cell text
	 */
	void Set(const std::string& column, const std::string& value);

	/**
	 * Sets a numeric column with 4 decimal places
	 */
	void Set(const std::string& column, double value);

	const std::string& result_path() const { return result_path_; }

private:
	bool record_result_;
	std::string result_path_;
	std::vector<std::pair<std::string, std::string>> row_;
};

} // namespace SalKafka
