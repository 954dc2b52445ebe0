#include <chrono>
#include <iostream>
#include <memory>
#include <sstream>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cxxopts.hpp>
#include <glog/logging.h>

#include "cli_common.h"
#include "producer_pipeline.h"
#include "result_writer.h"
#include "startup.h"
#include "synthetic_data.h"
#include "../broker/kafka_admin.h"
#include "../broker/kafka_producer.h"
#include "../common/configuration.h"
#include "../common/errors.h"
#include "../metadata/metadata_source.h"

using namespace SalKafka;

namespace {

int RunWriter(const cxxopts::ParseResult& result) {
	const std::string component_name = result["component"].as<std::string>();
	const std::string topic_name = result["topic"].as<std::string>();
	ProducerOptions producer_options;
	producer_options.number = result["number"].as<int>();
	producer_options.index = result["index"].as<int>();
	const bool nowait_ack = result.count("nowait_ack") > 0;
	const std::string validation_name = result["validation"].as<std::string>();
	const int partitions = result["partitions"].as<int>();

	if (!LoadConfiguration(result["config"].as<std::string>())) {
		return 1;
	}
	const SalKafkaConfig& config = GetConfig().config();

	std::ostringstream summary;
	summary << "component=" << component_name << " topic=" << topic_name
			<< " number=" << producer_options.number << " index=" << producer_options.index
			<< " nowait_ack=" << (nowait_ack ? "true" : "false") << " validation=" << validation_name;

	// Everything that can be rejected without I/O is checked first
	LOG(INFO) << "Parsing info for component " << component_name;
	YamlMetadataSource metadata(config.metadata.directory.get(), config.metadata.topic_subname.get());
	const ComponentDescriptor component = metadata.LoadComponent(component_name);
	const TopicDescriptor& topic = *SelectTopics(component, {topic_name}).front();
	LOG(INFO) << "avro_schema=" << topic.schema->ToJson();

	const ValidationType validation = ParseValidationType(validation_name);
	FieldMap base_record = DeriveSyntheticData(topic);
	const std::string acks = nowait_ack ? "0" : "1";
	LOG(INFO) << "acks=" << acks;

	HttpSchemaRegistry registry(config.registry.url.get(), config.registry.timeout_ms.get());
	SchemaRegistrar registrar(registry);
	KafkaAdminClient admin(config.broker.bootstrap_servers.get(), config.broker.admin_timeout_ms.get(),
			config.broker.message_max_bytes.get());
	TopicProvisioner provisioner(admin, config.broker.sentinel_topic.get(),
			config.broker.replication_factor.get(), config.broker.list_topics_timeout_ms.get());
	KafkaProducerClient producer_client(config.broker.bootstrap_servers.get(), acks,
			config.broker.message_max_bytes.get());

	boost::asio::io_context io;
	WorkerPool admin_pool(config.bridge.admin_threads.get(), "admin");
	WorkerPool producer_pool(config.bridge.worker_threads.get(), "producer");
	BlockingBridge admin_bridge(io, admin_pool);
	BlockingBridge producer_bridge(io, producer_pool);
	AsyncProducer producer(producer_bridge, producer_client, config.bridge.flush_timeout_ms.get());

	ResultWriter writer(config.results.directory.get(), "write_kafka.csv", result.count("record_results") > 0);
	std::unique_ptr<ProducerPipeline> pipeline;
	boost::asio::steady_timer exit_timer(io);

	Startup startup(admin_bridge, registrar, provisioner);
	startup.Run({&topic}, partitions, [&](const RegistrationMap& registrations) {
		const int32_t schema_id = registrations.at(topic.logical_name).schema_id;
		pipeline = std::make_unique<ProducerPipeline>(topic, std::move(base_record),
				MakeValidationStrategy(validation, topic), Serializer(topic.schema, schema_id),
				producer, producer_options);
		pipeline->Start([&](const ProducerResult& run) {
			std::cout << "Wrote " << FormatFixed(run.messages_per_second, 1)
					  << " messages/second: " << summary.str() << std::endl;
			writer.Set("component", component_name);
			writer.Set("topic", topic_name);
			writer.Set("number", std::to_string(run.messages));
			writer.Set("acks", acks);
			writer.Set("validation", validation_name);
			writer.Set("elapsed_s", run.elapsed_s);
			writer.Set("messages_per_second", run.messages_per_second);

			// Give a concurrently running reader time to finish
			exit_timer.expires_after(std::chrono::milliseconds(config.run.exit_delay_ms.get()));
			exit_timer.async_wait([](const boost::system::error_code&) {});
		});
	});

	io.run();
	return 0;
}

} // namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files.

	// Setup command line options
	cxxopts::Options options("salkafka_write", "Write messages for one topic of one SAL component to Kafka");
	options.positional_help("component topic");

	std::string validation_help = "Validation:";
	for (const auto& name : ValidationTypeNames()) validation_help += " " + name;

	options.add_options()
		("component", "SAL component name", cxxopts::value<std::string>())
		("topic", "Topic attribute name, e.g. evt_summaryState", cxxopts::value<std::string>())
		("n,number", "Number of messages to write", cxxopts::value<int>()->default_value("1"))
		("index", "SAL index; ignored for non-indexed components", cxxopts::value<int>()->default_value("0"))
		("nowait_ack", "Do not wait for acknowledgement from the broker")
		("validation", validation_help, cxxopts::value<std::string>()->default_value("dataclass"))
		("partitions", "Partitions of a topic that has to be created", cxxopts::value<int>()->default_value("1"))
		("config", "Configuration file", cxxopts::value<std::string>()->default_value(""))
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("record_results", "Record Results in a csv file")
		("h,help", "Print usage");
	options.parse_positional({"component", "topic"});

	try {
		auto result = options.parse(argc, argv);
		if (result.count("help")) {
			std::cout << options.help() << std::endl;
			return 0;
		}
		if (!result.count("component") || !result.count("topic")) {
			std::cerr << options.help() << std::endl;
			return 2;
		}
		FLAGS_v = result["log_level"].as<int>();
		return RunWriter(result);
	} catch (const Error& e) {
		LOG(ERROR) << "Run aborted: " << e.what();
	} catch (const std::exception& e) {
		LOG(ERROR) << "Unexpected error: " << e.what();
	}
	return 1;
}
