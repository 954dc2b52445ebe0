#include <iostream>
#include <map>
#include <memory>
#include <sstream>

#include <boost/asio/io_context.hpp>
#include <cxxopts.hpp>
#include <glog/logging.h>
#include "absl/cleanup/cleanup.h"

#include "cli_common.h"
#include "consumer_pipeline.h"
#include "result_writer.h"
#include "startup.h"
#include "../broker/kafka_admin.h"
#include "../broker/kafka_consumer.h"
#include "../common/configuration.h"
#include "../common/errors.h"
#include "../metadata/metadata_source.h"

using namespace SalKafka;

namespace {

int RunReader(const cxxopts::ParseResult& result) {
	const std::string component_name = result["component"].as<std::string>();
	const std::vector<std::string> topic_names = result["topic"].as<std::vector<std::string>>();
	ConsumerOptions consumer_options;
	consumer_options.number = result["number"].as<int64_t>();
	consumer_options.time = result.count("time") > 0;
	const int max_history_read = result["max_history_read"].as<int>();
	const int partitions = result["partitions"].as<int>();
	const std::string postprocess_name = result["postprocess"].as<std::string>();

	if (consumer_options.time && consumer_options.number == 1) {
		throw ConfigurationError("You must specify --number > 1 with --time");
	}
	if (!LoadConfiguration(result["config"].as<std::string>())) {
		return 1;
	}
	const SalKafkaConfig& config = GetConfig().config();

	std::ostringstream summary;
	summary << "component=" << component_name << " topic=[";
	for (size_t i = 0; i < topic_names.size(); ++i) summary << (i ? ", " : "") << topic_names[i];
	summary << "] number=" << consumer_options.number << " time=" << (consumer_options.time ? "true" : "false")
			<< " max_history_read=" << max_history_read << " partitions=" << partitions
			<< " postprocess=" << postprocess_name;

	// Everything that can be rejected without I/O is checked first
	LOG(INFO) << "Parsing info for component " << component_name;
	YamlMetadataSource metadata(config.metadata.directory.get(), config.metadata.topic_subname.get());
	const ComponentDescriptor component = metadata.LoadComponent(component_name);
	const std::vector<const TopicDescriptor*> topics = SelectTopics(component, topic_names);
	const PostProcessStrategy strategy = MakePostProcessStrategy(ParsePostProcessType(postprocess_name));
	for (const auto* topic : topics) {
		for (const auto& field : UndecodableFields(*topic)) {
			LOG(WARNING) << topic->logical_name << "." << field
					<< " is a map field; messages on this topic cannot be decoded";
		}
	}
	if (component.is_indexed) {
		VLOG(1) << "max_history_read=" << max_history_read << " is not applied";
	}

	std::map<std::string, const TopicDescriptor*> by_wire_name;
	for (const auto* topic : topics) by_wire_name[topic->wire_name] = topic;

	HttpSchemaRegistry registry(config.registry.url.get(), config.registry.timeout_ms.get());
	SchemaRegistrar registrar(registry);
	Deserializer deserializer(&registry);
	KafkaAdminClient admin(config.broker.bootstrap_servers.get(), config.broker.admin_timeout_ms.get(),
			config.broker.message_max_bytes.get());
	TopicProvisioner provisioner(admin, config.broker.sentinel_topic.get(),
			config.broker.replication_factor.get(), config.broker.list_topics_timeout_ms.get());
	KafkaConsumerClient consumer_client(config.broker.bootstrap_servers.get(), MakeRandomGroupId(),
			config.consumer.auto_offset_reset.get());

	boost::asio::io_context io;
	WorkerPool admin_pool(config.bridge.admin_threads.get(), "admin");
	WorkerPool consumer_pool(config.bridge.worker_threads.get(), "consumer");
	BlockingBridge admin_bridge(io, admin_pool);
	BlockingBridge consumer_bridge(io, consumer_pool);
	AsyncConsumer consumer(consumer_bridge, consumer_client, config.bridge.poll_timeout_ms.get());
	// An aborted run may leave a read polling on the pool
	auto stop_reading = absl::MakeCleanup([&consumer, &consumer_pool] {
		consumer.Shutdown();
		consumer_pool.Stop();
	});

	ResultWriter writer(config.results.directory.get(), "read_kafka.csv", result.count("record_results") > 0);
	ConsumerPipeline pipeline(by_wire_name, deserializer, admin_bridge, strategy, consumer, consumer_options,
			std::cout);

	Startup startup(admin_bridge, registrar, provisioner);
	startup.Run(topics, partitions, [&](const RegistrationMap& registrations) {
		for (const auto* topic : topics) {
			deserializer.AddSchema(registrations.at(topic->logical_name).schema_id, topic->schema);
		}
		pipeline.Start([&](const ConsumerResult& run) {
			if (consumer_options.time) {
				std::cout << "Read " << FormatFixed(run.messages_per_second, 1)
						  << " messages/second: " << summary.str() << std::endl;
				std::cout << "Delay mean = " << FormatFixed(run.delays.mean, 3)
						  << ", stdev = " << FormatFixed(run.delays.stdev, 3)
						  << ", min = " << FormatFixed(run.delays.min, 3)
						  << ", max = " << FormatFixed(run.delays.max, 3) << " seconds" << std::endl;
			}
			writer.Set("component", component_name);
			writer.Set("topics", std::to_string(topics.size()));
			writer.Set("number", std::to_string(run.messages));
			writer.Set("postprocess", postprocess_name);
			writer.Set("messages_per_second", run.messages_per_second);
			writer.Set("delay_mean_s", run.delays.mean);
			writer.Set("delay_stdev_s", run.delays.stdev);
			writer.Set("delay_min_s", run.delays.min);
			writer.Set("delay_max_s", run.delays.max);
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
	cxxopts::Options options("salkafka_read", "Read and print messages for topics of one SAL component from Kafka");
	options.positional_help("component topic [topic...]");

	std::string postprocess_help = "How to handle the received data:";
	for (const auto& name : PostProcessTypeNames()) postprocess_help += " " + name;

	options.add_options()
		("component", "SAL component name", cxxopts::value<std::string>())
		("topic", "Topic attribute names, e.g. evt_summaryState cmd_start",
			cxxopts::value<std::vector<std::string>>())
		("n,number", "Number of messages to read; 0 for no limit", cxxopts::value<int64_t>()->default_value("10"))
		("t,time", "Measure the elapsed time. This requires number > 1")
		("max_history_read", "The max number of historical samples to read for indexed SAL components",
			cxxopts::value<int>()->default_value("1000"))
		("partitions", "The number of partitions per topic", cxxopts::value<int>()->default_value("1"))
		("postprocess", postprocess_help, cxxopts::value<std::string>()->default_value("dataclass"))
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
		return RunReader(result);
	} catch (const Error& e) {
		LOG(ERROR) << "Run aborted: " << e.what();
	} catch (const std::exception& e) {
		LOG(ERROR) << "Unexpected error: " << e.what();
	}
	return 1;
}
