#include "utils/config.hpp"

#include <cstdint>
#include <stdexcept>
#include <unordered_map>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "utils/file_utils.hpp"
#include "utils/string_utils.hpp"


namespace fetchpool
{
	namespace
	{
		template<typename T>
		T get_value(const YAML::Node& root_node, const std::string& name)
		{
			if(const auto node = root_node[name]; node)
			{
				return node.as<T>();
			}
			spdlog::error("Failed to read node " + name);
			throw std::runtime_error("Failed to read node " + name);
		}

		template<typename T>
		T get_optional_value(const YAML::Node& root_node, const std::string& name, T default_value)
		{
			if(const auto node = root_node[name]; node)
			{
				return node.as<T>();
			}
			else
			{
				return default_value;
			}
		}

		std::chrono::milliseconds get_positive_duration(const YAML::Node& root_node, const std::string& name, std::chrono::milliseconds default_value)
		{
			const auto value = get_optional_value<int64_t>(root_node, name, default_value.count());
			if(value <= 0)
			{
				spdlog::error("Node {} must be greater than 0, got {}", name, value);
				throw std::runtime_error("Node " + name + " must be greater than 0");
			}

			return std::chrono::milliseconds(value);
		}

		Config::PoolConfig load_pool_config(const YAML::Node& node)
		{
			Config::PoolConfig pool_config;

			const auto max_concurrency = get_optional_value<int64_t>(node, "max_concurrency", 4);
			if(max_concurrency <= 0)
			{
				spdlog::error("Invalid max_concurrency: {}", max_concurrency);
				throw std::runtime_error("Node max_concurrency must be greater than 0");
			}
			pool_config.max_concurrency = static_cast<std::size_t>(max_concurrency);

			pool_config.poll_interval = get_positive_duration(node, "poll_interval_ms", pool_config.poll_interval);

			if(node["wait_timeout_ms"])
			{
				pool_config.wait_timeout = get_positive_duration(node, "wait_timeout_ms", std::chrono::milliseconds(1));
			}

			return pool_config;
		}

		CurlTransport::Options load_transport_config(const YAML::Node& node)
		{
			CurlTransport::Options options;

			options.timeout = get_positive_duration(node, "timeout_ms", options.timeout);
			options.connect_timeout = get_positive_duration(node, "connect_timeout_ms", options.connect_timeout);

			const auto max_retries = get_optional_value<int64_t>(node, "max_retries", static_cast<int64_t>(options.max_retries));
			if(max_retries < 0)
			{
				spdlog::error("Invalid max_retries: {}", max_retries);
				throw std::runtime_error("Node max_retries must not be negative");
			}
			options.max_retries = static_cast<std::size_t>(max_retries);

			options.retry_delay = get_positive_duration(node, "retry_delay_ms", options.retry_delay);

			options.user_agent = get_optional_value<std::string>(node, "user_agent", options.user_agent);
			options.referer = get_optional_value<std::string>(node, "referer", options.referer);
			options.content_type = get_optional_value<std::string>(node, "content_type", options.content_type);
			options.verbose = get_optional_value<bool>(node, "verbose", options.verbose);

			if(const auto headers_node = node["headers"]; headers_node)
			{
				if(!headers_node.IsMap())
				{
					throw std::runtime_error("Node headers must be a map");
				}

				for(auto iter = std::cbegin(headers_node); iter != std::cend(headers_node); ++iter)
				{
					options.headers.insert_or_assign(iter->first.as<std::string>(), iter->second.as<std::string>());
				}
			}

			return options;
		}

		Config::LoggingConfig::LogLevel map_log_level(const std::string& log_level_name)
		{
			const std::unordered_map<std::string, Config::LoggingConfig::LogLevel> level_mapping{
					{"INFO", Config::LoggingConfig::LogLevel::INFO},
					{"WARNING", Config::LoggingConfig::LogLevel::WARNING},
					{"ERROR", Config::LoggingConfig::LogLevel::ERROR},
					{"DEBUG", Config::LoggingConfig::LogLevel::DEBUG}
			};

			const auto normalized = to_upper(trim(log_level_name));
			if(const auto iter = level_mapping.find(normalized); iter != level_mapping.end())
			{
				return iter->second;
			}

			spdlog::error("Invalid logging level: {}", log_level_name);
			throw std::runtime_error("Invalid logging level");
		}

		Config::LoggingConfig load_logging_config(const YAML::Node& node)
		{
			Config::LoggingConfig logging_config = {};

			const auto level_string = get_value<std::string>(node, "level");
			logging_config.level = map_log_level(level_string);

			return logging_config;
		}

		Config::RequestConfig load_request_config(const YAML::Node& node, const std::filesystem::path& base_directory)
		{
			Config::RequestConfig request_config;

			request_config.url = get_value<std::string>(node, "url");
			if(is_blank(request_config.url))
			{
				throw std::runtime_error("Request url must not be empty");
			}

			request_config.name = get_optional_value<std::string>(node, "name", "");

			try
			{
				request_config.method = parse_http_method(get_optional_value<std::string>(node, "method", "GET"));
			}
			catch(const std::invalid_argument& error)
			{
				spdlog::error("Invalid request method for {}: {}", request_config.url, error.what());
				throw std::runtime_error(error.what());
			}

			if(node["body"] && node["body_file"])
			{
				throw std::runtime_error("Request " + request_config.url + " defines both body and body_file");
			}

			if(const auto body_node = node["body"]; body_node)
			{
				request_config.body = body_node.as<std::string>();
			}
			else if(const auto body_file_node = node["body_file"]; body_file_node)
			{
				std::filesystem::path body_path = body_file_node.as<std::string>();
				if(body_path.is_relative())
				{
					body_path = base_directory / body_path;
				}
				request_config.body = read_file(body_path);
			}

			if(request_config.method == HttpMethod::GET && !request_config.body.empty())
			{
				spdlog::warn("Request {} is a GET request, its body is ignored", request_config.url);
			}

			return request_config;
		}

		std::vector<Config::RequestConfig> load_requests_config(const YAML::Node& node, const std::filesystem::path& base_directory)
		{
			if(!node.IsSequence())
			{
				throw std::runtime_error("Node requests must be a list");
			}

			std::vector<Config::RequestConfig> requests;
			requests.reserve(node.size());

			for(auto iter = std::cbegin(node); iter != std::cend(node); ++iter)
			{
				requests.push_back(load_request_config(*iter, base_directory));
			}

			return requests;
		}

		Config build_config(const YAML::Node& root_node, const std::filesystem::path& base_directory)
		{
			Config config;

			if(const auto node = root_node["pool"]; node)
			{
				config.pool = load_pool_config(node);
			}

			if(const auto node = root_node["transport"]; node)
			{
				config.transport = load_transport_config(node);
			}

			if(const auto node = root_node["logging"]; node)
			{
				config.logging = load_logging_config(node);
			}
			else
			{
				config.logging = Config::LoggingConfig{
					Config::LoggingConfig::LogLevel::INFO
				};
			}

			if(const auto node = root_node["requests"]; node)
			{
				config.requests = load_requests_config(node, base_directory);
			}

			return config;
		}
	}

	Config load_config(const std::filesystem::path& path)
	{
		if(!std::filesystem::exists(path))
		{
			throw std::runtime_error("File " + path.string() + " not found");
		}

		if(!std::filesystem::is_regular_file(path))
		{
			throw std::runtime_error(path.string() + " is not a regular file");
		}

		const YAML::Node root_node = YAML::LoadFile(path.string());

		return build_config(root_node, path.parent_path());
	}

	Config parse_config(const std::string& document, const std::filesystem::path& base_directory)
	{
		const YAML::Node root_node = YAML::Load(document);

		return build_config(root_node, base_directory);
	}

	void log_config(const Config& config)
	{
		spdlog::info(
				"Pool - concurrency limit: {}, poll interval: {}ms",
				config.pool.max_concurrency, config.pool.poll_interval.count()
		);

		if(config.pool.wait_timeout.has_value())
		{
			spdlog::info("Pool - wait timeout: {}ms", config.pool.wait_timeout->count());
		}

		spdlog::info(
				"Transport - timeout: {}ms, connect timeout: {}ms, retries: {}, retry delay: {}ms",
				config.transport.timeout.count(), config.transport.connect_timeout.count(),
				config.transport.max_retries, config.transport.retry_delay.count()
		);

		for(const auto& [name, value]: config.transport.headers)
		{
			spdlog::debug("Transport - header {}: {}", name, value);
		}

		spdlog::info("Requests configured: {}", config.requests.size());
	}
}
