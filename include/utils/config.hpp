#ifndef FETCHPOOL_CONFIG_HPP
#define FETCHPOOL_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "execution/transport/curl_transport.hpp"
#include "model/http_types.hpp"


namespace fetchpool
{
	struct Config
	{
		struct PoolConfig
		{
			std::size_t max_concurrency = 4;
			std::chrono::milliseconds poll_interval{100};
			std::optional<std::chrono::milliseconds> wait_timeout;
		};

		struct LoggingConfig
		{
			enum class LogLevel
			{
				INFO,
				WARNING,
				ERROR,
				DEBUG
			};

			LogLevel level;
		};

		struct RequestConfig
		{
			std::string name;
			std::string url;
			HttpMethod method = HttpMethod::GET;
			std::string body;
		};

		PoolConfig pool;
		CurlTransport::Options transport;
		LoggingConfig logging;
		std::vector<RequestConfig> requests;
	};


	Config load_config(const std::filesystem::path& path);

	/**
	 * Parses a yaml document. Relative body_file entries are resolved against base_directory.
	 */
	Config parse_config(const std::string& document, const std::filesystem::path& base_directory = ".");

	void log_config(const Config& config);
}

#endif //FETCHPOOL_CONFIG_HPP
