#ifndef FETCHPOOL_CURL_TRANSPORT_HPP
#define FETCHPOOL_CURL_TRANSPORT_HPP

#include <chrono>
#include <cstddef>
#include <map>
#include <string>

#include "execution/transport/i_transport.hpp"


namespace fetchpool
{
	class CurlTransport final: public ITransport
	{
	public:
		struct Options
		{
			std::chrono::milliseconds timeout{50000};
			std::chrono::milliseconds connect_timeout{10000};
			std::size_t max_retries = 1;
			std::chrono::milliseconds retry_delay{1000};
			std::string user_agent = "fetchpool/1.0";
			std::string referer;
			std::string content_type = "application/x-www-form-urlencoded";
			std::map<std::string, std::string> headers;
			bool verbose = false;
		};

		explicit CurlTransport(Options options);

		CurlTransport(const CurlTransport&) = delete;
		CurlTransport& operator=(const CurlTransport&) = delete;

		[[nodiscard]] transport_result_t execute(const HttpRequest& request) override;

	private:
		Options options_;

		[[nodiscard]] transport_result_t perform(const HttpRequest& request) const;
	};
}

#endif //FETCHPOOL_CURL_TRANSPORT_HPP
