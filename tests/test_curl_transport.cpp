/**
 * @file test_curl_transport.cpp
 * @brief Catch2 tests for fetchpool::CurlTransport that need no remote server.
 */

#include "execution/transport/curl_transport.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <memory>
#include <thread>
#include <variant>
#include <vector>

using namespace fetchpool;
using namespace std::chrono_literals;

namespace
{
	// nothing listens on port 1, the connection is refused at once
	constexpr auto UNREACHABLE_ENDPOINT = "http://127.0.0.1:1/";

	CurlTransport::Options local_options()
	{
		CurlTransport::Options options;
		options.timeout = 2000ms;
		options.connect_timeout = 1000ms;
		options.max_retries = 0;
		return options;
	}
}

TEST_CASE("curl transport - concurrent construction and teardown", "[curl_transport]")
{
	std::vector<std::unique_ptr<CurlTransport>> transports(8);
	{
		std::vector<std::jthread> builders;
		for(auto& transport: transports)
		{
			builders.emplace_back([&transport]
			{
				transport = std::make_unique<CurlTransport>(local_options());
			});
		}
	}

	{
		std::vector<std::jthread> destroyers;
		for(std::size_t i = 1; i < transports.size(); ++i)
		{
			destroyers.emplace_back([&transport = transports[i]]
			{
				transport.reset();
			});
		}
	}

	// the library stays usable after the other transports are gone
	REQUIRE(transports[0] != nullptr);
	const auto result = transports[0]->execute(HttpRequest{UNREACHABLE_ENDPOINT, HttpMethod::GET, {}});

	REQUIRE(std::holds_alternative<TransportError>(result));
	const auto& error = std::get<TransportError>(result);
	REQUIRE_FALSE(error.status_code.has_value());
	REQUIRE_FALSE(error.message.empty());
}

TEST_CASE("curl transport - retries are reported in the error", "[curl_transport]")
{
	auto options = local_options();
	options.max_retries = 2;
	options.retry_delay = 10ms;
	CurlTransport transport(options);

	const auto result = transport.execute(HttpRequest{UNREACHABLE_ENDPOINT, HttpMethod::POST, "a=1"});

	REQUIRE(std::holds_alternative<TransportError>(result));
	REQUIRE(std::get<TransportError>(result).message.starts_with("Request failed after 2 retries: "));
}
