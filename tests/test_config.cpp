/**
 * @file test_config.cpp
 * @brief Catch2 tests for yaml configuration loading.
 */

#include "utils/config.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace fetchpool;
using namespace std::chrono_literals;

TEST_CASE("config - defaults for an empty document", "[config]")
{
	const auto config = parse_config("{}");

	REQUIRE(config.pool.max_concurrency == 4);
	REQUIRE(config.pool.poll_interval == 100ms);
	REQUIRE_FALSE(config.pool.wait_timeout.has_value());

	REQUIRE(config.transport.timeout == 50000ms);
	REQUIRE(config.transport.max_retries == 1);
	REQUIRE(config.transport.retry_delay == 1000ms);
	REQUIRE(config.transport.content_type == "application/x-www-form-urlencoded");
	REQUIRE_FALSE(config.transport.verbose);

	REQUIRE(config.logging.level == Config::LoggingConfig::LogLevel::INFO);
	REQUIRE(config.requests.empty());
}

TEST_CASE("config - full document", "[config]")
{
	const auto config = parse_config(R"(
pool:
  max_concurrency: 8
  poll_interval_ms: 25
  wait_timeout_ms: 30000
transport:
  timeout_ms: 2000
  connect_timeout_ms: 500
  max_retries: 3
  retry_delay_ms: 250
  user_agent: test-agent
  referer: http://localhost/
  content_type: application/json
  verbose: true
  headers:
    Authorization: Bearer token
    X-Trace: abc
logging:
  level: debug
requests:
  - url: http://localhost/models
  - name: completion
    url: http://localhost/chat
    method: post
    body: '{"prompt": "hello"}'
)");

	REQUIRE(config.pool.max_concurrency == 8);
	REQUIRE(config.pool.poll_interval == 25ms);
	REQUIRE(config.pool.wait_timeout == 30000ms);

	REQUIRE(config.transport.timeout == 2000ms);
	REQUIRE(config.transport.connect_timeout == 500ms);
	REQUIRE(config.transport.max_retries == 3);
	REQUIRE(config.transport.retry_delay == 250ms);
	REQUIRE(config.transport.user_agent == "test-agent");
	REQUIRE(config.transport.referer == "http://localhost/");
	REQUIRE(config.transport.content_type == "application/json");
	REQUIRE(config.transport.verbose);
	REQUIRE(config.transport.headers.size() == 2);
	REQUIRE(config.transport.headers.at("Authorization") == "Bearer token");

	REQUIRE(config.logging.level == Config::LoggingConfig::LogLevel::DEBUG);

	REQUIRE(config.requests.size() == 2);
	REQUIRE(config.requests[0].method == HttpMethod::GET);
	REQUIRE(config.requests[0].name.empty());
	REQUIRE(config.requests[1].name == "completion");
	REQUIRE(config.requests[1].method == HttpMethod::POST);
	REQUIRE(config.requests[1].body == R"({"prompt": "hello"})");
}

TEST_CASE("config - request body read from file", "[config]")
{
	const auto directory = std::filesystem::temp_directory_path() / "fetchpool_config_test";
	std::filesystem::create_directories(directory);
	{
		std::ofstream body_file(directory / "body.json");
		body_file << R"({"text": "from file"})";
	}

	const auto config = parse_config(R"(
requests:
  - url: http://localhost/tts
    method: POST
    body_file: body.json
)", directory);

	REQUIRE(config.requests.size() == 1);
	REQUIRE(config.requests[0].body == R"({"text": "from file"})");

	std::filesystem::remove_all(directory);
}

TEST_CASE("config - invalid values are rejected", "[config]")
{
	SECTION("zero concurrency")
	{
		REQUIRE_THROWS_AS(parse_config("pool: {max_concurrency: 0}"), std::runtime_error);
	}

	SECTION("negative concurrency")
	{
		REQUIRE_THROWS_AS(parse_config("pool: {max_concurrency: -2}"), std::runtime_error);
	}

	SECTION("negative retries")
	{
		REQUIRE_THROWS_AS(parse_config("transport: {max_retries: -1}"), std::runtime_error);
	}

	SECTION("zero timeout")
	{
		REQUIRE_THROWS_AS(parse_config("transport: {timeout_ms: 0}"), std::runtime_error);
	}

	SECTION("unknown log level")
	{
		REQUIRE_THROWS_AS(parse_config("logging: {level: VERBOSE}"), std::runtime_error);
	}

	SECTION("unsupported method")
	{
		REQUIRE_THROWS_AS(parse_config("requests: [{url: 'http://localhost', method: DELETE}]"), std::runtime_error);
	}

	SECTION("missing url")
	{
		REQUIRE_THROWS_AS(parse_config("requests: [{method: GET}]"), std::runtime_error);
	}

	SECTION("body and body_file together")
	{
		REQUIRE_THROWS_AS(parse_config("requests: [{url: 'http://localhost', body: a, body_file: b}]"), std::runtime_error);
	}

	SECTION("missing body file")
	{
		REQUIRE_THROWS_AS(parse_config("requests: [{url: 'http://localhost', body_file: does_not_exist.json}]"), std::runtime_error);
	}
}

TEST_CASE("config - missing file", "[config]")
{
	REQUIRE_THROWS_AS(load_config("/nonexistent/fetchpool.yaml"), std::runtime_error);
}
