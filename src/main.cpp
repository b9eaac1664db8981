#include <chrono>
#include <iostream>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "execution/pool/request_pool.hpp"
#include "execution/transport/curl_transport.hpp"
#include "service/common_exceptions.hpp"
#include "utils/config.hpp"

using namespace fetchpool;


void init_global_logger(const Config::LoggingConfig& config)
{
	using enum Config::LoggingConfig::LogLevel;

	const std::unordered_map<Config::LoggingConfig::LogLevel, spdlog::level::level_enum> spdlog_log_level_map{
		{INFO, spdlog::level::level_enum::info},
		{WARNING, spdlog::level::level_enum::warn},
		{ERROR, spdlog::level::level_enum::err},
		{DEBUG, spdlog::level::level_enum::debug}
	};

	const auto spdlog_level = spdlog_log_level_map.at(config.level);
	spdlog::set_level(spdlog_level);
	spdlog::info("Logger set up to: {} level", spdlog::level::to_short_c_str(spdlog_level));
}

std::shared_ptr<RequestTask> build_task(const Config::RequestConfig& request_config)
{
	auto on_success = [](const RequestTask& task)
	{
		const auto result = task.result();
		spdlog::info("{} finished with status {}", task.request().endpoint, result->status_code.value_or(0));
	};

	auto on_failure = [](const RequestTask& task, const TransportError& error)
	{
		spdlog::error("{} failed: {}", task.request().endpoint, error.message);
	};

	auto task = request_config.method == HttpMethod::POST
			? RequestTask::make_post(request_config.url, request_config.body, on_success, on_failure)
			: RequestTask::make_get(request_config.url, on_success, on_failure);

	if(!request_config.name.empty())
	{
		task->set_name(request_config.name);
	}

	return task;
}

nlohmann::json build_task_report(const RequestTask& task)
{
	nlohmann::json report{
		{"id", task.id()},
		{"name", task.name()},
		{"method", std::string(to_string(task.request().method))},
		{"url", task.request().endpoint},
		{"state", std::string(to_string(task.state()))}
	};

	const auto started_at = task.started_at();
	const auto completed_at = task.completed_at();
	if(started_at.has_value() && completed_at.has_value())
	{
		const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(completed_at.value() - started_at.value());
		report["duration_ms"] = duration.count();
	}

	if(const auto result = task.result(); result.has_value())
	{
		if(result->status_code.has_value())
		{
			report["status_code"] = result->status_code.value();
		}

		if(result->has_error())
		{
			report["error"] = result->error_message;
		}
		else if(auto body = result->to_json(); body.has_value())
		{
			report["body"] = std::move(body.value());
		}
		else
		{
			report["body_size"] = result->body.size();
		}
	}

	return report;
}

int main(int argc, char* argv[])
{
	const std::string config_path = argc > 1 ? argv[1] : "./fetchpool.yaml";

	Config config;
	try
	{
		config = load_config(config_path);
	}
	catch(const std::exception& error)
	{
		spdlog::critical("Failed to load configuration {}: {}", config_path, error.what());
		return 2;
	}

	init_global_logger(config.logging);
	log_config(config);

	const auto transport = std::make_shared<CurlTransport>(config.transport);
	RequestPool pool(transport, config.pool.max_concurrency, config.pool.poll_interval);

	pool.add_completion_handler([](const PoolStatus& status)
	{
		spdlog::info(
				"All requests finished - completed: {}, failed: {}, cancelled: {}",
				status.completed, status.failed, status.cancelled
		);
	});

	std::size_t rejected = 0;
	for(const auto& request_config: config.requests)
	{
		try
		{
			pool.submit(build_task(request_config));
		}
		catch(const ValidationException& error)
		{
			spdlog::error("Request {} rejected: {}", request_config.url, error.what());
			++rejected;
		}
	}

	if(!pool.wait_all(config.pool.wait_timeout))
	{
		spdlog::warn("Requests did not finish in time, cancelling the queued ones");
		pool.stop_now();
	}

	pool.stop();

	const auto status = pool.status();

	nlohmann::json report;
	report["status"] = status;
	report["tasks"] = nlohmann::json::array();
	for(const auto& task: pool.list_tasks())
	{
		report["tasks"].push_back(build_task_report(*task));
	}

	std::cout << report.dump(2) << std::endl;

	return rejected == 0 && status.completed == status.total ? 0 : 1;
}
