#include "model/request_task.hpp"

#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "utils/string_utils.hpp"
#include "utils/uuid.hpp"


namespace fetchpool
{
	bool HttpResult::has_error() const noexcept
	{
		return !error_message.empty();
	}

	std::optional<nlohmann::json> HttpResult::to_json() const
	{
		if(is_blank(body))
		{
			return std::nullopt;
		}

		auto document = nlohmann::json::parse(body, nullptr, false);
		if(document.is_discarded())
		{
			return std::nullopt;
		}

		return std::optional<nlohmann::json>(std::in_place, std::move(document));
	}

	RequestTask::RequestTask(HttpRequest request, success_callback_t on_success, failure_callback_t on_failure)
		:	id_(UUID().as_string()),
			request_(std::move(request)),
			created_at_(clock_t::now()),
			on_success_(std::move(on_success)),
			on_failure_(std::move(on_failure))
	{
	}

	std::shared_ptr<RequestTask> RequestTask::make_get(
			std::string endpoint,
			success_callback_t on_success, failure_callback_t on_failure
	)
	{
		return std::make_shared<RequestTask>(
				HttpRequest{std::move(endpoint), HttpMethod::GET, {}},
				std::move(on_success), std::move(on_failure)
		);
	}

	std::shared_ptr<RequestTask> RequestTask::make_post(
			std::string endpoint, std::string body,
			success_callback_t on_success, failure_callback_t on_failure
	)
	{
		return std::make_shared<RequestTask>(
				HttpRequest{std::move(endpoint), HttpMethod::POST, std::move(body)},
				std::move(on_success), std::move(on_failure)
		);
	}

	const std::string& RequestTask::id() const noexcept
	{
		return id_;
	}

	const HttpRequest& RequestTask::request() const noexcept
	{
		return request_;
	}

	std::string RequestTask::name() const
	{
		std::unique_lock lock(mutex_);
		return name_;
	}

	void RequestTask::set_name(std::string name)
	{
		std::unique_lock lock(mutex_);
		ensure_not_submitted();

		name_ = std::move(name);
	}

	std::shared_ptr<ITransport> RequestTask::transport() const
	{
		std::unique_lock lock(mutex_);
		return transport_;
	}

	void RequestTask::set_transport(std::shared_ptr<ITransport> transport)
	{
		std::unique_lock lock(mutex_);
		ensure_not_submitted();

		transport_ = std::move(transport);
	}

	RequestTask::State RequestTask::state() const
	{
		std::unique_lock lock(mutex_);
		return state_;
	}

	bool RequestTask::is_terminal() const
	{
		const auto current_state = state();
		return current_state == State::COMPLETED
			|| current_state == State::FAILED
			|| current_state == State::CANCELLED;
	}

	std::optional<HttpResult> RequestTask::result() const
	{
		std::unique_lock lock(mutex_);
		return result_;
	}

	RequestTask::time_point_t RequestTask::created_at() const noexcept
	{
		return created_at_;
	}

	std::optional<RequestTask::time_point_t> RequestTask::started_at() const
	{
		std::unique_lock lock(mutex_);
		return started_at_;
	}

	std::optional<RequestTask::time_point_t> RequestTask::completed_at() const
	{
		std::unique_lock lock(mutex_);
		return completed_at_;
	}

	bool RequestTask::mark_submitted()
	{
		std::unique_lock lock(mutex_);
		if(submitted_ || state_ != State::PENDING)
		{
			return false;
		}

		submitted_ = true;
		return true;
	}

	void RequestTask::mark_running()
	{
		std::unique_lock lock(mutex_);
		if(state_ != State::PENDING)
		{
			throw std::logic_error("Task " + id_ + " cannot start from state " + std::string(to_string(state_)));
		}

		state_ = State::RUNNING;
		started_at_ = clock_t::now();
	}

	RequestTask::success_callback_t RequestTask::mark_completed(HttpResult result)
	{
		std::unique_lock lock(mutex_);
		if(state_ != State::RUNNING)
		{
			throw std::logic_error("Task " + id_ + " cannot complete from state " + std::string(to_string(state_)));
		}

		result_ = std::move(result);
		state_ = State::COMPLETED;
		completed_at_ = clock_t::now();

		on_failure_ = nullptr;
		return std::exchange(on_success_, nullptr);
	}

	RequestTask::failure_callback_t RequestTask::mark_failed(HttpResult result)
	{
		std::unique_lock lock(mutex_);
		if(state_ != State::RUNNING)
		{
			throw std::logic_error("Task " + id_ + " cannot fail from state " + std::string(to_string(state_)));
		}

		result_ = std::move(result);
		state_ = State::FAILED;
		completed_at_ = clock_t::now();

		on_success_ = nullptr;
		return std::exchange(on_failure_, nullptr);
	}

	bool RequestTask::mark_cancelled()
	{
		std::unique_lock lock(mutex_);
		if(state_ != State::PENDING)
		{
			return false;
		}

		state_ = State::CANCELLED;
		completed_at_ = clock_t::now();

		on_success_ = nullptr;
		on_failure_ = nullptr;
		return true;
	}

	void RequestTask::ensure_not_submitted() const
	{
		if(submitted_)
		{
			throw std::logic_error("Task " + id_ + " was already submitted");
		}
	}

	std::string_view to_string(RequestTask::State state) noexcept
	{
		using enum RequestTask::State;

		switch(state)
		{
			case PENDING:
				return "PENDING";
			case RUNNING:
				return "RUNNING";
			case COMPLETED:
				return "COMPLETED";
			case FAILED:
				return "FAILED";
			case CANCELLED:
				return "CANCELLED";
		}

		return "UNKNOWN";
	}
}
