#ifndef FETCHPOOL_REQUEST_TASK_HPP
#define FETCHPOOL_REQUEST_TASK_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "model/http_types.hpp"


namespace fetchpool
{
	class ITransport;
	class RequestPool;

	struct HttpResult
	{
		std::optional<long> status_code;
		std::string body;
		std::string error_message;

		[[nodiscard]] bool has_error() const noexcept;

		/**
		 * Parses the response body as json.
		 * Returns nothing when the body is blank or is not a valid json document.
		 */
		[[nodiscard]] std::optional<nlohmann::json> to_json() const;
	};

	/**
	 * Single outbound request tracked by the pool.
	 *
	 * Everything that describes the request (id, endpoint, method, body, callbacks) is fixed
	 * before submission. After submission only the owning pool changes the state, timestamps
	 * and result, all accessors may be called from any thread.
	 */
	class RequestTask
	{
	public:
		enum class State
		{
			PENDING,
			RUNNING,
			COMPLETED,
			FAILED,
			CANCELLED
		};

		using clock_t = std::chrono::system_clock;
		using time_point_t = clock_t::time_point;

		using success_callback_t = std::function<void(const RequestTask&)>;
		using failure_callback_t = std::function<void(const RequestTask&, const TransportError&)>;

		explicit RequestTask(HttpRequest request, success_callback_t on_success = {}, failure_callback_t on_failure = {});

		RequestTask(const RequestTask&) = delete;
		RequestTask& operator=(const RequestTask&) = delete;

		[[nodiscard]] static std::shared_ptr<RequestTask> make_get(
				std::string endpoint,
				success_callback_t on_success = {}, failure_callback_t on_failure = {}
		);
		[[nodiscard]] static std::shared_ptr<RequestTask> make_post(
				std::string endpoint, std::string body,
				success_callback_t on_success = {}, failure_callback_t on_failure = {}
		);

		[[nodiscard]] const std::string& id() const noexcept;
		[[nodiscard]] const HttpRequest& request() const noexcept;

		[[nodiscard]] std::string name() const;
		void set_name(std::string name);

		[[nodiscard]] std::shared_ptr<ITransport> transport() const;
		void set_transport(std::shared_ptr<ITransport> transport);

		[[nodiscard]] State state() const;
		[[nodiscard]] bool is_terminal() const;
		[[nodiscard]] std::optional<HttpResult> result() const;

		[[nodiscard]] time_point_t created_at() const noexcept;
		[[nodiscard]] std::optional<time_point_t> started_at() const;
		[[nodiscard]] std::optional<time_point_t> completed_at() const;

	private:
		friend class RequestPool;

		const std::string id_;
		const HttpRequest request_;
		const time_point_t created_at_;

		mutable std::mutex mutex_;

		std::string name_;
		std::shared_ptr<ITransport> transport_;

		bool submitted_ = false;
		State state_ = State::PENDING;
		std::optional<HttpResult> result_;
		std::optional<time_point_t> started_at_;
		std::optional<time_point_t> completed_at_;

		success_callback_t on_success_;
		failure_callback_t on_failure_;

		bool mark_submitted();
		void mark_running();
		success_callback_t mark_completed(HttpResult result);
		failure_callback_t mark_failed(HttpResult result);
		bool mark_cancelled();

		void ensure_not_submitted() const;
	};

	[[nodiscard]] std::string_view to_string(RequestTask::State state) noexcept;
}

#endif //FETCHPOOL_REQUEST_TASK_HPP
