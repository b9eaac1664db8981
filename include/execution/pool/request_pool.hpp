#ifndef FETCHPOOL_REQUEST_POOL_HPP
#define FETCHPOOL_REQUEST_POOL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "execution/pool/concurrency_gate.hpp"
#include "execution/transport/i_transport.hpp"
#include "model/pool_status.hpp"
#include "model/request_task.hpp"
#include "service/task_registry.hpp"


namespace fetchpool
{
	/**
	 * Runs submitted requests with at most max_concurrency of them in flight.
	 *
	 * Submitted tasks are kept in the registry for the lifetime of the pool and queued in
	 * submission order. A dispatch thread is started by the first submission, it moves tasks
	 * from the queue to their own execution threads while the concurrency gate has free slots,
	 * and exits once the queue is empty and nothing is in flight, notifying the completion
	 * handlers. The next submission starts it again.
	 */
	class RequestPool
	{
	public:
		using completion_handler_t = std::function<void(const PoolStatus&)>;
		using handler_id_t = std::size_t;

		constexpr static std::chrono::milliseconds DEFAULT_POLL_INTERVAL{100};

		RequestPool(
				std::shared_ptr<ITransport> transport,
				std::size_t max_concurrency,
				std::chrono::milliseconds poll_interval = DEFAULT_POLL_INTERVAL
		);
		~RequestPool();

		RequestPool(const RequestPool&) = delete;
		RequestPool& operator=(const RequestPool&) = delete;

		void submit(std::shared_ptr<RequestTask> task);
		void submit_batch(const std::vector<std::shared_ptr<RequestTask>>& tasks);

		std::string submit_get(
				std::string endpoint,
				RequestTask::success_callback_t on_success = {},
				RequestTask::failure_callback_t on_failure = {}
		);
		std::string submit_post(
				std::string endpoint, std::string body,
				RequestTask::success_callback_t on_success = {},
				RequestTask::failure_callback_t on_failure = {}
		);

		[[nodiscard]] PoolStatus status() const;
		[[nodiscard]] std::shared_ptr<const RequestTask> find_task(const std::string& task_id) const;
		[[nodiscard]] std::shared_ptr<const RequestTask> get_task(const std::string& task_id) const;
		[[nodiscard]] std::vector<std::shared_ptr<const RequestTask>> list_tasks() const;

		[[nodiscard]] std::size_t max_concurrency() const noexcept;
		[[nodiscard]] bool is_running() const;

		handler_id_t add_completion_handler(completion_handler_t handler);
		void remove_completion_handler(handler_id_t handler_id);

		/**
		 * Blocks until the queue is empty, no execution is in flight and the dispatch thread went idle.
		 * Returns false when the timeout expired first. Must not be called from a callback or handler.
		 */
		bool wait_all(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

		/**
		 * Graceful stop: rejects new submissions and waits for the queued and running tasks.
		 * On timeout returns false and lets the drain continue.
		 */
		bool stop(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

		/**
		 * Immediate stop: rejects new submissions, cancels every queued task and stops the dispatch
		 * thread. Executions already in flight run to completion.
		 */
		void stop_now();

		void shutdown();

	private:
		struct Execution
		{
			std::atomic_bool finished = false;
			std::jthread thread;
		};

		std::shared_ptr<ITransport> transport_;
		const std::chrono::milliseconds poll_interval_;

		ConcurrencyGate gate_;
		TaskRegistry registry_;

		mutable std::mutex state_mutex_;
		std::condition_variable_any state_cv_;
		std::deque<std::shared_ptr<RequestTask>> queue_;
		std::size_t in_flight_ = 0;
		bool running_ = false;
		bool loop_active_ = false;
		bool accepting_ = true;
		bool disposed_ = false;
		std::jthread dispatch_thread_;

		// owned by the dispatch thread
		std::list<std::unique_ptr<Execution>> executions_;

		std::atomic<std::size_t> total_count_ = 0;
		std::atomic<std::size_t> running_count_ = 0;
		std::atomic<std::size_t> completed_count_ = 0;
		std::atomic<std::size_t> failed_count_ = 0;
		std::atomic<std::size_t> cancelled_count_ = 0;

		std::mutex handlers_mutex_;
		std::map<handler_id_t, completion_handler_t> completion_handlers_;
		handler_id_t next_handler_id_ = 0;

		static void thread_body(std::stop_token stop_token, RequestPool& pool);

		void ensure_dispatch_started();
		bool finish_run();

		void launch_execution(std::shared_ptr<RequestTask> task, ConcurrencyGate::Slot slot);
		void execute(RequestTask& task);
		void complete_task(RequestTask& task, HttpResponse response);
		void fail_task(RequestTask& task, const TransportError& error);
		void finish_execution();
		void reap_executions(bool wait_for_running);

		void notify_all_completed(const PoolStatus& status);
		// state_mutex_ must be held
		[[nodiscard]] PoolStatus snapshot_status() const;

		[[nodiscard]] bool idle() const;
		void ensure_not_pool_thread(const char* operation) const;
	};
}

#endif //FETCHPOOL_REQUEST_POOL_HPP
