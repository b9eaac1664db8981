#include "execution/pool/request_pool.hpp"

#include <stdexcept>
#include <system_error>
#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

#include "service/common_exceptions.hpp"
#include "utils/string_utils.hpp"


namespace
{
	template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
	template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

	// set on the dispatch thread and on every execution thread of a pool
	thread_local const fetchpool::RequestPool* current_pool = nullptr;
}

namespace fetchpool
{
	RequestPool::RequestPool(
			std::shared_ptr<ITransport> transport,
			std::size_t max_concurrency,
			std::chrono::milliseconds poll_interval
	)
		:	transport_(std::move(transport)),
			poll_interval_(poll_interval),
			gate_(max_concurrency)
	{
		if(!transport_)
		{
			throw std::invalid_argument("Request pool requires a transport");
		}

		if(poll_interval_ <= std::chrono::milliseconds::zero())
		{
			throw std::invalid_argument("Poll interval must be greater than 0");
		}

		spdlog::info("Request pool created - concurrency limit: {}", max_concurrency);
	}

	RequestPool::~RequestPool()
	{
		shutdown();
	}

	void RequestPool::submit(std::shared_ptr<RequestTask> task)
	{
		if(!task)
		{
			throw ValidationException("Task must not be null");
		}

		if(is_blank(task->request().endpoint))
		{
			throw ValidationException("Task endpoint must not be empty");
		}

		{
			std::unique_lock lock(state_mutex_);

			if(disposed_)
			{
				throw PoolClosedException("Request pool was already torn down");
			}

			if(!accepting_)
			{
				throw PoolClosedException("Request pool is stopped and does not accept new tasks");
			}

			if(registry_.contains(task->id()))
			{
				throw ObjectAlreadyExistsException("Task with id " + task->id() + " already exists");
			}

			if(!task->mark_submitted())
			{
				throw ValidationException("Task " + task->id() + " was already submitted");
			}

			registry_.add(task);
			queue_.push_back(task);
			++total_count_;

			ensure_dispatch_started();
		}
		state_cv_.notify_all();

		spdlog::debug("Task {} queued - {} {}", task->id(), to_string(task->request().method), task->request().endpoint);
	}

	void RequestPool::submit_batch(const std::vector<std::shared_ptr<RequestTask>>& tasks)
	{
		for(const auto& task: tasks)
		{
			submit(task);
		}
	}

	std::string RequestPool::submit_get(
			std::string endpoint,
			RequestTask::success_callback_t on_success,
			RequestTask::failure_callback_t on_failure
	)
	{
		auto task = RequestTask::make_get(std::move(endpoint), std::move(on_success), std::move(on_failure));
		submit(task);

		return task->id();
	}

	std::string RequestPool::submit_post(
			std::string endpoint, std::string body,
			RequestTask::success_callback_t on_success,
			RequestTask::failure_callback_t on_failure
	)
	{
		auto task = RequestTask::make_post(std::move(endpoint), std::move(body), std::move(on_success), std::move(on_failure));
		submit(task);

		return task->id();
	}

	PoolStatus RequestPool::status() const
	{
		std::unique_lock lock(state_mutex_);

		return snapshot_status();
	}

	PoolStatus RequestPool::snapshot_status() const
	{
		PoolStatus status;
		status.total = total_count_;
		status.pending = queue_.size();
		status.is_running = running_;
		status.running = running_count_;
		status.completed = completed_count_;
		status.failed = failed_count_;
		status.cancelled = cancelled_count_;

		return status;
	}

	std::shared_ptr<const RequestTask> RequestPool::find_task(const std::string& task_id) const
	{
		return registry_.find(task_id);
	}

	std::shared_ptr<const RequestTask> RequestPool::get_task(const std::string& task_id) const
	{
		return registry_.get(task_id);
	}

	std::vector<std::shared_ptr<const RequestTask>> RequestPool::list_tasks() const
	{
		const auto tasks = registry_.list();
		return {tasks.begin(), tasks.end()};
	}

	std::size_t RequestPool::max_concurrency() const noexcept
	{
		return gate_.capacity();
	}

	bool RequestPool::is_running() const
	{
		std::unique_lock lock(state_mutex_);
		return running_;
	}

	RequestPool::handler_id_t RequestPool::add_completion_handler(completion_handler_t handler)
	{
		std::unique_lock lock(handlers_mutex_);

		const auto handler_id = next_handler_id_++;
		completion_handlers_.try_emplace(handler_id, std::move(handler));

		return handler_id;
	}

	void RequestPool::remove_completion_handler(handler_id_t handler_id)
	{
		std::unique_lock lock(handlers_mutex_);

		if(completion_handlers_.erase(handler_id) == 0)
		{
			throw ObjectNotFoundException("No completion handler with id " + std::to_string(handler_id));
		}
	}

	bool RequestPool::wait_all(std::optional<std::chrono::milliseconds> timeout)
	{
		ensure_not_pool_thread("wait_all");

		std::unique_lock lock(state_mutex_);
		const auto is_idle = [this]
		{
			return idle();
		};

		if(timeout.has_value())
		{
			return state_cv_.wait_for(lock, timeout.value(), is_idle);
		}

		state_cv_.wait(lock, is_idle);
		return true;
	}

	bool RequestPool::stop(std::optional<std::chrono::milliseconds> timeout)
	{
		ensure_not_pool_thread("stop");

		{
			std::unique_lock lock(state_mutex_);
			accepting_ = false;
			running_ = false;

			spdlog::info("Stopping request pool - {} queued, {} in flight", queue_.size(), in_flight_);
		}

		if(!wait_all(timeout))
		{
			spdlog::warn("Request pool did not drain before the timeout, tasks keep running");
			return false;
		}

		std::jthread dispatch_thread;
		{
			std::unique_lock lock(state_mutex_);
			dispatch_thread = std::move(dispatch_thread_);
		}

		if(dispatch_thread.joinable())
		{
			dispatch_thread.request_stop();
			dispatch_thread.join();
		}

		spdlog::info("Request pool stopped");
		return true;
	}

	void RequestPool::stop_now()
	{
		std::size_t cancelled = 0;
		{
			std::unique_lock lock(state_mutex_);
			accepting_ = false;
			running_ = false;

			dispatch_thread_.request_stop();

			while(!queue_.empty())
			{
				const auto task = std::move(queue_.front());
				queue_.pop_front();

				if(task->mark_cancelled())
				{
					++cancelled_count_;
					++cancelled;
				}
			}
		}
		state_cv_.notify_all();

		if(cancelled > 0)
		{
			spdlog::info("Request pool stopped immediately - {} queued tasks cancelled", cancelled);
		}
	}

	void RequestPool::shutdown()
	{
		ensure_not_pool_thread("shutdown");

		{
			std::unique_lock lock(state_mutex_);
			if(disposed_)
			{
				return;
			}

			disposed_ = true;
		}

		stop_now();

		std::jthread dispatch_thread;
		{
			std::unique_lock lock(state_mutex_);
			dispatch_thread = std::move(dispatch_thread_);
		}

		if(dispatch_thread.joinable())
		{
			dispatch_thread.join();
		}

		reap_executions(true);

		spdlog::info("Request pool shut down");
	}

	void RequestPool::thread_body(std::stop_token stop_token, RequestPool& pool)
	{
		spdlog::info("Request pool - dispatch thread starting...");
		current_pool = &pool;

		while(!stop_token.stop_requested())
		{
			pool.reap_executions(false);

			{
				std::unique_lock lock(pool.state_mutex_);

				if(pool.queue_.empty())
				{
					if(pool.in_flight_ == 0)
					{
						lock.unlock();
						if(pool.finish_run())
						{
							spdlog::info("Request pool - dispatch thread idle");
							return;
						}

						continue;
					}

					pool.state_cv_.wait_for(
						lock, stop_token, pool.poll_interval_,
						[&queue=pool.queue_, &in_flight=pool.in_flight_]
						{
							return !queue.empty() || in_flight == 0;
						}
					);
					continue;
				}
			}

			auto slot = pool.gate_.acquire(stop_token);
			if(!slot.has_value())
			{
				break;
			}

			std::shared_ptr<RequestTask> task;
			{
				std::unique_lock lock(pool.state_mutex_);

				if(stop_token.stop_requested())
				{
					break;
				}

				if(pool.queue_.empty())
				{
					spdlog::debug("Admission queue emptied while waiting for a slot, releasing it");
					continue;
				}

				task = std::move(pool.queue_.front());
				pool.queue_.pop_front();

				task->mark_running();
				++pool.running_count_;
				++pool.in_flight_;
			}

			pool.launch_execution(std::move(task), std::move(slot.value()));
		}

		pool.reap_executions(true);
		{
			std::unique_lock lock(pool.state_mutex_);
			pool.loop_active_ = false;
			pool.running_ = false;
		}
		pool.state_cv_.notify_all();

		spdlog::info("Request pool - dispatch thread stopping...");
	}

	void RequestPool::ensure_dispatch_started()
	{
		if(loop_active_ || !accepting_)
		{
			return;
		}

		// previous run went idle and only has to return
		if(dispatch_thread_.joinable())
		{
			dispatch_thread_.join();
		}

		loop_active_ = true;
		running_ = true;

		dispatch_thread_ = std::jthread([this](std::stop_token stop_token)
		{
			thread_body(stop_token, *this);
		});
	}

	bool RequestPool::finish_run()
	{
		reap_executions(true);

		PoolStatus snapshot;
		{
			std::unique_lock lock(state_mutex_);

			// work submitted since the idle check belongs to this run
			if(!queue_.empty() || in_flight_ != 0)
			{
				return false;
			}

			snapshot = snapshot_status();
		}

		spdlog::debug(
				"All tasks completed - total: {}, completed: {}, failed: {}, cancelled: {}",
				snapshot.total, snapshot.completed, snapshot.failed, snapshot.cancelled
		);
		notify_all_completed(snapshot);

		{
			std::unique_lock lock(state_mutex_);

			// a completion handler may have queued more work
			if(!queue_.empty() || in_flight_ != 0)
			{
				return false;
			}

			loop_active_ = false;
			running_ = false;
		}
		state_cv_.notify_all();

		return true;
	}

	void RequestPool::launch_execution(std::shared_ptr<RequestTask> task, ConcurrencyGate::Slot slot)
	{
		auto& execution = executions_.emplace_back(std::make_unique<Execution>());

		try
		{
			execution->thread = std::jthread(
				[this, task, slot = std::move(slot), &finished = execution->finished]() mutable
				{
					current_pool = this;
					{
						const auto held_slot = std::move(slot);
						execute(*task);
					}
					finish_execution();
					finished = true;
				}
			);
		}
		catch(const std::system_error& error)
		{
			spdlog::error("Failed to start execution thread for task {}: {}", task->id(), error.what());
			executions_.pop_back();

			fail_task(*task, TransportError{std::string("Failed to start execution: ") + error.what(), std::nullopt});
			--running_count_;
			finish_execution();
		}

		spdlog::debug("Task {} dispatched", task->id());
	}

	void RequestPool::execute(RequestTask& task)
	{
		auto transport = task.transport();
		if(!transport)
		{
			transport = transport_;
		}

		transport_result_t outcome;
		try
		{
			outcome = transport->execute(task.request());
		}
		catch(const std::exception& error)
		{
			outcome = TransportError{error.what(), std::nullopt};
		}
		catch(...)
		{
			outcome = TransportError{"Unknown transport error", std::nullopt};
		}

		std::visit(
			overloaded{
				[this, &task](HttpResponse& response) { complete_task(task, std::move(response)); },
				[this, &task](const TransportError& error) { fail_task(task, error); }
			},
			outcome
		);

		--running_count_;
	}

	void RequestPool::complete_task(RequestTask& task, HttpResponse response)
	{
		const auto status_code = response.status_code;
		auto callback = task.mark_completed(HttpResult{status_code, std::move(response.body), {}});
		++completed_count_;

		spdlog::debug("Task {} completed with status {}", task.id(), status_code);

		if(callback)
		{
			try
			{
				callback(task);
			}
			catch(const std::exception& error)
			{
				spdlog::error("Success callback of task {} failed: {}", task.id(), error.what());
			}
			catch(...)
			{
				spdlog::error("Success callback of task {} failed with an unknown exception", task.id());
			}
		}
	}

	void RequestPool::fail_task(RequestTask& task, const TransportError& error)
	{
		HttpResult result;
		result.status_code = error.status_code;
		result.error_message = error.message.empty() ? "Unknown transport error" : error.message;

		auto callback = task.mark_failed(std::move(result));
		++failed_count_;

		spdlog::debug("Task {} failed: {}", task.id(), error.message);

		if(callback)
		{
			try
			{
				callback(task, error);
			}
			catch(const std::exception& callback_error)
			{
				spdlog::error("Failure callback of task {} failed: {}", task.id(), callback_error.what());
			}
			catch(...)
			{
				spdlog::error("Failure callback of task {} failed with an unknown exception", task.id());
			}
		}
	}

	void RequestPool::finish_execution()
	{
		{
			std::unique_lock lock(state_mutex_);
			--in_flight_;
		}
		state_cv_.notify_all();
	}

	void RequestPool::reap_executions(bool wait_for_running)
	{
		for(auto iter = executions_.begin(); iter != executions_.end();)
		{
			auto& execution = *iter;
			if(!wait_for_running && !execution->finished)
			{
				++iter;
				continue;
			}

			if(execution->thread.joinable())
			{
				execution->thread.join();
			}
			iter = executions_.erase(iter);
		}
	}

	void RequestPool::notify_all_completed(const PoolStatus& status)
	{
		std::vector<completion_handler_t> handlers;
		{
			std::unique_lock lock(handlers_mutex_);
			handlers.reserve(completion_handlers_.size());
			for(const auto& [handler_id, handler]: completion_handlers_)
			{
				handlers.push_back(handler);
			}
		}

		for(const auto& handler: handlers)
		{
			try
			{
				handler(status);
			}
			catch(const std::exception& error)
			{
				spdlog::error("Completion handler failed: {}", error.what());
			}
			catch(...)
			{
				spdlog::error("Completion handler failed with an unknown exception");
			}
		}
	}

	bool RequestPool::idle() const
	{
		return queue_.empty() && in_flight_ == 0 && !loop_active_;
	}

	void RequestPool::ensure_not_pool_thread(const char* operation) const
	{
		if(current_pool == this)
		{
			throw std::logic_error(std::string(operation) + " cannot be called from a thread owned by the pool");
		}
	}
}
