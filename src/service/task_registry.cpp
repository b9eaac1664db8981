#include "service/task_registry.hpp"

#include <algorithm>
#include <mutex>

#include "service/common_exceptions.hpp"


namespace fetchpool
{
	void TaskRegistry::add(std::shared_ptr<RequestTask> task)
	{
		std::unique_lock lock(tasks_mutex_);

		const auto [iter, inserted] = tasks_.try_emplace(task->id(), task);
		if(!inserted)
		{
			throw ObjectAlreadyExistsException("Task with id " + task->id() + " already exists");
		}

		submission_order_.emplace_back(std::move(task));
	}

	std::shared_ptr<RequestTask> TaskRegistry::find(const std::string& task_id) const
	{
		std::shared_lock lock(tasks_mutex_);

		const auto iter = tasks_.find(task_id);
		if(iter == tasks_.end())
		{
			return nullptr;
		}

		return iter->second;
	}

	std::shared_ptr<RequestTask> TaskRegistry::get(const std::string& task_id) const
	{
		auto task = find(task_id);
		if(!task)
		{
			throw ObjectNotFoundException("No task with id " + task_id + " found");
		}

		return task;
	}

	bool TaskRegistry::contains(const std::string& task_id) const noexcept
	{
		std::shared_lock lock(tasks_mutex_);
		return tasks_.contains(task_id);
	}

	std::vector<std::shared_ptr<RequestTask>> TaskRegistry::list() const
	{
		std::shared_lock lock(tasks_mutex_);
		return submission_order_;
	}

	std::size_t TaskRegistry::count_in_state(RequestTask::State state) const
	{
		std::shared_lock lock(tasks_mutex_);

		return static_cast<std::size_t>(std::count_if(
				submission_order_.begin(), submission_order_.end(),
				[state](const auto& task)
				{
					return task->state() == state;
				}
		));
	}
}
