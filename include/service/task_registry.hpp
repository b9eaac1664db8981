#ifndef FETCHPOOL_TASK_REGISTRY_HPP
#define FETCHPOOL_TASK_REGISTRY_HPP

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "model/request_task.hpp"


namespace fetchpool
{
	class TaskRegistry
	{
	public:
		void add(std::shared_ptr<RequestTask> task);

		[[nodiscard]] std::shared_ptr<RequestTask> find(const std::string& task_id) const;
		[[nodiscard]] std::shared_ptr<RequestTask> get(const std::string& task_id) const;
		[[nodiscard]] bool contains(const std::string& task_id) const noexcept;

		[[nodiscard]] std::vector<std::shared_ptr<RequestTask>> list() const;
		[[nodiscard]] std::size_t count_in_state(RequestTask::State state) const;

	private:
		mutable std::shared_mutex tasks_mutex_;

		std::unordered_map<std::string, std::shared_ptr<RequestTask>> tasks_;
		std::vector<std::shared_ptr<RequestTask>> submission_order_;
	};
}

#endif //FETCHPOOL_TASK_REGISTRY_HPP
