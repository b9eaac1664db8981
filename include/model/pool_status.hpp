#ifndef FETCHPOOL_POOL_STATUS_HPP
#define FETCHPOOL_POOL_STATUS_HPP

#include <cstddef>

#include <nlohmann/json_fwd.hpp>


namespace fetchpool
{
	struct PoolStatus
	{
		std::size_t total = 0;
		std::size_t pending = 0;
		std::size_t running = 0;
		std::size_t completed = 0;
		std::size_t failed = 0;
		std::size_t cancelled = 0;
		bool is_running = false;

		[[nodiscard]] std::size_t finished() const noexcept
		{
			return completed + failed + cancelled;
		}
	};

	void to_json(nlohmann::json& json, const PoolStatus& status);
}

#endif //FETCHPOOL_POOL_STATUS_HPP
