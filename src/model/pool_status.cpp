#include "model/pool_status.hpp"

#include <nlohmann/json.hpp>


namespace fetchpool
{
	void to_json(nlohmann::json& json, const PoolStatus& status)
	{
		json = nlohmann::json{
			{"total", status.total},
			{"pending", status.pending},
			{"running", status.running},
			{"completed", status.completed},
			{"failed", status.failed},
			{"cancelled", status.cancelled},
			{"is_running", status.is_running}
		};
	}
}
