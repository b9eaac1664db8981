#ifndef FETCHPOOL_I_TRANSPORT_HPP
#define FETCHPOOL_I_TRANSPORT_HPP

#include "model/http_types.hpp"


namespace fetchpool
{
	/**
	 * Executes a single outbound request and reports either the response or the failure.
	 * Implementations must be safe to call from several threads at once, the pool invokes
	 * execute() from every execution thread it runs.
	 */
	class ITransport
	{
	public:
		virtual ~ITransport() = default;

		[[nodiscard]] virtual transport_result_t execute(const HttpRequest& request) = 0;
	};
}

#endif //FETCHPOOL_I_TRANSPORT_HPP
