#include "model/http_types.hpp"

#include <stdexcept>

#include "utils/string_utils.hpp"


namespace fetchpool
{
	std::string_view to_string(HttpMethod method) noexcept
	{
		switch(method)
		{
			case HttpMethod::GET:
				return "GET";
			case HttpMethod::POST:
				return "POST";
		}

		return "UNKNOWN";
	}

	HttpMethod parse_http_method(std::string_view method_name)
	{
		const auto normalized = to_upper(trim(method_name));
		if(normalized == "GET")
		{
			return HttpMethod::GET;
		}
		else if(normalized == "POST")
		{
			return HttpMethod::POST;
		}

		throw std::invalid_argument("Unsupported http method: " + std::string(method_name));
	}
}
