#ifndef FETCHPOOL_HTTP_TYPES_HPP
#define FETCHPOOL_HTTP_TYPES_HPP

#include <optional>
#include <string>
#include <string_view>
#include <variant>


namespace fetchpool
{
	enum class HttpMethod
	{
		GET,
		POST
	};

	[[nodiscard]] std::string_view to_string(HttpMethod method) noexcept;
	[[nodiscard]] HttpMethod parse_http_method(std::string_view method_name);

	struct HttpRequest
	{
		std::string endpoint;
		HttpMethod method = HttpMethod::GET;
		std::string body;
	};

	struct HttpResponse
	{
		long status_code = 0;
		std::string body;
	};

	struct TransportError
	{
		std::string message;
		std::optional<long> status_code;
	};

	using transport_result_t = std::variant<HttpResponse, TransportError>;
}

#endif //FETCHPOOL_HTTP_TYPES_HPP
