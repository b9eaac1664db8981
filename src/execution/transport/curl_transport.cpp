#include "execution/transport/curl_transport.hpp"

#include <memory>
#include <stdexcept>
#include <string_view>
#include <thread>

#include <curl/curl.h>
#include <spdlog/spdlog.h>


namespace
{
	using curl_handle_t = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
	using curl_headers_t = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

	std::size_t write_body(char* data, std::size_t size, std::size_t count, void* userp)
	{
		auto& body = *static_cast<std::string*>(userp);
		body.append(data, size * count);

		return size * count;
	}

	int trace(CURL* curl_handle, curl_infotype type, char* data, size_t size, [[maybe_unused]] void* userp)
	{
		switch(type)
		{
			case CURLINFO_TEXT:
			{
				spdlog::debug("[{}] == Info: {}", static_cast<void*>(curl_handle), std::string_view(data, size));
				break;
			}
			case CURLINFO_HEADER_OUT:
			{
				spdlog::debug("[{}] => Header", static_cast<void*>(curl_handle));
				break;
			}
			case CURLINFO_DATA_OUT:
			{
				spdlog::debug("[{}] => Data {} bytes", static_cast<void*>(curl_handle), size);
				break;
			}
			case CURLINFO_SSL_DATA_OUT:
			{
				spdlog::debug("[{}] => SSL Data", static_cast<void*>(curl_handle));
				break;
			}
			case CURLINFO_HEADER_IN:
			{
				spdlog::debug("[{}] <= Header", static_cast<void*>(curl_handle));
				break;
			}
			case CURLINFO_DATA_IN:
			{
				spdlog::debug("[{}] <= Data {} bytes", static_cast<void*>(curl_handle), size);
				break;
			}
			case CURLINFO_SSL_DATA_IN:
			{
				spdlog::debug("[{}] <= SSL Data", static_cast<void*>(curl_handle));
				break;
			}
			default:
			{
				break;
			}
		}

		return 0;
	}

	curl_headers_t build_headers(const fetchpool::CurlTransport::Options& options, const fetchpool::HttpRequest& request)
	{
		curl_slist* headers = nullptr;
		for(const auto& [name, value]: options.headers)
		{
			headers = curl_slist_append(headers, (name + ": " + value).c_str());
		}

		if(request.method == fetchpool::HttpMethod::POST && !options.headers.contains("Content-Type"))
		{
			headers = curl_slist_append(headers, ("Content-Type: " + options.content_type).c_str());
		}

		return curl_headers_t(headers, &curl_slist_free_all);
	}

	struct CurlGlobal
	{
		CurlGlobal()
		{
			spdlog::debug("Initializing curl");
			if(curl_global_init(CURL_GLOBAL_ALL))
			{
				throw std::runtime_error("Curl initialization failed");
			}
		}

		~CurlGlobal()
		{
			curl_global_cleanup();
		}
	};

	// curl_global_init is not thread-safe, run it once per process
	void ensure_curl_initialized()
	{
		static const CurlGlobal curl_global;
	}
}

namespace fetchpool
{
	CurlTransport::CurlTransport(Options options)
		: options_(std::move(options))
	{
		ensure_curl_initialized();

		spdlog::debug(
				"Curl transport - timeout: {}ms, retries: {}, retry delay: {}ms",
				options_.timeout.count(), options_.max_retries, options_.retry_delay.count()
		);
	}

	transport_result_t CurlTransport::execute(const HttpRequest& request)
	{
		transport_result_t result = perform(request);

		for(std::size_t attempt = 1; attempt <= options_.max_retries && std::holds_alternative<TransportError>(result); ++attempt)
		{
			spdlog::warn(
					"Request {} {} failed: {}. Retrying ({}/{})",
					to_string(request.method), request.endpoint,
					std::get<TransportError>(result).message, attempt, options_.max_retries
			);

			std::this_thread::sleep_for(options_.retry_delay);
			result = perform(request);
		}

		if(auto* error = std::get_if<TransportError>(&result); error != nullptr && options_.max_retries > 0)
		{
			error->message = "Request failed after " + std::to_string(options_.max_retries) + " retries: " + error->message;
		}

		return result;
	}

	transport_result_t CurlTransport::perform(const HttpRequest& request) const
	{
		curl_handle_t handle(curl_easy_init(), &curl_easy_cleanup);
		if(!handle)
		{
			return TransportError{"Failed to create curl handle", std::nullopt};
		}

		std::string response_body;
		char error_buffer[CURL_ERROR_SIZE] = {};

		auto headers = build_headers(options_, request);

		curl_easy_setopt(handle.get(), CURLOPT_URL, request.endpoint.c_str());
		curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
		curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
		curl_easy_setopt(handle.get(), CURLOPT_ACCEPT_ENCODING, "");
		curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout.count()));
		curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout.count()));
		curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
		curl_easy_setopt(handle.get(), CURLOPT_ERRORBUFFER, error_buffer);
		curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_body);
		curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response_body);

		if(!options_.referer.empty())
		{
			curl_easy_setopt(handle.get(), CURLOPT_REFERER, options_.referer.c_str());
		}

		if(headers)
		{
			curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.get());
		}

		if(request.method == HttpMethod::POST)
		{
			curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
			curl_easy_setopt(handle.get(), CURLOPT_COPYPOSTFIELDS, request.body.c_str());
		}

		if(options_.verbose)
		{
			curl_easy_setopt(handle.get(), CURLOPT_DEBUGFUNCTION, trace);
			curl_easy_setopt(handle.get(), CURLOPT_VERBOSE, 1L);
		}

		const auto code = curl_easy_perform(handle.get());
		if(code != CURLE_OK)
		{
			const std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(code);
			return TransportError{detail, std::nullopt};
		}

		long response_code = 0;
		curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response_code);

		spdlog::debug("{} {} returned status {}", to_string(request.method), request.endpoint, response_code);

		if(response_code < 200 || response_code >= 300)
		{
			return TransportError{"Unexpected http status " + std::to_string(response_code), response_code};
		}

		return HttpResponse{response_code, std::move(response_body)};
	}
}
