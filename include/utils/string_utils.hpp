#ifndef FETCHPOOL_STRING_UTILS_HPP
#define FETCHPOOL_STRING_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>


namespace fetchpool
{
	inline std::string trim(std::string_view value)
	{
		const auto is_space = [](unsigned char character)
		{
			return std::isspace(character) != 0;
		};

		const auto begin = std::find_if_not(std::begin(value), std::end(value), is_space);
		const auto end = std::find_if_not(std::rbegin(value), std::rend(value), is_space).base();

		if(begin >= end)
		{
			return {};
		}

		return std::string(begin, end);
	}

	inline bool is_blank(std::string_view value)
	{
		return std::all_of(
				std::begin(value), std::end(value),
				[](unsigned char character)
				{
					return std::isspace(character) != 0;
				}
		);
	}

	inline std::string to_upper(std::string_view value)
	{
		std::string res(value);
		std::transform(
				std::begin(res), std::end(res), std::begin(res),
				[](unsigned char character)
				{
					return static_cast<char>(std::toupper(character));
				}
		);

		return res;
	}
}

#endif //FETCHPOOL_STRING_UTILS_HPP
