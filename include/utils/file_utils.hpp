#ifndef FETCHPOOL_FILE_UTILS_HPP
#define FETCHPOOL_FILE_UTILS_HPP

#include <filesystem>
#include <stdexcept>
#include <string>


namespace fetchpool
{
	struct FileReadError: public std::runtime_error
	{
		using std::runtime_error::runtime_error;
	};

	[[nodiscard]] std::string read_file(const std::filesystem::path& filepath);
}

#endif //FETCHPOOL_FILE_UTILS_HPP
