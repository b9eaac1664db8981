#include "utils/file_utils.hpp"

#include <fstream>
#include <iterator>


namespace fs = std::filesystem;

namespace fetchpool
{
	std::string read_file(const std::filesystem::path& filepath)
	{
		if(!fs::exists(filepath))
		{
			throw FileReadError("File " + filepath.string() + " not found");
		}

		if(!fs::is_regular_file(filepath))
		{
			throw FileReadError(filepath.string() + " is not a regular file");
		}

		const auto file_size = fs::file_size(filepath);
		std::ifstream file(filepath, std::ios::binary);
		if(!file)
		{
			throw FileReadError("Failed to open file " + filepath.string());
		}

		std::string string_data;
		string_data.reserve(file_size);
		string_data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());

		if(file.bad())
		{
			throw FileReadError("Failed to read data from file " + filepath.string());
		}

		return string_data;
	}
}
