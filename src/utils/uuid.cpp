#include "utils/uuid.hpp"

#include <uuid/uuid.h>


namespace fetchpool
{
	UUID::UUID()
	{
		uuid_generate_random(data_.data());
	}

	std::string UUID::as_string() const
	{
		std::array<char, 37> buffer{};
		uuid_unparse_lower(data_.data(), buffer.data());

		return std::string(buffer.data());
	}
}
