#ifndef FETCHPOOL_UUID_HPP
#define FETCHPOOL_UUID_HPP

#include <array>
#include <compare>
#include <string>


namespace fetchpool
{
	class UUID
	{
	public:
		UUID();

		[[nodiscard]] std::string as_string() const;

		std::strong_ordering operator<=>(const UUID& other) const noexcept = default;
		bool operator==(const UUID& other) const noexcept = default;

	private:
		std::array<unsigned char, 16> data_{};
	};
}

#endif //FETCHPOOL_UUID_HPP
