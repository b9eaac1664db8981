#ifndef FETCHPOOL_COMMON_EXCEPTIONS_HPP
#define FETCHPOOL_COMMON_EXCEPTIONS_HPP

#include <stdexcept>


namespace fetchpool
{
	struct ValidationException: public std::runtime_error
	{
		using std::runtime_error::runtime_error;
	};

	struct PoolClosedException: public ValidationException
	{
		using ValidationException::ValidationException;
	};

	struct ObjectAlreadyExistsException: public std::runtime_error
	{
		using std::runtime_error::runtime_error;
	};

	struct ObjectNotFoundException: public std::runtime_error
	{
		using std::runtime_error::runtime_error;
	};
}

#endif //FETCHPOOL_COMMON_EXCEPTIONS_HPP
