#include "execution/pool/concurrency_gate.hpp"

#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>


namespace fetchpool
{
	ConcurrencyGate::Slot::Slot(ConcurrencyGate& gate) noexcept
		: gate_(&gate)
	{
	}

	ConcurrencyGate::Slot::~Slot()
	{
		release();
	}

	ConcurrencyGate::Slot::Slot(Slot&& other) noexcept
		: gate_(std::exchange(other.gate_, nullptr))
	{
	}

	ConcurrencyGate::Slot& ConcurrencyGate::Slot::operator=(Slot&& other) noexcept
	{
		if(this != &other)
		{
			release();
			gate_ = std::exchange(other.gate_, nullptr);
		}

		return *this;
	}

	void ConcurrencyGate::Slot::release() noexcept
	{
		if(gate_ != nullptr)
		{
			std::exchange(gate_, nullptr)->release();
		}
	}

	bool ConcurrencyGate::Slot::held() const noexcept
	{
		return gate_ != nullptr;
	}

	ConcurrencyGate::ConcurrencyGate(std::size_t capacity)
		: capacity_(capacity), available_(capacity)
	{
		if(capacity == 0)
		{
			throw std::invalid_argument("Gate capacity must be greater than 0");
		}
	}

	std::optional<ConcurrencyGate::Slot> ConcurrencyGate::acquire(std::stop_token stop_token)
	{
		std::unique_lock lock(mutex_);

		const bool acquired = cv_.wait(
				lock, stop_token,
				[this]
				{
					return available_ > 0;
				}
		);

		if(!acquired)
		{
			return std::nullopt;
		}

		--available_;
		return Slot(*this);
	}

	std::optional<ConcurrencyGate::Slot> ConcurrencyGate::try_acquire()
	{
		std::unique_lock lock(mutex_);
		if(available_ == 0)
		{
			return std::nullopt;
		}

		--available_;
		return Slot(*this);
	}

	std::size_t ConcurrencyGate::capacity() const noexcept
	{
		return capacity_;
	}

	std::size_t ConcurrencyGate::available() const
	{
		std::unique_lock lock(mutex_);
		return available_;
	}

	std::size_t ConcurrencyGate::in_use() const
	{
		std::unique_lock lock(mutex_);
		return capacity_ - available_;
	}

	void ConcurrencyGate::release() noexcept
	{
		{
			std::unique_lock lock(mutex_);
			if(available_ == capacity_)
			{
				spdlog::error("Concurrency gate released more slots than it handed out");
				return;
			}

			++available_;
		}
		cv_.notify_one();
	}
}
