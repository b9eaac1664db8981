#ifndef FETCHPOOL_CONCURRENCY_GATE_HPP
#define FETCHPOOL_CONCURRENCY_GATE_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <stop_token>


namespace fetchpool
{
	/**
	 * Counting gate limiting the number of simultaneous executions.
	 * A slot is only ever handed out wrapped in a Slot guard, which gives it back on destruction,
	 * so every acquire is matched by exactly one release.
	 */
	class ConcurrencyGate
	{
	public:
		class Slot
		{
		public:
			Slot() noexcept = default;
			~Slot();

			Slot(Slot&& other) noexcept;
			Slot& operator=(Slot&& other) noexcept;

			Slot(const Slot&) = delete;
			Slot& operator=(const Slot&) = delete;

			void release() noexcept;
			[[nodiscard]] bool held() const noexcept;

		private:
			friend class ConcurrencyGate;

			explicit Slot(ConcurrencyGate& gate) noexcept;

			ConcurrencyGate* gate_ = nullptr;
		};

		explicit ConcurrencyGate(std::size_t capacity);

		ConcurrencyGate(const ConcurrencyGate&) = delete;
		ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;

		/**
		 * Blocks until a slot is free. Returns nothing when stop is requested on the token
		 * before a slot could be taken.
		 */
		[[nodiscard]] std::optional<Slot> acquire(std::stop_token stop_token);
		[[nodiscard]] std::optional<Slot> try_acquire();

		[[nodiscard]] std::size_t capacity() const noexcept;
		[[nodiscard]] std::size_t available() const;
		[[nodiscard]] std::size_t in_use() const;

	private:
		const std::size_t capacity_;

		mutable std::mutex mutex_;
		std::condition_variable_any cv_;
		std::size_t available_;

		void release() noexcept;
	};
}

#endif //FETCHPOOL_CONCURRENCY_GATE_HPP
