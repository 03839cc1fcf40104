/*

Copyright (c) 2007-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef IGD_OPERATION_FUTURE_HPP_INCLUDED
#define IGD_OPERATION_FUTURE_HPP_INCLUDED

#include "igd/config.hpp"
#include "igd/assert.hpp"
#include "igd/error_code.hpp"
#include "igd/mapping_error.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace igd {

	template <typename T>
	using operation_result = std::variant<T, upnp_fault, transport_failure>;

	namespace aux {

	template <typename T>
	struct operation_state
	{
		using callback_t = std::function<void(operation_result<T> const&)>;

		std::mutex mutex;
		std::condition_variable cond;
		std::optional<operation_result<T>> result;
		std::vector<callback_t> callbacks;
	};
	}

	// the consumer side of one asynchronous router exchange. It moves from
	// pending to completed exactly once; completed carries exactly one of
	// the success value, a router fault or a transport failure. Any number of
	// threads may wait on, or copy, the same future. Waiting doesn't consume
	// the result.
	template <typename T>
	class operation_future
	{
	public:
		using value_type = T;
		using result_type = operation_result<T>;
		using callback_t = typename aux::operation_state<T>::callback_t;

		operation_future() = default;
		explicit operation_future(std::shared_ptr<aux::operation_state<T>> s)
			: m_state(std::move(s)) {}

		bool valid() const { return bool(m_state); }

		bool is_ready() const
		{
			IGD_ASSERT(m_state);
			std::lock_guard<std::mutex> l(m_state->mutex);
			return m_state->result.has_value();
		}

		void wait() const
		{
			IGD_ASSERT(m_state);
			std::unique_lock<std::mutex> l(m_state->mutex);
			m_state->cond.wait(l, [this] { return m_state->result.has_value(); });
		}

		// returns true if the operation completed within ``timeout``
		template <typename Rep, typename Period>
		bool wait_for(std::chrono::duration<Rep, Period> const& timeout) const
		{
			IGD_ASSERT(m_state);
			std::unique_lock<std::mutex> l(m_state->mutex);
			return m_state->cond.wait_for(l, timeout
				, [this] { return m_state->result.has_value(); });
		}

		// waits for completion and returns the outcome
		result_type const& result() const
		{
			wait();
			// the result never changes once set
			return *m_state->result;
		}

		// waits for completion. Returns the value, or throws mapping_error
		T get() const
		{
			result_type const& r = result();
			if (auto const* f = std::get_if<upnp_fault>(&r)) throw translate(*f);
			if (auto const* f = std::get_if<transport_failure>(&r)) throw translate(*f);
			return std::get<T>(r);
		}

		// waits for completion. On failure ``ec`` is set and a default
		// constructed T is returned
		T get(error_code& ec) const
		{
			ec.clear();
			result_type const& r = result();
			if (auto const* f = std::get_if<upnp_fault>(&r))
			{
				ec = to_error_code(*f);
				return T();
			}
			if (auto const* f = std::get_if<transport_failure>(&r))
			{
				ec = to_error_code(*f);
				return T();
			}
			return std::get<T>(r);
		}

		// ``cb`` is invoked once the operation completes, on the thread
		// completing it. If it already has, ``cb`` is invoked immediately
		void on_complete(callback_t cb) const
		{
			IGD_ASSERT(m_state);
			if (!cb) return;
			{
				std::lock_guard<std::mutex> l(m_state->mutex);
				if (!m_state->result)
				{
					m_state->callbacks.push_back(std::move(cb));
					return;
				}
			}
			cb(*m_state->result);
		}

	private:
		std::shared_ptr<aux::operation_state<T>> m_state;
	};

	// the producer side of an operation_future
	template <typename T>
	class operation_promise
	{
	public:
		using result_type = operation_result<T>;

		operation_promise()
			: m_state(std::make_shared<aux::operation_state<T>>()) {}

		operation_future<T> get_future() const
		{ return operation_future<T>(m_state); }

		// moves the operation to completed. Only the first completion has any
		// effect, later ones return false and leave the result, the waiters
		// and the callbacks alone
		bool complete(result_type r) const
		{
			std::vector<typename aux::operation_state<T>::callback_t> callbacks;
			{
				std::lock_guard<std::mutex> l(m_state->mutex);
				if (m_state->result) return false;
				m_state->result.emplace(std::move(r));
				callbacks.swap(m_state->callbacks);
			}
			m_state->cond.notify_all();
			// the result is immutable from here on, no need to hold the lock
			for (auto const& cb : callbacks) cb(*m_state->result);
			return true;
		}

		bool set_value(T v) const
		{ return complete(result_type(std::in_place_index<0>, std::move(v))); }

		bool set_fault(int const code, std::string description) const
		{ return complete(result_type(std::in_place_type<upnp_fault>
			, upnp_fault{code, std::move(description)})); }

		bool set_failure(error_code const& ec, std::string message = std::string()) const
		{
			if (message.empty()) message = ec.message();
			return complete(result_type(std::in_place_type<transport_failure>
				, transport_failure{ec, std::move(message)}));
		}

		bool is_complete() const
		{
			std::lock_guard<std::mutex> l(m_state->mutex);
			return m_state->result.has_value();
		}

	private:
		std::shared_ptr<aux::operation_state<T>> m_state;
	};
}

#endif // IGD_OPERATION_FUTURE_HPP_INCLUDED
