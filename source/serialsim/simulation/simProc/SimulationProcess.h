/*  This file is part of Serialsim, a cycle-accurate simulator for bit-serial arithmetic circuits.
	Copyright (C) 2021 Michael Offel, Andreas Ley

	Serialsim is free software; you can redistribute it and/or
	modify it under the terms of the GNU Lesser General Public
	License as published by the Free Software Foundation; either
	version 3 of the License, or (at your option) any later version.

	Serialsim is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
	Lesser General Public License for more details.

	You should have received a copy of the GNU Lesser General Public
	License along with this library; if not, write to the Free Software
	Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
*/
#pragma once

#include "../../utils/Exceptions.h"
#include "../../utils/Preprocessor.h"

#include <coroutine>
#include <functional>
#include <map>
#include <memory>
#include <queue>
#include <utility>
#include <vector>

namespace ssim::hlim {
	class Clock;
}

namespace ssim::sim {

template<typename ReturnValue = void>
struct base_promise_type {
	ReturnValue returnValue;
	template<std::convertible_to<ReturnValue> From>
	void return_value(From &&from) { returnValue = std::forward<From>(from); }
};

template<>
struct base_promise_type<void> {
	void return_void() { }
};

template<typename ReturnValue, typename promise_type>
struct BaseCall {
	ReturnValue await_resume() noexcept { return std::move(calledSimulationCoroutine.promise().returnValue); }
	std::coroutine_handle<promise_type> calledSimulationCoroutine;
};

template<typename promise_type>
struct BaseCall<void, promise_type> {
	void await_resume() noexcept { }
	std::coroutine_handle<promise_type> calledSimulationCoroutine;
};


/**
 * @brief Coroutine type of simulation processes and of the functions they call.
 * @details A SimulationFunction starts suspended and owns its coroutine frame. Top level processes are handed to the
 * SimulationCoroutineHandler, sub functions are run by co_awaiting them from another SimulationFunction, in which case
 * the caller resumes (and receives the return value) once the callee finishes.
 */
template<typename ReturnValue = void>
class SimulationFunction {
	public:
		struct promise_type : public base_promise_type<ReturnValue> {

			using returnType = ReturnValue;

			promise_type() = default;
			promise_type(const promise_type &) = delete;
			void operator=(const promise_type &) = delete;

			SimulationFunction get_return_object() { return SimulationFunction(std::coroutine_handle<promise_type>::from_promise(*this)); }
			std::suspend_always initial_suspend() noexcept { return {}; }
			void unhandled_exception() { throw; }

			/**
			 * @brief Special awaiter for the final suspend that transfers control back to the calling simulation function, if any.
			 */
			struct FinalSuspendAwaiter {
				bool await_ready() noexcept { return false; }
				std::coroutine_handle<> await_suspend(std::coroutine_handle<promise_type> handle) noexcept {
					if (handle.promise().continuation)
						return handle.promise().continuation;
					return std::noop_coroutine();
				}
				void await_resume() noexcept {}
			};
			FinalSuspendAwaiter final_suspend() noexcept { return {}; }

			std::coroutine_handle<> continuation;

			/// Keeps the functor (and thus the lambda captures) of a top level process alive as long as the coroutine exists.
			std::unique_ptr<std::function<SimulationFunction<ReturnValue>()>> functorInstance;
		};
		using Handle = std::coroutine_handle<promise_type>;

		SimulationFunction() = default;
		explicit SimulationFunction(Handle handle) : m_handle(handle) { }
		SimulationFunction(SimulationFunction &&other) noexcept : m_handle(std::exchange(other.m_handle, {})) { }
		SimulationFunction &operator=(SimulationFunction &&other) noexcept {
			if (this != &other) {
				reset();
				m_handle = std::exchange(other.m_handle, {});
			}
			return *this;
		}
		SimulationFunction(const SimulationFunction &) = delete;
		SimulationFunction &operator=(const SimulationFunction &) = delete;

		~SimulationFunction() { reset(); }

		void reset() {
			if (m_handle)
				m_handle.destroy();
			m_handle = {};
		}

		inline Handle getHandle() const { return m_handle; }
		inline bool done() const { return !m_handle || m_handle.done(); }

		/**
		 * @brief Awaiter for running a sub function to completion from within another simulation function.
		 */
		struct Call : public BaseCall<ReturnValue, promise_type> {
			bool await_ready() noexcept { return this->calledSimulationCoroutine.done(); }
			std::coroutine_handle<> await_suspend(std::coroutine_handle<> callingSimulationCoroutine) noexcept {
				this->calledSimulationCoroutine.promise().continuation = callingSimulationCoroutine;
				return this->calledSimulationCoroutine;
			}

			explicit Call(Handle handle) noexcept : BaseCall<ReturnValue, promise_type>{handle} { }
		};

		Call operator co_await() {
			SSIM_ASSERT_HINT(m_handle, "co_await on an empty simulation function");
			return Call(m_handle);
		}
	protected:
		Handle m_handle;
};

using SimProcess = SimulationFunction<void>;


/**
 * @brief Runs top level simulation processes and resumes those waiting for clock edges.
 */
class SimulationCoroutineHandler {
	public:
		static thread_local SimulationCoroutineHandler *activeHandler;

		SimulationCoroutineHandler() = default;
		SimulationCoroutineHandler(const SimulationCoroutineHandler &) = delete;
		~SimulationCoroutineHandler();

		/// Instantiates the process and queues it to run on the next call to run().
		void start(std::function<SimulationFunction<void>()> functor);
		/// Destroys all processes, including those that are still waiting.
		void stopAll();

		void readyToResume(std::coroutine_handle<> handle) { m_coroutinesReadyToResume.push(handle); }
		void waitForClock(std::coroutine_handle<> handle, const hlim::Clock *clock);
		/// Moves all processes waiting for the given clock into the ready queue.
		void clockTriggered(const hlim::Clock *clock);
		/// Resumes ready processes until none are left.
		void run();

		size_t numRunningProcesses() const;
	protected:
		std::vector<SimulationFunction<void>> m_simulationCoroutines;
		std::queue<std::coroutine_handle<>> m_coroutinesReadyToResume;
		std::map<const hlim::Clock*, std::vector<std::coroutine_handle<>>> m_waitingForClock;
};

}
