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

#include <coroutine>

namespace ssim::hlim {
	class Clock;
}

namespace ssim::sim {

/**
 * @brief co_awaiting on a WaitClock continues the simulation until the next rising edge of the clock.
 * @details The process resumes after all modules on that clock have advanced, so it sees the new register values
 * and any inputs it sets are sampled at the following edge. Repeatedly co_awaiting a clock advances in clock ticks.
 */
class WaitClock {
	public:
		WaitClock(const hlim::Clock *clock);

		bool await_ready() noexcept { return false; }
		void await_suspend(std::coroutine_handle<> handle);
		void await_resume() noexcept { }

		const hlim::Clock *getClock() const { return m_clock; }
	protected:
		const hlim::Clock *m_clock;
};

inline WaitClock OnClk(const hlim::Clock &clock) { return WaitClock(&clock); }

}
