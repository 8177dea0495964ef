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
#include "serialsim/pch.h"
#include "WaitClock.h"
#include "SimulationProcess.h"

namespace ssim::sim {

WaitClock::WaitClock(const hlim::Clock *clock) : m_clock(clock)
{
}

void WaitClock::await_suspend(std::coroutine_handle<> handle)
{
	auto *handler = SimulationCoroutineHandler::activeHandler;
	SSIM_DESIGNCHECK_HINT(handler != nullptr, "Waiting for a clock is only possible from within a running simulation process");
	handler->waitForClock(handle, m_clock);
}

}
