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

#include "../hlim/ClockRational.h"
#include "ProtocolViolation.h"

namespace ssim::hlim {
	class Clock;
}

namespace ssim::sim {

/**
 * @brief Interface for classes that want to be informed of simulator events.
 */
class SimulatorCallbacks
{
	public:
		virtual ~SimulatorCallbacks() = default;

		/**
		 * @brief Called immediately when the simulation is powered on before any initialization has happened.
		 */
		virtual void onPowerOn() { }

		/**
		 * @brief Called after all nodes attained their power on values but before simulation processes have started.
		 */
		virtual void onAfterPowerOn() { }

		/**
		 * @brief Called whenever all values of a time step are final.
		 * @details This is where checks can be performed or states can be written to waveform files.
		 */
		virtual void onCommitState() { }

		/**
		 * @brief Called whenever the simulation time advances, but before the new state for this time step has been evaluated.
		 * @param simulationTime The new simulator time.
		 */
		virtual void onNewTick(const hlim::ClockRational &simulationTime) { }

		/**
		 * @brief Called after all modules attached to the clock have advanced.
		 */
		virtual void onClock(const hlim::Clock *clock) { }

		/// A module sampled inputs it does not define and continued with a default.
		virtual void onProtocolViolation(const ProtocolViolation &violation) { }
};

}
