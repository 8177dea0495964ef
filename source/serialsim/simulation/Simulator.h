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

#include "BitVectorState.h"
#include "SimulatorCallbacks.h"

#include "simProc/SimulationProcess.h"
#include "simProc/WaitClock.h"

#include "../hlim/ClockRational.h"

#include <functional>
#include <vector>

namespace ssim::hlim {
	class Circuit;
	class Clock;
}

namespace ssim::sim {

/**
 * @brief Interface for all cycle based simulators
 */
class Simulator
{
	public:
		Simulator() = default;
		virtual ~Simulator() = default;

		/// Adds a simulator callback hook to inform waveform recorders and test fixtures about simulation events.
		void addCallbacks(SimulatorCallbacks *simCallbacks) { m_callbackDispatcher.m_callbacks.push_back(simCallbacks); }
		void removeCallbacks(SimulatorCallbacks *simCallbacks);

		/**
		 * @brief Prepares the simulator for the simulation of the given circuit.
		 * @details The circuit must outlive the simulator or the next call to compileProgram.
		 */
		virtual void compileProgram(const hlim::Circuit &circuit) = 0;

		/**
			@name Simulator control
			@{
		*/

		/// Reset circuit and simulation processes into the power-on state
		virtual void powerOn() = 0;

		/// Declare current state the final state for this time step.
		/// @details Triggers waveform recorders etc.
		virtual void commitState() = 0;

		/**
		 * @brief Advance simulation to the next clock edge
		 * @details First moves the simulation time to the next edge and announces it through SimulatorCallbacks::onNewTick.
		 * All modules of the triggering clock(s) are then evaluated from the current state, after which all of them advance at once.
		 * SimulatorCallbacks::onClock is announced, simulation processes waiting on the clock are resumed and finally the state is committed.
		 */
		virtual void advanceEvent() = 0;

		/**
		 * @brief Advance simulation by given amount of time or until aborted.
		 * @param seconds Amount of time (in seconds) by which the simulation gets advanced.
		 */
		virtual void advance(hlim::ClockRational seconds) = 0;

		/**
		 * @brief Aborts a running simulation
		 * @details Calls to advance() return after the current clock edge has been completed.
		 */
		virtual void abort() = 0;

		/**
		 * @return returns whether abort() has been called
		*/
		virtual bool abortCalled() const = 0;

		/// @}

		/// Returns the elapsed simulation time (in seconds) since @ref powerOn.
		inline const hlim::ClockRational &getCurrentSimulationTime() const { return m_simulationTime; }

		/// Number of rising edges of the clock since @ref powerOn.
		virtual std::uint64_t getTickCount(const hlim::Clock &clock) const = 0;

		/// Adds a simulation process to this simulator that gets started on power on.
		virtual void addSimulationProcess(std::function<SimulationFunction<void>()> simProc) = 0;

	protected:
		/// Forwards every event to a list of callbacks.
		class CallbackDispatcher : public SimulatorCallbacks
		{
			public:
				std::vector<SimulatorCallbacks*> m_callbacks;

				virtual void onPowerOn() override;
				virtual void onAfterPowerOn() override;
				virtual void onCommitState() override;
				virtual void onNewTick(const hlim::ClockRational &simulationTime) override;
				virtual void onClock(const hlim::Clock *clock) override;
				virtual void onProtocolViolation(const ProtocolViolation &violation) override;
		};

		CallbackDispatcher m_callbackDispatcher;
		hlim::ClockRational m_simulationTime;
};

}
