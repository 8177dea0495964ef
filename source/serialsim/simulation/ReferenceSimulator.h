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

#include "Simulator.h"

#include <vector>

namespace ssim::hlim {
	class Module;
}

namespace ssim::sim {

/**
 * @brief Straightforward simulator that steps from clock edge to clock edge.
 * @details Clocks of different frequencies are supported, edges that fall on the same point in time are simulated as one step.
 */
class ReferenceSimulator : public Simulator
{
	public:
		ReferenceSimulator();
		~ReferenceSimulator();

		virtual void compileProgram(const hlim::Circuit &circuit) override;

		virtual void powerOn() override;
		virtual void commitState() override;
		virtual void advanceEvent() override;
		virtual void advance(hlim::ClockRational seconds) override;

		virtual void abort() override;
		virtual bool abortCalled() const override { return m_abortCalled; }

		virtual std::uint64_t getTickCount(const hlim::Clock &clock) const override;

		virtual void addSimulationProcess(std::function<SimulationFunction<void>()> simProc) override;
	protected:
		struct ClockDomain {
			const hlim::Clock *clock;
			std::vector<hlim::Module*> modules;
			std::uint64_t ticks = 0;
		};

		const hlim::Circuit *m_circuit = nullptr;
		std::vector<ClockDomain> m_clockDomains;
		std::vector<std::function<SimulationFunction<void>()>> m_simProcs;
		SimulationCoroutineHandler m_simulationCoroutineHandler;
		bool m_abortCalled = false;
		bool m_poweredOn = false;

		hlim::ClockRational nextEdgeTime() const;
};

}
