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

#include "SimulatorCallbacks.h"
#include "simProc/SimulationProcess.h"

#include <memory>
#include <functional>
#include <vector>

namespace ssim::hlim {
	class Circuit;
}

namespace ssim::sim {

	class Simulator;

/**
 * @brief Runs a circuit in the reference simulator and routes protocol violations into Boost.Test.
 * @details Protocol violations fail the test, unless the test declared them
 * expected through allowProtocolViolations() and then inspects them through getProtocolViolations().
 */
	class UnitTestSimulationFixture : public SimulatorCallbacks
	{
	public:
		UnitTestSimulationFixture();
		~UnitTestSimulationFixture();

		void addSimulationProcess(std::function<SimulationFunction<>()> simProc);

		void runTicks(const hlim::Circuit& circuit, const hlim::Clock* clock, unsigned numTicks);

		virtual void onProtocolViolation(const ProtocolViolation &violation) override;

		void allowProtocolViolations() { m_protocolViolationsAllowed = true; }
		const std::vector<ProtocolViolation> &getProtocolViolations() const { return m_protocolViolations; }

		Simulator& getSimulator() { return *m_simulator; }
	protected:
		std::unique_ptr<Simulator> m_simulator;

		std::vector<ProtocolViolation> m_protocolViolations;
		bool m_protocolViolationsAllowed = false;

		void reportIssues();
};


}
