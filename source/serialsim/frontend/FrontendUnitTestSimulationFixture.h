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

#include <serialsim/simulation/UnitTestSimulationFixture.h>
#include <serialsim/simulation/Simulator.h>
#include <serialsim/simulation/waveformFormats/VCDSink.h>
#include <serialsim/hlim/Circuit.h>

#include <memory>
#include <functional>
#include <optional>


namespace ssim {

	/**
	 * @brief Helper class to facilitate writing unit tests
	 * @details Owns the circuit under test, which is built in the test body before running.
	 */
	class UnitTestSimulationFixture : protected sim::UnitTestSimulationFixture
	{
		public:
			UnitTestSimulationFixture();
			~UnitTestSimulationFixture();

			/// Compiles and runs the simulation for a specified amount of ticks (rising edges) of the given clock.
			void runTicks(const hlim::Clock& clock, unsigned numTicks);

			/// Enables recording of a waveform for a subsequent simulation run
			void recordVCD(const std::string& filename);

			/// Stops an ongoing simulation (to be used during runHitsTimeout)
			void stopTest();

			/// Compiles and runs the simulation until the timeout (in simulation time) is reached or stopTest is called
			/// @return returns true if the timeout was reached.
			bool runHitsTimeout(const hlim::ClockRational &timeoutSeconds);

			hlim::Circuit circuit;

	protected:
			virtual void prepRun();

			bool m_stopTestCalled = false;
			std::optional<sim::VCDSink> m_vcdSink;
	};

	/**
	 * @brief Helper class to facilitate writing unit tests
	 */
	class BoostUnitTestSimulationFixture : protected UnitTestSimulationFixture {
		public:
			sim::Simulator &getSimulator() { return sim::UnitTestSimulationFixture::getSimulator(); }
			hlim::Circuit &getCircuit() { return circuit; }

			using sim::UnitTestSimulationFixture::addSimulationProcess;
			using sim::UnitTestSimulationFixture::allowProtocolViolations;
			using sim::UnitTestSimulationFixture::getProtocolViolations;

			void runTest(const hlim::ClockRational &timeoutSeconds);
		protected:
			void prepRun() override;
	};

}
