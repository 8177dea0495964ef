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

#include "BaseNode.h"
#include "Clock.h"
#include "Node_Pin.h"

#include <vector>

namespace ssim::sim {
	class SimulatorCallbacks;
}

namespace ssim::hlim {

/**
 * @brief A synchronous circuit block on a single clock.
 * @details Each clock edge is simulated in two steps. simulateEvaluate() reads only the committed values of the
 * module's nodes and input pins and stages all next values. simulateAdvance() then commits every node at once,
 * so the order in which nodes or modules are evaluated never matters.
 */
class Module
{
	public:
		Module(std::string name, Clock &clock);
		virtual ~Module() = default;

		Module(const Module &) = delete;
		Module &operator=(const Module &) = delete;

		inline const std::string &getName() const { return m_name; }
		inline Clock &getClock() const { return *m_clock; }
		/// All nodes in the order they were registered, for waveforms and inspection.
		inline const std::vector<BaseNode*> &getNodes() const { return m_nodes; }
		BaseNode *findNode(std::string_view name) const;

		virtual void simulatePowerOn();
		/// @param tick Number of the clock edge being simulated, counted from one.
		virtual void simulateEvaluate(sim::SimulatorCallbacks &simCallbacks, std::uint64_t tick) = 0;
		virtual void simulateAdvance();
	protected:
		std::string m_name;
		Clock *m_clock;
		std::vector<BaseNode*> m_nodes;

		void addNode(BaseNode &node);

		void reportViolation(sim::SimulatorCallbacks &simCallbacks, std::uint64_t tick, std::string message) const;

		/// Samples a single bit control pin. An undefined value is reported and replaced by the inactive level.
		bool sampleControl(sim::SimulatorCallbacks &simCallbacks, std::uint64_t tick, const Node_Pin &pin, bool inactiveLevel) const;
		/// Copy of the pin's value with undefined bits forced to zero.
		sim::DefaultBitVectorState sampleOperand(const Node_Pin &pin) const;
		/// Reports undefined bits of an operand pin, returns true if any were found.
		bool checkOperandDefined(sim::SimulatorCallbacks &simCallbacks, std::uint64_t tick, const Node_Pin &pin) const;
};

}
