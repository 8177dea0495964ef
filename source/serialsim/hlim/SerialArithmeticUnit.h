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

namespace ssim::hlim {

struct SerialResult
{
	sim::LogicBit result;
	sim::LogicBit carryOut;
};

/**
 * @brief One bit full adder/subtractor.
 * @details In subtract mode the subtrahend is inverted, so with a carry preset to one the unit computes
 * minuend - subtrahend bit serially. A final carry out of zero then signals a borrow.
 */
class SerialArithmeticUnit
{
	public:
		static SerialResult compute(sim::LogicBit minuend, sim::LogicBit subtrahend, sim::LogicBit carryIn, bool subtract);
};

/// Registered carry/borrow bit between successive serial arithmetic steps. Powers on cleared.
class CarryFlag : public BaseNode
{
	public:
		CarryFlag(std::string name = "carry");

		virtual std::string getTypeName() const override { return "CarryFlag"; }
		virtual sim::DefaultBitVectorState getState() const override;

		virtual void simulatePowerOn() override;
		virtual void simulateAdvance() override;

		inline sim::LogicBit value() const { return m_value; }

		void preset() { update(sim::LogicBit::known(true)); }
		void clear() { update(sim::LogicBit::known(false)); }
		void update(sim::LogicBit carryOut);
	protected:
		sim::LogicBit m_value;
		sim::LogicBit m_next;
		bool m_staged = false;
};

}
