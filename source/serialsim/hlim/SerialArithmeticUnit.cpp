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
#include "SerialArithmeticUnit.h"

namespace ssim::hlim {

SerialResult SerialArithmeticUnit::compute(sim::LogicBit minuend, sim::LogicBit subtrahend, sim::LogicBit carryIn, bool subtract)
{
	sim::LogicBit operand = subtrahend ^ sim::LogicBit::known(subtract);
	sim::LogicBit partial = minuend ^ operand;

	return {
		.result = partial ^ carryIn,
		.carryOut = (carryIn & partial) | (minuend & operand),
	};
}


CarryFlag::CarryFlag(std::string name) : BaseNode(std::move(name), BitWidth{1})
{
	m_value = sim::LogicBit::known(false);
}

sim::DefaultBitVectorState CarryFlag::getState() const
{
	sim::DefaultBitVectorState state;
	state.resize(1);
	sim::setBit(state, 0, m_value);
	return state;
}

void CarryFlag::simulatePowerOn()
{
	m_value = sim::LogicBit::known(false);
	m_staged = false;
}

void CarryFlag::simulateAdvance()
{
	if (m_staged)
		m_value = m_next;
	m_staged = false;
}

void CarryFlag::update(sim::LogicBit carryOut)
{
	SSIM_ASSERT_HINT(!m_staged, "Carry flag " + m_name + " was written twice in the same clock cycle");
	m_staged = true;
	m_next = carryOut;
}

}
