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
#include "Node_Pin.h"

namespace ssim::hlim {

Node_Pin::Node_Pin(std::string name, BitWidth width) : BaseNode(std::move(name), width)
{
	m_powerOnValue = sim::createUndefinedBitVectorState(width.bits());
	m_value = m_powerOnValue;
}

Node_Pin::Node_Pin(std::string name, BitWidth width, std::uint64_t powerOnValue) : BaseNode(std::move(name), width)
{
	SSIM_CONFIGCHECK_HINT(width.bits() >= 64 || powerOnValue <= width.mask(), "Power on value does not fit into pin " + m_name);
	m_powerOnValue = sim::createDefaultBitVectorState(width.bits(), powerOnValue);
	m_value = m_powerOnValue;
}

void Node_Pin::simulatePowerOn()
{
	m_value = m_powerOnValue;
}

void Node_Pin::set(const sim::DefaultBitVectorState &state)
{
	SSIM_DESIGNCHECK_HINT(state.size() == m_width.bits(), "Width mismatch when driving pin " + m_name);
	m_value = state;
}

void Node_Pin::set(std::uint64_t value)
{
	SSIM_DESIGNCHECK_HINT(m_width.bits() >= 64 || value <= m_width.mask(), "Value " + std::to_string(value) + " does not fit into pin " + m_name);
	m_value = sim::createDefaultBitVectorState(m_width.bits(), value);
}

void Node_Pin::set(const sim::BigInt &value)
{
	SSIM_DESIGNCHECK_HINT(value == 0 || (value > 0 && msb(value) < m_width.bits()), "Value does not fit into pin " + m_name);
	m_value = sim::createDefaultBitVectorState(m_width.bits(), value);
}

void Node_Pin::set(sim::LogicBit bit)
{
	SSIM_DESIGNCHECK_HINT(m_width.bits() == 1, "Driving a single bit into multi bit pin " + m_name);
	sim::setBit(m_value, 0, bit);
}

void Node_Pin::setUndefined()
{
	m_value.setRange(sim::DefaultConfig::DEFINED, 0, m_value.size(), false);
}

}
