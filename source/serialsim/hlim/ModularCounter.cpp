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
#include "ModularCounter.h"

#include <algorithm>

namespace ssim::hlim {

ModularCounter::ModularCounter(std::string name, std::uint64_t bottom, std::uint64_t top, WrapPolicy policy) :
		BaseNode(std::move(name), BitWidth::last(std::max<std::uint64_t>(top, 1))),
		m_bottom(bottom), m_top(top), m_policy(policy), m_value(bottom), m_next(bottom)
{
	SSIM_CONFIGCHECK_HINT(top >= bottom, "Counter " + m_name + " has a top value below its bottom value.");
}

sim::DefaultBitVectorState ModularCounter::getState() const
{
	return sim::createDefaultBitVectorState(m_width.bits(), m_value);
}

void ModularCounter::simulatePowerOn()
{
	m_value = m_bottom;
	m_staged = false;
}

void ModularCounter::simulateAdvance()
{
	if (m_staged)
		m_value = m_next;
	m_staged = false;
}

std::uint64_t ModularCounter::tick(bool reset, bool enable)
{
	SSIM_ASSERT_HINT(!m_staged, "Counter " + m_name + " was ticked twice in the same clock cycle");
	m_staged = true;

	if (reset)
		m_next = m_bottom;
	else if (!enable)
		m_next = m_value;
	else if (m_value < m_top)
		m_next = m_value + 1;
	else switch (m_policy) {
		case WrapPolicy::HOLD_AT_TOP: m_next = m_top; break;
		case WrapPolicy::WRAP_TO_BOTTOM: m_next = m_bottom; break;
		default:
			SSIM_ASSERT_HINT(false, "Unhandled wrap policy");
	}

	return m_next;
}

}
