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
#include "ClockedRegister.h"

namespace ssim::hlim {

ClockedRegister::ClockedRegister(std::string name, BitWidth width, ShiftMode mode) : BaseNode(std::move(name), width), m_mode(mode)
{
	m_value = sim::createUndefinedBitVectorState(width.bits());
}

void ClockedRegister::simulatePowerOn()
{
	m_value = sim::createUndefinedBitVectorState(m_width.bits());
	m_staged = false;
}

void ClockedRegister::simulateAdvance()
{
	if (m_staged)
		m_value = m_next;
	m_staged = false;
}

void ClockedRegister::stage(const RegisterDrive &drive)
{
	SSIM_ASSERT_HINT(!m_staged, "Register " + m_name + " was driven twice in the same clock cycle");
	m_staged = true;

	if (drive.clear) {
		m_next = sim::createDefaultBitVectorState(m_width.bits(), 0ull);
	} else if (drive.load) {
		SSIM_DESIGNCHECK_HINT(drive.loadValue.size() == m_width.bits(), "Width mismatch when loading register " + m_name);
		m_next = drive.loadValue;
	} else if (drive.shift) {
		computeShift(drive.serialIn);
	} else
		m_next = m_value;
}

void ClockedRegister::stageClear()
{
	stage({ .clear = true });
}

void ClockedRegister::stageLoad(const sim::DefaultBitVectorState &value)
{
	stage({ .load = true, .loadValue = value });
}

void ClockedRegister::stageShift(std::optional<sim::LogicBit> serialIn)
{
	stage({ .shift = true, .serialIn = serialIn });
}

void ClockedRegister::computeShift(std::optional<sim::LogicBit> serialIn)
{
	const size_t width = m_value.size();
	m_next.resize(width);
	m_next.copyRange(0, m_value, 1, width-1);

	switch (m_mode) {
		case ShiftMode::ROTATE:
			SSIM_DESIGNCHECK_HINT(!serialIn, "Rotating register " + m_name + " does not take a serial input");
			sim::setBit(m_next, width-1, lsb());
		break;
		case ShiftMode::SHIFT_DISCARD:
			SSIM_DESIGNCHECK_HINT(serialIn, "Shifting register " + m_name + " requires a serial input");
			sim::setBit(m_next, width-1, *serialIn);
		break;
		default:
			SSIM_ASSERT_HINT(false, "Unhandled shift mode");
	}
}

sim::LogicBit ClockedRegister::isZero() const
{
	bool allDefined = true;
	for (auto i : utils::Range(m_value.size())) {
		auto b = bit(i);
		if (b.isHigh())
			return sim::LogicBit::known(false);
		allDefined &= b.defined;
	}
	if (allDefined)
		return sim::LogicBit::known(true);
	return sim::LogicBit::undefined();
}

}
