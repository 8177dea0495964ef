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
#include "Node_SignalTap.h"

namespace ssim::hlim {

Node_SignalTap::Node_SignalTap(std::string name, BitWidth width, Probe probe) : BaseNode(std::move(name), width), m_probe(std::move(probe))
{
}

sim::DefaultBitVectorState Node_SignalTap::getState() const
{
	auto state = m_probe();
	SSIM_ASSERT_HINT(state.size() == m_width.bits(), "Signal tap " + m_name + " produced a value of the wrong width");
	return state;
}

}
