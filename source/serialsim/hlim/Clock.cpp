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
#include "Clock.h"

#include "../utils/Exceptions.h"

namespace ssim::hlim {

Clock::Clock(const ClockConfig &config) : m_name(config.name), m_frequency(config.absoluteFrequency)
{
	SSIM_CONFIGCHECK_HINT(m_frequency.numerator() != 0, "Clock " + m_name + " must have a non zero frequency.");
}

ClockRational Clock::edgeTime(std::uint64_t edge) const
{
	return period() * ClockRational(edge, 1);
}

}
