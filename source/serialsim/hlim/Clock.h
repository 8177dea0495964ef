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

#include "ClockRational.h"

#include <string>

namespace ssim::hlim {

struct ClockConfig
{
	std::string name = "clk";
	ClockRational absoluteFrequency = { 100'000'000, 1 };
};

/**
 * @brief A free running clock whose rising edges advance all modules attached to it.
 * @details Edges occur at multiples of the clock period, the first one a full period after power on.
 */
class Clock
{
	public:
		Clock(const ClockConfig &config);
		Clock(const Clock &) = delete;
		Clock &operator=(const Clock &) = delete;

		inline const std::string &getName() const { return m_name; }
		inline ClockRational absoluteFrequency() const { return m_frequency; }
		inline ClockRational period() const { return ClockRational(1) / m_frequency; }

		/// Time of the n-th rising edge, counted from one.
		ClockRational edgeTime(std::uint64_t edge) const;
	protected:
		std::string m_name;
		ClockRational m_frequency;
};

}
