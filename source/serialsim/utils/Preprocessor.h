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

#include <iostream>

#if defined(_MSC_VER)

#define GET_FUNCTION_NAME __FUNCSIG__

#elif defined(__GNUC__)

#define GET_FUNCTION_NAME __PRETTY_FUNCTION__

#else
#error "Unsupported platform!"
#endif


#define SSIM_ASSERT(x) { if (!(x)) { throw ssim::utils::InternalError(__FILE__, __LINE__, std::string("Assertion failed: ") + #x); }}
#define SSIM_ASSERT_HINT(x, message) { if (!(x)) { throw ssim::utils::InternalError(__FILE__, __LINE__, std::string("Assertion failed: ") + #x + " Hint: " + message); }}


#define SSIM_DESIGNCHECK(x) { if (!(x)) { throw ssim::utils::DesignError(__FILE__, __LINE__, std::string("Design failed: ") + #x); }}
#define SSIM_DESIGNCHECK_HINT(x, message) { if (!(x)) { throw ssim::utils::DesignError(__FILE__, __LINE__, std::string("Design failed: ") + #x + " Hint: " + message); }}

#define SSIM_CONFIGCHECK(x) { if (!(x)) { throw ssim::utils::ConfigurationError(__FILE__, __LINE__, std::string("Invalid configuration: ") + #x); }}
#define SSIM_CONFIGCHECK_HINT(x, message) { if (!(x)) { throw ssim::utils::ConfigurationError(__FILE__, __LINE__, std::string("Invalid configuration: ") + #x + " Hint: " + message); }}
