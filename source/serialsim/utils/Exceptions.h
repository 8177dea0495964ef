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

#include "StackTrace.h"
#include "Preprocessor.h"

#include <boost/lexical_cast.hpp>

#include <stdexcept>
#include <iostream>


namespace ssim::utils {

std::string composeErrorString(const char *file, size_t line, const std::string &what);


/**
 * @brief Base for all errors thrown by serialsim.
 * @details Carries the source location in the message and records the call stack at the point of construction.
 */
template<class BaseError>
class SimError : public BaseError
{
	public:
		SimError(const char *file, size_t line, const std::string &what) :
				BaseError(composeErrorString(file, line, what)), m_trace(1, 20) { }
		inline const StackTrace &getStackTrace() const { return m_trace; }
	protected:
		StackTrace m_trace;
};

extern template class SimError<std::logic_error>;
extern template class SimError<std::runtime_error>;
extern template class SimError<std::invalid_argument>;


/// Broken internal invariant of the simulator itself.
class InternalError : public SimError<std::logic_error>
{
	public:
		InternalError(const char *file, size_t line, const std::string &what);
		~InternalError();
};


/// The circuit or the simulation API was used in a way that is not supported.
class DesignError : public SimError<std::runtime_error>
{
	public:
		DesignError(const char *file, size_t line, const std::string &what);
		~DesignError();
};


/// Invalid generics or configuration values, raised before any tick is simulated.
class ConfigurationError : public SimError<std::invalid_argument>
{
	public:
		ConfigurationError(const char *file, size_t line, const std::string &what);
		~ConfigurationError();
};


template<class BaseError>
std::ostream &operator<<(std::ostream &stream, const SimError<BaseError> &exception) {
	stream
		<< exception.what() << std::endl
		<< "Stack trace: " << std::endl
		<< exception.getStackTrace();

	return stream;
}

}
