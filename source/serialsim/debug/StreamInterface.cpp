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
#include "StreamInterface.h"

#include "../hlim/BaseNode.h"
#include "../utils/Exceptions.h"

#include <boost/format.hpp>

namespace ssim::dbg {

	void StreamInterface::create(std::ostream &stream, LogMessage::Severity minSeverity)
	{
		instance.reset(nullptr);
		instance.reset(new StreamInterface(stream, minSeverity));
	}

	void StreamInterface::create(const std::filesystem::path &filename, LogMessage::Severity minSeverity)
	{
		instance.reset(nullptr); // Close previous first
		try {
			instance.reset(new StreamInterface(filename, minSeverity));
		} catch (...) {
			instance = std::make_unique<DebugInterface>();
			throw;
		}
	}

	StreamInterface::StreamInterface(std::ostream &stream, LogMessage::Severity minSeverity) :
		m_stream(&stream), m_description("the attached output stream"), m_minSeverity(minSeverity)
	{
	}

	StreamInterface::StreamInterface(const std::filesystem::path &filename, LogMessage::Severity minSeverity) :
		m_file(filename.string().c_str(), std::fstream::out), m_stream(&m_file), m_description(filename.string()), m_minSeverity(minSeverity)
	{
		SSIM_CONFIGCHECK_HINT(m_file.is_open(), "Could not open log file " + filename.string());
	}

	std::string StreamInterface::format(const LogMessage &msg)
	{
		std::string text;
		for (const auto &part : msg.parts()) {
			if (std::holds_alternative<const char*>(part))
				text += std::get<const char*>(part);
			else if (std::holds_alternative<std::string>(part))
				text += std::get<std::string>(part);
			else {
				const hlim::BaseNode *node = std::get<const hlim::BaseNode*>(part);
				text += node != nullptr ? node->getName() : std::string("<null>");
			}
		}

		return (boost::format("[%s/%s] %s") % severityName(msg.severity()) % sourceName(msg.source()) % text).str();
	}

	void StreamInterface::log(LogMessage msg)
	{
		if (msg.severity() < m_minSeverity)
			return;

		(*m_stream) << format(msg) << '\n';
		if (msg.severity() >= LogMessage::LOG_WARNING)
			m_stream->flush();
	}

	void StreamInterface::changeState(State state)
	{
		DebugInterface::changeState(state);
		if (state == State::SIMULATION)
			m_stream->flush();
	}

	std::string StreamInterface::howToReachLog()
	{
		return "Log is written to " + m_description;
	}
}
