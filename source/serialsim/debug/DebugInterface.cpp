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
#include "DebugInterface.h"
#include "StreamInterface.h"

namespace ssim::dbg {

LogMessage::LogMessage()
{
}

LogMessage::LogMessage(const char *c)
{
	(*this) << c;
}

std::string_view severityName(LogMessage::Severity severity)
{
	switch (severity) {
		case LogMessage::LOG_INFO: return "info";
		case LogMessage::LOG_WARNING: return "warning";
		case LogMessage::LOG_ERROR: return "error";
	}
	return "unknown";
}

std::string_view sourceName(LogMessage::Source source)
{
	switch (source) {
		case LogMessage::LOG_DESIGN: return "design";
		case LogMessage::LOG_SIMULATION: return "simulation";
		case LogMessage::LOG_CONFIGURATION: return "configuration";
	}
	return "unknown";
}


thread_local std::unique_ptr<DebugInterface> DebugInterface::instance = std::make_unique<DebugInterface>();

void changeState(State state)
{
	DebugInterface::instance->changeState(state);
}

void log(const LogMessage &msg)
{
	DebugInterface::instance->log(msg);
}

void logToStream(std::ostream &stream, LogMessage::Severity minSeverity)
{
	StreamInterface::create(stream, minSeverity);
}

void logToFile(const std::filesystem::path &filename, LogMessage::Severity minSeverity)
{
	StreamInterface::create(filename, minSeverity);
}

void logDisable()
{
	DebugInterface::instance.reset(nullptr);
	DebugInterface::instance = std::make_unique<DebugInterface>();
}

std::string howToReachLog()
{
	return DebugInterface::instance->howToReachLog();
}

}
