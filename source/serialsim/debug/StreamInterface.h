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

#include "DebugInterface.h"

#include <fstream>
#include <ostream>

namespace ssim::dbg {

	/**
	 * @brief Logging backend that writes one line per message to a stream.
	 * @details Lines have the form "[warning/simulation] message", node references are rendered by their name.
	 */
	class StreamInterface : public DebugInterface
	{
		public:
			static void create(std::ostream &stream, LogMessage::Severity minSeverity);
			static void create(const std::filesystem::path &filename, LogMessage::Severity minSeverity);

			StreamInterface(std::ostream &stream, LogMessage::Severity minSeverity);
			StreamInterface(const std::filesystem::path &filename, LogMessage::Severity minSeverity);

			virtual void log(LogMessage msg) override;
			virtual void changeState(State state) override;
			virtual std::string howToReachLog() override;

			static std::string format(const LogMessage &msg);
		protected:
			std::ofstream m_file;
			std::ostream *m_stream;
			std::string m_description;
			LogMessage::Severity m_minSeverity;
	};
}
