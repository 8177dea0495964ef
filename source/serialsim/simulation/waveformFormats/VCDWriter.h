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

#include "../BitVectorState.h"

#include <filesystem>
#include <fstream>
#include <string_view>

namespace ssim::sim
{
	/**
	 * @brief Writes the value change dump text that VCDSink produces.
	 * @details All declarations are written before beginDumpVars(), all value changes after it.
	 * Times are given in picoseconds.
	 */
	class VCDWriter
	{
	public:
		/// Writes the closing keyword of a $scope or $dumpvars block on destruction.
		class Section
		{
		public:
			Section(std::ostream &file, const char *closing) : m_file(file), m_closing(closing) { }
			Section(const Section &) = delete;
			~Section() { m_file << m_closing; }
		private:
			std::ostream &m_file;
			const char *m_closing;
		};

		VCDWriter(const std::filesystem::path &filename);

		Section beginModule(std::string_view name);
		void declareWire(size_t width, std::string_view code, std::string_view label);
		void declareString(std::string_view code, std::string_view label);

		Section beginDumpVars();
		void writeState(std::string_view code, const DefaultBitVectorState &state, size_t offset, size_t size);
		void writeString(std::string_view code, std::string_view text);
		void writeBitState(std::string_view code, bool defined, bool value);
		void writeTime(size_t picoseconds);

		void flush() { m_file.flush(); }
	protected:
		std::ofstream m_file;
		bool m_declarationsDone = false;

		static char stateChar(bool defined, bool value) { return defined ? (value ? '1' : '0') : 'X'; }
	};
}
