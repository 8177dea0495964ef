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
#include "VCDWriter.h"

#include "../../utils/Exceptions.h"

namespace ssim::sim {

VCDWriter::VCDWriter(const std::filesystem::path &filename)
{
	if (filename.has_parent_path())
		std::filesystem::create_directories(filename.parent_path());

	m_file.open(filename, std::ofstream::binary);
	SSIM_CONFIGCHECK_HINT(m_file.is_open(), "Could not open waveform file " + filename.string());

	m_file
		<< "$version\nSerialsim simulation output\n$end\n"
		<< "$timescale\n1ps\n$end\n";
}

VCDWriter::Section VCDWriter::beginModule(std::string_view name)
{
	SSIM_ASSERT(!name.empty());
	SSIM_ASSERT(!m_declarationsDone);
	m_file << "$scope module " << name << " $end\n";
	return Section(m_file, "$upscope $end\n");
}

void VCDWriter::declareWire(size_t width, std::string_view code, std::string_view label)
{
	SSIM_ASSERT(!m_declarationsDone);
	m_file << "$var wire " << width << ' ' << code << ' ' << label << " $end\n";
}

void VCDWriter::declareString(std::string_view code, std::string_view label)
{
	SSIM_ASSERT(!m_declarationsDone);
	m_file << "$var string 0 " << code << ' ' << label << " $end\n";
}

VCDWriter::Section VCDWriter::beginDumpVars()
{
	SSIM_ASSERT(!m_declarationsDone);
	m_declarationsDone = true;
	m_file << "$enddefinitions $end\n$dumpvars\n";
	return Section(m_file, "$end\n");
}

void VCDWriter::writeState(std::string_view code, const DefaultBitVectorState &state, size_t offset, size_t size)
{
	SSIM_ASSERT(m_declarationsDone);

	m_file << 'b';
	// MSB first
	for (size_t bit = offset + size; bit > offset; bit--)
		m_file << stateChar(state.get(DefaultConfig::DEFINED, bit - 1), state.get(DefaultConfig::VALUE, bit - 1));
	m_file << ' ' << code << '\n';
}

void VCDWriter::writeString(std::string_view code, std::string_view text)
{
	SSIM_ASSERT(m_declarationsDone);

	// Strings end at the first blank, so blanks are escaped and an empty string becomes a single escaped blank.
	m_file << 's';
	if (text.empty())
		m_file << "\\x20";
	for (auto c : text) {
		if (c == ' ')
			m_file << "\\x20";
		else if (c == '\n')
			m_file << "\\x0a";
		else
			m_file << c;
	}
	m_file << ' ' << code << '\n';
}

void VCDWriter::writeBitState(std::string_view code, bool defined, bool value)
{
	SSIM_ASSERT(m_declarationsDone);
	m_file << stateChar(defined, value) << code << '\n';
}

void VCDWriter::writeTime(size_t picoseconds)
{
	SSIM_ASSERT(m_declarationsDone);
	m_file << '#' << picoseconds << '\n';
}

}
