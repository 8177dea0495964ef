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

#include "utils/Exceptions.h"
#include "utils/ConfigTree.h"
#include "utils/Range.h"

#include "debug/DebugInterface.h"
#include "debug/StreamInterface.h"

#include "frontend/BitWidth.h"

#include "hlim/Circuit.h"
#include "hlim/Clock.h"
#include "hlim/Module.h"
#include "hlim/Node_Pin.h"
#include "hlim/Node_SignalTap.h"
#include "hlim/ClockedRegister.h"
#include "hlim/ModularCounter.h"
#include "hlim/SerialArithmeticUnit.h"
#include "hlim/Synchronizer.h"
#include "hlim/ControlFsm.h"

#include "simulation/BitVectorState.h"
#include "simulation/ReferenceSimulator.h"
#include "simulation/simProc/SimulationProcess.h"
#include "simulation/simProc/WaitClock.h"
#include "simulation/waveformFormats/VCDSink.h"

#include "scl/arith/BitSerialMultiplier.h"
#include "scl/arith/Gcd.h"
