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

#include "BaseNode.h"

#include <magic_enum.hpp>

#include <algorithm>
#include <type_traits>

namespace ssim::hlim {

/**
 * @brief State register of a finite state machine over the enumeration State.
 * @details The next state is staged during evaluation and becomes visible with the clock edge.
 * Not staging a next state keeps the current one. The state index is exposed as the node value,
 * the enumerator name as text state for waveforms and logs.
 */
template<typename State> requires std::is_enum_v<State>
class ControlFsm : public BaseNode
{
	public:
		ControlFsm(std::string name, State initialState) :
			BaseNode(std::move(name), BitWidth::last(std::max<size_t>(magic_enum::enum_count<State>() - 1, 1))),
			m_initialState(initialState), m_state(initialState), m_next(initialState) { }

		virtual std::string getTypeName() const override { return "Fsm"; }

		virtual sim::DefaultBitVectorState getState() const override {
			auto index = magic_enum::enum_index(m_state);
			SSIM_ASSERT(index.has_value());
			return sim::createDefaultBitVectorState(m_width.bits(), (std::uint64_t) *index);
		}

		virtual bool hasTextState() const override { return true; }
		virtual std::string getTextState() const override { return std::string(magic_enum::enum_name(m_state)); }

		virtual void simulatePowerOn() override {
			m_state = m_next = m_initialState;
			m_staged = false;
		}

		virtual void simulateAdvance() override {
			if (m_staged)
				m_state = m_next;
			m_staged = false;
		}

		void stage(State next) {
			SSIM_ASSERT_HINT(!m_staged, "State machine " + m_name + " was advanced twice in the same clock cycle");
			m_staged = true;
			m_next = next;
		}

		inline State state() const { return m_state; }
		inline bool in(State state) const { return m_state == state; }
		/// True during evaluation if the staged state differs from the current one.
		inline bool transitionStaged() const { return m_staged && m_next != m_state; }
		inline State stagedState() const { return m_staged ? m_next : m_state; }
	protected:
		State m_initialState;
		State m_state;
		State m_next;
		bool m_staged = false;
};

}
