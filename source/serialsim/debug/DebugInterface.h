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

#include <concepts>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ssim {

namespace hlim {
	class BaseNode;
}

namespace dbg {

/**
 * @brief Helper class for composing logging messages.
 * @details Similarly to std::ostream, it uses the << operator to concatenate message parts.
 * Message parts can refer to circuit nodes such that the logging backend can render them by name.
 *
 * A common use case is `log(LogMessage() << LogMessage::LOG_WARNING << LogMessage::LOG_SIMULATION << "Undefined start signal at " << node);`
 */
class LogMessage
{
	public:
		enum Severity {
			LOG_INFO,
			LOG_WARNING,
			LOG_ERROR
		};

		enum Source {
			LOG_DESIGN,
			LOG_SIMULATION,
			LOG_CONFIGURATION
		};

		/// Creates an empty log message
		LogMessage();
		/// Same as `LogMessage() << c`
		LogMessage(const char *c);

		/// Sets the severity of the log message
		LogMessage &operator<<(Severity s) { m_severity = s; return *this; }
		/// Sets the origin of the log message
		LogMessage &operator<<(Source s) { m_source = s; return *this; }

		LogMessage &operator<<(const char *c) { m_messageParts.push_back(c); return *this; }
		LogMessage &operator<<(std::string s) { m_messageParts.push_back(std::move(s)); return *this; }
		LogMessage &operator<<(std::string_view s) { m_messageParts.push_back(std::string(s)); return *this; }
		/// @brief Adds a reference to a node to the message.
		/// @details The node must outlive the point at which the backend consumes the message.
		LogMessage &operator<<(const hlim::BaseNode *node) { m_messageParts.push_back(node); return *this; }

		template<std::derived_from<hlim::BaseNode> T>
		LogMessage &operator<<(const T &v) { return this->operator<<((const hlim::BaseNode *)&v); }

		LogMessage &operator<<(std::uint64_t v) { m_messageParts.push_back(std::to_string(v)); return *this; }

		Severity severity() const { return m_severity; }
		Source source() const { return m_source; }

		const auto &parts() const { return m_messageParts; }
	protected:
		Severity m_severity = LOG_INFO;
		Source m_source = LOG_DESIGN;

		std::vector<std::variant<const char*, std::string, const hlim::BaseNode*>> m_messageParts;
};

std::string_view severityName(LogMessage::Severity severity);
std::string_view sourceName(LogMessage::Source source);

enum class State {
	DESIGN,
	SIMULATION
};

/**
 * @brief Common interface that all logging backends must implement.
 * @details Also serves as the default implementation that silently ignores all log messages.
 */
class DebugInterface
{
	public:
		virtual ~DebugInterface() = default;

		inline State getState() const { return m_state; }

		thread_local static std::unique_ptr<DebugInterface> instance;

		virtual void log(LogMessage msg) { }
		virtual void changeState(State state) { m_state = state; }
		virtual std::string howToReachLog() { return "Logging disabled! Rerun with a call to e.g. ssim::dbg::logToStream or ssim::dbg::logToFile."; }

	protected:
		State m_state = State::DESIGN;
};

/// Initialize logging to write human readable lines to the given stream, which must outlive the backend.
void logToStream(std::ostream &stream, LogMessage::Severity minSeverity = LogMessage::LOG_INFO);
/// Initialize logging to write human readable lines to a file.
void logToFile(const std::filesystem::path &filename, LogMessage::Severity minSeverity = LogMessage::LOG_INFO);
/// Reverts to the silent default backend.
void logDisable();

void changeState(State state);

/// Log a message to whatever backend has been initialized.
void log(const LogMessage &msg);
/// Print a short, human readable description of how the log can be accessed.
std::string howToReachLog();

}

}
