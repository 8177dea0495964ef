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

#include "ConfigTree.h"

#include <boost/spirit/home/x3.hpp>


namespace ssim::utils
{
	std::optional<std::string_view> globbingMatchPath(std::string_view pattern, std::string_view str)
	{
		size_t patternPos = 0;
		while (patternPos < pattern.size() && patternPos < str.size() && str[patternPos] == pattern[patternPos])
			patternPos++;

		if (patternPos == pattern.size())
			return str.substr(0, patternPos);

		if (pattern[patternPos] != '*')
			return std::nullopt;

		std::optional<std::string_view> bestMatch;
		for (size_t strPos = patternPos; strPos <= str.size(); ++strPos)
		{
			std::string_view subStr = str.substr(strPos);
			auto match = globbingMatchPath(pattern.substr(patternPos + 1), subStr);
			if (match)
				bestMatch = str.substr(0, strPos + match->size());

			if (subStr.starts_with('/'))
				break;
		}
		return bestMatch;
	}

	std::string replaceEnvVars(const std::string& src)
	{
		using namespace boost::spirit::x3;

		std::string ret;
		ret.reserve(src.size());

		auto appendVar = [&](auto& ctx) {
			const std::string varName = _attr(ctx);
			const char* var = getenv(varName.c_str());
			SSIM_CONFIGCHECK_HINT(var != nullptr, "environment variable '" + varName + "' not found.");
			_attr(ctx) = var;
		};

		auto parser = *((lit('$') >> '(' >> (*(char_ - ')'))[appendVar] >> ')') | char_);
		bool valid = parse(src.cbegin(), src.cend(), parser, ret);
		SSIM_ASSERT(valid);
		return ret;
	}

	struct PathMatcher
	{
		void operator () (YAML::Node node, std::string_view path)
		{
			if (!node.IsMap())
				return;

			for (auto it = node.begin(); it != node.end(); ++it)
			{
				const std::string key = it->first.as<std::string>();
				auto match = globbingMatchPath(key, path);
				if (match && match->size() == path.size())
					matches.push_back(it->second);
				else if (match && path[match->size()] == '/')
					(*this)(it->second, path.substr(match->size() + 1));
			}
		}

		std::vector<YAML::Node> matches;
	};

	ConfigTree ConfigTree::operator[](std::string_view path) const
	{
		ConfigTree ret;

		PathMatcher	m;
		for (auto it = m_nodes.rbegin(); it != m_nodes.rend(); ++it)
		{
			m(*it, path);
			if (!m.matches.empty())
				break;
		}

		ret.m_nodes = std::move(m.matches);
		return ret;
	}

	ConfigTree::ConfigTree(YAML::Node node) :
		m_nodes{node}
	{
	}

	bool ConfigTree::isDefined() const
	{
		return !m_nodes.empty() && m_nodes.front().IsDefined();
	}

	bool ConfigTree::isNull() const
	{
		return m_nodes.size() == 1 && m_nodes.front().IsNull();
	}

	bool ConfigTree::isScalar() const
	{
		return m_nodes.size() == 1 && m_nodes.front().IsScalar();
	}

	bool ConfigTree::isSequence() const
	{
		return m_nodes.size() == 1 && m_nodes.front().IsSequence();
	}

	bool ConfigTree::isMap() const
	{
		return !m_nodes.empty() && m_nodes.front().IsMap();
	}

	ConfigTree::map_iterator ConfigTree::mapBegin() const
	{
		if (isMap())
		{
			SSIM_ASSERT_HINT(m_nodes.size() == 1, "iterating a globbed map is not supported");
			return map_iterator{ m_nodes.front().begin() };
		}
		return map_iterator{};
	}

	ConfigTree::map_iterator ConfigTree::mapEnd() const
	{
		if (isMap())
		{
			SSIM_ASSERT_HINT(m_nodes.size() == 1, "iterating a globbed map is not supported");
			return map_iterator{ m_nodes.front().end() };
		}
		return map_iterator{};
	}

	ConfigTree::iterator ConfigTree::begin() const
	{
		if (isSequence())
			return iterator{ m_nodes.front().begin() };
		return iterator{};
	}

	ConfigTree::iterator ConfigTree::end() const
	{
		if (isSequence())
			return iterator{ m_nodes.front().end() };
		return iterator{};
	}

	size_t ConfigTree::size() const
	{
		if (isSequence())
			return m_nodes.front().size();
		return 0;
	}

	ConfigTree ConfigTree::operator[](size_t index) const
	{
		if (isSequence())
			return ConfigTree{ m_nodes.front()[index] };
		return ConfigTree();
	}

	void ConfigTree::loadFromFile(const std::filesystem::path &filename)
	{
		YAML::Node document;
		try {
			document = YAML::LoadFile(filename.string());
		} catch (const YAML::Exception &e) {
			throw ConfigurationError(__FILE__, __LINE__, "Could not load " + filename.string() + ": " + e.what());
		}
		appendDocument(document, filename.string());
	}

	void ConfigTree::loadFromString(const std::string &yaml)
	{
		YAML::Node document;
		try {
			document = YAML::Load(yaml);
		} catch (const YAML::Exception &e) {
			throw ConfigurationError(__FILE__, __LINE__, std::string("Could not parse configuration: ") + e.what());
		}
		appendDocument(document, "<string>");
	}

	void ConfigTree::appendDocument(YAML::Node document, const std::string &origin)
	{
		SSIM_CONFIGCHECK_HINT(document.IsMap() || document.IsNull(), origin + " is not a yaml map");
		m_nodes.push_back(document);
	}
}
