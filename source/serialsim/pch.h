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

#ifndef SSIM_NO_PCH

#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/rational.hpp>
#include <boost/spirit/home/x3.hpp>
#include <boost/stacktrace.hpp>
#include <boost/multiprecision/cpp_int.hpp>

#include <magic_enum.hpp>

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <bit>
#include <concepts>
#include <coroutine>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <queue>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace boost {
	extern template class rational<std::uint64_t>;
	extern template class basic_format<char>;
}

namespace std {
	extern template class std::vector<std::uint64_t>;
}

#endif
