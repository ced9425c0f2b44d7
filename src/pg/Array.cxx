// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Array.hxx"

#include <boost/json/value.hpp>

#include <fmt/format.h>

#include <cmath>
#include <stdexcept>
#include <vector>

namespace Pg {

std::forward_list<std::string>
DecodeArray(const char *p)
{
	std::forward_list<std::string> dest;

	if (p == nullptr || *p == 0)
		return dest;

	std::vector<std::string> v;
	DecodeArray(std::string_view{p}, v);

	auto i = dest.before_begin();
	for (auto &value : v)
		i = dest.emplace_after(i, std::move(value));

	return dest;
}

static void
AppendQuoted(std::string &dest, std::string_view src)
{
	dest.push_back('"');

	for (const char ch : src) {
		if (ch == '\\' || ch == '"') {
			dest.push_back('\\');
			dest.push_back(ch);
		} else if (static_cast<unsigned char>(ch) < 0x20) {
			fmt::format_to(std::back_inserter(dest), "\\u{:04x}",
				       static_cast<unsigned>(ch));
		} else
			dest.push_back(ch);
	}

	dest.push_back('"');
}

static void
AppendDouble(std::string &dest, double value)
{
	if (!std::isfinite(value))
		throw std::invalid_argument("cannot encode non-finite number");

	const std::size_t start = dest.size();
	fmt::format_to(std::back_inserter(dest), "{}", value);

	/* make sure this is not decoded as an integer */
	if (dest.find_first_of(".e", start) == dest.npos)
		dest.append(".0");
}

static void
AppendValue(std::string &dest, const boost::json::value &src)
{
	switch (src.kind()) {
	case boost::json::kind::null:
		dest.append("NULL");
		break;

	case boost::json::kind::bool_:
		dest.push_back(src.get_bool() ? 't' : 'f');
		break;

	case boost::json::kind::int64:
		fmt::format_to(std::back_inserter(dest), "{}", src.get_int64());
		break;

	case boost::json::kind::uint64:
		fmt::format_to(std::back_inserter(dest), "{}", src.get_uint64());
		break;

	case boost::json::kind::double_:
		AppendDouble(dest, src.get_double());
		break;

	case boost::json::kind::string:
		{
			const auto &s = src.get_string();
			AppendQuoted(dest, {s.data(), s.size()});
		}
		break;

	case boost::json::kind::array:
		{
			dest.push_back('{');

			bool first = true;
			for (const auto &i : src.get_array()) {
				if (first)
					first = false;
				else
					dest.push_back(',');

				AppendValue(dest, i);
			}

			dest.push_back('}');
		}
		break;

	case boost::json::kind::object:
		throw std::invalid_argument("cannot encode object in array");
	}
}

std::string
EncodeArray(const boost::json::value &src)
{
	std::string dest;
	AppendValue(dest, src);
	return dest;
}

} /* namespace Pg */
