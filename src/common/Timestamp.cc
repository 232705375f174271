/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/3/20.
//

#include "Timestamp.hh"

#include <charconv>
#include <ostream>

namespace tkr {

using namespace std::chrono;

Timestamp Timestamp::now()
{
	return time_point_cast<milliseconds>(system_clock::now());
}

std::optional<Timestamp> Timestamp::from_string(std::string_view s)
{
	long long ms{};
	auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), ms);
	if (ec != std::errc{} || end != s.data() + s.size() || s.empty())
		return std::nullopt;

	return Timestamp{milliseconds{ms}};
}

std::string Timestamp::to_string() const
{
	return std::to_string(time_since_epoch().count());
}

void to_json(nlohmann::json& json, const Timestamp& input)
{
	json = input.time_since_epoch().count();
}

void from_json(const nlohmann::json& json, Timestamp& output)
{
	output = Timestamp{milliseconds{json.get<long long>()}};
}

std::ostream& operator<<(std::ostream& os, Timestamp tp)
{
	return os << tp.time_since_epoch().count();
}

} // end of namespace tkr
