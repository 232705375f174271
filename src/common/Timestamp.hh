/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/3/20.
//

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace tkr {

using TimePointBase = std::chrono::time_point<
	std::chrono::system_clock,
	std::chrono::milliseconds
>;

/// \brief  The unit of timestamp stored in database.
/// It is currently the number of milliseconds since the unix epoch. It is
/// also used as the score in the sorted sets.
struct Timestamp : TimePointBase
{
	using time_point::time_point;
	Timestamp() = default;
	Timestamp(TimePointBase tp) : Timestamp{tp.time_since_epoch()} {}

	static Timestamp now();

	/// Parse the decimal string representation used in the redis hashes.
	static std::optional<Timestamp> from_string(std::string_view s);
	[[nodiscard]] std::string to_string() const;
};

void to_json(nlohmann::json& json, const Timestamp& input);
void from_json(const nlohmann::json& json, Timestamp& output);

std::ostream& operator<<(std::ostream& os, Timestamp tp);

} // end of namespace tkr
