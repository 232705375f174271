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

#include "common/Timestamp.hh"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace tkr {
namespace redis {
class Reply;
}

/// The canonical task record. It has no knowledge about how it is stored
/// and indexed. See TaskIndex for that.
struct Task
{
	static constexpr std::size_t max_description = 10000;

	/// Soft-deleted tasks can be restored within this period. After that
	/// they are erased by ExpiryCollector.
	static constexpr std::chrono::hours recovery_window{7 * 24};

	std::string id;
	std::string owner;
	std::string description;

	// empty means uncategorized
	std::string category;

	bool        completed{false};
	Timestamp   created;
	Timestamp   updated;
	std::optional<Timestamp> deleted;

	/// Create a new active task with a random ID. Description and category are trimmed.
	static Task create(std::string_view owner, std::string_view description, std::string_view category, Timestamp now);

	/// Build a task from the reply of HGETALL. Returns std::nullopt if the
	/// hash does not exist or does not look like a task.
	static std::optional<Task> from_hash(const redis::Reply& hgetall);

	/// Random UUID (version 4) in its canonical text form.
	static std::string generate_id();

	[[nodiscard]] std::error_code validate() const;

	[[nodiscard]] bool is_deleted() const {return deleted.has_value();}
	[[nodiscard]] bool is_active() const {return !deleted.has_value();}
};

bool operator==(const Task& lhs, const Task& rhs);
bool operator!=(const Task& lhs, const Task& rhs);

void to_json(nlohmann::json& json, const Task& task);
void from_json(const nlohmann::json& json, Task& task);

std::string trim(std::string_view s);

/// Number of UTF-8 code points in s, or std::nullopt if s is not valid
/// UTF-8 (stray continuation bytes, truncated or overlong sequences,
/// surrogates and code points above U+10FFFF).
std::optional<std::size_t> utf8_length(std::string_view s);

} // end of namespace tkr
