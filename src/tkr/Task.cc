/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/3/20.
//

#include "Task.hh"

#include "common/Error.hh"
#include "crypto/Random.hh"
#include "net/Redis.hh"

#include <nlohmann/json.hpp>

#include <boost/algorithm/string/trim.hpp>

#include <array>
#include <cstdint>
#include <tuple>

namespace tkr {

std::string trim(std::string_view s)
{
	return boost::algorithm::trim_copy(std::string{s});
}

std::optional<std::size_t> utf8_length(std::string_view s)
{
	std::size_t count = 0;
	for (std::size_t i = 0; i < s.size(); count++)
	{
		auto lead = static_cast<unsigned char>(s[i]);

		// number of continuation bytes, and the allowed range of the first one
		std::size_t trail = 0;
		unsigned char min = 0x80, max = 0xBF;
		if (lead < 0x80)
			trail = 0;
		else if (lead >= 0xC2 && lead <= 0xDF)
			trail = 1;
		else if (lead >= 0xE0 && lead <= 0xEF)
		{
			trail = 2;
			if (lead == 0xE0) min = 0xA0;       // overlong
			if (lead == 0xED) max = 0x9F;       // surrogates
		}
		else if (lead >= 0xF0 && lead <= 0xF4)
		{
			trail = 3;
			if (lead == 0xF0) min = 0x90;       // overlong
			if (lead == 0xF4) max = 0x8F;       // above U+10FFFF
		}
		else
			return std::nullopt;

		if (s.size() - i - 1 < trail)
			return std::nullopt;

		for (std::size_t j = 1; j <= trail; j++)
		{
			auto c = static_cast<unsigned char>(s[i+j]);
			if (j == 1 ? (c < min || c > max) : (c & 0xC0) != 0x80)
				return std::nullopt;
		}
		i += trail + 1;
	}
	return count;
}
	return count;
}

Task Task::create(std::string_view owner, std::string_view description, std::string_view category, Timestamp now)
{
	Task task;
	task.id          = generate_id();
	task.owner       = std::string{owner};
	task.description = trim(description);
	task.category    = trim(category);
	task.created     = now;
	task.updated     = now;
	return task;
}

std::string Task::generate_id()
{
	auto bytes = secure_random_array<std::uint8_t, 16>();

	// RFC 4122 version 4, variant 1
	bytes[6] = (bytes[6] & 0x0F) | 0x40;
	bytes[8] = (bytes[8] & 0x3F) | 0x80;

	static const char hex[] = "0123456789abcdef";
	std::string result;
	result.reserve(36);
	for (std::size_t i = 0; i < bytes.size(); i++)
	{
		if (i == 4 || i == 6 || i == 8 || i == 10)
			result.push_back('-');
		result.push_back(hex[bytes[i] >> 4]);
		result.push_back(hex[bytes[i] & 0x0F]);
	}
	return result;
}

std::optional<Task> Task::from_hash(const redis::Reply& hgetall)
{
	auto [id, owner, desc, cat, completed, created, updated, deleted] = hgetall.map_kv_pair(
		"id", "user_id", "description", "category", "completed", "created_at", "updated_at", "deleted_at"
	);

	if (id.as_string().empty() || owner.as_string().empty())
		return std::nullopt;

	Task task;
	task.id          = std::string{id.as_string()};
	task.owner       = std::string{owner.as_string()};
	task.description = std::string{desc.as_string()};
	task.category    = std::string{cat.as_string()};
	task.completed   = completed.as_string() == "1" || completed.as_string() == "true";

	// Unparsable timestamps are treated as the epoch, except deleted_at:
	// an unparsable deleted_at means the task is active.
	task.created = Timestamp::from_string(created.as_string()).value_or(Timestamp{});
	task.updated = Timestamp::from_string(updated.as_string()).value_or(Timestamp{});
	task.deleted = Timestamp::from_string(deleted.as_string());

	return task;
}

std::error_code Task::validate() const
{
	if (trim(id).empty())
		return Error::invalid_task_id;
	if (trim(owner).empty())
		return Error::invalid_owner;

	auto desc = trim(description);
	if (desc.empty())
		return Error::empty_description;
	auto length = utf8_length(desc);
	if (!length)
		return Error::invalid_description_encoding;
	if (*length > max_description)
		return Error::description_too_long;

	return {};
}

bool operator==(const Task& lhs, const Task& rhs)
{
	return
		std::tie(lhs.id, lhs.owner, lhs.description, lhs.category, lhs.completed, lhs.created, lhs.updated, lhs.deleted) ==
		std::tie(rhs.id, rhs.owner, rhs.description, rhs.category, rhs.completed, rhs.created, rhs.updated, rhs.deleted);
}

bool operator!=(const Task& lhs, const Task& rhs)
{
	return !(lhs == rhs);
}

void to_json(nlohmann::json& json, const Task& task)
{
	json = nlohmann::json{
		{"id",          task.id},
		{"user_id",     task.owner},
		{"description", task.description},
		{"completed",   task.completed},
		{"created_at",  task.created},
		{"updated_at",  task.updated}
	};
	if (!task.category.empty())
		json["category"] = task.category;
	if (task.deleted)
		json["deleted_at"] = *task.deleted;
}

void from_json(const nlohmann::json& json, Task& task)
{
	task.id          = json.at("id").get<std::string>();
	task.owner       = json.at("user_id").get<std::string>();
	task.description = json.at("description").get<std::string>();
	task.category    = json.value("category", std::string{});
	task.completed   = json.value("completed", false);
	task.created     = json.at("created_at").get<Timestamp>();
	task.updated     = json.at("updated_at").get<Timestamp>();

	if (auto it = json.find("deleted_at"); it != json.end() && !it->is_null())
		task.deleted = it->get<Timestamp>();
	else
		task.deleted = std::nullopt;
}

} // end of namespace tkr
