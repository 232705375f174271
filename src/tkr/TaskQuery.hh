/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/6/20.
//

#pragma once

#include "TaskFilter.hh"

#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tkr {
namespace redis {
class Connection;
class Reply;
}

struct Task;

/// \brief  Read-only queries on the tasks of an owner.
///
/// Reads are not atomic with each other. A listing may see a task that is
/// being modified concurrently, or skip one that vanishes between reading
/// the index and reading the task itself.
class TaskQuery
{
public:
	explicit TaskQuery(std::string_view owner);

	/// List the tasks selected by \a filter. The completion has the signature
	/// `void(std::vector<Task>, std::error_code)`.
	///
	/// Active tasks come first, newest first. Soft-deleted tasks follow if
	/// requested, most recently deleted first. When filtering by category,
	/// the tasks are ordered by ID instead. Offset and limit select a window
	/// of task IDs before the tasks are loaded, and the completed filter is
	/// applied afterwards, so a page may contain fewer tasks than the limit.
	template <typename Complete>
	void list(redis::Connection& db, const TaskFilter& filter, Complete&& complete) const;

	/// Load one task, active or soft-deleted. The completion has the signature
	/// `void(Task, std::error_code)`.
	template <typename Complete>
	void find(redis::Connection& db, std::string_view id, Complete&& complete) const;

	/// Names of all categories of the owner, sorted. The completion has the
	/// signature `void(std::vector<std::string>, std::error_code)`.
	template <typename Complete>
	void categories(redis::Connection& db, Complete&& complete) const;

	/// The only ownership check of all read paths. Tasks of other owners are
	/// reported as not found, never as forbidden.
	static bool visible_to(const Task& task, std::string_view owner);

	[[nodiscard]] const std::string& owner() const {return m_owner;}

private:
	template <typename Complete>
	void candidates(redis::Connection& db, const TaskFilter& filter, Complete&& complete) const;

	template <typename Complete>
	static void hydrate(redis::Connection& db, const std::string& owner, std::vector<std::string>&& ids, Complete&& complete);

	[[nodiscard]] std::error_code check_owner() const;

	// Strings in an array reply, e.g. from SMEMBERS or ZREVRANGE.
	static std::vector<std::string> string_list(const redis::Reply& reply, std::error_code& ec);

private:
	std::string m_owner;
};

} // end of namespace tkr
