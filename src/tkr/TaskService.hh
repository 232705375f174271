/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/8/20.
//

#pragma once

#include "TaskFilter.hh"

#include "common/Timestamp.hh"

#include <functional>
#include <string_view>

namespace tkr {
namespace redis {
class Connection;
}

/// \brief  Business rules on top of TaskIndex and TaskQuery.
///
/// This is the interface used by the HTTP layer. The owner of every call is
/// the authenticated user. The service trims user input, stamps the time of
/// modification from its clock and enforces the recovery window of deleted
/// tasks. All completions receive an std::error_code which can be compared
/// with ErrorClass.
class TaskService
{
public:
	using Clock = std::function<Timestamp()>;

	explicit TaskService(redis::Connection& db, Clock clock = &Timestamp::now);

	/// `void(Task, std::error_code)`
	template <typename Complete>
	void create(std::string_view owner, std::string_view description, std::string_view category, Complete&& complete);

	/// `void(Task, std::error_code)`
	template <typename Complete>
	void get(std::string_view owner, std::string_view id, Complete&& complete);

	/// `void(std::vector<Task>, std::error_code)`
	template <typename Complete>
	void list(std::string_view owner, const TaskFilter& filter, Complete&& complete);

	/// `void(std::vector<std::string>, std::error_code)`
	template <typename Complete>
	void categories(std::string_view owner, Complete&& complete);

	/// Returns the updated task. `void(Task, std::error_code)`
	template <typename Complete>
	void set_completion(std::string_view owner, std::string_view id, bool completed, Complete&& complete);

	/// `void(std::error_code)`
	template <typename Complete>
	void soft_delete(std::string_view owner, std::string_view id, Complete&& complete);

	/// Restore a task deleted within Task::recovery_window. Returns the
	/// restored task. `void(Task, std::error_code)`
	template <typename Complete>
	void restore(std::string_view owner, std::string_view id, Complete&& complete);

	/// `void(std::error_code)`
	template <typename Complete>
	void rename_category(std::string_view owner, std::string_view old_name, std::string_view new_name, Complete&& complete);

	/// `void(std::error_code)`
	template <typename Complete>
	void delete_category(std::string_view owner, std::string_view name, Complete&& complete);

	[[nodiscard]] Timestamp now() const {return m_clock();}

private:
	redis::Connection&  m_db;
	Clock               m_clock;
};

} // end of namespace tkr
