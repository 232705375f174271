/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/5/20.
//

#pragma once

#include "common/Error.hh"
#include "common/Timestamp.hh"

#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace tkr {
namespace redis {
class Connection;
class CommandString;
class Reply;
}

struct Task;

/// \brief  Maintains the task hashes and all the index structures of an owner.
///
/// Every mutation is a single Lua script, so redis applies it atomically.
/// The scripts check their own preconditions (ownership, deleted state,
/// category existence) before touching anything, and report failures with
/// a small integer status which is translated to tkr::Error here.
///
/// All completion callbacks have the signature `void(std::error_code)`.
class TaskIndex
{
public:
	explicit TaskIndex(std::string_view owner);

	template <typename Complete, typename=std::enable_if_t<std::is_invocable_v<Complete, std::error_code>>>
	void create(redis::Connection& db, const Task& task, Complete&& complete);

	template <typename Complete, typename=std::enable_if_t<std::is_invocable_v<Complete, std::error_code>>>
	void set_completion(
		redis::Connection& db,
		std::string_view id,
		bool completed,
		Timestamp now,
		Complete&& complete
	);

	template <typename Complete, typename=std::enable_if_t<std::is_invocable_v<Complete, std::error_code>>>
	void soft_delete(redis::Connection& db, std::string_view id, Timestamp now, Complete&& complete);

	template <typename Complete, typename=std::enable_if_t<std::is_invocable_v<Complete, std::error_code>>>
	void restore(redis::Connection& db, std::string_view id, Timestamp now, Complete&& complete);

	template <typename Complete, typename=std::enable_if_t<std::is_invocable_v<Complete, std::error_code>>>
	void rename_category(
		redis::Connection& db,
		std::string_view old_name,
		std::string_view new_name,
		Timestamp now,
		Complete&& complete
	);

	template <typename Complete, typename=std::enable_if_t<std::is_invocable_v<Complete, std::error_code>>>
	void delete_category(redis::Connection& db, std::string_view name, Timestamp now, Complete&& complete);

	[[nodiscard]] const std::string& owner() const {return m_owner;}

private:
	[[nodiscard]] redis::CommandString create_command(const Task& task) const;
	[[nodiscard]] redis::CommandString set_completion_command(std::string_view id, bool completed, Timestamp now) const;
	[[nodiscard]] redis::CommandString soft_delete_command(std::string_view id, Timestamp now) const;
	[[nodiscard]] redis::CommandString restore_command(std::string_view id, Timestamp now) const;
	[[nodiscard]] redis::CommandString rename_category_command(std::string_view old_name, std::string_view new_name, Timestamp now) const;
	[[nodiscard]] redis::CommandString delete_category_command(std::string_view name, Timestamp now) const;

	[[nodiscard]] std::error_code check_owner() const;
	[[nodiscard]] std::error_code check_task(std::string_view id) const;

	// Translate the status returned by the scripts: 0 means OK, 1 means not found
	// and 2 means conflict.
	static std::error_code script_status(const redis::Reply& reply, std::error_code ec, Error not_found, Error conflict);

	// For scripts that never report a conflict. A status of 2 is a command error.
	static std::error_code script_status(const redis::Reply& reply, std::error_code ec, Error not_found);

private:
	std::string m_owner;
};

} // end of namespace tkr
