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

#include <string>
#include <string_view>

namespace tkr::key {

/// Prefix of the task hashes. The Lua scripts use it to build task keys
/// from the IDs they read from the index sets.
constexpr std::string_view task_prefix{"task:"};

/// task is a redis hash that contains all fields of a task.
std::string task(std::string_view id);

/// active_tasks is a redis set that contains the IDs of all active tasks of an owner.
std::string active_tasks(std::string_view owner);

/// active_order is a redis sorted set that contains the IDs of all active
/// tasks of an owner. The score is the creation time.
std::string active_order(std::string_view owner);

/// categories is a redis set that contains the names of the categories used by an owner.
std::string categories(std::string_view owner);

/// category is a redis set that contains the IDs of the active tasks in a category.
std::string category(std::string_view owner, std::string_view name);

/// deleted_order is a redis sorted set that contains the IDs of all soft-deleted
/// tasks of an owner. The score is the deletion time.
std::string deleted_order(std::string_view owner);

// SCAN pattern that matches deleted_order() of all owners
constexpr std::string_view deleted_order_pattern{"user:*:tasks:deleted"};

} // end of namespace
