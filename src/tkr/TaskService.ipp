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

#include "TaskService.hh"
#include "Task.hh"
#include "TaskIndex.ipp"
#include "TaskQuery.ipp"

#include "common/Error.hh"

namespace tkr {

template <typename Complete>
void TaskService::create(std::string_view owner, std::string_view description, std::string_view category, Complete&& complete)
{
	auto task = Task::create(owner, description, category, now());
	TaskIndex{owner}.create(m_db, task, [task, comp=std::forward<Complete>(complete)](std::error_code ec) mutable
	{
		comp(ec ? Task{} : std::move(task), ec);
	});
}

template <typename Complete>
void TaskService::get(std::string_view owner, std::string_view id, Complete&& complete)
{
	TaskQuery{owner}.find(m_db, trim(id), std::forward<Complete>(complete));
}

template <typename Complete>
void TaskService::list(std::string_view owner, const TaskFilter& filter, Complete&& complete)
{
	auto trimmed = filter;
	if (trimmed.category)
		trimmed.category = trim(*trimmed.category);

	TaskQuery{owner}.list(m_db, trimmed, std::forward<Complete>(complete));
}

template <typename Complete>
void TaskService::categories(std::string_view owner, Complete&& complete)
{
	TaskQuery{owner}.categories(m_db, std::forward<Complete>(complete));
}

template <typename Complete>
void TaskService::set_completion(std::string_view owner, std::string_view id, bool completed, Complete&& complete)
{
	auto tid = trim(id);
	TaskIndex{owner}.set_completion(m_db, tid, completed, now(), [
		&db=m_db, owner=std::string{owner}, tid, comp=std::forward<Complete>(complete)
	](std::error_code ec) mutable
	{
		if (ec)
		{
			comp(Task{}, ec);
			return;
		}

		TaskQuery{owner}.find(db, tid, std::move(comp));
	});
}

template <typename Complete>
void TaskService::soft_delete(std::string_view owner, std::string_view id, Complete&& complete)
{
	TaskIndex{owner}.soft_delete(m_db, trim(id), now(), std::forward<Complete>(complete));
}

template <typename Complete>
void TaskService::restore(std::string_view owner, std::string_view id, Complete&& complete)
{
	auto tid = trim(id);

	// The recovery window is checked here instead of in the Lua script. A task
	// which has expired but has not been erased yet cannot be restored either.
	TaskQuery{owner}.find(m_db, tid, [
		&db=m_db, owner=std::string{owner}, tid, now=now(), comp=std::forward<Complete>(complete)
	](Task&& task, std::error_code ec) mutable
	{
		if (!ec && !task.is_deleted())
			ec = Error::task_not_deleted;
		if (!ec && *task.deleted < now - Task::recovery_window)
			ec = Error::restore_window_expired;

		if (ec)
		{
			comp(Task{}, ec);
			return;
		}

		TaskIndex{owner}.restore(db, tid, now, [&db, owner, tid, comp=std::move(comp)](std::error_code ec) mutable
		{
			if (ec)
			{
				comp(Task{}, ec);
				return;
			}

			TaskQuery{owner}.find(db, tid, std::move(comp));
		});
	});
}

template <typename Complete>
void TaskService::rename_category(std::string_view owner, std::string_view old_name, std::string_view new_name, Complete&& complete)
{
	TaskIndex{owner}.rename_category(m_db, trim(old_name), trim(new_name), now(), std::forward<Complete>(complete));
}

template <typename Complete>
void TaskService::delete_category(std::string_view owner, std::string_view name, Complete&& complete)
{
	TaskIndex{owner}.delete_category(m_db, trim(name), now(), std::forward<Complete>(complete));
}

} // end of namespace tkr
