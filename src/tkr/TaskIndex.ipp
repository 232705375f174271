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

#include "TaskIndex.hh"
#include "Task.hh"

#include "net/Redis.hh"

namespace tkr {

template <typename Complete, typename>
void TaskIndex::create(redis::Connection& db, const Task& task, Complete&& complete)
{
	auto ec = check_owner();
	if (!ec)
		ec = task.validate();
	if (!ec && task.owner != m_owner)
		ec = Error::invalid_owner;

	if (ec)
	{
		complete(ec);
		return;
	}

	db.command(
		[comp=std::forward<Complete>(complete)](redis::Reply&& reply, std::error_code ec) mutable
		{
			comp(script_status(reply, ec, Error::task_not_found, Error::task_exists));
		},
		create_command(task)
	);
}

template <typename Complete, typename>
void TaskIndex::set_completion(
	redis::Connection& db,
	std::string_view id,
	bool completed,
	Timestamp now,
	Complete&& complete
)
{
	if (auto ec = check_task(id))
	{
		complete(ec);
		return;
	}

	db.command(
		[comp=std::forward<Complete>(complete)](redis::Reply&& reply, std::error_code ec) mutable
		{
			comp(script_status(reply, ec, Error::task_not_found));
		},
		set_completion_command(id, completed, now)
	);
}

template <typename Complete, typename>
void TaskIndex::soft_delete(redis::Connection& db, std::string_view id, Timestamp now, Complete&& complete)
{
	if (auto ec = check_task(id))
	{
		complete(ec);
		return;
	}

	db.command(
		[comp=std::forward<Complete>(complete)](redis::Reply&& reply, std::error_code ec) mutable
		{
			comp(script_status(reply, ec, Error::task_not_found, Error::task_already_deleted));
		},
		soft_delete_command(id, now)
	);
}

template <typename Complete, typename>
void TaskIndex::restore(redis::Connection& db, std::string_view id, Timestamp now, Complete&& complete)
{
	if (auto ec = check_task(id))
	{
		complete(ec);
		return;
	}

	db.command(
		[comp=std::forward<Complete>(complete)](redis::Reply&& reply, std::error_code ec) mutable
		{
			comp(script_status(reply, ec, Error::task_not_found, Error::task_not_deleted));
		},
		restore_command(id, now)
	);
}

template <typename Complete, typename>
void TaskIndex::rename_category(
	redis::Connection& db,
	std::string_view old_name,
	std::string_view new_name,
	Timestamp now,
	Complete&& complete
)
{
	auto ec = check_owner();
	if (!ec && (trim(old_name).empty() || trim(new_name).empty()))
		ec = Error::invalid_category_name;
	if (!ec && old_name == new_name)
		ec = Error::same_category_name;

	if (ec)
	{
		complete(ec);
		return;
	}

	db.command(
		[comp=std::forward<Complete>(complete)](redis::Reply&& reply, std::error_code ec) mutable
		{
			comp(script_status(reply, ec, Error::category_not_found, Error::category_renamed));
		},
		rename_category_command(old_name, new_name, now)
	);
}

template <typename Complete, typename>
void TaskIndex::delete_category(redis::Connection& db, std::string_view name, Timestamp now, Complete&& complete)
{
	auto ec = check_owner();
	if (!ec && trim(name).empty())
		ec = Error::invalid_category_name;

	if (ec)
	{
		complete(ec);
		return;
	}

	db.command(
		[comp=std::forward<Complete>(complete)](redis::Reply&& reply, std::error_code ec) mutable
		{
			comp(script_status(reply, ec, Error::category_not_found));
		},
		delete_category_command(name, now)
	);
}

} // end of namespace tkr
