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

#include "TaskQuery.hh"
#include "RedisKeys.hh"
#include "Task.hh"

#include "common/Error.hh"
#include "net/Redis.hh"
#include "util/AggregatedCallBack.hh"

#include <algorithm>
#include <memory>
#include <optional>

namespace tkr {

template <typename Complete>
void TaskQuery::list(redis::Connection& db, const TaskFilter& filter, Complete&& complete) const
{
	auto ec = check_owner();
	if (!ec)
		ec = filter.validate();

	if (ec)
	{
		complete(std::vector<Task>{}, ec);
		return;
	}

	candidates(db, filter, [
		&db, owner=m_owner, filter, comp=std::forward<Complete>(complete)
	](std::vector<std::string>&& ids, std::error_code ec) mutable
	{
		if (ec)
		{
			comp(std::vector<Task>{}, ec);
			return;
		}

		// pagination is done on the IDs, not the tasks
		auto [first, last] = filter.window(ids.size());
		std::vector<std::string> page(
			std::make_move_iterator(ids.begin() + first),
			std::make_move_iterator(ids.begin() + last)
		);

		hydrate(db, owner, std::move(page), [completed=filter.completed, comp=std::move(comp)](std::vector<Task>&& tasks, std::error_code ec) mutable
		{
			if (!ec && completed.has_value())
				tasks.erase(
					std::remove_if(tasks.begin(), tasks.end(), [c=*completed](const Task& t){return t.completed != c;}),
					tasks.end()
				);

			comp(std::move(tasks), ec);
		});
	});
}

template <typename Complete>
void TaskQuery::candidates(redis::Connection& db, const TaskFilter& filter, Complete&& complete) const
{
	// Append the soft-deleted tasks after the active ones, if requested.
	auto with_deleted = [
		&db, include=filter.include_deleted, deleted_order=key::deleted_order(m_owner),
		comp=std::forward<Complete>(complete)
	](std::vector<std::string>&& ids, std::error_code ec) mutable
	{
		if (ec || !include)
		{
			comp(std::move(ids), ec);
			return;
		}

		db.command(
			[ids=std::move(ids), comp=std::move(comp)](redis::Reply&& reply, std::error_code ec) mutable
			{
				auto deleted = string_list(reply, ec);
				ids.insert(ids.end(), std::make_move_iterator(deleted.begin()), std::make_move_iterator(deleted.end()));
				comp(std::move(ids), ec);
			},
			"ZREVRANGE %b 0 -1", deleted_order.data(), deleted_order.size()
		);
	};

	if (filter.by_category())
	{
		// Sets are unordered. Sort the IDs so that pages do not overlap.
		auto category = key::category(m_owner, *filter.category);
		db.command(
			[next=std::move(with_deleted)](redis::Reply&& reply, std::error_code ec) mutable
			{
				auto ids = string_list(reply, ec);
				std::sort(ids.begin(), ids.end());
				next(std::move(ids), ec);
			},
			"SMEMBERS %b", category.data(), category.size()
		);
	}
	else
	{
		auto active_order = key::active_order(m_owner);
		db.command(
			[next=std::move(with_deleted)](redis::Reply&& reply, std::error_code ec) mutable
			{
				auto ids = string_list(reply, ec);
				next(std::move(ids), ec);
			},
			"ZREVRANGE %b 0 -1", active_order.data(), active_order.size()
		);
	}
}

template <typename Complete>
void TaskQuery::hydrate(redis::Connection& db, const std::string& owner, std::vector<std::string>&& ids, Complete&& complete)
{
	if (ids.empty())
	{
		complete(std::vector<Task>{}, std::error_code{});
		return;
	}

	// One slot for each ID to keep the order of the IDs. Replies come back in
	// order anyway, but the slots make it explicit.
	auto slots = std::make_shared<std::vector<std::optional<Task>>>(ids.size());

	auto join = make_shared_callback(
		[slots, owner, comp=std::forward<Complete>(complete)](std::error_code ec) mutable
		{
			std::vector<Task> tasks;
			if (!ec)
			{
				for (auto&& slot : *slots)
				{
					// Skip tasks that vanished after reading the index.
					if (slot && visible_to(*slot, owner))
						tasks.push_back(std::move(*slot));
				}
			}
			comp(std::move(tasks), ec);
		},
		ids.size()
	);

	for (std::size_t i = 0; i < ids.size(); i++)
	{
		auto task_key = key::task(ids[i]);
		db.command(
			[slots, join, i](redis::Reply&& reply, std::error_code ec)
			{
				if (!ec && reply.is_error())
					ec = Error::redis_command_error;
				if (!ec)
					(*slots)[i] = Task::from_hash(reply);

				(*join)(ec);
			},
			"HGETALL %b", task_key.data(), task_key.size()
		);
	}
}

template <typename Complete>
void TaskQuery::find(redis::Connection& db, std::string_view id, Complete&& complete) const
{
	auto ec = check_owner();
	if (!ec && trim(id).empty())
		ec = Error::invalid_task_id;

	if (ec)
	{
		complete(Task{}, ec);
		return;
	}

	auto task_key = key::task(id);
	db.command(
		[owner=m_owner, comp=std::forward<Complete>(complete)](redis::Reply&& reply, std::error_code ec) mutable
		{
			if (!ec && reply.is_error())
				ec = Error::redis_command_error;

			std::optional<Task> task;
			if (!ec)
				task = Task::from_hash(reply);

			if (!ec && (!task || !visible_to(*task, owner)))
				ec = Error::task_not_found;

			comp(ec ? Task{} : std::move(*task), ec);
		},
		"HGETALL %b", task_key.data(), task_key.size()
	);
}

template <typename Complete>
void TaskQuery::categories(redis::Connection& db, Complete&& complete) const
{
	if (auto ec = check_owner())
	{
		complete(std::vector<std::string>{}, ec);
		return;
	}

	auto categories = key::categories(m_owner);
	db.command(
		[comp=std::forward<Complete>(complete)](redis::Reply&& reply, std::error_code ec) mutable
		{
			auto names = string_list(reply, ec);
			names.erase(
				std::remove_if(names.begin(), names.end(), [](auto& name){return name.empty();}),
				names.end()
			);
			std::sort(names.begin(), names.end());
			comp(std::move(names), ec);
		},
		"SMEMBERS %b", categories.data(), categories.size()
	);
}

} // end of namespace tkr
