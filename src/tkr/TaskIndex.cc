/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/5/20.
//

#include "TaskIndex.hh"
#include "RedisKeys.hh"
#include "Task.hh"

#include "common/Error.hh"
#include "net/Redis.hh"

namespace tkr {

TaskIndex::TaskIndex(std::string_view owner) : m_owner{owner}
{
}

std::error_code TaskIndex::check_owner() const
{
	return trim(m_owner).empty() ? std::error_code{Error::invalid_owner} : std::error_code{};
}

std::error_code TaskIndex::check_task(std::string_view id) const
{
	if (auto ec = check_owner())
		return ec;

	return trim(id).empty() ? std::error_code{Error::invalid_task_id} : std::error_code{};
}

std::error_code TaskIndex::script_status(const redis::Reply& reply, std::error_code ec, Error not_found, Error conflict)
{
	if (ec)
		return ec;

	if (!reply || reply.type() != REDIS_REPLY_INTEGER)
		return Error::redis_command_error;

	switch (reply.as_int())
	{
		case 0: return {};
		case 1: return not_found;
		case 2: return conflict;
		default: return Error::redis_command_error;
	}
}

std::error_code TaskIndex::script_status(const redis::Reply& reply, std::error_code ec, Error not_found)
{
	return script_status(reply, ec, not_found, Error::redis_command_error);
}

redis::CommandString TaskIndex::create_command(const Task& task) const
{
	auto task_key     = key::task(task.id);
	auto active_set   = key::active_tasks(m_owner);
	auto active_order = key::active_order(m_owner);
	auto categories   = key::categories(m_owner);
	auto category_key = key::category(m_owner, task.category);

	// A new task is always active, even if the deleted field is set.
	auto created   = task.created.to_string();
	auto updated   = task.updated.to_string();
	auto completed = std::string_view{task.completed ? "1" : "0"};

	static const char lua[] = R"__(
		local task_key, active_set, active_order, categories, category_key = KEYS[1], KEYS[2], KEYS[3], KEYS[4], KEYS[5]
		local id, owner, desc, category, completed, created, updated = ARGV[1], ARGV[2], ARGV[3], ARGV[4], ARGV[5], ARGV[6], ARGV[7]

		-- task IDs are never reused, not even after they are erased
		if redis.call('EXISTS', task_key) == 1 then
			return 2
		end

		redis.call('HSET', task_key,
			'id', id, 'user_id', owner, 'description', desc, 'category', category,
			'completed', completed, 'created_at', created, 'updated_at', updated
		)
		redis.call('SADD', active_set, id)
		redis.call('ZADD', active_order, created, id)

		if category ~= '' then
			redis.call('SADD', categories,   category)
			redis.call('SADD', category_key, id)
		end
		return 0
	)__";
	return redis::CommandString{
		"EVAL %s 5 %b %b %b %b %b   %b %b %b %b %b %b %b", lua,

		task_key.data(),     task_key.size(),
		active_set.data(),   active_set.size(),
		active_order.data(), active_order.size(),
		categories.data(),   categories.size(),
		category_key.data(), category_key.size(),

		task.id.data(), task.id.size(),                     // ARGV[1]: task ID
		m_owner.data(), m_owner.size(),                     // ARGV[2]: owner
		task.description.data(), task.description.size(),   // ARGV[3]: description
		task.category.data(), task.category.size(),         // ARGV[4]: category
		completed.data(), completed.size(),                 // ARGV[5]: completed
		created.data(), created.size(),                     // ARGV[6]: creation time
		updated.data(), updated.size()                      // ARGV[7]: update time
	};
}

redis::CommandString TaskIndex::set_completion_command(std::string_view id, bool completed, Timestamp now) const
{
	auto task_key = key::task(id);
	auto updated  = now.to_string();
	auto flag     = std::string_view{completed ? "1" : "0"};

	static const char lua[] = R"__(
		local task_key = KEYS[1]
		local owner, completed, updated = ARGV[1], ARGV[2], ARGV[3]

		if redis.call('HGET', task_key, 'user_id') ~= owner then
			return 1
		end

		redis.call('HSET', task_key, 'completed', completed, 'updated_at', updated)
		return 0
	)__";
	return redis::CommandString{
		"EVAL %s 1 %b   %b %b %b", lua,
		task_key.data(), task_key.size(),

		m_owner.data(), m_owner.size(),     // ARGV[1]: owner
		flag.data(), flag.size(),           // ARGV[2]: completed
		updated.data(), updated.size()      // ARGV[3]: update time
	};
}

redis::CommandString TaskIndex::soft_delete_command(std::string_view id, Timestamp now) const
{
	auto task_key      = key::task(id);
	auto active_set    = key::active_tasks(m_owner);
	auto active_order  = key::active_order(m_owner);
	auto deleted_order = key::deleted_order(m_owner);
	auto category_key  = key::category(m_owner, {});
	auto deleted       = now.to_string();

	// The owner's category set is left untouched even if the task is the last
	// active one in its category. Only delete_category() removes categories.
	static const char lua[] = R"__(
		local task_key, active_set, active_order, deleted_order = KEYS[1], KEYS[2], KEYS[3], KEYS[4]
		local owner, id, now, category_prefix = ARGV[1], ARGV[2], ARGV[3], ARGV[4]

		local fields = redis.call('HMGET', task_key, 'user_id', 'deleted_at', 'category')
		if fields[1] ~= owner then
			return 1
		end
		if fields[2] and fields[2] ~= '' then
			return 2
		end

		redis.call('HSET', task_key, 'deleted_at', now, 'updated_at', now)
		redis.call('SREM', active_set, id)
		redis.call('ZREM', active_order, id)
		if fields[3] and fields[3] ~= '' then
			redis.call('SREM', category_prefix .. fields[3], id)
		end
		redis.call('ZADD', deleted_order, now, id)
		return 0
	)__";
	return redis::CommandString{
		"EVAL %s 4 %b %b %b %b   %b %b %b %b", lua,
		task_key.data(),      task_key.size(),
		active_set.data(),    active_set.size(),
		active_order.data(),  active_order.size(),
		deleted_order.data(), deleted_order.size(),

		m_owner.data(), m_owner.size(),             // ARGV[1]: owner
		id.data(), id.size(),                       // ARGV[2]: task ID
		deleted.data(), deleted.size(),             // ARGV[3]: deletion time
		category_key.data(), category_key.size()    // ARGV[4]: prefix of category keys
	};
}

redis::CommandString TaskIndex::restore_command(std::string_view id, Timestamp now) const
{
	auto task_key      = key::task(id);
	auto active_set    = key::active_tasks(m_owner);
	auto active_order  = key::active_order(m_owner);
	auto deleted_order = key::deleted_order(m_owner);
	auto categories    = key::categories(m_owner);
	auto category_key  = key::category(m_owner, {});
	auto updated       = now.to_string();

	// The task goes back to its original position in active_order: the score
	// is its creation time, not the restoration time.
	static const char lua[] = R"__(
		local task_key, active_set, active_order, deleted_order, categories = KEYS[1], KEYS[2], KEYS[3], KEYS[4], KEYS[5]
		local owner, id, now, category_prefix = ARGV[1], ARGV[2], ARGV[3], ARGV[4]

		local fields = redis.call('HMGET', task_key, 'user_id', 'deleted_at', 'category', 'created_at')
		if fields[1] ~= owner then
			return 1
		end
		if not fields[2] or fields[2] == '' then
			return 2
		end

		redis.call('HDEL', task_key, 'deleted_at')
		redis.call('HSET', task_key, 'updated_at', now)
		redis.call('SADD', active_set, id)
		redis.call('ZADD', active_order, fields[4] or '0', id)

		-- the category may have been renamed or deleted while the task was in
		-- the deleted set, so make sure it is listed again
		if fields[3] and fields[3] ~= '' then
			redis.call('SADD', categories, fields[3])
			redis.call('SADD', category_prefix .. fields[3], id)
		end
		redis.call('ZREM', deleted_order, id)
		return 0
	)__";
	return redis::CommandString{
		"EVAL %s 5 %b %b %b %b %b   %b %b %b %b", lua,
		task_key.data(),      task_key.size(),
		active_set.data(),    active_set.size(),
		active_order.data(),  active_order.size(),
		deleted_order.data(), deleted_order.size(),
		categories.data(),    categories.size(),

		m_owner.data(), m_owner.size(),             // ARGV[1]: owner
		id.data(), id.size(),                       // ARGV[2]: task ID
		updated.data(), updated.size(),             // ARGV[3]: update time
		category_key.data(), category_key.size()    // ARGV[4]: prefix of category keys
	};
}

redis::CommandString TaskIndex::rename_category_command(std::string_view old_name, std::string_view new_name, Timestamp now) const
{
	auto categories = key::categories(m_owner);
	auto old_key    = key::category(m_owner, old_name);
	auto new_key    = key::category(m_owner, new_name);
	auto updated    = now.to_string();

	static const char lua[] = R"__(
		local categories, old_key, new_key = KEYS[1], KEYS[2], KEYS[3]
		local old_name, new_name, now, task_prefix, owner = ARGV[1], ARGV[2], ARGV[3], ARGV[4], ARGV[5]

		-- If the old name is gone but the new one is there, the same rename
		-- has already been done.
		if redis.call('SISMEMBER', categories, old_name) == 0 then
			if redis.call('SISMEMBER', categories, new_name) == 1 then
				return 2
			end
			return 1
		end

		-- Renaming into an existing category merges the two member sets.
		for _, id in ipairs(redis.call('SMEMBERS', old_key)) do
			local task_key = task_prefix .. id

			-- Members whose task hash has vanished or belongs to someone else
			-- are dropped, instead of creating a partial task hash.
			if redis.call('HGET', task_key, 'user_id') == owner then
				redis.call('HSET', task_key, 'category', new_name, 'updated_at', now)
				redis.call('SADD', new_key, id)
			end
		end

		redis.call('SREM', categories, old_name)
		redis.call('SADD', categories, new_name)
		redis.call('DEL',  old_key)
		return 0
	)__";
	return redis::CommandString{
		"EVAL %s 3 %b %b %b   %b %b %b %b %b", lua,
		categories.data(), categories.size(),
		old_key.data(),    old_key.size(),
		new_key.data(),    new_key.size(),

		old_name.data(), old_name.size(),               // ARGV[1]: old category name
		new_name.data(), new_name.size(),               // ARGV[2]: new category name
		updated.data(), updated.size(),                 // ARGV[3]: update time
		key::task_prefix.data(), key::task_prefix.size(),   // ARGV[4]: prefix of task keys
		m_owner.data(), m_owner.size()                  // ARGV[5]: owner
	};
}

redis::CommandString TaskIndex::delete_category_command(std::string_view name, Timestamp now) const
{
	auto categories   = key::categories(m_owner);
	auto category_key = key::category(m_owner, name);
	auto updated      = now.to_string();

	// Tasks in the category are decategorized, never deleted.
	static const char lua[] = R"__(
		local categories, category_key = KEYS[1], KEYS[2]
		local name, now, task_prefix, owner = ARGV[1], ARGV[2], ARGV[3], ARGV[4]

		if redis.call('SISMEMBER', categories, name) == 0 then
			return 1
		end

		for _, id in ipairs(redis.call('SMEMBERS', category_key)) do
			local task_key = task_prefix .. id
			if redis.call('HGET', task_key, 'user_id') == owner then
				redis.call('HSET', task_key, 'category', '', 'updated_at', now)
			end
		end

		redis.call('SREM', categories, name)
		redis.call('DEL',  category_key)
		return 0
	)__";
	return redis::CommandString{
		"EVAL %s 2 %b %b   %b %b %b %b", lua,
		categories.data(),   categories.size(),
		category_key.data(), category_key.size(),

		name.data(), name.size(),                           // ARGV[1]: category name
		updated.data(), updated.size(),                     // ARGV[2]: update time
		key::task_prefix.data(), key::task_prefix.size(),   // ARGV[3]: prefix of task keys
		m_owner.data(), m_owner.size()                      // ARGV[4]: owner
	};
}

} // end of namespace tkr
