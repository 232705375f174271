/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/7/20.
//

#include "ExpiryCollector.hh"
#include "RedisKeys.hh"
#include "Task.hh"

#include "common/Error.hh"

#include "net/Redis.hh"
#include "util/Log.hh"

namespace tkr {

ExpiryCollector::ExpiryCollector(long scan_count) : m_scan_count{scan_count > 0 ? scan_count : 100}
{
}

Timestamp ExpiryCollector::cutoff(Timestamp now)
{
	return Timestamp{now - Task::recovery_window};
}

redis::CommandString ExpiryCollector::erase_command(std::string_view deleted_order, Timestamp cutoff)
{
	auto max_score = "(" + cutoff.to_string();

	// Only touches the task hashes and the deleted set. Soft-deleted tasks
	// are not in any other index.
	static const char lua[] = R"__(
		local deleted_order = KEYS[1]
		local max_score, task_prefix = ARGV[1], ARGV[2]

		-- Other keys may match the SCAN pattern, e.g. the set of a category
		-- whose name ends with ":tasks:deleted".
		if redis.call('TYPE', deleted_order).ok ~= 'zset' then
			return -1
		end

		local ids = redis.call('ZRANGEBYSCORE', deleted_order, '-inf', max_score)
		for _, id in ipairs(ids) do
			redis.call('DEL',  task_prefix .. id)
			redis.call('ZREM', deleted_order, id)
		end
		return #ids
	)__";
	return redis::CommandString{
		"EVAL %s 1 %b   %b %b", lua,
		deleted_order.data(), deleted_order.size(),

		max_score.data(), max_score.size(),                 // ARGV[1]: exclusive upper bound of deletion time
		key::task_prefix.data(), key::task_prefix.size()    // ARGV[2]: prefix of task keys
	};
}

void ExpiryCollector::tally(SweepResult& result, std::string_view deleted_order, const redis::Reply& reply, std::error_code ec)
{
	if (!ec && reply.type() != REDIS_REPLY_INTEGER)
		ec = Error::redis_command_error;

	if (ec)
	{
		Log(LOG_WARNING, "cannot erase expired tasks in %1%: %2% (%3% %4%). Will retry in next sweep.",
			deleted_order, ec, ec.message(), reply.as_error());
		result.owners++;
		result.failed++;
	}

	// not a deleted task set
	else if (reply.as_int() < 0)
		Log(LOG_DEBUG, "%1% is not a set of deleted tasks. Skipped.", deleted_order);

	else
	{
		result.owners++;
		result.erased += static_cast<std::size_t>(reply.as_int());
	}
}

} // end of namespace tkr
