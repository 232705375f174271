/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/7/20.
//

#pragma once

#include "ExpiryCollector.hh"
#include "RedisKeys.hh"

#include "common/Error.hh"
#include "net/Redis.hh"
#include "util/AggregatedCallBack.hh"

namespace tkr {

template <typename Complete>
void ExpiryCollector::sweep(redis::Connection& db, Timestamp now, Complete&& complete) const
{
	scan(db, m_scan_count, cutoff(now), "0", std::make_shared<SweepResult>(), std::forward<Complete>(complete));
}

template <typename Complete>
void ExpiryCollector::scan(
	redis::Connection& db,
	long count,
	Timestamp cutoff,
	std::string cursor,
	std::shared_ptr<SweepResult> result,
	Complete&& complete
)
{
	auto count_str = std::to_string(count);
	db.command(
		[
			&db, count, cutoff, result, comp=std::forward<Complete>(complete)
		](redis::Reply&& reply, std::error_code ec) mutable
		{
			if (!ec && reply.is_error())
				ec = Error::redis_command_error;

			auto [cursor_reply, keys] = reply.as_tuple<2>(ec);
			if (ec)
			{
				comp(*result, ec);
				return;
			}

			// Continue scanning after all owners in this batch are done. SCAN
			// is finished when the cursor goes back to 0.
			auto next = [
				&db, count, cutoff, result, cursor=std::string{cursor_reply.as_string()}, comp=std::move(comp)
			](std::error_code) mutable
			{
				if (cursor == "0" || cursor.empty())
					comp(*result, std::error_code{});
				else
					scan(db, count, cutoff, std::move(cursor), std::move(result), std::move(comp));
			};

			if (keys.array_size() == 0)
			{
				next({});
				return;
			}

			auto join = make_shared_callback(std::move(next), keys.array_size());
			for (auto&& owner_key : keys)
			{
				auto deleted_order = std::string{owner_key.as_string()};
				db.command(
					[result, join, deleted_order](redis::Reply&& reply, std::error_code ec)
					{
						tally(*result, deleted_order, reply, ec);

						// failures of one owner do not stop the others
						(*join)({});
					},
					erase_command(deleted_order, cutoff)
				);
			}
		},
		"SCAN %b MATCH %b COUNT %b",
		cursor.data(), cursor.size(),
		key::deleted_order_pattern.data(), key::deleted_order_pattern.size(),
		count_str.data(), count_str.size()
	);
}

} // end of namespace tkr
