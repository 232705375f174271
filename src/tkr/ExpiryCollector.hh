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

#include "common/Timestamp.hh"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace tkr {
namespace redis {
class Connection;
class CommandString;
class Reply;
}

struct SweepResult
{
	// number of tasks permanently erased
	std::size_t erased{0};

	// number of owners whose batch failed and will be retried in the next sweep
	std::size_t failed{0};

	// number of owners visited, including the failed ones
	std::size_t owners{0};
};

/// \brief  Permanently erase the tasks that have been soft-deleted for longer
///         than Task::recovery_window.
///
/// The owners are found by scanning the keys of their deleted task sets, so
/// the collector does not need to know about the users. Each owner is
/// handled by a separate Lua script. A failed script does not stop the
/// sweep: it is logged and counted in SweepResult::failed.
class ExpiryCollector
{
public:
	explicit ExpiryCollector(long scan_count = 100);

	/// The completion has the signature `void(SweepResult, std::error_code)`.
	/// Only a failed SCAN is reported as an error.
	template <typename Complete>
	void sweep(redis::Connection& db, Timestamp now, Complete&& complete) const;

	/// Tasks deleted before the cutoff are erased. Tasks deleted exactly at
	/// the cutoff are kept.
	static Timestamp cutoff(Timestamp now);

	/// Add the reply of the erase script of one owner to \a result. A failed
	/// script is logged and counted in SweepResult::failed. Keys which are
	/// not sets of deleted tasks are skipped and not counted.
	static void tally(SweepResult& result, std::string_view deleted_order, const redis::Reply& reply, std::error_code ec);

private:
	template <typename Complete>
	static void scan(
		redis::Connection& db,
		long count,
		Timestamp cutoff,
		std::string cursor,
		std::shared_ptr<SweepResult> result,
		Complete&& complete
	);

	static redis::CommandString erase_command(std::string_view deleted_order, Timestamp cutoff);


private:
	long m_scan_count;
};

} // end of namespace tkr
