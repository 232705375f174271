/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/6/20.
//

#include "TaskQuery.hh"
#include "Task.hh"

#include "common/Error.hh"
#include "net/Redis.hh"

namespace tkr {

TaskQuery::TaskQuery(std::string_view owner) : m_owner{owner}
{
}

bool TaskQuery::visible_to(const Task& task, std::string_view owner)
{
	return !owner.empty() && task.owner == owner;
}

std::error_code TaskQuery::check_owner() const
{
	return trim(m_owner).empty() ? std::error_code{Error::invalid_owner} : std::error_code{};
}

std::vector<std::string> TaskQuery::string_list(const redis::Reply& reply, std::error_code& ec)
{
	std::vector<std::string> result;
	if (ec)
		return result;

	if (reply.is_error())
	{
		ec = Error::redis_command_error;
		return result;
	}

	result.reserve(reply.array_size());
	for (auto&& item : reply)
		result.emplace_back(item.as_string());
	return result;
}

} // end of namespace tkr
