/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/5/20.
//

#include "RedisKeys.hh"

namespace tkr::key {
namespace {

std::string user_key(std::string_view owner, std::string_view suffix)
{
	std::string s{"user:"};
	s.append(owner.data(), owner.size());
	s.append(suffix.data(), suffix.size());
	return s;
}

} // end of local namespace

std::string task(std::string_view id)
{
	std::string s{task_prefix};
	s.append(id.data(), id.size());
	return s;
}

std::string active_tasks(std::string_view owner)
{
	return user_key(owner, ":tasks");
}

std::string active_order(std::string_view owner)
{
	return user_key(owner, ":tasks:sorted");
}

std::string categories(std::string_view owner)
{
	return user_key(owner, ":categories");
}

std::string category(std::string_view owner, std::string_view name)
{
	auto s = user_key(owner, ":category:");
	s.append(name.data(), name.size());
	return s;
}

std::string deleted_order(std::string_view owner)
{
	return user_key(owner, ":tasks:deleted");
}

} // end of namespace
