/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/8/20.
//

#include "TaskService.hh"

namespace tkr {

TaskService::TaskService(redis::Connection& db, Clock clock) :
	m_db{db},
	m_clock{std::move(clock)}
{
}

} // end of namespace tkr
