/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/2/20.
//

#include "Log.hh"

namespace tkr {

void open_log(const char *ident, bool console, int max_priority)
{
	::openlog(ident, LOG_PID | (console ? LOG_PERROR : 0), LOG_DAEMON);
	::setlogmask(LOG_UPTO(max_priority));
}

namespace detail {

void write_log(int priority, const std::string& line)
{
	// lines are never used as format strings
	::syslog(priority, "%s", line.c_str());
}

} // end of namespace detail
} // end of namespace
