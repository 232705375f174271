/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/2/20.
//

#pragma once

#include <boost/format.hpp>

#include <string>
#include <syslog.h>

namespace tkr {

namespace detail {
void write_log(int priority, const std::string& line);
}

/// Open syslog with \a ident. When \a console is true, messages are printed
/// to stderr as well. Messages less important than \a max_priority are
/// discarded.
void open_log(const char *ident, bool console, int max_priority = LOG_INFO);

/// Write a line to syslog. \a fmt is a boost::format string. Missing or
/// extra arguments are not errors.
template <typename... Args>
void Log(int priority, const std::string& fmt, Args&&... args)
{
	boost::format line{fmt};
	line.exceptions(boost::io::no_error_bits);
	detail::write_log(priority, (line % ... % std::forward<Args>(args)).str());
}

} // end of namespace
