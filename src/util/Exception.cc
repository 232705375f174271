/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/2/20.
//

#include "Exception.hh"

#include <boost/exception/diagnostic_information.hpp>
#include <boost/exception/get_error_info.hpp>
#include <boost/core/demangle.hpp>

#include <sstream>
#include <typeinfo>

namespace tkr {

const char* Exception::what() const noexcept
{
	return boost::diagnostic_information_what(*this, true);
}

std::string summary(const boost::exception& e)
{
	std::ostringstream ss;
	ss << boost::core::demangle(typeid(e).name());

	if (auto ec = boost::get_error_info<ErrorCode>(e))
		ss << ": " << ec->message();
	if (auto ep = boost::get_error_info<Endpoint>(e))
		ss << " (" << *ep << ")";
	return ss.str();
}

} // end of namespace
