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

#include <boost/exception/exception.hpp>
#include <boost/exception/error_info.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <string>
#include <system_error>

namespace tkr {

/// Base class of all exceptions thrown by task_keeper. Only start-up code
/// throws; the task store reports errors with std::error_code.
struct Exception : virtual boost::exception, virtual std::exception
{
	const char* what() const noexcept override;
};

struct SystemError : virtual Exception {};

/// Cannot connect to the redis server.
struct RedisConnectError : virtual SystemError {};

using ErrorCode = boost::error_info<struct tag_error_code, std::error_code>;
using Endpoint  = boost::error_info<struct tag_endpoint,   boost::asio::ip::tcp::endpoint>;

/// A one-line summary of \a e for log messages, without the throw location.
std::string summary(const boost::exception& e);

} // end of namespace
