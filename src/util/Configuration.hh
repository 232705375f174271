/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/9/20.
//

#pragma once

#include "Exception.hh"

#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/exception/error_info.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/filesystem/path.hpp>

#include <chrono>
#include <iosfwd>
#include <string>

namespace tkr {

/// \brief  Parsing command line options and configuration file
class Configuration
{
public:
	struct Error : virtual Exception {};
	struct FileError : virtual Error {};
	struct InvalidValue : virtual Error {};
	using Path      = boost::error_info<struct tag_path,    boost::filesystem::path>;
	using Message   = boost::error_info<struct tag_message, std::string>;

public:
	Configuration(int argc, const char *const *argv, const char *env);

	boost::asio::ip::tcp::endpoint redis() const {return m_redis;}
	std::chrono::seconds sweep_interval() const {return m_sweep_interval;}

	bool help() const {return m_args.count("help") > 0;}
	bool sweep_once() const {return m_args.count("sweep-once") > 0;}

	template <typename Function>
	bool list(Function&& func) const
	{
		return m_args.count("list") > 0 ?
			(func(m_args["list"].as<std::string>()), true) :
			false;
	}

	void usage(std::ostream& out) const;

private:
	void load_config(const boost::filesystem::path& path);

private:
	boost::program_options::options_description m_desc{"Allowed options"};
	boost::program_options::variables_map       m_args;

	boost::asio::ip::tcp::endpoint m_redis{
		boost::asio::ip::make_address("127.0.0.1"),
		6379
	};
	std::chrono::seconds m_sweep_interval{24 * 3600};
};

} // end of namespace
