/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/9/20.
//

#include "Configuration.hh"

#include "config.hh"

#include <nlohmann/json.hpp>

#include <boost/program_options.hpp>
#include <boost/exception/info.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/filesystem.hpp>

#include <fstream>

namespace po = boost::program_options;
namespace ip = boost::asio::ip;

namespace tkr {
namespace {

ip::tcp::endpoint parse_endpoint(const nlohmann::json& json, const ip::tcp::endpoint& fallback)
{
	return {
		json.contains("address") ? ip::make_address(json["address"].get<std::string>()) : fallback.address(),
		json.value("port", fallback.port())
	};
}

} // end of local namespace

Configuration::Configuration(int argc, const char *const *argv, const char *env)
{
	m_desc.add_options()
		("help",        "produce help message")
		("sweep-once",  "erase expired tasks once and quit")
		("list",        po::value<std::string>()->value_name("owner"), "print all tasks of an owner in JSON and quit")
		("cfg",         po::value<std::string>()->default_value(
			env ? std::string{env} : std::string{tkr::constants::config_filename}
		)->value_name("path"), "Configuration file. Use environment variable TASK_KEEPER_CONFIG to set default path.")
	;

	if (argc > 0)
	{
		store(po::parse_command_line(argc, argv, m_desc), m_args);
		po::notify(m_args);
	}

	// no need for other options when --help is specified
	if (!help())
		load_config(
			m_args.count("cfg") > 0 ? m_args["cfg"].as<std::string>() :
			env ? std::string{env} : std::string{tkr::constants::config_filename}
		);
}

void Configuration::usage(std::ostream &out) const
{
	out << m_desc;
}

void Configuration::load_config(const boost::filesystem::path& path)
{
	try
	{
		std::ifstream config_file;
		config_file.open(path.string(), std::ios::in);
		if (!config_file)
		{
			BOOST_THROW_EXCEPTION(FileError()
				<< ErrorCode({errno, std::system_category()})
			);
		}

		nlohmann::json json;
		try
		{
			json = nlohmann::json::parse(config_file);
		}
		catch (nlohmann::json::parse_error& e)
		{
			BOOST_THROW_EXCEPTION(Error() << Message{e.what()});
		}

		using jptr = nlohmann::json::json_pointer;

		if (auto redis = json.value(jptr{"/redis"}, nlohmann::json::object_t{}); !redis.empty())
			m_redis = parse_endpoint(redis, m_redis);

		auto interval = json.value(jptr{"/sweep_interval_sec"}, m_sweep_interval.count());
		if (interval <= 0)
			BOOST_THROW_EXCEPTION(InvalidValue() << Message{"sweep_interval_sec must be positive"});
		m_sweep_interval = std::chrono::seconds{interval};
	}
	catch (Exception& e)
	{
		e << Path{path};
		throw;
	}
	catch (std::exception& e)
	{
		throw boost::enable_error_info(e) << Path{path};
	}
}

} // end of namespace
