/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

#include "tkr/ExpiryCollector.ipp"
#include "tkr/Task.hh"
#include "tkr/TaskQuery.ipp"
#include "net/Redis.hh"
#include "util/Configuration.hh"
#include "util/Exception.hh"
#include "util/Log.hh"

#include "config.hh"

#include <nlohmann/json.hpp>

#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/exception/info.hpp>
#include <boost/throw_exception.hpp>
#include <boost/system/system_error.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>

namespace tkr {

void log_sweep(const SweepResult& result, std::error_code ec)
{
	if (ec)
		Log(LOG_WARNING, "sweep aborted after %1% tasks erased: %2% (%3%)", result.erased, ec, ec.message());
	else
		Log(LOG_NOTICE, "sweep finished: %1% expired tasks erased from %2% owners, %3% owners failed",
			result.erased, result.owners, result.failed);
}

/// Allocate a connection from \a pool. Throws RedisConnectError if a new
/// socket cannot be connected.
std::shared_ptr<redis::Connection> alloc_connection(redis::Pool& pool, const boost::asio::ip::tcp::endpoint& remote)
{
	try
	{
		return pool.alloc();
	}
	catch (boost::system::system_error& e)
	{
		BOOST_THROW_EXCEPTION(RedisConnectError()
			<< ErrorCode{e.code()}
			<< Endpoint{remote}
		);
	}
}

// Each sweep runs on its own connection from the pool, so a broken
// connection is replaced in the next sweep.
void sweep_periodically(
	boost::asio::steady_timer& timer,
	redis::Pool& pool,
	const boost::asio::ip::tcp::endpoint& remote,
	const ExpiryCollector& gc,
	std::chrono::seconds interval
)
{
	auto next = [&timer, &pool, &remote, &gc, interval]
	{
		timer.expires_after(interval);
		timer.async_wait([&timer, &pool, &remote, &gc, interval](boost::system::error_code ec)
		{
			if (!ec)
				sweep_periodically(timer, pool, remote, gc, interval);
		});
	};

	std::shared_ptr<redis::Connection> db;
	try
	{
		db = alloc_connection(pool, remote);
	}
	catch (RedisConnectError& e)
	{
		Log(LOG_WARNING, "sweep skipped: %1%. Retry in %2% seconds.", summary(e), interval.count());
		next();
		return;
	}

	gc.sweep(*db, Timestamp::now(), [db, next](SweepResult result, std::error_code ec)
	{
		log_sweep(result, ec);
		next();
	});
}

int list_tasks(boost::asio::io_context& ioc, redis::Connection& db, const std::string& owner)
{
	TaskFilter all;
	all.include_deleted = true;
	all.limit = 0;

	int result = EXIT_FAILURE;
	TaskQuery{owner}.list(db, all, [&result](std::vector<Task> tasks, std::error_code ec)
	{
		if (ec)
		{
			std::cerr << "cannot list tasks: " << ec.message() << std::endl;
			return;
		}

		std::cout << nlohmann::json(tasks).dump(4) << std::endl;
		result = EXIT_SUCCESS;
	});

	ioc.run();
	return result;
}

int sweep_once(boost::asio::io_context& ioc, redis::Connection& db)
{
	int result = EXIT_FAILURE;
	ExpiryCollector gc;
	gc.sweep(db, Timestamp::now(), [&result](SweepResult sweep, std::error_code ec)
	{
		log_sweep(sweep, ec);
		std::cout << sweep.erased << " expired tasks erased" << std::endl;
		if (!ec && sweep.failed == 0)
			result = EXIT_SUCCESS;
	});

	ioc.run();
	return result;
}

int run(const Configuration& cfg)
{
	boost::asio::io_context ioc;
	auto pool = std::make_shared<redis::Pool>(ioc, cfg.redis());

	std::string owner;
	if (cfg.list([&owner](auto&& o){owner = o;}))
		return list_tasks(ioc, *alloc_connection(*pool, cfg.redis()), owner);

	if (cfg.sweep_once())
		return sweep_once(ioc, *alloc_connection(*pool, cfg.redis()));

	// Fail early if redis is not reachable at all. The connection goes
	// back to the pool for the first sweep.
	alloc_connection(*pool, cfg.redis());

	Log(LOG_NOTICE, "task_keeper (version %1%) starting. Sweep every %2% seconds.",
		constants::version, cfg.sweep_interval().count());

	ExpiryCollector gc;
	boost::asio::steady_timer timer{ioc};
	auto remote = cfg.redis();

	boost::asio::signal_set signals{ioc, SIGINT, SIGTERM};
	signals.async_wait([&ioc](boost::system::error_code ec, int signal)
	{
		if (!ec)
		{
			Log(LOG_NOTICE, "received signal %1%. Quitting.", signal);
			ioc.stop();
		}
	});

	sweep_periodically(timer, *pool, remote, gc, cfg.sweep_interval());
	ioc.run();
	return EXIT_SUCCESS;
}

} // end of namespace

int main(int argc, char *argv[])
{
	using namespace tkr;
	try
	{
		Configuration cfg{argc, argv, ::getenv("TASK_KEEPER_CONFIG")};
		if (cfg.help())
		{
			cfg.usage(std::cout);
			std::cout << "\n";
			return EXIT_SUCCESS;
		}

		// one-shot commands are run from a terminal
		open_log("task_keeper", cfg.sweep_once() || cfg.list([](auto&&){}));

		return run(cfg);
	}
	catch (RedisConnectError& e)
	{
		Log(LOG_CRIT, "cannot start: %1%", summary(e));
		return EXIT_FAILURE;
	}
	catch (Exception& e)
	{
		Log(LOG_CRIT, "Uncaught boost::exception: %1%", boost::diagnostic_information(e));
		return EXIT_FAILURE;
	}
	catch (std::exception& e)
	{
		Log(LOG_CRIT, "Uncaught std::exception: %1%", e.what());
		return EXIT_FAILURE;
	}
}
