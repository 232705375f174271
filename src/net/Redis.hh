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


#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/buffer.hpp>

#include <hiredis/hiredis.h>

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace tkr::redis {

// Error enum
enum class Error
{
	ok = REDIS_OK,
	io = REDIS_ERR_IO,
	eof = REDIS_ERR_EOF,
	protocol = REDIS_ERR_PROTOCOL,
	oom = REDIS_ERR_OOM,
	other = REDIS_ERR_OTHER,

	// other logical errors
	command_error = 1000,
	field_not_found,
	disconnected
};

std::error_code make_error_code(Error err);
const std::error_category& redis_error_category();

}

namespace std
{
	template <> struct is_error_code_enum<tkr::redis::Error> : true_type {};
}

namespace tkr::redis {

namespace detail {
template <typename T, std::size_t>
using Repeat = T;
}

class Reply
{
public:
	explicit Reply(redisReply *r = nullptr) noexcept;
	Reply(const Reply&) = default;
	Reply(Reply&& other) = default ;
	~Reply() = default;

	Reply& operator=(const Reply&) = default;
	Reply& operator=(Reply&& other) = default ;
	void swap(Reply& other) noexcept ;

	using iterator = std::vector<Reply>::const_iterator;
	using const_iterator = std::vector<Reply>::const_iterator;
	[[nodiscard]] iterator begin() const;
	[[nodiscard]] iterator end() const;

	[[nodiscard]] bool is_string() const {return m_reply && m_reply->type == REDIS_REPLY_STRING;}
	[[nodiscard]] bool is_nil() const {return m_reply && m_reply->type == REDIS_REPLY_NIL;}
	[[nodiscard]] bool is_error() const {return m_reply && m_reply->type == REDIS_REPLY_ERROR;}

	[[nodiscard]] std::string_view as_string() const noexcept;
	[[nodiscard]] std::string_view as_status() const noexcept;
	[[nodiscard]] std::string_view as_error() const noexcept;
	[[nodiscard]] std::string_view as_any_string() const noexcept;
	[[nodiscard]] int type() const noexcept {return m_reply ? m_reply->type : 0;}

	explicit operator bool() const noexcept ;

	[[nodiscard]] long long as_int() const noexcept;
	[[nodiscard]] long long to_int() const noexcept;

	[[nodiscard]] Reply as_array(std::size_t i) const noexcept;
	[[nodiscard]] Reply as_array(std::size_t i, std::error_code& ec) const noexcept;
	[[nodiscard]] Reply operator[](std::size_t i) const noexcept;
	[[nodiscard]] std::size_t array_size() const noexcept;

	/// Look up the values of an HGETALL-style key/value array. Returns a
	/// tuple of replies, one for each field in the parameter list. Missing
	/// fields are empty replies.
	template <typename... Field>
	auto map_kv_pair(Field... fields) const
	{
		return map_kv_pair_impl(std::index_sequence_for<Field...>{}, fields...);
	}

	/// Return a tuple of the first \a count replies in the array.
	template <std::size_t count>
	auto as_tuple(std::error_code& ec) const
	{
		return as_tuple_impl(ec, std::make_index_sequence<count>{});
	}

private:
	template <std::size_t... index, typename... Field>
	auto map_kv_pair_impl(std::index_sequence<index...>, Field... fields) const
	{
		std::tuple<detail::Repeat<Reply, index>...> result;
		for (auto i = 0U; i+1 < array_size() ; i += 2)
		{
			auto name = as_array(i).as_string();

			// only the first matching field is assigned
			(void)((name == fields ? (std::get<index>(result) = as_array(i+1), true) : false) || ...);
		}
		return result;
	}

	template <std::size_t... index>
	auto as_tuple_impl(std::error_code& ec, std::index_sequence<index...>) const
	{
		return std::make_tuple(as_array(index, ec)...);
	}

private:
	std::shared_ptr<::redisReply> m_reply;

	// If m_reply represents an array, each element in the "element" array in redisReply
	// will be moved to m_array.
	std::vector<Reply> m_array;
};

class ReplyReader
{
public:
	enum class Result {ok, error, not_ready};

public:
	ReplyReader() = default;
	ReplyReader(ReplyReader&&) = default;
	ReplyReader(const ReplyReader&) = delete;
	~ReplyReader() = default;
	ReplyReader& operator=(ReplyReader&&) = default;
	ReplyReader& operator=(const ReplyReader&) = delete;

	void feed(const char *data, std::size_t size);
	std::tuple<Reply, Result> get();

private:
	struct Deleter {void operator()(::redisReader*) const noexcept; };
	std::unique_ptr<::redisReader, Deleter> m_reader{::redisReaderCreate()};
};

class CommandString
{
public:
	CommandString() = default;

	/// The first argument MUST be the command string. For security
	/// reason, this class does not accept std::string and const char*.
	/// It expects a hard-coded string literal. Arguments from users
	/// must be passed with "%b".
	template <std::size_t N, typename... Args>
	explicit CommandString(const char (&cmd)[N], Args... args) :
		m_length{::redisFormatCommand(&m_cmd, cmd, args...)}
	{
		if (m_length < 0)
			throw std::logic_error("invalid command string");
	}
	CommandString(CommandString&& other) noexcept ;
	CommandString(const CommandString&) = delete;
	~CommandString();
	CommandString& operator=(CommandString&& other) noexcept ;
	CommandString& operator=(const CommandString&) = delete;

	void swap(CommandString& other) noexcept ;

	[[nodiscard]] auto get() const {return m_cmd;}
	[[nodiscard]] auto length() const {return static_cast<std::size_t>(m_length);}
	[[nodiscard]] auto buffer() const {return boost::asio::buffer(m_cmd, length());}
	[[nodiscard]] std::string_view str() const {return {m_cmd, length()};}

private:
	char    *m_cmd{};
	int     m_length{};
};

class Connection;

/// Connect to a redis server without a pool. The socket is closed when the
/// last reference to the returned connection goes away.
std::shared_ptr<Connection> connect(
	boost::asio::io_context& ioc,
	const boost::asio::ip::tcp::endpoint& remote = boost::asio::ip::tcp::endpoint{
		boost::asio::ip::make_address("127.0.0.1"),
		6379
	}
);

class PoolBase
{
public:
	virtual ~PoolBase() = default;
	virtual void dealloc(boost::asio::ip::tcp::socket socket) = 0;
};

/// A pipelined connection to the redis server. Commands are written to the
/// socket in the order they are issued and their callbacks are invoked in
/// the same order when the replies arrive.
class Connection : public std::enable_shared_from_this<Connection>
{
public:
	using Completion = std::function<void(Reply, std::error_code)>;

public:
	Connection(std::weak_ptr<PoolBase> parent, boost::asio::ip::tcp::socket socket);

	Connection(Connection&&) = delete;
	Connection(const Connection&) = delete;
	~Connection();

	Connection& operator=(Connection&&) = delete;
	Connection& operator=(const Connection&) = delete;

	template <typename Callback, std::size_t N, typename... Args>
	std::enable_if_t<std::is_invocable_v<Callback, Reply, std::error_code>>
	command(Callback&& callback, const char (&cmd)[N], Args... args)
	{
		CommandString str;
		try
		{
			str = CommandString{cmd, args...};
		}
		catch (std::logic_error&)
		{
			callback(Reply{}, std::error_code{Error::protocol});
			return;
		}
		command(std::forward<Callback>(callback), std::move(str));
	}

	template <typename Callback>
	std::enable_if_t<std::is_invocable_v<Callback, Reply, std::error_code>>
	command(Callback&& callback, CommandString&& cmd)
	{
		do_write(std::move(cmd), wrap(std::forward<Callback>(callback)));
	}

	/// Fire-and-forget. The reply is discarded.
	template <std::size_t N, typename... Args>
	void command(const char (&cmd)[N], Args... args)
	{
		command([](auto&&, auto){}, cmd, args...);
	}

	void disconnect();
	[[nodiscard]] bool is_open() const {return m_socket.is_open();}

private:
	// Only copy-constructible callbacks can be stored in std::function.
	// Move-only callbacks are kept in a shared_ptr instead.
	template <typename Callback>
	Completion wrap(Callback&& callback)
	{
		using C = std::decay_t<Callback>;
		if constexpr (std::is_copy_constructible_v<C>)
			return [cb=std::forward<Callback>(callback), self=shared_from_this()](Reply r, std::error_code ec) mutable
			{
				cb(std::move(r), ec);
			};
		else
			return [cb=std::make_shared<C>(std::forward<Callback>(callback)), self=shared_from_this()](Reply r, std::error_code ec)
			{
				(*cb)(std::move(r), ec);
			};
	}

	void do_write(CommandString&& cmd, Completion&& completion);
	void write_next();
	void do_read();
	void on_read(boost::system::error_code ec, std::size_t bytes);

	// must not call disconnect() inside the callbacks in m_callbacks
	void fail_all(std::error_code ec);

private:
	struct Pending
	{
		CommandString   cmd;
		Completion      completion;
	};

	boost::asio::ip::tcp::socket m_socket;

	char m_read_buf[8*1024]{};

	// commands not yet written to the socket
	std::deque<Pending>     m_write_queue;

	// commands written and waiting for replies
	std::deque<Completion>  m_callbacks;
	bool m_reading{false};

	ReplyReader m_reader;
	std::weak_ptr<PoolBase> m_parent;
};

/// A pool of sockets connected to the same redis server. Sockets of destroyed
/// connections are returned to the pool and reused by the next alloc().
class Pool : public PoolBase, public std::enable_shared_from_this<Pool>
{
public:
	Pool(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& remote);

	std::shared_ptr<Connection> alloc();
	void dealloc(boost::asio::ip::tcp::socket socket) override;

	[[nodiscard]] std::size_t idle() const;

private:
	boost::asio::ip::tcp::socket get_sock();

private:
	boost::asio::io_context&                    m_ioc;
	boost::asio::ip::tcp::endpoint              m_remote;
	std::vector<boost::asio::ip::tcp::socket>   m_socks;

	mutable std::mutex  m_mx;
};

} // end of namespace
