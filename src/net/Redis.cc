/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/2/20.
//

#include "Redis.hh"

#include "util/Log.hh"

#include <boost/asio/write.hpp>

#include <cassert>

namespace tkr::redis {

std::shared_ptr<Connection> connect(
	boost::asio::io_context& ioc,
	const boost::asio::ip::tcp::endpoint& remote
)
{
	boost::asio::ip::tcp::socket sock{ioc};
	sock.connect(remote);
	return std::make_shared<Connection>(std::weak_ptr<PoolBase>{}, std::move(sock));
}

Connection::Connection(std::weak_ptr<PoolBase> parent, boost::asio::ip::tcp::socket socket) :
	m_socket{std::move(socket)},
	m_parent{std::move(parent)}
{
}

Connection::~Connection()
{
	// Only return healthy sockets with no outstanding replies to the pool.
	// Otherwise the next owner will receive our replies.
	if (auto pool = m_parent.lock(); pool && m_socket.is_open() && m_callbacks.empty() && m_write_queue.empty())
		pool->dealloc(std::move(m_socket));
}

void Connection::do_write(CommandString&& cmd, Completion&& completion)
{
	if (!m_socket.is_open())
	{
		completion(Reply{}, Error::disconnected);
		return;
	}

	m_write_queue.push_back(Pending{std::move(cmd), std::move(completion)});

	// Only one outstanding async_write() is allowed on the socket. The
	// others will be sent by write_next() when it finishes.
	if (m_write_queue.size() == 1)
		write_next();
}

void Connection::write_next()
{
	assert(!m_write_queue.empty());
	async_write(
		m_socket,
		m_write_queue.front().cmd.buffer(),
		[this, self=shared_from_this()](auto ec, std::size_t)
		{
			auto pending = std::move(m_write_queue.front());
			m_write_queue.pop_front();

			if (!ec)
			{
				m_callbacks.push_back(std::move(pending.completion));
				if (!m_reading)
					do_read();

				if (!m_write_queue.empty())
					write_next();
			}
			else
			{
				Log(LOG_WARNING, "Redis write error: %1% (%2%). Disconnecting.", ec, ec.message());
				disconnect();

				// no write is in progress, so the rest of the queue will never be sent
				auto queue = std::move(m_write_queue);
				m_write_queue.clear();

				pending.completion(Reply{}, std::error_code{ec.value(), ec.category()});
				for (auto&& p : queue)
					p.completion(Reply{}, Error::disconnected);
			}
		}
	);
}

void Connection::do_read()
{
	m_reading = true;
	m_socket.async_read_some(
		boost::asio::buffer(m_read_buf),
		[this, self=shared_from_this()](auto ec, auto read){ on_read(ec, read); }
	);
}

void Connection::on_read(boost::system::error_code ec, std::size_t bytes)
{
	m_reading = false;
	if (!ec)
	{
		m_reader.feed(m_read_buf, bytes);

		auto [reply, result] = m_reader.get();

		// Extract all replies from the reader
		while (!m_callbacks.empty() && result == ReplyReader::Result::ok)
		{
			auto completion = std::move(m_callbacks.front());
			m_callbacks.pop_front();
			completion(std::move(reply), {});

			std::tie(reply, result) = m_reader.get();
		}

		if (result == ReplyReader::Result::ok)
			Log(LOG_WARNING, "Redis sends more replies than requested. Ignoring reply.");

		if (result == ReplyReader::Result::error)
		{
			Log(LOG_WARNING, "Redis reply parse error. Disconnecting.");
			fail_all(Error::protocol);
			disconnect();
		}

		// Keep reading until all outstanding commands are finished
		else if (!m_callbacks.empty() && !m_reading)
			do_read();
	}
	else if (ec != boost::asio::error::operation_aborted)
	{
		Log(LOG_WARNING, "Redis read error: %1% (%2%). Disconnecting.", ec, ec.message());
		fail_all(std::error_code{ec.value(), ec.category()});
		disconnect();
	}
	else
		fail_all(Error::disconnected);
}

void Connection::fail_all(std::error_code ec)
{
	auto callbacks = std::move(m_callbacks);
	m_callbacks.clear();
	for (auto&& callback : callbacks)
		callback(Reply{}, ec);
}

void Connection::disconnect()
{
	boost::system::error_code ec;
	m_socket.close(ec);
}

Reply::Reply(::redisReply *r) noexcept :
	m_reply{r, [](::redisReply *r){if (r) ::freeReplyObject(r);}}
{
	// Special handling for arrays
	for (std::size_t i = 0 ; m_reply && m_reply->type == REDIS_REPLY_ARRAY && i < m_reply->elements; i++)
	{
		// Steal the element pointer and assign it to the shared_ptr of
		// our vector. Basically takes the ownership of the array element.
		m_array.emplace_back(m_reply->element[i]);
		m_reply->element[i] = nullptr;
	}
}

void Reply::swap(Reply& other) noexcept
{
	m_reply.swap(other.m_reply);
	m_array.swap(other.m_array);
}

std::string_view Reply::as_string() const noexcept
{
	return (m_reply && m_reply->type == REDIS_REPLY_STRING) ? as_any_string() : std::string_view{};
}

std::string_view Reply::as_status() const noexcept
{
	return (m_reply && m_reply->type == REDIS_REPLY_STATUS) ? as_any_string() : std::string_view{};
}

std::string_view Reply::as_error() const noexcept
{
	return (m_reply && m_reply->type == REDIS_REPLY_ERROR) ? as_any_string() : std::string_view{};
}

std::string_view Reply::as_any_string() const noexcept
{
	return (m_reply && (
		m_reply->type == REDIS_REPLY_STRING ||
		m_reply->type == REDIS_REPLY_STATUS ||
		m_reply->type == REDIS_REPLY_ERROR
	)) ?
		std::string_view{m_reply->str, static_cast<std::size_t>(m_reply->len)} : std::string_view{};
}

Reply Reply::as_array(std::size_t i) const noexcept
{
	return m_reply && m_reply->type == REDIS_REPLY_ARRAY && i < m_array.size() ?
		m_array[i] : Reply{};
}

Reply Reply::as_array(std::size_t i, std::error_code& ec) const noexcept
{
	// If there is already an error, do nothing and because we can't report error.
	if (ec || !m_reply)
		return Reply{};

	if (m_reply->type == REDIS_REPLY_ARRAY && i < m_array.size())
	{
		return m_array[i];
	}
	else
	{
		ec = Error::field_not_found;
		return Reply{};
	}
}

Reply::iterator Reply::begin() const
{
	return m_array.begin();
}

Reply::iterator Reply::end() const
{
	return m_array.end();
}

Reply Reply::operator[](std::size_t i) const noexcept
{
	return as_array(i);
}

std::size_t Reply::array_size() const noexcept
{
	return m_reply && m_reply->type == REDIS_REPLY_ARRAY ? m_array.size() : 0U;
}

long long Reply::as_int() const noexcept
{
	return m_reply && m_reply->type == REDIS_REPLY_INTEGER ? m_reply->integer : 0;
}

Reply::operator bool() const noexcept
{
	return m_reply && m_reply->type != REDIS_REPLY_ERROR;
}

long long Reply::to_int() const noexcept
{
	if (m_reply && m_reply->type == REDIS_REPLY_INTEGER)
		return m_reply->integer;

	auto s = as_any_string();
	long long result = 0;
	for (auto c : s)
	{
		if (c < '0' || c > '9')
			return 0;
		result = result * 10 + (c - '0');
	}
	return result;
}

const std::error_category& redis_error_category()
{
	struct Cat : std::error_category
	{
		const char *name() const noexcept override { return "redis"; }

		std::string message(int ev) const override
		{
			switch (static_cast<Error>(ev))
			{
				case Error::ok: return "success";
				case Error::io: return "IO error";
				case Error::eof: return "EOF error";
				case Error::protocol: return "protocol error";
				case Error::oom: return "out-of-memory error";
				case Error::other: return "other error";
				case Error::command_error: return "command error";
				case Error::field_not_found: return "field not found";
				case Error::disconnected: return "disconnected";
				default: return "unknown error";
			}
		}
	};
	static const Cat cat{};
	return cat;
}

std::error_code make_error_code(Error err)
{
	return std::error_code(static_cast<int>(err), redis_error_category());
}

CommandString::CommandString(CommandString&& other) noexcept
{
	swap(other);
}

CommandString::~CommandString()
{
	if (m_cmd)
		::redisFreeCommand(m_cmd);
}

CommandString& CommandString::operator=(CommandString&& other) noexcept
{
	CommandString tmp{std::move(other)};
	swap(tmp);
	return *this;
}

void CommandString::swap(CommandString& other) noexcept
{
	std::swap(m_cmd, other.m_cmd);
	std::swap(m_length, other.m_length);
}

void ReplyReader::feed(const char *data, std::size_t size)
{
	::redisReaderFeed(m_reader.get(), data, size);
}

std::tuple<Reply, ReplyReader::Result> ReplyReader::get()
{
	::redisReply *reply{};
	auto result = ::redisReaderGetReply(m_reader.get(), reinterpret_cast<void**>(&reply));
	return std::make_tuple(
		Reply{reply},
		result == REDIS_OK ? (reply ? Result::ok : Result::not_ready) : Result::error
	);
}

void ReplyReader::Deleter::operator()(::redisReader *reader) const noexcept
{
	::redisReaderFree(reader);
}

Pool::Pool(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& remote) :
	m_ioc{ioc},
	m_remote{remote}
{
}

boost::asio::ip::tcp::socket Pool::get_sock()
{
	{
		std::unique_lock<std::mutex> lock{m_mx};
		if (!m_socks.empty())
		{
			auto sock = std::move(m_socks.back());
			m_socks.pop_back();
			return sock;
		}
	}

	boost::asio::ip::tcp::socket sock{m_ioc};
	sock.connect(m_remote);

	return sock;
}

std::shared_ptr<Connection> Pool::alloc()
{
	return std::make_shared<Connection>(weak_from_this(), get_sock());
}

void Pool::dealloc(boost::asio::ip::tcp::socket socket)
{
	std::unique_lock<std::mutex> lock{m_mx};
	m_socks.push_back(std::move(socket));
}

std::size_t Pool::idle() const
{
	std::unique_lock<std::mutex> lock{m_mx};
	return m_socks.size();
}

} // end of namespace
