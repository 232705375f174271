/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/3/20.
//

#include "Random.hh"

#include <sys/random.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <random>
#include <system_error>

namespace tkr {

void secure_random(void *buf, std::size_t size)
{
	auto out = static_cast<unsigned char*>(buf);
	while (size > 0)
	{
		auto count = ::getrandom(out, size, 0);
		if (count < 0)
		{
			if (errno == EINTR)
				continue;
			throw std::system_error(errno, std::generic_category());
		}
		out  += count;
		size -= static_cast<std::size_t>(count);
	}
}

void insecure_random(void *buf, std::size_t size)
{
	thread_local std::mt19937_64 gen{secure_random<std::uint64_t>()};

	auto out = static_cast<unsigned char*>(buf);
	while (size > 0)
	{
		auto val = gen();
		auto count = std::min(size, sizeof(val));
		std::memcpy(out, &val, count);
		out  += count;
		size -= count;
	}
}

} // end of namespace tkr
