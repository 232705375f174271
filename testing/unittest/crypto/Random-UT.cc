/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/3/20.
//

#include <catch2/catch.hpp>

#include "crypto/Random.hh"

#include <array>
#include <cstdint>
#include <future>
#include <set>
#include <vector>

using namespace tkr;

TEST_CASE("secure_random() fills buffers larger than one getrandom() call", "[normal]")
{
	std::vector<unsigned char> buf(1024*1024);
	secure_random(buf.data(), buf.size());

	// all zero after 1MB of random bytes is practically impossible
	std::set<unsigned char> distinct(buf.begin(), buf.end());
	REQUIRE(distinct.size() > 200);
}

TEST_CASE("insecure_random() generates different numbers", "[normal]")
{
	std::set<std::uint64_t> values;
	for (int i = 0; i < 100; i++)
		values.insert(insecure_random<std::uint64_t>());
	REQUIRE(values.size() == 100);
}

TEST_CASE("insecure_random() in different threads are seeded differently", "[normal]")
{
	auto fut_arr1 = std::async(std::launch::async, []{return insecure_random_array<std::uint64_t, 4>();});
	auto fut_arr2 = std::async(std::launch::async, []{return insecure_random_array<std::uint64_t, 4>();});

	REQUIRE(fut_arr1.get() != fut_arr2.get());
}
