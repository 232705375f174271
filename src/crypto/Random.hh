/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/3/20.
//

#pragma once

#include <array>
#include <cstddef>
#include <type_traits>

namespace tkr {

void secure_random(void *buf, std::size_t size);
void insecure_random(void *buf, std::size_t size);

template <typename T>
std::enable_if_t<std::is_standard_layout<T>::value, T> secure_random()
{
	T val;
	secure_random(&val, sizeof(val));
	return val;
}

template <typename T>
std::enable_if_t<std::is_standard_layout<T>::value, T> insecure_random()
{
	T val;
	insecure_random(&val, sizeof(val));
	return val;
}

template <typename T, std::size_t size>
std::array<T, size> secure_random_array()
{
	return secure_random<std::array<T, size>>();
}

template <typename T, std::size_t size>
std::array<T, size> insecure_random_array()
{
	return insecure_random<std::array<T, size>>();
}

} // end of namespace tkr
