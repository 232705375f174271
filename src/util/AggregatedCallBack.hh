/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/6/20.
//

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <system_error>
#include <utility>

namespace tkr {

/// \brief  Join the completions of a number of pipelined redis commands.
///
/// Each reply handler holds a shared_ptr to the same AggregatedCallBack and
/// calls it exactly once with its own error code. When the last one arrives
/// the wrapped callback is invoked with the first error reported, or a
/// default-constructed error_code if all of them succeeded.
template <typename Callback>
class AggregatedCallBack
{
public:
	AggregatedCallBack(Callback&& callback, std::size_t expected_count) :
		m_callback{std::move(callback)},
		m_expected_count{expected_count}
	{
	}

	void operator()(std::error_code ec)
	{
		if (ec && !m_first_error)
			m_first_error = ec;

		if (++m_count == m_expected_count)
			std::invoke(m_callback, m_first_error);
	}

private:
	Callback        m_callback;
	std::size_t     m_expected_count;
	std::size_t     m_count{0};
	std::error_code m_first_error;
};

template <typename Callback>
auto make_shared_callback(Callback&& callback, std::size_t expected_count)
{
	return std::make_shared<AggregatedCallBack<std::decay_t<Callback>>>(
		std::forward<Callback>(callback), expected_count
	);
}

} // end of namespace tkr
