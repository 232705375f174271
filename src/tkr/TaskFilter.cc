/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/5/20.
//

#include "TaskFilter.hh"

#include "common/Error.hh"

#include <algorithm>

namespace tkr {

std::error_code TaskFilter::validate() const
{
	if (limit < 0 || limit > max_limit || offset < 0)
		return Error::invalid_filter;

	return {};
}

std::pair<std::size_t, std::size_t> TaskFilter::window(std::size_t total) const
{
	auto first = std::min(static_cast<std::size_t>(std::max(offset, 0L)), total);
	auto last  = limit > 0 ? std::min(first + static_cast<std::size_t>(limit), total) : total;
	return {first, last};
}

} // end of namespace tkr
