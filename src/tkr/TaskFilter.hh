/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/5/20.
//

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace tkr {

/// Options for TaskQuery::list().
struct TaskFilter
{
	static constexpr long max_limit = 1000;

	// exact match; unset or empty means all categories
	std::optional<std::string> category;

	// unset means both completed and incomplete tasks
	std::optional<bool> completed;

	bool include_deleted{false};

	// 0 means no limit
	long limit{100};
	long offset{0};

	[[nodiscard]] std::error_code validate() const;

	[[nodiscard]] bool by_category() const {return category.has_value() && !category->empty();}

	/// The [first, last) range of the candidate IDs selected by offset and limit.
	[[nodiscard]] std::pair<std::size_t, std::size_t> window(std::size_t total) const;
};

} // end of namespace tkr
