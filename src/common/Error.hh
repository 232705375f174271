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

#include <system_error>

namespace tkr {

enum class Error
{
	ok,

	// validation
	invalid_task_id,
	invalid_owner,
	empty_description,
	description_too_long,
	invalid_description_encoding,
	invalid_filter,
	invalid_category_name,

	// not found
	task_not_found,
	category_not_found,

	// conflict
	task_exists,
	task_not_deleted,
	task_already_deleted,
	same_category_name,
	category_renamed,
	restore_window_expired,

	// storage
	redis_command_error
};

/// Error classes reported to the transport layer. Use them as error
/// conditions, e.g. `ec == ErrorClass::not_found`. Error codes from other
/// categories (redis, asio) are all storage errors.
enum class ErrorClass
{
	validation = 1,
	not_found,
	conflict,
	storage
};

const std::error_category& tkr_error_category();
const std::error_category& tkr_error_class_category();
std::error_code make_error_code(Error err);
std::error_condition make_error_condition(ErrorClass cls);

ErrorClass classify(Error err);

} // end of namespace tkr

namespace std
{
	template <> struct is_error_code_enum<tkr::Error> : true_type {};
	template <> struct is_error_condition_enum<tkr::ErrorClass> : true_type {};
}
