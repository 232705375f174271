/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/3/20.
//

#include "Error.hh"

#include <string>

namespace tkr {

ErrorClass classify(Error err)
{
	switch (err)
	{
		case Error::invalid_task_id:
		case Error::invalid_owner:
		case Error::empty_description:
		case Error::description_too_long:
		case Error::invalid_description_encoding:
		case Error::invalid_filter:
		case Error::invalid_category_name:
			return ErrorClass::validation;

		case Error::task_not_found:
		case Error::category_not_found:
			return ErrorClass::not_found;

		case Error::task_exists:
		case Error::task_not_deleted:
		case Error::task_already_deleted:
		case Error::same_category_name:
		case Error::category_renamed:
		case Error::restore_window_expired:
			return ErrorClass::conflict;

		default:
			return ErrorClass::storage;
	}
}

const std::error_category& tkr_error_category()
{
	struct Cat : std::error_category
	{
		Cat() = default;
		const char *name() const noexcept override { return "tkr"; }

		std::string message(int ev) const override
		{
			switch (static_cast<Error>(ev))
			{
				case Error::ok: return "no error";
				case Error::invalid_task_id: return "task ID cannot be empty";
				case Error::invalid_owner: return "owner ID cannot be empty";
				case Error::empty_description: return "task description cannot be empty";
				case Error::description_too_long: return "task description cannot exceed 10000 characters";
				case Error::invalid_description_encoding: return "task description is not valid UTF-8";
				case Error::invalid_filter: return "invalid task filter";
				case Error::invalid_category_name: return "category name cannot be empty";
				case Error::task_not_found: return "task not found";
				case Error::category_not_found: return "category not found";
				case Error::task_exists: return "task already exists";
				case Error::task_not_deleted: return "task is not deleted";
				case Error::task_already_deleted: return "task is already deleted";
				case Error::same_category_name: return "new category name must be different";
				case Error::category_renamed: return "category has already been renamed";
				case Error::restore_window_expired: return "task cannot be restored after 7 days";
				case Error::redis_command_error: return "redis command error";
				default: return "unknown error " + std::to_string(ev);
			}
		}

		std::error_condition default_error_condition(int ev) const noexcept override
		{
			return ev == 0 ? std::error_condition{} : make_error_condition(classify(static_cast<Error>(ev)));
		}
	};
	static const Cat cat;
	return cat;
}

const std::error_category& tkr_error_class_category()
{
	struct Cat : std::error_category
	{
		Cat() = default;
		const char *name() const noexcept override { return "tkr-class"; }

		std::string message(int ev) const override
		{
			switch (static_cast<ErrorClass>(ev))
			{
				case ErrorClass::validation: return "validation error";
				case ErrorClass::not_found: return "not found";
				case ErrorClass::conflict: return "conflict";
				case ErrorClass::storage: return "storage error";
				default: return "unknown error class " + std::to_string(ev);
			}
		}

		bool equivalent(const std::error_code& code, int condition) const noexcept override
		{
			if (!code)
				return false;

			// Everything outside our own category comes from the store or
			// the network underneath it.
			if (code.category() != tkr_error_category())
				return static_cast<ErrorClass>(condition) == ErrorClass::storage;

			return classify(static_cast<Error>(code.value())) == static_cast<ErrorClass>(condition);
		}
	};
	static const Cat cat;
	return cat;
}

std::error_code make_error_code(Error err)
{
	return std::error_code(static_cast<int>(err), tkr_error_category());
}

std::error_condition make_error_condition(ErrorClass cls)
{
	return std::error_condition(static_cast<int>(cls), tkr_error_class_category());
}

} // end of namespace
