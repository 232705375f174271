/*
	Copyright © 2020 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the task_keeper
    distribution for more details.
*/

//
// Created by nestal on 6/5/20.
//

#include <catch2/catch.hpp>

#include "tkr/TaskIndex.hh"
#include "tkr/TaskIndex.ipp"
#include "tkr/RedisKeys.hh"
#include "tkr/Task.hh"
#include "TestStore.hh"

#include "net/Redis.hh"

using namespace tkr;
using namespace std::chrono_literals;

namespace {

auto expect_ok(int& tested)
{
	return [&tested](std::error_code ec)
	{
		INFO("error = " << ec << " " << ec.message());
		REQUIRE_FALSE(ec);
		tested++;
	};
}

auto expect_error(int& tested, Error expected)
{
	return [&tested, expected](std::error_code ec)
	{
		INFO("error = " << ec << " " << ec.message());
		REQUIRE(ec == expected);
		tested++;
	};
}

} // end of local namespace

TEST_CASE("create task adds it to all indices", "[normal]")
{
	boost::asio::io_context ioc;
	auto redis = redis::connect(ioc);

	auto owner = random_owner();
	TaskIndex subject{owner};
	REQUIRE(subject.owner() == owner);

	auto work = Task::create(owner, "write report", "work", test_epoch());
	auto misc = Task::create(owner, "call mum", "", test_epoch() + 1s);

	int tested = 0;
	subject.create(*redis, work, expect_ok(tested));
	subject.create(*redis, misc, expect_ok(tested));

	inspect(*redis, owner, work.id, "work", [&tested](auto& state)
	{
		REQUIRE(state.record_exists);
		REQUIRE(state.active());
		REQUIRE(*state.active_score == test_epoch().time_since_epoch().count());
		REQUIRE(state.category_listed);
		REQUIRE(state.in_category);
		tested++;
	});
	inspect(*redis, owner, misc.id, "", [&tested](auto& state)
	{
		REQUIRE(state.record_exists);
		REQUIRE(state.active());

		// uncategorized tasks do not create an empty category
		REQUIRE_FALSE(state.category_listed);
		REQUIRE_FALSE(state.in_category);
		tested++;
	});
	load(*redis, work.id, [&tested, &work](auto&& task)
	{
		REQUIRE(task.has_value());
		REQUIRE(*task == work);
		tested++;
	});

	REQUIRE(ioc.run_for(10s) > 0);
	REQUIRE(tested == 5);
}

TEST_CASE("invalid tasks are rejected before touching redis", "[error]")
{
	boost::asio::io_context ioc;
	auto redis = redis::connect(ioc);

	auto owner = random_owner();
	auto task  = Task::create(owner, "something", "work", test_epoch());

	int tested = 0;
	SECTION("empty description")
	{
		task.description = " ";
		TaskIndex{owner}.create(*redis, task, expect_error(tested, Error::empty_description));
	}
	SECTION("task of another owner")
	{
		TaskIndex{random_owner()}.create(*redis, task, expect_error(tested, Error::invalid_owner));
	}
	SECTION("empty owner")
	{
		TaskIndex{""}.soft_delete(*redis, task.id, test_epoch(), expect_error(tested, Error::invalid_owner));
	}
	SECTION("empty task ID")
	{
		TaskIndex{owner}.restore(*redis, "  ", test_epoch(), expect_error(tested, Error::invalid_task_id));
	}

	// the callback is invoked immediately without waiting for redis
	REQUIRE(tested == 1);

	inspect(*redis, owner, task.id, "work", [&tested](auto& state)
	{
		REQUIRE_FALSE(state.record_exists);
		REQUIRE_FALSE(state.in_active_set);
		REQUIRE_FALSE(state.category_listed);
		tested++;
	});
	REQUIRE(ioc.run_for(10s) > 0);
	REQUIRE(tested == 2);
}

TEST_CASE("task IDs cannot be reused", "[error]")
{
	boost::asio::io_context ioc;
	auto redis = redis::connect(ioc);

	auto owner = random_owner();
	TaskIndex subject{owner};
	auto task = Task::create(owner, "original", "", test_epoch());

	int tested = 0;
	subject.create(*redis, task, expect_ok(tested));

	auto copy = task;
	copy.description = "overwritten";
	subject.create(*redis, copy, [&tested](std::error_code ec)
	{
		REQUIRE(ec == Error::task_exists);
		REQUIRE(ec == ErrorClass::conflict);
		tested++;
	});
	load(*redis, task.id, [&tested](auto&& loaded)
	{
		REQUIRE(loaded.has_value());
		REQUIRE(loaded->description == "original");
		tested++;
	});

	REQUIRE(ioc.run_for(10s) > 0);
	REQUIRE(tested == 3);
}

TEST_CASE("set completion changes the task hash only", "[normal]")
{
	boost::asio::io_context ioc;
	auto redis = redis::connect(ioc);

	auto owner = random_owner();
	TaskIndex subject{owner};
	auto task = Task::create(owner, "read book", "home", test_epoch());

	int tested = 0;
	subject.create(*redis, task, expect_ok(tested));
	subject.set_completion(*redis, task.id, true, test_epoch() + 1h, expect_ok(tested));

	load(*redis, task.id, [&tested, &task](auto&& loaded)
	{
		REQUIRE(loaded.has_value());
		REQUIRE(loaded->completed);
		REQUIRE(loaded->updated == test_epoch() + 1h);
		REQUIRE(loaded->created == task.created);
		REQUIRE(loaded->description == task.description);
		tested++;
	});
	inspect(*redis, owner, task.id, "home", [&tested](auto& state)
	{
		REQUIRE(state.active());
		REQUIRE(state.in_category);
		tested++;
	});

	subject.set_completion(*redis, task.id, false, test_epoch() + 2h, expect_ok(tested));
	load(*redis, task.id, [&tested](auto&& loaded)
	{
		REQUIRE(loaded.has_value());
		REQUIRE_FALSE(loaded->completed);
		tested++;
	});

	REQUIRE(ioc.run_for(10s) > 0);
	REQUIRE(tested == 6);
}

TEST_CASE("tasks of other owners are not found", "[error]")
{
	boost::asio::io_context ioc;
	auto redis = redis::connect(ioc);

	auto owner = random_owner();
	auto task  = Task::create(owner, "private", "secret", test_epoch());

	int tested = 0;
	TaskIndex{owner}.create(*redis, task, expect_ok(tested));

	TaskIndex intruder{random_owner()};
	intruder.set_completion(*redis, task.id, true, test_epoch(), expect_error(tested, Error::task_not_found));
	intruder.soft_delete(*redis, task.id, test_epoch(), expect_error(tested, Error::task_not_found));
	intruder.restore(*redis, task.id, test_epoch(), expect_error(tested, Error::task_not_found));
	intruder.rename_category(*redis, "secret", "mine", test_epoch(), expect_error(tested, Error::category_not_found));
	intruder.delete_category(*redis, "secret", test_epoch(), expect_error(tested, Error::category_not_found));

	// same as a task that does not exist at all
	TaskIndex{owner}.soft_delete(*redis, Task::generate_id(), test_epoch(), expect_error(tested, Error::task_not_found));

	inspect(*redis, owner, task.id, "secret", [&tested](auto& state)
	{
		REQUIRE(state.active());
		REQUIRE(state.category_listed);
		REQUIRE(state.in_category);
		tested++;
	});
	load(*redis, task.id, [&tested](auto&& loaded)
	{
		REQUIRE(loaded.has_value());
		REQUIRE_FALSE(loaded->completed);
		REQUIRE(loaded->category == "secret");
		tested++;
	});

	REQUIRE(ioc.run_for(10s) > 0);
	REQUIRE(tested == 9);
}

TEST_CASE("soft delete moves task to deleted set", "[normal]")
{
	boost::asio::io_context ioc;
	auto redis = redis::connect(ioc);

	auto owner = random_owner();
	TaskIndex subject{owner};
	auto task = Task::create(owner, "old stuff", "garage", test_epoch());

	int tested = 0;
	subject.create(*redis, task, expect_ok(tested));
	subject.soft_delete(*redis, task.id, test_epoch() + 1h, expect_ok(tested));

	inspect(*redis, owner, task.id, "garage", [&tested](auto& state)
	{
		REQUIRE(state.record_exists);
		REQUIRE(state.deleted());
		REQUIRE(*state.deleted_score == (test_epoch() + 1h).time_since_epoch().count());

		// the category stays even if it has no more active tasks
		REQUIRE(state.category_listed);
		REQUIRE_FALSE(state.in_category);
		tested++;
	});
	load(*redis, task.id, [&tested](auto&& loaded)
	{
		REQUIRE(loaded.has_value());
		REQUIRE(loaded->is_deleted());
		REQUIRE(*loaded->deleted == test_epoch() + 1h);
		REQUIRE(loaded->updated == test_epoch() + 1h);
		REQUIRE(loaded->category == "garage");
		tested++;
	});

	// deleting twice is a conflict and does not change the deletion time
	subject.soft_delete(*redis, task.id, test_epoch() + 2h, [&tested](std::error_code ec)
	{
		REQUIRE(ec == Error::task_already_deleted);
		REQUIRE(ec == ErrorClass::conflict);
		tested++;
	});
	inspect(*redis, owner, task.id, "garage", [&tested](auto& state)
	{
		REQUIRE(*state.deleted_score == (test_epoch() + 1h).time_since_epoch().count());
		tested++;
	});

	REQUIRE(ioc.run_for(10s) > 0);
	REQUIRE(tested == 6);
}

TEST_CASE("restore puts task back to its original position", "[normal]")
{
	boost::asio::io_context ioc;
	auto redis = redis::connect(ioc);

	auto owner = random_owner();
	TaskIndex subject{owner};
	auto task = Task::create(owner, "come back", "work", test_epoch());
	task.completed = true;

	int tested = 0;
	subject.create(*redis, task, expect_ok(tested));

	SECTION("restore an active task")
	{
		subject.restore(*redis, task.id, test_epoch() + 1h, [&tested](std::error_code ec)
		{
			REQUIRE(ec == Error::task_not_deleted);
			REQUIRE(ec == ErrorClass::conflict);
			tested++;
		});
		REQUIRE(ioc.run_for(10s) > 0);
		REQUIRE(tested == 2);
	}
	SECTION("delete and restore")
	{
		subject.soft_delete(*redis, task.id, test_epoch() + 1h, expect_ok(tested));
		subject.restore(*redis, task.id, test_epoch() + 2h, expect_ok(tested));

		inspect(*redis, owner, task.id, "work", [&tested](auto& state)
		{
			REQUIRE(state.active());

			// score is the creation time, not the restoration time
			REQUIRE(*state.active_score == test_epoch().time_since_epoch().count());
			REQUIRE(state.category_listed);
			REQUIRE(state.in_category);
			tested++;
		});
		load(*redis, task.id, [&tested, task](auto&& loaded)
		{
			REQUIRE(loaded.has_value());
			REQUIRE(loaded->is_active());
			REQUIRE(loaded->updated == test_epoch() + 2h);

			// everything else is the same as before deletion
			auto expected = task;
			expected.updated = loaded->updated;
			REQUIRE(*loaded == expected);
			tested++;
		});

		REQUIRE(ioc.run_for(10s) > 0);
		REQUIRE(tested == 5);
	}
}

TEST_CASE("restore task after its category is renamed", "[normal]")
{
	boost::asio::io_context ioc;
	auto redis = redis::connect(ioc);

	auto owner = random_owner();
	TaskIndex subject{owner};
	auto deleted = Task::create(owner, "deleted", "old", test_epoch());
	auto active  = Task::create(owner, "active", "old", test_epoch());

	int tested = 0;
	subject.create(*redis, deleted, expect_ok(tested));
	subject.create(*redis, active, expect_ok(tested));
	subject.soft_delete(*redis, deleted.id, test_epoch() + 1min, expect_ok(tested));

	// the deleted task is not a member of the category, so it is not renamed
	subject.rename_category(*redis, "old", "new", test_epoch() + 2min, expect_ok(tested));
	subject.restore(*redis, deleted.id, test_epoch() + 3min, expect_ok(tested));

	inspect(*redis, owner, deleted.id, "old", [&tested](auto& state)
	{
		REQUIRE(state.active());

		// the old category is listed again together with its task
		REQUIRE(state.category_listed);
		REQUIRE(state.in_category);
		tested++;
	});
	inspect(*redis, owner, active.id, "new", [&tested](auto& state)
	{
		REQUIRE(state.category_listed);
		REQUIRE(state.in_category);
		tested++;
	});

	REQUIRE(ioc.run_for(10s) > 0);
	REQUIRE(tested == 7);
}

TEST_CASE("rename category", "[normal]")
{
	boost::asio::io_context ioc;
	auto redis = redis::connect(ioc);

	auto owner = random_owner();
	TaskIndex subject{owner};
	auto t1 = Task::create(owner, "one", "work", test_epoch());
	auto t2 = Task::create(owner, "two", "work", test_epoch() + 1s);
	auto t3 = Task::create(owner, "three", "job", test_epoch() + 2s);

	int tested = 0;
	subject.create(*redis, t1, expect_ok(tested));
	subject.create(*redis, t2, expect_ok(tested));
	subject.create(*redis, t3, expect_ok(tested));

	// rename into an existing category merges the two
	subject.rename_category(*redis, "work", "job", test_epoch() + 1h, expect_ok(tested));

	for (auto&& id : {t1.id, t2.id, t3.id})
	{
		inspect(*redis, owner, id, "job", [&tested](auto& state)
		{
			REQUIRE(state.active());
			REQUIRE(state.category_listed);
			REQUIRE(state.in_category);
			tested++;
		});
	}
	inspect(*redis, owner, t1.id, "work", [&tested](auto& state)
	{
		REQUIRE_FALSE(state.category_listed);
		REQUIRE_FALSE(state.in_category);
		tested++;
	});
	load(*redis, t1.id, [&tested](auto&& loaded)
	{
		REQUIRE(loaded->category == "job");
		REQUIRE(loaded->updated == test_epoch() + 1h);
		tested++;
	});
	load(*redis, t3.id, [&tested](auto&& loaded)
	{
		// t3 was already in "job" and is not touched
		REQUIRE(loaded->category == "job");
		REQUIRE(loaded->updated == test_epoch() + 2s);
		tested++;
	});

	// the same rename again is a conflict, because "work" is already "job"
	subject.rename_category(*redis, "work", "job", test_epoch() + 2h, [&tested](std::error_code ec)
	{
		REQUIRE(ec == Error::category_renamed);
		REQUIRE(ec == ErrorClass::conflict);
		tested++;
	});

	// nothing changed by the second rename
	load(*redis, t1.id, [&tested](auto&& loaded)
	{
		REQUIRE(loaded->category == "job");
		REQUIRE(loaded->updated == test_epoch() + 1h);
		tested++;
	});

	// "work" to some other name is still not found
	subject.rename_category(*redis, "work", "office", test_epoch() + 3h, [&tested](std::error_code ec)
	{
		REQUIRE(ec == Error::category_not_found);
		REQUIRE(ec == ErrorClass::not_found);
		tested++;
	});

	REQUIRE(ioc.run_for(10s) > 0);
	REQUIRE(tested == 13);
}

TEST_CASE("bad category names", "[error]")
{
	boost::asio::io_context ioc;
	auto redis = redis::connect(ioc);

	TaskIndex subject{random_owner()};

	int tested = 0;
	subject.rename_category(*redis, "same", "same", test_epoch(), [&tested](std::error_code ec)
	{
		REQUIRE(ec == Error::same_category_name);
		REQUIRE(ec == ErrorClass::conflict);
		tested++;
	});
	subject.rename_category(*redis, "", "new", test_epoch(), expect_error(tested, Error::invalid_category_name));
	subject.rename_category(*redis, "old", " ", test_epoch(), expect_error(tested, Error::invalid_category_name));
	subject.delete_category(*redis, "\t", test_epoch(), [&tested](std::error_code ec)
	{
		REQUIRE(ec == Error::invalid_category_name);
		REQUIRE(ec == ErrorClass::validation);
		tested++;
	});
	REQUIRE(tested == 4);

	subject.rename_category(*redis, "never-used", "new", test_epoch(), expect_error(tested, Error::category_not_found));
	subject.delete_category(*redis, "never-used", test_epoch(), expect_error(tested, Error::category_not_found));

	REQUIRE(ioc.run_for(10s) > 0);
	REQUIRE(tested == 6);
}

TEST_CASE("delete category keeps its tasks", "[normal]")
{
	boost::asio::io_context ioc;
	auto redis = redis::connect(ioc);

	auto owner = random_owner();
	TaskIndex subject{owner};
	auto t1 = Task::create(owner, "one", "errands", test_epoch());
	auto t2 = Task::create(owner, "two", "errands", test_epoch());

	int tested = 0;
	subject.create(*redis, t1, expect_ok(tested));
	subject.create(*redis, t2, expect_ok(tested));
	subject.delete_category(*redis, "errands", test_epoch() + 1h, expect_ok(tested));

	for (auto&& id : {t1.id, t2.id})
	{
		inspect(*redis, owner, id, "errands", [&tested](auto& state)
		{
			REQUIRE(state.record_exists);
			REQUIRE(state.active());
			REQUIRE_FALSE(state.category_listed);
			REQUIRE_FALSE(state.in_category);
			tested++;
		});
		load(*redis, id, [&tested](auto&& loaded)
		{
			REQUIRE(loaded.has_value());
			REQUIRE(loaded->category.empty());
			REQUIRE(loaded->updated == test_epoch() + 1h);
			tested++;
		});
	}

	subject.delete_category(*redis, "errands", test_epoch() + 2h, expect_error(tested, Error::category_not_found));

	REQUIRE(ioc.run_for(10s) > 0);
	REQUIRE(tested == 8);
}

TEST_CASE("dangling category members are dropped on rename", "[error]")
{
	boost::asio::io_context ioc;
	auto redis = redis::connect(ioc);

	auto owner = random_owner();
	TaskIndex subject{owner};
	auto task = Task::create(owner, "real", "list", test_epoch());

	int tested = 0;
	subject.create(*redis, task, expect_ok(tested));

	// a member ID without task hash
	auto ghost   = Task::generate_id();
	auto members = key::category(owner, "list");
	redis->command("SADD %b %b", members.data(), members.size(), ghost.data(), ghost.size());

	subject.rename_category(*redis, "list", "todo", test_epoch() + 1h, expect_ok(tested));

	inspect(*redis, owner, ghost, "todo", [&tested](auto& state)
	{
		// no partial hash is created for the missing task
		REQUIRE_FALSE(state.record_exists);
		REQUIRE_FALSE(state.in_category);
		tested++;
	});
	inspect(*redis, owner, task.id, "todo", [&tested](auto& state)
	{
		REQUIRE(state.in_category);
		tested++;
	});

	REQUIRE(ioc.run_for(10s) > 0);
	REQUIRE(tested == 4);
}
