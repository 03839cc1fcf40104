/*

Copyright (c) 2017-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "igd/operation_future.hpp"
#include "test.hpp"

#include <boost/asio/error.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace igd;

IGD_TEST(first_completion_wins)
{
	operation_promise<int> p;
	operation_future<int> f = p.get_future();
	TEST_CHECK(f.valid());
	TEST_CHECK(!f.is_ready());

	int calls = 0;
	f.on_complete([&](operation_result<int> const& r)
	{
		++calls;
		TEST_EQUAL(std::get<int>(r), 7);
	});

	TEST_CHECK(p.set_value(7));
	TEST_CHECK(!p.set_value(8));
	TEST_CHECK(!p.set_fault(501, "Action Failed"));
	TEST_CHECK(!p.set_failure(boost::asio::error::timed_out));

	TEST_CHECK(f.is_ready());
	TEST_CHECK(p.is_complete());
	TEST_EQUAL(calls, 1);
	TEST_EQUAL(f.get(), 7);
	// reading the result doesn't consume it
	TEST_EQUAL(f.get(), 7);
}

IGD_TEST(callback_after_completion)
{
	operation_promise<std::string> p;
	p.set_value("10.0.0.1");

	int calls = 0;
	p.get_future().on_complete([&](operation_result<std::string> const& r)
	{
		++calls;
		TEST_EQUAL(std::get<std::string>(r), "10.0.0.1");
	});
	TEST_EQUAL(calls, 1);
}

IGD_TEST(get_throws_fault)
{
	operation_promise<int> p;
	p.set_fault(718, "ConflictInMappingEntry");
	operation_future<int> const f = p.get_future();

	TEST_CHECK(std::holds_alternative<upnp_fault>(f.result()));
	try
	{
		f.get();
		TEST_ERROR("get() did not throw");
	}
	catch (mapping_error const& e)
	{
		TEST_EQUAL(e.code(), error_code(upnp_errors::port_mapping_conflict));
		TEST_EQUAL(e.description(), "ConflictInMappingEntry");
	}

	error_code ec;
	TEST_EQUAL(f.get(ec), 0);
	TEST_EQUAL(ec, error_code(718, upnp_category()));
}

IGD_TEST(get_throws_transport_failure)
{
	operation_promise<int> p;
	p.set_failure(boost::asio::error::connection_refused);
	operation_future<int> const f = p.get_future();

	TEST_CHECK(std::holds_alternative<transport_failure>(f.result()));
	TEST_THROW(f.get());

	error_code ec;
	f.get(ec);
	TEST_EQUAL(ec, error_code(boost::asio::error::connection_refused));

	try { f.get(); }
	catch (mapping_error const& e)
	{
		// without a message, the error's own message is used
		TEST_EQUAL(e.description(), ec.message());
	}
}

IGD_TEST(get_ec_clears)
{
	operation_promise<int> p;
	p.set_value(3);
	error_code ec = errors::invalid_url;
	TEST_EQUAL(p.get_future().get(ec), 3);
	TEST_CHECK(!ec);
}

IGD_TEST(wait_for_times_out)
{
	operation_promise<int> p;
	operation_future<int> const f = p.get_future();
	TEST_CHECK(!f.wait_for(std::chrono::milliseconds(10)));
	p.set_value(1);
	TEST_CHECK(f.wait_for(std::chrono::milliseconds(10)));
}

IGD_TEST(many_waiters)
{
	operation_promise<int> p;
	operation_future<int> const f = p.get_future();

	std::atomic<int> sum{0};
	std::vector<std::thread> waiters;
	for (int i = 0; i < 8; ++i)
	{
		// each waiter holds its own copy of the future
		waiters.emplace_back([f, &sum] { sum += f.get(); });
	}

	std::this_thread::sleep_for(std::chrono::milliseconds(20));
	p.set_value(5);
	for (auto& t : waiters) t.join();
	TEST_EQUAL(sum.load(), 40);
}

IGD_TEST(racing_completions)
{
	// many threads attempting to complete the same operation. Exactly one
	// succeeds and callbacks run once
	for (int round = 0; round < 20; ++round)
	{
		operation_promise<int> p;
		std::atomic<int> calls{0};
		p.get_future().on_complete([&](operation_result<int> const&) { ++calls; });

		std::atomic<int> winners{0};
		std::vector<std::thread> threads;
		for (int i = 0; i < 4; ++i)
		{
			threads.emplace_back([&p, &winners, i]
			{
				if (i % 2 == 0 ? p.set_value(i) : p.set_fault(501, "Action Failed"))
					++winners;
			});
		}
		for (auto& t : threads) t.join();

		TEST_EQUAL(winners.load(), 1);
		TEST_EQUAL(calls.load(), 1);
	}
}

IGD_TEST(default_constructed)
{
	operation_future<int> f;
	TEST_CHECK(!f.valid());
}
