#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <daas/collection_task.hpp>
#include <daas/error.hpp>

#include "test_util.hpp"

using namespace daas;
using namespace std::chrono_literals;

TEST_CASE("collection_task terminal states", "[task]")
{
   SECTION("work that returns succeeds")
   {
      std::atomic<bool> ran{false};
      collection_task   task("s1", [&](const cancellation_token&) { ran = true; });
      task.join();
      REQUIRE(ran);
      REQUIRE(task.status() == collection_task::state::succeeded);
      REQUIRE(task.error().empty());
      REQUIRE(task.session_id() == "s1");
   }

   SECTION("work that throws fails")
   {
      collection_task task("s1", [](const cancellation_token&)
                           { throw tool_failed_error("collector exited with code 3"); });
      task.join();
      REQUIRE(task.status() == collection_task::state::failed);
      REQUIRE(task.error() == "collector exited with code 3");
   }

   SECTION("work that observes cancellation is canceled")
   {
      collection_task task("s1",
                           [](const cancellation_token& cancel)
                           {
                              while (true)
                              {
                                 cancel.throw_if_canceled();
                                 std::this_thread::sleep_for(1ms);
                              }
                           });
      std::this_thread::sleep_for(10ms);
      REQUIRE(task.status() == collection_task::state::running);
      REQUIRE_FALSE(task.is_terminal());

      task.cancel();
      REQUIRE(task.cancel_requested());
      task.join();
      REQUIRE(task.status() == collection_task::state::canceled);
   }

   SECTION("canceling finished work changes nothing")
   {
      collection_task task("s1", [](const cancellation_token&) {});
      task.join();
      task.cancel();
      REQUIRE(task.status() == collection_task::state::succeeded);
   }
}

TEST_CASE("collection_task destruction cancels and waits", "[task]")
{
   std::atomic<bool> exited{false};
   {
      collection_task task("s1",
                           [&](const cancellation_token& cancel)
                           {
                              while (!cancel.is_canceled())
                                 std::this_thread::sleep_for(1ms);
                              exited = true;
                           });
      REQUIRE(test::wait_until([&]() { return !task.is_terminal(); }));
   }
   REQUIRE(exited);
}

TEST_CASE("collection_task state names", "[task]")
{
   std::ostringstream out;
   out << collection_task::state::running << " " << collection_task::state::succeeded << " "
       << collection_task::state::failed << " " << collection_task::state::canceled;
   REQUIRE(out.str() == "running succeeded failed canceled");
}
