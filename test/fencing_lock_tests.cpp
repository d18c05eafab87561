#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include <daas/debug.hpp>
#include <daas/error.hpp>
#include <daas/fencing_lock.hpp>
#include <daas/file_utils.hpp>

#include "test_util.hpp"

using namespace daas;
using namespace std::chrono_literals;

namespace
{
   lock_config fast_config()
   {
      lock_config cfg;
      cfg.ttl           = 60s;
      cfg.corrupt_grace = 0ms;
      return cfg;
   }
}  // namespace

TEST_CASE("fencing_lock acquire and release", "[lock]")
{
   test::temp_dir dir("lock_basic");
   manual_clock   clk;
   fencing_lock   a(dir.path(), "deployment", "worker-a", fast_config(), clk);
   fencing_lock   b(dir.path(), "deployment", "worker-b", fast_config(), clk);

   REQUIRE_FALSE(a.is_held());
   REQUIRE_FALSE(a.lock_info());

   REQUIRE(a.lock("deploy"));
   REQUIRE(a.is_held());
   REQUIRE(b.is_held());

   SECTION("a second acquirer is refused and changes nothing")
   {
      auto before = read_file(a.record_path());
      REQUIRE_FALSE(b.lock("deploy"));
      REQUIRE_FALSE(a.lock("deploy"));
      REQUIRE(read_file(a.record_path()) == before);
   }

   SECTION("the record names the holder")
   {
      auto info = b.lock_info();
      REQUIRE(info);
      REQUIRE(info->owner_worker == "worker-a");
      REQUIRE(info->owner_pid == current_pid());
      REQUIRE(info->operation == "deploy");
      REQUIRE(info->expires_at == clk.now() + 60s);
   }

   SECTION("release frees the resource for anyone")
   {
      a.release();
      REQUIRE_FALSE(a.is_held());
      REQUIRE_FALSE(std::filesystem::exists(a.lock_dir()));
      REQUIRE(b.lock("deploy"));
      REQUIRE(b.lock_info()->owner_worker == "worker-b");
   }

   SECTION("release does not check the owner")
   {
      b.release();
      REQUIRE_FALSE(a.is_held());
   }

   SECTION("releasing twice is harmless")
   {
      a.release();
      REQUIRE_NOTHROW(a.release());
      REQUIRE_FALSE(a.is_held());
   }
}

TEST_CASE("fencing_lock expiry", "[lock]")
{
   test::temp_dir dir("lock_expiry");
   manual_clock   clk;
   fencing_lock   a(dir.path(), "deployment", "worker-a", fast_config(), clk);
   fencing_lock   b(dir.path(), "deployment", "worker-b", fast_config(), clk);

   REQUIRE(a.lock("deploy"));

   clk.advance(59s);
   REQUIRE(b.is_held());

   SECTION("an expired lock is not held and is deleted by the observer")
   {
      clk.advance(1s);
      REQUIRE_FALSE(b.is_held());
      REQUIRE_FALSE(std::filesystem::exists(a.lock_dir()));
   }

   SECTION("an expired lock can be taken over")
   {
      clk.advance(5min);
      REQUIRE(b.lock("deploy"));
      REQUIRE(a.lock_info()->owner_worker == "worker-b");
      REQUIRE(a.lock_info()->expires_at == clk.now() + 60s);
   }
}

TEST_CASE("fencing_lock corrupt records", "[lock]")
{
   test::temp_dir dir("lock_corrupt");
   manual_clock   clk;
   fencing_lock   l(dir.path(), "deployment", "worker-a", fast_config(), clk);

   std::filesystem::create_directories(l.lock_dir());

   SECTION("a directory without a record is reclaimed")
   {
      REQUIRE_FALSE(l.is_held());
      REQUIRE_FALSE(std::filesystem::exists(l.lock_dir()));
   }

   SECTION("unparseable content is reclaimed")
   {
      write_file_atomic(l.record_path(), "{ not json");
      REQUIRE_FALSE(l.lock_info());
      REQUIRE(l.lock("deploy"));
   }

   SECTION("a record without expiry is reclaimed")
   {
      write_file_atomic(l.record_path(), R"({"heldByWorker":"ghost"})");
      REQUIRE(l.lock("deploy"));
      REQUIRE(l.lock_info()->owner_worker == "worker-a");
   }

   SECTION("a record completed during the grace period is respected")
   {
      lock_config cfg   = fast_config();
      cfg.corrupt_grace = 200ms;
      fencing_lock waiting(dir.path(), "deployment", "worker-b", cfg, clk);

      std::thread writer(
          [&]()
          {
             std::this_thread::sleep_for(50ms);
             lock_record r;
             r.owner_worker = "slow-writer";
             r.operation    = "deploy";
             r.expires_at   = clk.now() + 60s;
             write_file_atomic(l.record_path(), r.to_json());
          });

      REQUIRE_FALSE(waiting.lock("deploy"));
      writer.join();
      REQUIRE(l.lock_info()->owner_worker == "slow-writer");
   }
}

TEST_CASE("fencing_lock concurrent acquirers", "[lock][concurrent]")
{
   test::temp_dir dir("lock_race");

   // a loser that looks between the winner's mkdir and its record write
   // must wait out the grace period instead of reclaiming
   lock_config cfg   = fast_config();
   cfg.corrupt_grace = 500ms;

   constexpr int     num_threads = 8;
   constexpr int     rounds      = 10;
   std::atomic<int>  winners{0};
   std::atomic<bool> go{false};

   for (int round = 0; round < rounds; ++round)
   {
      winners = 0;
      go      = false;
      std::vector<std::thread> threads;
      for (int i = 0; i < num_threads; ++i)
      {
         threads.emplace_back(
             [&, i]()
             {
                set_current_thread_name("acquirer");
                fencing_lock l(dir.path(), "deployment", "worker-" + std::to_string(i), cfg);
                while (!go.load())
                   std::this_thread::yield();
                if (l.lock("race"))
                   ++winners;
             });
      }
      go = true;
      for (auto& t : threads)
         t.join();

      REQUIRE(winners == 1);
      fencing_lock(dir.path(), "deployment", "cleanup").release();
   }
}

TEST_CASE("fencing_lock miscellany", "[lock]")
{
   test::temp_dir dir("lock_misc");
   fencing_lock   l(dir.path(), "deployment", "worker-a", fast_config());

   SECTION("waiting acquisition is not implemented")
   {
      REQUIRE_THROWS_AS(l.lock_async("deploy"), not_implemented_error);
      REQUIRE_FALSE(l.is_held());
   }

   SECTION("lock message")
   {
      REQUIRE(l.lock_message() == fencing_lock::default_lock_message);
      l.set_lock_message("Deploying build 7, back in five minutes.");
      REQUIRE(l.lock_message() == "Deploying build 7, back in five minutes.");
      l.set_lock_message("");
      REQUIRE(l.lock_message() == fencing_lock::default_lock_message);
   }

   SECTION("resources are independent")
   {
      fencing_lock other(dir.path(), "backup", "worker-a", fast_config());
      REQUIRE(l.lock("deploy"));
      REQUIRE(other.lock("backup"));
      l.release();
      REQUIRE(other.is_held());
   }

   SECTION("scoped lock releases what it took")
   {
      {
         scoped_fencing_lock guard(l, "deploy");
         REQUIRE(guard.owns_lock());
         REQUIRE(l.is_held());

         scoped_fencing_lock second(l, "deploy");
         REQUIRE_FALSE(second);
      }
      REQUIRE_FALSE(l.is_held());
   }
}
