#pragma once
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>

namespace daas
{
   /**
    * The collectors a session can ask for.
    *
    * 0. memory_dump - a full memory snapshot of the target process
    * 1. profiler    - an execution/CPU trace of the target process
    *
    * Anything read from the store that is not one of these names decodes to
    * unknown, which is a fatal configuration error for that session.
    */
   enum class diagnostic_tool_kind
   {
      memory_dump = 0,
      profiler    = 1,
      unknown     = 2
   };

   inline std::ostream& operator<<(std::ostream& os, diagnostic_tool_kind k)
   {
      switch (k)
      {
         case diagnostic_tool_kind::memory_dump:
            return os << "MemoryDump";
         case diagnostic_tool_kind::profiler:
            return os << "Profiler";
         default:
            return os << "Unknown";
      }
   }

   inline diagnostic_tool_kind tool_kind_from_string(std::string_view str)
   {
      if (str == "MemoryDump" || str == "memory_dump")
         return diagnostic_tool_kind::memory_dump;
      if (str == "Profiler" || str == "profiler")
         return diagnostic_tool_kind::profiler;
      return diagnostic_tool_kind::unknown;
   }

   inline std::istream& operator>>(std::istream& is, diagnostic_tool_kind& k)
   {
      std::string str;
      is >> str;
      k = tool_kind_from_string(str);
      if (k == diagnostic_tool_kind::unknown)
         is.setstate(std::ios::failbit);
      return is;
   }

   /**
    * Parameters of a fencing_lock.
    */
   struct lock_config
   {
      /**
       * How long a lock stays valid after it was taken. A holder that crashes
       * blocks the resource for at most this long, after which the next
       * observer reclaims it. 20 minutes covers the slowest deployment.
       */
      std::chrono::seconds ttl{1200};

      /**
       * A lock directory without a readable record may belong to a holder that
       * is still writing it. The observer waits this long once and reads again
       * before reclaiming.
       */
      std::chrono::milliseconds corrupt_grace{1000};
   };

   /**
    * Parameters of a file_session_store.
    */
   struct store_config
   {
      /// An instance whose heartbeat is older than this is not counted
      /// when an all-instances session is created.
      std::chrono::milliseconds heartbeat_ttl{std::chrono::minutes(3)};

      /// Guards session creation.
      lock_config lock;
   };

   /**
    * Heartbeat lifetime for instances polling every poll_interval: three
    * missed polls, never less than the 3 minute default.
    */
   inline std::chrono::milliseconds heartbeat_ttl_for(std::chrono::milliseconds poll_interval)
   {
      return std::max<std::chrono::milliseconds>(std::chrono::minutes(3), poll_interval * 3);
   }

   /**
    * Parameters of the session_runner control loop.
    */
   struct runner_config
   {
      /// Time between two ticks of the control loop.
      std::chrono::milliseconds poll_interval{std::chrono::minutes(1)};

      /**
       * A session that has been active for longer than this is forced
       * complete no matter how many instances reported back, so a stuck or
       * crashed participant cannot hold the fleet forever.
       */
      std::chrono::milliseconds max_session_duration{std::chrono::minutes(15)};

      /**
       * When a session is forced complete, cancel this instance's collection
       * for it instead of letting it run on and reporting into a closed session.
       */
      bool cancel_on_forced_completion = true;

      /// Artifacts of a session are written below output_dir/<session id>/
      std::filesystem::path output_dir = "/home/LogFiles/daas";
   };

   /**
    * Where the collectors live and how they are stopped.
    */
   struct tool_config
   {
      std::filesystem::path memory_dump_executable = "dotnet-dump";
      std::filesystem::path trace_executable       = "dotnet-trace";

      /// Process the collectors attach to; 0 lets the collector pick.
      int target_pid = 0;

      /// After SIGTERM on cancellation, how long before SIGKILL.
      std::chrono::milliseconds kill_grace{5000};

      /// How often a running collector is checked for exit or cancellation.
      std::chrono::milliseconds wait_poll{50};
   };

}  // namespace daas
