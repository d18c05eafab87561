#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <daas/collection_task.hpp>
#include <daas/config.hpp>
#include <daas/diagnostic_tool.hpp>
#include <daas/session_store.hpp>
#include <daas/time.hpp>

namespace daas
{
   /**
    * Per-instance control loop that drives diagnostic sessions to completion.
    *
    * Every instance of the fleet runs one of these against the shared
    * session_store. There is no leader: each runner independently discovers
    * the active session, decides whether this instance takes part, collects
    * locally, and closes the session when it sees that everyone in scope is
    * done or that the session ran past its deadline. Whichever runner notices
    * first closes it; mark_session_complete() being idempotent makes the
    * others' attempts harmless.
    *
    * Local collections run as collection_tasks on their own threads and are
    * tracked in a map keyed by session id, at most one per session. Only
    * tick() adds to or removes from that map.
    */
   class session_runner
   {
     public:
      using gate_fn = std::function<bool()>;

      session_runner(session_store&                 store,
                     const diagnostic_tool_factory& tools,
                     runner_config                  cfg  = {},
                     const clock&                   clk  = system_clock_source::instance(),
                     gate_fn                        gate = {});

      /// Stops the loop and cancels local collections.
      ~session_runner();

      session_runner(const session_runner&)            = delete;
      session_runner& operator=(const session_runner&) = delete;

      /**
       * One pass of the control loop:
       *
       *    1. fetch the active session
       *    2. close it if every instance in scope collected
       *    3. force it closed if it is older than max_session_duration
       *    4. stop unless this instance is in scope
       *    5. stop if a collection for it is running here, or already done,
       *       or failed here before
       *    6. otherwise start collecting
       *    7. reap finished collections of any session
       *
       * Ticks never overlap. Store failures propagate after step 7 has run.
       */
      void tick();

      /**
       * Starts the loop thread, which ticks every poll_interval while the
       * gate is open and only sleeps while it is closed.
       */
      void start();

      /// Stops the loop thread, cancels and waits for all local collections.
      void stop();

      bool is_running() const { return _thread.joinable() && !_stop.load(); }

      /// Number of completed ticks, failed ones included.
      uint64_t tick_count() const { return _ticks.load(std::memory_order_acquire); }

      std::vector<std::string>               tracked_sessions() const;
      std::optional<collection_task::state> task_state(const std::string& session_id) const;

      /// Requests cancellation of this instance's collection for a session.
      bool cancel_session(const std::string& session_id);

     private:
      void run_active_session();
      bool check_and_complete_session(const session& s, bool force);
      void start_collection(const session& s, std::shared_ptr<diagnostic_tool> tool);
      void run_tool_for_session(const session&            s,
                                diagnostic_tool&          tool,
                                const cancellation_token& cancel);
      void add_logs_to_session(const session& s, std::vector<log_file> logs);
      void reap_completed_tasks();
      bool is_tracking(const std::string& session_id) const;
      void loop();
      bool wait_for_next_tick();

      session_store&                 _store;
      const diagnostic_tool_factory& _tools;
      runner_config                  _config;
      const clock&                   _clock;
      gate_fn                        _gate;

      // serializes tick(); _abandoned is only touched under it
      std::mutex            _tick_mutex;
      std::set<std::string> _abandoned;

      mutable std::mutex                                      _tasks_mutex;
      std::map<std::string, std::unique_ptr<collection_task>> _tasks;

      std::atomic<uint64_t>   _ticks{0};
      std::atomic<bool>       _stop{false};
      std::mutex              _wait_mutex;
      std::condition_variable _cv;
      std::thread             _thread;
   };

}  // namespace daas
