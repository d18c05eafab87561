#pragma once
#include <atomic>
#include <functional>
#include <iosfwd>
#include <mutex>
#include <string>
#include <thread>

#include <daas/cancellation.hpp>

namespace daas
{
   /**
    * One local collection run for one session, executing on its own thread.
    *
    * The task carries its own cancellation source and reports a run state
    * that only ever moves from running to exactly one terminal state. The
    * owner polls status() and destroys the task once it is terminal; nothing
    * calls back into the owner when the work ends.
    */
   class collection_task
   {
     public:
      enum class state : uint8_t
      {
         running,
         succeeded,
         failed,
         canceled
      };

      using work_fn = std::function<void(const cancellation_token&)>;

      /**
       * Starts work on a new thread. An operation_canceled escaping work ends
       * the task canceled, any other exception ends it failed.
       */
      collection_task(std::string session_id, work_fn work);

      /// Cancels the work if still running and waits for the thread.
      ~collection_task();

      collection_task(const collection_task&)            = delete;
      collection_task& operator=(const collection_task&) = delete;

      void  cancel() { _cancel.cancel(); }
      bool  cancel_requested() const { return _cancel.is_canceled(); }
      state status() const { return _state.load(std::memory_order_acquire); }
      bool  is_terminal() const { return status() != state::running; }

      /// Blocks until the thread has exited.
      void join();

      const std::string& session_id() const { return _session_id; }

      /// What ended a failed task, empty otherwise.
      std::string error() const;

     private:
      void finish(state s, std::string error = {});

      std::string         _session_id;
      work_fn             _work;
      cancellation_source _cancel;
      std::atomic<state>  _state{state::running};

      mutable std::mutex _error_mutex;
      std::string        _error;

      std::thread _thread;
   };

   std::ostream& operator<<(std::ostream& os, collection_task::state s);

}  // namespace daas
