#include <ostream>

#include <daas/collection_task.hpp>
#include <daas/debug.hpp>
#include <daas/error.hpp>

namespace daas
{
   collection_task::collection_task(std::string session_id, work_fn work)
       : _session_id(std::move(session_id)), _work(std::move(work))
   {
      // started last so the thread never sees a partially built task
      _thread = std::thread(
          [this]()
          {
             set_current_thread_name("collect");
             try
             {
                _work(_cancel.token());
                finish(state::succeeded);
             }
             catch (const operation_canceled&)
             {
                DAAS_WARN("collection for session ", _session_id, " was canceled");
                finish(state::canceled);
             }
             catch (const std::exception& e)
             {
                DAAS_ERROR("collection for session ", _session_id, " failed: ", e.what());
                finish(state::failed, e.what());
             }
             catch (...)
             {
                DAAS_ERROR("collection for session ", _session_id, " failed: unknown exception");
                finish(state::failed, "unknown exception");
             }
          });
   }

   collection_task::~collection_task()
   {
      if (!is_terminal())
         cancel();
      join();
   }

   void collection_task::join()
   {
      if (_thread.joinable() && _thread.get_id() != std::this_thread::get_id())
         _thread.join();
   }

   void collection_task::finish(state s, std::string error)
   {
      {
         std::lock_guard<std::mutex> lock(_error_mutex);
         _error = std::move(error);
      }
      _state.store(s, std::memory_order_release);
   }

   std::string collection_task::error() const
   {
      std::lock_guard<std::mutex> lock(_error_mutex);
      return _error;
   }

   std::ostream& operator<<(std::ostream& os, collection_task::state s)
   {
      switch (s)
      {
         case collection_task::state::running:
            return os << "running";
         case collection_task::state::succeeded:
            return os << "succeeded";
         case collection_task::state::failed:
            return os << "failed";
         case collection_task::state::canceled:
            return os << "canceled";
         default:
            return os << "unknown";
      }
   }
}  // namespace daas
