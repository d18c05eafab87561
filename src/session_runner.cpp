#include <exception>

#include <daas/debug.hpp>
#include <daas/environment.hpp>
#include <daas/error.hpp>
#include <daas/file_utils.hpp>
#include <daas/session_runner.hpp>

namespace daas
{
   session_runner::session_runner(session_store&                 store,
                                  const diagnostic_tool_factory& tools,
                                  runner_config                  cfg,
                                  const clock&                   clk,
                                  gate_fn                        gate)
       : _store(store), _tools(tools), _config(std::move(cfg)), _clock(clk), _gate(std::move(gate))
   {
      if (!_gate)
         _gate = [] { return true; };
   }

   session_runner::~session_runner()
   {
      stop();
   }

   void session_runner::tick()
   {
      std::lock_guard<std::mutex> lock(_tick_mutex);

      std::exception_ptr failure;
      try
      {
         run_active_session();
      }
      catch (...)
      {
         failure = std::current_exception();
      }

      // cleanup does not depend on the store being reachable
      reap_completed_tasks();
      _ticks.fetch_add(1, std::memory_order_acq_rel);

      if (failure)
         std::rethrow_exception(failure);
   }

   void session_runner::run_active_session()
   {
      auto active = _store.get_active_session();
      if (!active)
      {
         _abandoned.clear();
         return;
      }
      const auto& id = active->session_id;

      // failures are only remembered for the session that is still active
      std::erase_if(_abandoned, [&](const std::string& s) { return s != id; });

      if (check_and_complete_session(*active, false))
         return;

      if (_clock.now() - active->start_time > _config.max_session_duration)
      {
         DAAS_WARN("session ", id, " exceeded ",
                   std::chrono::duration_cast<std::chrono::seconds>(_config.max_session_duration)
                       .count(),
                   "s, forcing completion");
         check_and_complete_session(*active, true);
         if (_config.cancel_on_forced_completion)
            cancel_session(id);
         return;
      }

      if (!_store.should_collect_on_this_instance(*active))
         return;

      if (is_tracking(id))
      {
         DAAS_DEBUG("collection for session ", id, " is in progress");
         return;
      }
      if (_abandoned.count(id))
         return;
      if (_store.has_this_instance_collected(*active))
         return;

      std::shared_ptr<diagnostic_tool> tool;
      try
      {
         tool = _tools.make(active->tool);
      }
      catch (const unsupported_tool_error& e)
      {
         DAAS_ERROR("session ", id, " (tool '", active->tool_name, "'): ", e.what());
         _abandoned.insert(id);
         return;
      }

      start_collection(*active, std::move(tool));
   }

   bool session_runner::check_and_complete_session(const session& s, bool force)
   {
      if (force || _store.all_instances_collected(s))
      {
         _store.mark_session_complete(s);
         return true;
      }
      return false;
   }

   void session_runner::start_collection(const session& s, std::shared_ptr<diagnostic_tool> tool)
   {
      auto task = std::make_unique<collection_task>(
          s.session_id, [this, s, tool](const cancellation_token& cancel)
          { run_tool_for_session(s, *tool, cancel); });

      std::lock_guard<std::mutex> lock(_tasks_mutex);
      _tasks.emplace(s.session_id, std::move(task));
   }

   void session_runner::run_tool_for_session(const session&            s,
                                             diagnostic_tool&          tool,
                                             const cancellation_token& cancel)
   {
      _store.mark_instance_started(s);

      DAAS_INFO("invoking ", s.tool, " for session ", s.session_id, " on ", host_name());
      auto logs = tool.invoke(s.tool_params, _config.output_dir / s.session_id, cancel);

      // the session may have been forced closed while the tool ran
      cancel.throw_if_canceled();

      add_logs_to_session(s, std::move(logs));
      _store.mark_instance_complete(s);

      // the last instance to finish closes the session without waiting for a tick
      check_and_complete_session(s, false);
   }

   void session_runner::add_logs_to_session(const session& s, std::vector<log_file> logs)
   {
      for (auto& l : logs)
      {
         l.size = daas::file_size(l.full_path);
         l.name = file_name(l.full_path);
      }
      _store.add_logs(s, logs);
   }

   void session_runner::reap_completed_tasks()
   {
      std::vector<std::unique_ptr<collection_task>> finished;
      {
         std::lock_guard<std::mutex> lock(_tasks_mutex);
         for (auto it = _tasks.begin(); it != _tasks.end();)
         {
            if (!it->second->is_terminal())
            {
               ++it;
               continue;
            }
            auto status = it->second->status();
            DAAS_INFO("task for session ", it->first, " has completed with status ", status,
                      " on ", host_name());
            if (status != collection_task::state::succeeded)
               _abandoned.insert(it->first);
            finished.push_back(std::move(it->second));
            it = _tasks.erase(it);
         }
      }
      // joining happens outside the lock
      finished.clear();
   }

   bool session_runner::is_tracking(const std::string& session_id) const
   {
      std::lock_guard<std::mutex> lock(_tasks_mutex);
      return _tasks.count(session_id) > 0;
   }

   std::vector<std::string> session_runner::tracked_sessions() const
   {
      std::lock_guard<std::mutex> lock(_tasks_mutex);
      std::vector<std::string>    ids;
      for (const auto& [id, task] : _tasks)
         ids.push_back(id);
      return ids;
   }

   std::optional<collection_task::state> session_runner::task_state(
       const std::string& session_id) const
   {
      std::lock_guard<std::mutex> lock(_tasks_mutex);
      auto                        it = _tasks.find(session_id);
      if (it == _tasks.end())
         return std::nullopt;
      return it->second->status();
   }

   bool session_runner::cancel_session(const std::string& session_id)
   {
      std::lock_guard<std::mutex> lock(_tasks_mutex);
      auto                        it = _tasks.find(session_id);
      if (it == _tasks.end() || it->second->is_terminal())
         return false;
      DAAS_WARN("canceling collection for session ", session_id);
      it->second->cancel();
      return true;
   }

   void session_runner::start()
   {
      if (_thread.joinable())
         return;

      _stop.store(false, std::memory_order_relaxed);
      _thread = std::thread(
          [this]()
          {
             set_current_thread_name("runner");
             loop();
          });
      DAAS_INFO("session runner started, polling every ",
                std::chrono::duration_cast<std::chrono::seconds>(_config.poll_interval).count(),
                "s");
   }

   void session_runner::loop()
   {
      do
      {
         if (!_gate())
            continue;
         try
         {
            tick();
         }
         catch (const std::exception& e)
         {
            DAAS_ERROR("session runner tick failed: ", e.what());
         }
         catch (...)
         {
            DAAS_ERROR("session runner tick failed: unknown exception");
         }
      } while (wait_for_next_tick());
   }

   bool session_runner::wait_for_next_tick()
   {
      std::unique_lock<std::mutex> lock(_wait_mutex);
      return !_cv.wait_for(lock, _config.poll_interval,
                           [this]() { return _stop.load(std::memory_order_relaxed); });
   }

   void session_runner::stop()
   {
      if (_thread.joinable())
      {
         {
            std::lock_guard<std::mutex> lock(_wait_mutex);
            _stop.store(true, std::memory_order_release);
         }
         _cv.notify_all();
         _thread.join();
         DAAS_INFO("session runner stopped");
      }

      std::map<std::string, std::unique_ptr<collection_task>> tasks;
      {
         std::lock_guard<std::mutex> lock(_tasks_mutex);
         tasks.swap(_tasks);
      }
      for (auto& [id, task] : tasks)
         task->cancel();
      // destructors wait for the collection threads
   }
}  // namespace daas
