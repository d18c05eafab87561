#pragma once
#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <daas/session_store.hpp>

namespace daas::test
{
   /**
    * In-memory session_store shared by several "instances" in one process.
    * Each fake_session_store is one instance's view of a fake_fleet.
    */
   class fake_fleet
   {
     public:
      void add(session s)
      {
         std::lock_guard<std::mutex> lock(_mutex);
         _sessions[s.session_id] = std::move(s);
      }

      std::optional<session> get(const std::string& id) const
      {
         std::lock_guard<std::mutex> lock(_mutex);
         auto                        it = _sessions.find(id);
         if (it == _sessions.end())
            return std::nullopt;
         return it->second;
      }

      /// Number of times a session went from active to complete.
      int completions() const { return _completions.load(); }

      /// While set, every call fails as if the shared storage were down.
      std::atomic<bool> unreachable{false};

     private:
      friend class fake_session_store;

      void check() const
      {
         if (unreachable.load())
            throw std::runtime_error("session store unreachable");
      }

      mutable std::mutex             _mutex;
      std::map<std::string, session> _sessions;
      std::atomic<int>               _completions{0};
   };

   class fake_session_store : public session_store
   {
     public:
      fake_session_store(fake_fleet& fleet, std::string instance_id, const clock& clk)
          : _fleet(fleet), _instance(std::move(instance_id)), _clock(clk)
      {
      }

      std::optional<session> get_active_session() override
      {
         _fleet.check();
         ++get_active_calls;
         std::lock_guard<std::mutex> lock(_fleet._mutex);
         for (const auto& [id, s] : _fleet._sessions)
         {
            if (!s.complete)
               return s;
         }
         return std::nullopt;
      }

      bool should_collect_on_this_instance(const session& s) override
      {
         _fleet.check();
         return s.in_scope(_instance);
      }

      bool has_this_instance_collected(const session& s) override
      {
         _fleet.check();
         std::lock_guard<std::mutex> lock(_fleet._mutex);
         return _fleet._sessions.at(s.session_id).completed.count(_instance) > 0;
      }

      void mark_instance_started(const session& s) override
      {
         _fleet.check();
         std::lock_guard<std::mutex> lock(_fleet._mutex);
         _fleet._sessions.at(s.session_id).started.insert(_instance);
      }

      void mark_instance_complete(const session& s) override
      {
         _fleet.check();
         std::lock_guard<std::mutex> lock(_fleet._mutex);
         _fleet._sessions.at(s.session_id).completed.insert(_instance);
      }

      bool all_instances_collected(const session& s) override
      {
         _fleet.check();
         std::lock_guard<std::mutex> lock(_fleet._mutex);
         const auto& stored = _fleet._sessions.at(s.session_id);
         if (stored.instances.empty())
            return !stored.completed.empty() &&
                   std::includes(stored.completed.begin(), stored.completed.end(),
                                 stored.started.begin(), stored.started.end());
         return std::all_of(stored.instances.begin(), stored.instances.end(),
                            [&](const std::string& i) { return stored.completed.count(i) > 0; });
      }

      void mark_session_complete(const session& s) override
      {
         _fleet.check();
         std::lock_guard<std::mutex> lock(_fleet._mutex);
         auto& stored = _fleet._sessions.at(s.session_id);
         if (stored.complete)
            return;
         stored.complete = true;
         stored.end_time = _clock.now();
         ++_fleet._completions;
      }

      void add_logs(const session& s, const std::vector<log_file>& logs) override
      {
         _fleet.check();
         std::lock_guard<std::mutex> lock(_fleet._mutex);
         auto& stored = _fleet._sessions.at(s.session_id);
         for (auto l : logs)
         {
            l.instance = _instance;
            stored.logs.push_back(std::move(l));
         }
      }

      std::atomic<int> get_active_calls{0};

     private:
      fake_fleet&  _fleet;
      std::string  _instance;
      const clock& _clock;
   };
}  // namespace daas::test
