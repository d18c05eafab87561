#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <daas/config.hpp>
#include <daas/fencing_lock.hpp>
#include <daas/session_store.hpp>
#include <daas/time.hpp>

namespace daas
{
   /**
    * A session_store kept in a directory shared by the whole fleet.
    *
    *    <root>/locks/sessions/             fencing lock around create_session()
    *    <root>/instances/<instance>         heartbeat, time of last poll
    *    <root>/sessions/<id>/session.json   header, written once
    *    <root>/sessions/<id>/started/<instance>
    *    <root>/sessions/<id>/completed/<instance>
    *    <root>/sessions/<id>/logs/<instance>.json
    *    <root>/sessions/<id>/complete       created once, holds the end time
    *
    * Apart from session creation, which runs under a fencing lock, every file
    * is either immutable, created exclusively, or written by exactly one
    * instance, so instances never need to coordinate their writes.
    */
   class file_session_store : public session_store
   {
     public:
      file_session_store(std::filesystem::path root,
                         std::string           instance_id,
                         store_config          cfg  = {},
                         const clock&          clk  = system_clock_source::instance());

      std::optional<session> get_active_session() override;
      bool                   should_collect_on_this_instance(const session& s) override;
      bool                   has_this_instance_collected(const session& s) override;
      void                   mark_instance_started(const session& s) override;
      void                   mark_instance_complete(const session& s) override;
      bool                   all_instances_collected(const session& s) override;
      void                   mark_session_complete(const session& s) override;
      void add_logs(const session& s, const std::vector<log_file>& logs) override;

      /**
       * Starts a new session. An empty instance list means every instance
       * whose heartbeat is fresh. The creating instance is not registered as
       * live by this call.
       *
       * @throw session_conflict_error if a session is still active or another
       *        instance is creating one right now
       */
      session create_session(diagnostic_tool_kind     tool,
                             std::string              tool_params,
                             std::vector<std::string> instances = {});

      std::optional<session> get_session(const std::string& session_id);

      /// All sessions with a readable header, oldest first.
      std::vector<session> list_sessions();

      /**
       * Records that this instance is alive. get_active_session() calls it, so
       * only instances that poll count as live; create_session() does not.
       */
      void heartbeat();

      std::vector<std::string> live_instances();

      const std::string&           instance_id() const { return _instance_id; }
      const std::filesystem::path& root() const { return _root; }

     private:
      std::filesystem::path  session_dir(const std::string& id) const;
      session                load(const std::filesystem::path& dir) const;
      std::set<std::string>  markers(const std::filesystem::path& dir) const;
      std::optional<session> find_active();
      std::string            new_session_id() const;

      std::filesystem::path _root;
      std::string           _instance_id;
      store_config          _config;
      const clock&          _clock;
      fencing_lock          _create_lock;
   };

}  // namespace daas
