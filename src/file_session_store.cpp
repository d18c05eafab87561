#include <time.h>
#include <algorithm>
#include <cstdio>
#include <random>
#include <stdexcept>

#include <daas/debug.hpp>
#include <daas/error.hpp>
#include <daas/file_session_store.hpp>
#include <daas/file_utils.hpp>

namespace daas
{
   namespace fs = std::filesystem;

   namespace
   {
      constexpr const char* header_file   = "session.json";
      constexpr const char* complete_file = "complete";

      void check_name(const std::string& name, const char* what)
      {
         if (name.empty() || name == "." || name == ".." ||
             name.find('/') != std::string::npos)
            throw std::invalid_argument(std::string("invalid ") + what + ": '" + name + "'");
      }
   }  // namespace

   file_session_store::file_session_store(fs::path     root,
                                          std::string  instance_id,
                                          store_config cfg,
                                          const clock& clk)
       : _root(std::move(root)),
         _instance_id(std::move(instance_id)),
         _config(cfg),
         _clock(clk),
         _create_lock(_root / "locks", "sessions", _instance_id, cfg.lock, clk)
   {
      check_name(_instance_id, "instance id");
      fs::create_directories(_root / "sessions");
      fs::create_directories(_root / "instances");
      _create_lock.set_lock_message("Another diagnostic session is being created.");
   }

   fs::path file_session_store::session_dir(const std::string& id) const
   {
      check_name(id, "session id");
      return _root / "sessions" / id;
   }

   std::set<std::string> file_session_store::markers(const fs::path& dir) const
   {
      std::set<std::string> names;
      std::error_code       ec;
      for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
      {
         auto name = it->path().filename().string();
         // skip temporaries of concurrent writers
         if (name.find(".tmp.") == std::string::npos)
            names.insert(name);
      }
      if (ec && ec != std::errc::no_such_file_or_directory)
         throw fs::filesystem_error("unable to list markers", dir, ec);
      return names;
   }

   session file_session_store::load(const fs::path& dir) const
   {
      auto header = read_file(dir / header_file);
      if (!header)
         throw corrupt_record_error("session " + dir.filename().string() + " has no header");

      session s   = session::header_from_json(*header);
      s.started   = markers(dir / "started");
      s.completed = markers(dir / "completed");

      if (auto end = read_file(dir / complete_file))
      {
         s.complete = true;
         s.end_time = parse_utc(*end);
      }

      for (const auto& name : markers(dir / "logs"))
      {
         auto text = read_file(dir / "logs" / name);
         if (!text)
            continue;
         try
         {
            auto logs = logs_from_json(*text);
            s.logs.insert(s.logs.end(), logs.begin(), logs.end());
         }
         catch (const corrupt_record_error& e)
         {
            // one instance's list must not hide the session from the fleet
            DAAS_WARN("ignoring log list ", name, " of session ", s.session_id, ": ", e.what());
         }
      }
      return s;
   }

   void file_session_store::heartbeat()
   {
      write_file_atomic(_root / "instances" / _instance_id, format_utc(_clock.now()));
   }

   std::vector<std::string> file_session_store::live_instances()
   {
      std::vector<std::string> live;
      auto                     now = _clock.now();
      for (const auto& name : markers(_root / "instances"))
      {
         auto text = read_file(_root / "instances" / name);
         if (!text)
            continue;
         auto seen = parse_utc(*text);
         if (!seen)
         {
            DAAS_WARN("ignoring unreadable heartbeat of instance ", name);
            continue;
         }
         if (now - *seen <= _config.heartbeat_ttl)
            live.push_back(name);
      }
      return live;
   }

   std::vector<session> file_session_store::list_sessions()
   {
      std::vector<session> sessions;
      for (const auto& id : markers(_root / "sessions"))
      {
         try
         {
            sessions.push_back(load(session_dir(id)));
         }
         catch (const corrupt_record_error& e)
         {
            DAAS_WARN("skipping session ", id, ": ", e.what());
         }
      }
      std::sort(sessions.begin(), sessions.end(),
                [](const session& a, const session& b)
                {
                   if (a.start_time != b.start_time)
                      return a.start_time < b.start_time;
                   return a.session_id < b.session_id;
                });
      return sessions;
   }

   std::optional<session> file_session_store::get_session(const std::string& session_id)
   {
      auto dir = session_dir(session_id);
      if (!fs::exists(dir))
         return std::nullopt;
      return load(dir);
   }

   std::optional<session> file_session_store::get_active_session()
   {
      heartbeat();
      return find_active();
   }

   std::optional<session> file_session_store::find_active()
   {
      std::optional<session> active;
      for (auto& s : list_sessions())
      {
         if (s.complete)
            continue;
         if (active)
            DAAS_WARN("sessions ", active->session_id, " and ", s.session_id,
                      " are both active, using the newer one");
         active = std::move(s);
      }
      return active;
   }

   bool file_session_store::should_collect_on_this_instance(const session& s)
   {
      return s.in_scope(_instance_id);
   }

   bool file_session_store::has_this_instance_collected(const session& s)
   {
      return fs::exists(session_dir(s.session_id) / "completed" / _instance_id);
   }

   void file_session_store::mark_instance_started(const session& s)
   {
      auto dir = session_dir(s.session_id) / "started";
      fs::create_directories(dir);
      touch(dir / _instance_id);
      DAAS_INFO("instance ", _instance_id, " started session ", s.session_id);
   }

   void file_session_store::mark_instance_complete(const session& s)
   {
      auto dir = session_dir(s.session_id) / "completed";
      fs::create_directories(dir);
      touch(dir / _instance_id);
      DAAS_INFO("instance ", _instance_id, " completed session ", s.session_id);
   }

   bool file_session_store::all_instances_collected(const session& s)
   {
      auto dir       = session_dir(s.session_id);
      auto completed = markers(dir / "completed");

      if (!s.instances.empty())
      {
         return std::all_of(s.instances.begin(), s.instances.end(),
                            [&](const std::string& i) { return completed.count(i) > 0; });
      }

      // nobody was known when the session was created; everyone who showed up counts
      if (completed.empty())
         return false;
      auto started = markers(dir / "started");
      return std::includes(completed.begin(), completed.end(), started.begin(), started.end());
   }

   void file_session_store::mark_session_complete(const session& s)
   {
      auto dir = session_dir(s.session_id);
      if (create_file_exclusive(dir / complete_file, format_utc(_clock.now())))
         DAAS_INFO("session ", s.session_id, " marked complete by ", _instance_id);
      else
         DAAS_DEBUG("session ", s.session_id, " was already complete");
   }

   void file_session_store::add_logs(const session& s, const std::vector<log_file>& logs)
   {
      auto dir = session_dir(s.session_id) / "logs";
      fs::create_directories(dir);

      // only this instance writes this file
      auto                  path = dir / (_instance_id + ".json");
      std::vector<log_file> all;
      if (auto text = read_file(path))
      {
         try
         {
            all = logs_from_json(*text);
         }
         catch (const corrupt_record_error& e)
         {
            DAAS_WARN("rewriting torn log list ", path.string(), ": ", e.what());
         }
      }
      for (auto l : logs)
      {
         if (l.instance.empty())
            l.instance = _instance_id;
         all.push_back(std::move(l));
      }
      write_file_atomic(path, logs_to_json(all));
   }

   std::string file_session_store::new_session_id() const
   {
      auto       now = _clock.now();
      time_t     tt  = std::chrono::system_clock::to_time_t(now);
      struct tm  tm_utc;
      gmtime_r(&tt, &tm_utc);

      static thread_local std::mt19937 gen(std::random_device{}());
      char                             buf[40];
      std::snprintf(buf, sizeof(buf), "%04d%02d%02d-%02d%02d%02d-%04x", tm_utc.tm_year + 1900,
                    tm_utc.tm_mon + 1, tm_utc.tm_mday, tm_utc.tm_hour, tm_utc.tm_min,
                    tm_utc.tm_sec, static_cast<unsigned>(gen() & 0xffff));
      return buf;
   }

   session file_session_store::create_session(diagnostic_tool_kind     tool,
                                              std::string              tool_params,
                                              std::vector<std::string> instances)
   {
      if (tool == diagnostic_tool_kind::unknown)
         throw unsupported_tool_error("cannot create a session for an unknown tool");
      for (const auto& i : instances)
         check_name(i, "instance id");

      scoped_fencing_lock guard(_create_lock, "create_session");
      if (!guard)
         throw session_conflict_error(_create_lock.lock_message());

      // no heartbeat, the creator may be an operator box that never collects
      if (auto active = find_active())
         throw session_conflict_error("session " + active->session_id + " is still active");

      session s;
      s.session_id    = new_session_id();
      s.tool          = tool;
      s.tool_params   = std::move(tool_params);
      s.start_time    = _clock.now();
      s.all_instances = instances.empty();
      s.instances     = s.all_instances ? live_instances() : std::move(instances);

      // readers never see a session directory without its header
      auto dir     = session_dir(s.session_id);
      auto staging = _root / "sessions" / (s.session_id + ".tmp.create");
      fs::create_directories(staging);
      write_file_atomic(staging / header_file, s.header_to_json());
      fs::rename(staging, dir);

      DAAS_INFO("created session ", s.session_id, " (", s.tool, ") for ",
                s.all_instances ? "all instances" : "selected instances", ", ",
                s.instances.size(), " known");
      return s;
   }
}  // namespace daas
