#include <nlohmann/json.hpp>
#include <algorithm>
#include <sstream>

#include <daas/error.hpp>
#include <daas/session.hpp>

namespace daas
{
   namespace
   {
      nlohmann::json parse(std::string_view text, const char* what)
      {
         auto j = nlohmann::json::parse(text, nullptr, false);
         if (j.is_discarded() || !j.is_object())
            throw corrupt_record_error(std::string(what) + " is not a json object");
         return j;
      }

      template <typename T>
      T get_or(const nlohmann::json& j, const char* key, T fallback)
      {
         auto it = j.find(key);
         if (it == j.end() || it->is_null())
            return fallback;
         try
         {
            return it->get<T>();
         }
         catch (const nlohmann::json::type_error& e)
         {
            throw corrupt_record_error(std::string("field ") + key + ": " + e.what());
         }
      }
   }  // namespace

   bool session::in_scope(std::string_view instance) const
   {
      if (all_instances)
         return true;
      return std::find(instances.begin(), instances.end(), instance) != instances.end();
   }

   std::string session::header_to_json() const
   {
      nlohmann::json j;
      j["sessionId"] = session_id;
      if (tool_name.empty())
      {
         std::ostringstream name;
         name << tool;
         j["tool"] = name.str();
      }
      else
      {
         j["tool"] = tool_name;
      }
      j["toolParams"]   = tool_params;
      j["startTime"]    = format_utc(start_time);
      j["allInstances"] = all_instances;
      j["instances"]    = instances;
      return j.dump(2);
   }

   session session::header_from_json(std::string_view text)
   {
      auto j = parse(text, "session header");

      session s;
      s.session_id = get_or<std::string>(j, "sessionId", "");
      if (s.session_id.empty())
         throw corrupt_record_error("session header has no sessionId");

      auto start = parse_utc(get_or<std::string>(j, "startTime", ""));
      if (!start)
         throw corrupt_record_error("session " + s.session_id + " has no valid startTime");
      s.start_time = *start;

      s.tool_name     = get_or<std::string>(j, "tool", "");
      s.tool          = tool_kind_from_string(s.tool_name);
      s.tool_params   = get_or<std::string>(j, "toolParams", "");
      s.all_instances = get_or<bool>(j, "allInstances", true);
      s.instances     = get_or<std::vector<std::string>>(j, "instances", {});
      return s;
   }

   std::string logs_to_json(const std::vector<log_file>& logs)
   {
      auto list = nlohmann::json::array();
      for (const auto& l : logs)
      {
         nlohmann::json item;
         item["fullPath"] = l.full_path.string();
         item["size"]     = l.size;
         item["name"]     = l.name;
         item["instance"] = l.instance;
         list.push_back(std::move(item));
      }
      nlohmann::json j;
      j["logs"] = std::move(list);
      return j.dump(2);
   }

   std::vector<log_file> logs_from_json(std::string_view text)
   {
      auto j = parse(text, "log list");

      std::vector<log_file> logs;
      auto                  list = j.find("logs");
      if (list == j.end())
         return logs;
      if (!list->is_array())
         throw corrupt_record_error("log list is not an array");

      for (const auto& item : *list)
      {
         if (!item.is_object())
            throw corrupt_record_error("log entry is not an object");
         log_file l;
         l.full_path = get_or<std::string>(item, "fullPath", "");
         l.size      = get_or<uint64_t>(item, "size", 0);
         l.name      = get_or<std::string>(item, "name", "");
         l.instance  = get_or<std::string>(item, "instance", "");
         if (l.full_path.empty())
            throw corrupt_record_error("log entry without fullPath");
         logs.push_back(std::move(l));
      }
      return logs;
   }
}  // namespace daas
