#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <daas/config.hpp>
#include <daas/time.hpp>

namespace daas
{
   /**
    * One artifact produced by a diagnostic tool. Tools fill in full_path;
    * size and name are filled in by the runner before the artifact is added
    * to the session.
    */
   struct log_file
   {
      std::filesystem::path full_path;
      uint64_t              size = 0;
      std::string           name;
      std::string           instance;

      friend bool operator==(const log_file&, const log_file&) = default;
   };

   /**
    * A fleet-wide diagnostic collection job as seen through the session store.
    *
    * The header fields (id, tool, parameters, start time and scope) are
    * written once when the session is created. The per-instance sets, the
    * completion state and the logs are a snapshot the store took when it
    * returned the session; they go stale as other instances make progress
    * and must be re-read through the store rather than trusted.
    */
   struct session
   {
      std::string          session_id;
      diagnostic_tool_kind tool = diagnostic_tool_kind::unknown;
      std::string          tool_name;  // as stored, kept for error reports
      std::string          tool_params;
      utc_time             start_time;

      // scope: every instance, or only those listed
      bool                     all_instances = true;
      std::vector<std::string> instances;

      std::set<std::string>   started;
      std::set<std::string>   completed;
      bool                    complete = false;
      std::optional<utc_time> end_time;
      std::vector<log_file>   logs;

      bool in_scope(std::string_view instance) const;

      /// Encodes the immutable header.
      std::string header_to_json() const;

      /// @throw corrupt_record_error
      static session header_from_json(std::string_view text);
   };

   std::string logs_to_json(const std::vector<log_file>& logs);

   /// @throw corrupt_record_error
   std::vector<log_file> logs_from_json(std::string_view text);

}  // namespace daas
