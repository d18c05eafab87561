#pragma once
#include <optional>
#include <vector>

#include <daas/session.hpp>

namespace daas
{
   /**
    * Shared, durable record of diagnostic sessions as seen from one instance.
    *
    * Every instance of the fleet holds its own store object over the same
    * shared state; "this instance" in the method names is the identity the
    * store was created with. Implementations must tolerate any number of
    * instances calling any of these concurrently. Methods report I/O failures
    * by throwing.
    */
   class session_store
   {
     public:
      virtual ~session_store() = default;

      /// The one session in the fleet that is not complete, if any.
      virtual std::optional<session> get_active_session() = 0;

      /// Whether this instance is in the session's participation scope.
      virtual bool should_collect_on_this_instance(const session& s) = 0;

      /// Whether this instance already finished its share of the session.
      virtual bool has_this_instance_collected(const session& s) = 0;

      virtual void mark_instance_started(const session& s)  = 0;
      virtual void mark_instance_complete(const session& s) = 0;

      /// Whether every instance in scope has marked itself complete.
      virtual bool all_instances_collected(const session& s) = 0;

      /**
       * Closes the session. Completing a session that is already complete
       * does nothing.
       */
      virtual void mark_session_complete(const session& s) = 0;

      virtual void add_logs(const session& s, const std::vector<log_file>& logs) = 0;
   };

}  // namespace daas
