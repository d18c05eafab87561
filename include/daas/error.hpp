#pragma once
#include <stdexcept>
#include <string>

namespace daas
{
   /**
    * Thrown by entry points that exist in the interface but have no backing
    * implementation yet, so that callers never mistake them for a no-op.
    */
   struct not_implemented_error : std::logic_error
   {
      using std::logic_error::logic_error;
   };

   /// A session names a diagnostic tool this build cannot run.
   struct unsupported_tool_error : std::runtime_error
   {
      using std::runtime_error::runtime_error;
   };

   /// A diagnostic tool ran but did not produce its artifacts.
   struct tool_failed_error : std::runtime_error
   {
      using std::runtime_error::runtime_error;
   };

   /// Raised inside a collection task when its cancellation source fired.
   struct operation_canceled : std::runtime_error
   {
      operation_canceled() : std::runtime_error("operation canceled") {}
   };

   /// A new session was requested while another one is still active.
   struct session_conflict_error : std::runtime_error
   {
      using std::runtime_error::runtime_error;
   };

   /// A persisted record exists but cannot be decoded.
   struct corrupt_record_error : std::runtime_error
   {
      using std::runtime_error::runtime_error;
   };
}  // namespace daas
