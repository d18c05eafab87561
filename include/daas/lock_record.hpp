#pragma once
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

#include <daas/time.hpp>

namespace daas
{
   /**
    * What a fencing lock holder writes at the lock location. Written once by
    * the acquirer and never changed afterwards.
    *
    * Encoded as a flat JSON object:
    *
    *    {"heldByOp":"deployment","heldByPID":4242,"heldByTID":4250,
    *     "heldByWorker":"..","lockExpiry":"2026-10-19T12:00:00.000Z"}
    */
   struct lock_record
   {
      int32_t     owner_pid = 0;
      int64_t     owner_tid = 0;
      std::string owner_worker;
      std::string operation;
      utc_time    expires_at;

      bool expired(utc_time now) const { return !(expires_at > now); }

      std::string to_json() const;

      /**
       * @throw corrupt_record_error if text is not a JSON object or the expiry
       *        is missing, empty or unparseable. The owner fields are
       *        informational and default when missing.
       */
      static lock_record from_json(std::string_view text);

      friend bool operator==(const lock_record&, const lock_record&) = default;
   };

   std::ostream& operator<<(std::ostream& os, const lock_record& r);

}  // namespace daas
