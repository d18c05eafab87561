#include <nlohmann/json.hpp>
#include <ostream>

#include <daas/error.hpp>
#include <daas/lock_record.hpp>

namespace daas
{
   std::string lock_record::to_json() const
   {
      nlohmann::json j;
      j["heldByPID"]    = owner_pid;
      j["heldByTID"]    = owner_tid;
      j["heldByWorker"] = owner_worker;
      j["heldByOp"]     = operation;
      j["lockExpiry"]   = format_utc(expires_at);
      return j.dump();
   }

   lock_record lock_record::from_json(std::string_view text)
   {
      auto j = nlohmann::json::parse(text, nullptr, false);
      if (j.is_discarded() || !j.is_object())
         throw corrupt_record_error("lock record is not a json object");

      auto expiry = j.find("lockExpiry");
      if (expiry == j.end() || !expiry->is_string() || expiry->get<std::string>().empty())
         throw corrupt_record_error("lock record has no expiry");

      auto expires_at = parse_utc(expiry->get<std::string>());
      if (!expires_at)
         throw corrupt_record_error("lock record has an unparseable expiry: " +
                                    expiry->get<std::string>());

      lock_record r;
      r.expires_at = *expires_at;

      // informational, a holder written by another build may leave them out
      if (auto it = j.find("heldByPID"); it != j.end() && it->is_number_integer())
         r.owner_pid = it->get<int32_t>();
      if (auto it = j.find("heldByTID"); it != j.end() && it->is_number_integer())
         r.owner_tid = it->get<int64_t>();
      if (auto it = j.find("heldByWorker"); it != j.end() && it->is_string())
         r.owner_worker = it->get<std::string>();
      if (auto it = j.find("heldByOp"); it != j.end() && it->is_string())
         r.operation = it->get<std::string>();
      return r;
   }

   std::ostream& operator<<(std::ostream& os, const lock_record& r)
   {
      return os << "Expiry: " << format_utc(r.expires_at) << "; PID: " << r.owner_pid
                << "; TID: " << r.owner_tid << "; OP: " << r.operation
                << "; Worker: " << r.owner_worker;
   }
}  // namespace daas
