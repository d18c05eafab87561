#include <sys/stat.h>
#include <cerrno>
#include <system_error>
#include <thread>

#include <daas/debug.hpp>
#include <daas/environment.hpp>
#include <daas/error.hpp>
#include <daas/fencing_lock.hpp>
#include <daas/file_utils.hpp>

namespace daas
{
   fencing_lock::fencing_lock(std::filesystem::path locks_root,
                              std::string           resource,
                              std::string           worker_id,
                              lock_config           cfg,
                              const clock&          clk)
       : _locks_root(std::move(locks_root)),
         _lock_dir(_locks_root / resource),
         _worker_id(std::move(worker_id)),
         _config(cfg),
         _clock(clk)
   {
   }

   fencing_lock::read_result fencing_lock::read_record(lock_record& out) const
   {
      std::error_code ec;
      if (!std::filesystem::is_directory(_lock_dir, ec))
         return read_result::absent;

      auto text = read_file(record_path());
      if (!text)
      {
         // the directory was removed after the check above
         if (!std::filesystem::exists(_lock_dir, ec))
            return read_result::absent;
         return read_result::corrupt;
      }

      try
      {
         out = lock_record::from_json(*text);
      }
      catch (const corrupt_record_error& e)
      {
         DAAS_DEBUG(_lock_dir.string(), ": ", e.what());
         return read_result::corrupt;
      }
      return out.expired(_clock.now()) ? read_result::expired : read_result::valid;
   }

   std::optional<lock_record> fencing_lock::observe() const
   {
      lock_record record;
      auto        result = read_record(record);

      if (result == read_result::corrupt && _config.corrupt_grace.count() > 0)
      {
         // the holder may still be writing its record
         std::this_thread::sleep_for(_config.corrupt_grace);
         result = read_record(record);
      }

      switch (result)
      {
         case read_result::absent:
            return std::nullopt;
         case read_result::valid:
            return record;
         case read_result::expired:
         {
            // another observer may have reclaimed it and a new holder taken it
            lock_record again;
            switch (read_record(again))
            {
               case read_result::valid:
                  return again;
               case read_result::absent:
                  return std::nullopt;
               default:
                  break;
            }
            DAAS_WARN("reclaiming expired lock ", _lock_dir.string(), " (", record, ")");
            remove_all_safe(_lock_dir);
            return std::nullopt;
         }
         case read_result::corrupt:
         default:
            DAAS_WARN("reclaiming corrupt lock ", _lock_dir.string());
            remove_all_safe(_lock_dir);
            return std::nullopt;
      }
   }

   bool fencing_lock::is_held() const
   {
      return observe().has_value();
   }

   std::optional<lock_record> fencing_lock::lock_info() const
   {
      return observe();
   }

   void fencing_lock::write_record(std::string_view operation)
   {
      lock_record r;
      r.owner_pid    = current_pid();
      r.owner_tid    = current_tid();
      r.owner_worker = _worker_id;
      r.operation    = std::string(operation);
      r.expires_at   = _clock.now() + _config.ttl;
      write_file_atomic(record_path(), r.to_json());
      DAAS_DEBUG("wrote lock record ", r);
   }

   bool fencing_lock::lock(std::string_view operation)
   {
      if (auto holder = observe())
      {
         DAAS_INFO("lock ", _lock_dir.string(), " already held: ", *holder);
         return false;
      }

      std::filesystem::create_directories(_locks_root);
      if (::mkdir(_lock_dir.c_str(), 0755) != 0)
      {
         if (errno == EEXIST)
         {
            DAAS_INFO("lost the race for ", _lock_dir.string(), " to another acquirer");
            return false;
         }
         throw std::system_error{errno, std::generic_category()};
      }

      try
      {
         write_record(operation);
      }
      catch (...)
      {
         remove_all_safe(_lock_dir);
         throw;
      }

      DAAS_INFO("acquired ", _lock_dir.string(), " for ", operation);
      return true;
   }

   std::future<void> fencing_lock::lock_async(std::string_view)
   {
      throw not_implemented_error("fencing_lock::lock_async: not implemented");
   }

   void fencing_lock::release()
   {
      std::error_code ec;
      if (!std::filesystem::exists(_lock_dir, ec))
      {
         DAAS_WARN("release of ", _lock_dir.string(), ": there is no lock held");
         return;
      }

      lock_record record;
      if (read_record(record) == read_result::valid &&
          (record.owner_worker != _worker_id || record.owner_pid != current_pid()))
      {
         DAAS_WARN("releasing ", _lock_dir.string(), " held by another owner (", record, ")");
      }

      if (remove_all_safe(_lock_dir))
         DAAS_INFO("released ", _lock_dir.string());
      else
         DAAS_WARN("release of ", _lock_dir.string(), ": lock disappeared before removal");
   }

   std::string fencing_lock::lock_message() const
   {
      std::lock_guard<std::mutex> lock(_msg_mutex);
      if (_message.empty())
         return default_lock_message;
      return _message;
   }

   void fencing_lock::set_lock_message(std::string msg)
   {
      std::lock_guard<std::mutex> lock(_msg_mutex);
      _message = std::move(msg);
   }
}  // namespace daas
