#pragma once
#include <filesystem>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <daas/config.hpp>
#include <daas/lock_record.hpp>
#include <daas/time.hpp>

namespace daas
{
   /**
    * A mutual exclusion lock between processes that share nothing but a file
    * system, possibly on different machines.
    *
    * The lock for a resource is the directory <locks_root>/<resource>. The
    * acquirer creates it with mkdir(), which fails if it already exists, and
    * then writes a lock_record into <dir>/info.lock. The lock is held iff the
    * directory exists, the record parses, and the record has not expired.
    *
    * There is no heartbeat and no quorum: a holder that dies keeps the
    * resource blocked until the record expires, after which the first process
    * to look at the lock deletes it. A corrupt record is deleted the same way
    * so that a torn write can never wedge the fleet. The price is that a
    * second acquirer can slip in while a slow legitimate holder is still
    * writing its record; the grace period in lock_config narrows that window.
    *
    * Any number of fencing_lock objects may refer to the same resource, in one
    * process or many.
    */
   class fencing_lock
   {
     public:
      static constexpr const char* default_lock_message =
          "There is a deployment currently in progress. Please try again when it completes.";

      fencing_lock(std::filesystem::path locks_root,
                   std::string           resource,
                   std::string           worker_id,
                   lock_config           cfg = {},
                   const clock&          clk = system_clock_source::instance());

      fencing_lock(const fencing_lock&)            = delete;
      fencing_lock& operator=(const fencing_lock&) = delete;

      /**
       * Tries to take the lock without waiting.
       *
       * @return false if another holder has a valid lock; nothing is
       *         written or deleted in that case
       */
      bool lock(std::string_view operation);

      /**
       * Waiting acquisition has no implementation.
       *
       * @throw not_implemented_error always
       */
      std::future<void> lock_async(std::string_view operation);

      /**
       * Removes the lock whoever holds it. Releasing a lock that is not there
       * logs a warning and does nothing else.
       */
      void release();

      /**
       * @return true if a valid lock exists. An expired or corrupt lock is
       *         deleted as a side effect and reported as not held.
       */
      bool is_held() const;

      /**
       * @return the record of the valid lock, nullopt if not held. Reclaims
       *         like is_held().
       */
      std::optional<lock_record> lock_info() const;

      /// Message shown to users who find the resource locked.
      std::string lock_message() const;
      void        set_lock_message(std::string msg);

      const std::filesystem::path& lock_dir() const { return _lock_dir; }
      std::filesystem::path        record_path() const { return _lock_dir / "info.lock"; }
      const std::string&           worker_id() const { return _worker_id; }

     private:
      enum class read_result
      {
         absent,
         valid,
         expired,
         corrupt
      };

      read_result read_record(lock_record& out) const;

      // the invariant check shared by is_held(), lock_info() and lock()
      std::optional<lock_record> observe() const;

      void write_record(std::string_view operation);

      std::filesystem::path _locks_root;
      std::filesystem::path _lock_dir;
      std::string           _worker_id;
      lock_config           _config;
      const clock&          _clock;

      mutable std::mutex _msg_mutex;
      std::string        _message;
   };

   /**
    * Releases the lock on destruction if this object acquired it.
    */
   class scoped_fencing_lock
   {
     public:
      scoped_fencing_lock(fencing_lock& l, std::string_view operation)
          : _lock(l), _owns(l.lock(operation))
      {
      }
      ~scoped_fencing_lock()
      {
         if (_owns)
            _lock.release();
      }

      scoped_fencing_lock(const scoped_fencing_lock&)            = delete;
      scoped_fencing_lock& operator=(const scoped_fencing_lock&) = delete;

      bool owns_lock() const { return _owns; }
      explicit operator bool() const { return _owns; }

     private:
      fencing_lock& _lock;
      bool          _owns;
   };

}  // namespace daas
