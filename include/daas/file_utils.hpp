#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace daas
{
   /**
    * Small helpers over std::filesystem and POSIX for state that several
    * processes, possibly on several machines, read and write concurrently.
    *
    * Writers never leave a half written file at the final path: content goes
    * to a temporary sibling first and is renamed into place.
    */

   /// Size in bytes, throws std::filesystem::filesystem_error if missing.
   uint64_t file_size(const std::filesystem::path& p);

   /// Last path component, e.g. "dump_1.dmp" for "/a/b/dump_1.dmp".
   std::string file_name(const std::filesystem::path& p);

   /**
    * Replaces the content of p. Throws std::system_error on failure; the old
    * content, if any, stays in place.
    */
   void write_file_atomic(const std::filesystem::path& p, std::string_view content);

   /**
    * Creates p with the given content only if it does not exist yet.
    *
    * @return false if p already existed
    */
   bool create_file_exclusive(const std::filesystem::path& p, std::string_view content);

   /**
    * @return the full content of p, nullopt if p does not exist. Other read
    *         errors throw std::system_error.
    */
   std::optional<std::string> read_file(const std::filesystem::path& p);

   /// Creates p if needed and sets its modification time to now.
   void touch(const std::filesystem::path& p);

   /**
    * Removes p recursively. A missing path is not an error. Failures are
    * logged and reported through the return value rather than thrown because
    * callers use this to reclaim state that another process may be removing
    * at the same moment.
    *
    * @return true if something was removed by this call
    */
   bool remove_all_safe(const std::filesystem::path& p);

}  // namespace daas
