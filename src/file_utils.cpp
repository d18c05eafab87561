#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <system_error>

#include <daas/debug.hpp>
#include <daas/environment.hpp>
#include <daas/file_utils.hpp>

namespace daas
{
   namespace
   {
      void write_all(int fd, std::string_view content)
      {
         while (!content.empty())
         {
            auto written = ::write(fd, content.data(), content.size());
            if (written < 0)
            {
               if (errno == EINTR)
                  continue;
               throw std::system_error{errno, std::generic_category()};
            }
            content.remove_prefix(written);
         }
      }

      // Unique within the fleet: several instances may write the same file.
      std::filesystem::path temp_sibling(const std::filesystem::path& p)
      {
         static std::atomic<uint64_t> counter{0};
         auto name = p.filename().string() + ".tmp." + std::to_string(current_pid()) + "." +
                     std::to_string(current_tid()) + "." + std::to_string(counter++);
         return p.parent_path() / name;
      }
   }  // namespace

   uint64_t file_size(const std::filesystem::path& p)
   {
      return std::filesystem::file_size(p);
   }

   std::string file_name(const std::filesystem::path& p)
   {
      return p.filename().string();
   }

   void write_file_atomic(const std::filesystem::path& p, std::string_view content)
   {
      auto tmp = temp_sibling(p);
      int  fd  = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
      if (fd < 0)
         throw std::system_error{errno, std::generic_category()};

      try
      {
         write_all(fd, content);
         if (::fsync(fd) != 0)
            throw std::system_error{errno, std::generic_category()};
      }
      catch (...)
      {
         ::close(fd);
         ::unlink(tmp.c_str());
         throw;
      }

      if (::close(fd) != 0)
      {
         int err = errno;
         ::unlink(tmp.c_str());
         throw std::system_error{err, std::generic_category()};
      }
      if (::rename(tmp.c_str(), p.c_str()) != 0)
      {
         int err = errno;
         ::unlink(tmp.c_str());
         throw std::system_error{err, std::generic_category()};
      }
   }

   bool create_file_exclusive(const std::filesystem::path& p, std::string_view content)
   {
      int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
      if (fd < 0)
      {
         if (errno == EEXIST)
            return false;
         throw std::system_error{errno, std::generic_category()};
      }

      try
      {
         write_all(fd, content);
      }
      catch (...)
      {
         ::close(fd);
         throw;
      }
      if (::close(fd) != 0)
         throw std::system_error{errno, std::generic_category()};
      return true;
   }

   std::optional<std::string> read_file(const std::filesystem::path& p)
   {
      int fd = ::open(p.c_str(), O_RDONLY | O_CLOEXEC);
      if (fd < 0)
      {
         if (errno == ENOENT || errno == ENOTDIR)
            return std::nullopt;
         throw std::system_error{errno, std::generic_category()};
      }

      std::string content;
      char        buf[4096];
      while (true)
      {
         auto n = ::read(fd, buf, sizeof(buf));
         if (n < 0)
         {
            if (errno == EINTR)
               continue;
            int err = errno;
            ::close(fd);
            throw std::system_error{err, std::generic_category()};
         }
         if (n == 0)
            break;
         content.append(buf, n);
      }
      ::close(fd);
      return content;
   }

   void touch(const std::filesystem::path& p)
   {
      int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
      if (fd < 0)
         throw std::system_error{errno, std::generic_category()};
      int rc  = ::futimens(fd, nullptr);
      int err = errno;
      ::close(fd);
      if (rc != 0)
         throw std::system_error{err, std::generic_category()};
   }

   bool remove_all_safe(const std::filesystem::path& p)
   {
      std::error_code ec;
      auto            removed = std::filesystem::remove_all(p, ec);
      if (ec)
      {
         // another process removing the same tree shows up as ENOENT part way
         if (ec != std::errc::no_such_file_or_directory)
            DAAS_WARN("unable to remove ", p.string(), ": ", ec.message());
         return false;
      }
      return removed > 0 && removed != static_cast<std::uintmax_t>(-1);
   }
}  // namespace daas
