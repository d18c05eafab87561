#pragma once
#include <pthread.h>
#include <strings.h>
#include <time.h>
#include <unistd.h>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <format>
#include <iterator>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace daas
{
   /**
    * Severity of a log line. Lines below the process threshold are dropped
    * before anything is formatted.
    *
    * The threshold is read once from DAAS_LOG_LEVEL, which takes a level name
    * in any case (trace, debug, info, warn, error, fatal, none) or its number
    * 0-6. Unset or unrecognized means info in debug builds and warn otherwise.
    */
   enum class log_level : uint8_t
   {
      trace = 0,
      debug = 1,
      info  = 2,
      warn  = 3,
      error = 4,
      fatal = 5,
      none  = 6
   };

   namespace detail
   {
      struct level_style
      {
         const char* name;
         const char* color;
      };

      // indexed by log_level
      inline constexpr level_style level_styles[] = {
          {"TRACE", "\033[37m"},  {"DEBUG", ""},          {"INFO", "\033[36m"},
          {"WARN", "\033[33m"},   {"ERROR", "\033[1;31m"}, {"FATAL", "\033[1;35m"},
          {"NONE", ""},
      };

      inline log_level default_log_level()
      {
#ifdef NDEBUG
         return log_level::warn;
#else
         return log_level::info;
#endif
      }

      inline log_level parse_log_level(const char* text)
      {
         if (!text || !*text)
            return default_log_level();

         for (size_t i = 0; i < std::size(level_styles); ++i)
         {
            if (strcasecmp(text, level_styles[i].name) == 0)
               return static_cast<log_level>(i);
         }

         char* end = nullptr;
         long  num = std::strtol(text, &end, 10);
         if (*end == '\0' && num >= 0 && num <= static_cast<long>(log_level::none))
            return static_cast<log_level>(num);
         return default_log_level();
      }

      inline std::mutex& log_mutex()
      {
         static std::mutex m;
         return m;
      }

      inline std::string_view base_name(const char* path)
      {
         const char* slash = strrchr(path, '/');
         return slash ? std::string_view(slash + 1) : std::string_view(path);
      }

      // daemons log to files; color only when someone is watching
      inline bool use_color()
      {
         static const bool tty = ::isatty(STDERR_FILENO) == 1;
         return tty;
      }

      inline std::string utc_clock_time()
      {
         auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();
         time_t    secs = static_cast<time_t>(ms / 1000);
         struct tm t;
         gmtime_r(&secs, &t);
         return std::format("{:02}:{:02}:{:02}.{:03}", t.tm_hour, t.tm_min, t.tm_sec, ms % 1000);
      }
   }  // namespace detail

   inline log_level get_log_level()
   {
      static const log_level level = detail::parse_log_level(std::getenv("DAAS_LOG_LEVEL"));
      return level;
   }

   /// Name of the calling thread as it appears in log lines; sets it if n is given.
   inline const char* thread_name(const char* n = nullptr)
   {
      static thread_local const char* name = "-";
      if (n)
         name = n;
      return name;
   }

   /**
    * Writes one line to stderr:
    *
    *    12:00:00.123 WARN    4242 runner   fencing_lock.cpp:87  reclaiming ...
    *
    * Several daas processes usually write into the same collected log, hence
    * the pid. args are streamed with operator<<.
    */
   template <typename... Ts>
   void write_log(log_level level, const char* file, int line, const Ts&... args)
   {
      if (level < get_log_level())
         return;

      const auto& style = detail::level_styles[static_cast<size_t>(level)];
      bool        color = *style.color && detail::use_color();

      std::ostringstream out;
      if (color)
         out << style.color;
      out << std::format("{} {:<5} {:>7} {:<8.8} {}:{}  ", detail::utc_clock_time(), style.name,
                         ::getpid(), thread_name(), detail::base_name(file), line);
      (out << ... << args);
      if (color)
         out << "\033[0m";
      out << '\n';

      std::lock_guard<std::mutex> lock(detail::log_mutex());
      std::cerr << out.str();
   }

#define DAAS_LOG_AT(lvl, ...) ::daas::write_log(::daas::log_level::lvl, __FILE__, __LINE__, __VA_ARGS__)

#define DAAS_TRACE(...) DAAS_LOG_AT(trace, __VA_ARGS__)
#define DAAS_DEBUG(...) DAAS_LOG_AT(debug, __VA_ARGS__)
#define DAAS_INFO(...) DAAS_LOG_AT(info, __VA_ARGS__)
#define DAAS_WARN(...) DAAS_LOG_AT(warn, __VA_ARGS__)
#define DAAS_ERROR(...) DAAS_LOG_AT(error, __VA_ARGS__)
#define DAAS_FATAL(...) DAAS_LOG_AT(fatal, __VA_ARGS__)

   /**
    * Names the calling thread for the log and for the OS, where the name is
    * cut to 15 characters. name must outlive the thread.
    */
   inline int set_current_thread_name(const char* name)
   {
      thread_name(name);
      char os_name[16] = {0};
      strncpy(os_name, name, sizeof(os_name) - 1);
      return pthread_setname_np(pthread_self(), os_name);
   }

}  // namespace daas
