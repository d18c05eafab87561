#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace daas
{
   /// Absolute wall-clock time, always interpreted as UTC.
   using utc_time = std::chrono::system_clock::time_point;

   /**
    * Source of the current time. Lock expiry and session deadlines are
    * evaluated against this rather than calling system_clock directly so that
    * tests can move time forward without sleeping.
    */
   class clock
   {
     public:
      virtual ~clock()              = default;
      virtual utc_time now() const = 0;
   };

   /**
    * The real clock, shared by everything in a process.
    */
   class system_clock_source : public clock
   {
     public:
      utc_time now() const override { return std::chrono::system_clock::now(); }

      static system_clock_source& instance()
      {
         static system_clock_source source;
         return source;
      }
   };

   /**
    * A clock that only moves when told to. Safe to read from any thread while
    * a test thread advances it.
    */
   class manual_clock : public clock
   {
     public:
      explicit manual_clock(utc_time start = std::chrono::system_clock::now())
          : _now_ms(to_ms(start))
      {
      }

      utc_time now() const override
      {
         return utc_time(std::chrono::milliseconds(_now_ms.load(std::memory_order_acquire)));
      }

      void set(utc_time t) { _now_ms.store(to_ms(t), std::memory_order_release); }

      template <typename Rep, typename Period>
      void advance(std::chrono::duration<Rep, Period> d)
      {
         _now_ms.fetch_add(std::chrono::duration_cast<std::chrono::milliseconds>(d).count(),
                           std::memory_order_acq_rel);
      }

     private:
      static int64_t to_ms(utc_time t)
      {
         return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch())
             .count();
      }

      std::atomic<int64_t> _now_ms;
   };

   /**
    * Formats as ISO-8601 with millisecond precision, e.g. 2026-10-19T12:00:00.000Z
    */
   std::string format_utc(utc_time t);

   /**
    * Parses the output of format_utc(). The fractional part and the trailing 'Z'
    * are optional; anything else that does not match returns nullopt.
    */
   std::optional<utc_time> parse_utc(std::string_view text);

}  // namespace daas
