#include <time.h>
#include <cstdio>
#include <daas/time.hpp>

namespace daas
{
   std::string format_utc(utc_time t)
   {
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
      auto secs   = ms / 1000;
      auto millis = ms % 1000;
      if (millis < 0)
      {
         millis += 1000;
         secs -= 1;
      }

      time_t  tt = static_cast<time_t>(secs);
      struct tm tm_utc;
      gmtime_r(&tt, &tm_utc);

      char buf[32];
      std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                    tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday, tm_utc.tm_hour,
                    tm_utc.tm_min, tm_utc.tm_sec, static_cast<int>(millis));
      return buf;
   }

   std::optional<utc_time> parse_utc(std::string_view text)
   {
      // sscanf needs a terminated buffer
      std::string s(text);

      int year, month, day, hour, minute, second;
      int consumed = 0;
      if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &year, &month, &day, &hour,
                      &minute, &second, &consumed) != 6)
         return std::nullopt;

      if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
          second > 60 || year < 1970)
         return std::nullopt;

      int         millis = 0;
      const char* rest   = s.c_str() + consumed;
      if (*rest == '.')
      {
         ++rest;
         int digits = 0;
         while (*rest >= '0' && *rest <= '9')
         {
            if (digits < 3)
            {
               millis = millis * 10 + (*rest - '0');
               ++digits;
            }
            ++rest;
         }
         if (digits == 0)
            return std::nullopt;
         while (digits++ < 3)
            millis *= 10;
      }
      if (*rest == 'Z')
         ++rest;
      if (*rest != '\0')
         return std::nullopt;

      struct tm tm_utc = {};
      tm_utc.tm_year   = year - 1900;
      tm_utc.tm_mon    = month - 1;
      tm_utc.tm_mday   = day;
      tm_utc.tm_hour   = hour;
      tm_utc.tm_min    = minute;
      tm_utc.tm_sec    = second;
      time_t secs      = timegm(&tm_utc);
      if (secs == static_cast<time_t>(-1))
         return std::nullopt;

      // timegm rolls 02-31 over into March
      struct tm date = {};
      date.tm_year   = year - 1900;
      date.tm_mon    = month - 1;
      date.tm_mday   = day;
      if (timegm(&date) == static_cast<time_t>(-1) || date.tm_mday != day ||
          date.tm_mon != month - 1)
         return std::nullopt;

      return utc_time(std::chrono::seconds(secs)) + std::chrono::milliseconds(millis);
   }
}  // namespace daas
