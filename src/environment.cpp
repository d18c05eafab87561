#include <pthread.h>
#include <sys/syscall.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <daas/environment.hpp>

namespace daas
{
   int32_t current_pid()
   {
      return static_cast<int32_t>(getpid());
   }

   int64_t current_tid()
   {
#ifdef __linux__
      return static_cast<int64_t>(syscall(SYS_gettid));
#else
      uint64_t tid = 0;
      pthread_threadid_np(nullptr, &tid);
      return static_cast<int64_t>(tid);
#endif
   }

   std::string host_name()
   {
      char buf[HOST_NAME_MAX + 1] = {0};
      if (gethostname(buf, sizeof(buf) - 1) != 0)
         return "localhost";
      return buf;
   }

   std::string instance_id_from_environment()
   {
      const char* id = std::getenv(instance_id_env_var);
      if (id && *id)
         return id;
      return host_name();
   }

   bool env_flag(const char* name, bool default_value)
   {
      const char* value = std::getenv(name);
      if (!value)
         return default_value;

      std::string v(value);
      std::transform(v.begin(), v.end(), v.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      return v == "1" || v == "true" || v == "yes" || v == "on";
   }
}  // namespace daas
