#pragma once
#include <cstdint>
#include <string>

namespace daas
{
   /// Environment variable the hosting platform uses for the fleet instance id.
   inline constexpr const char* instance_id_env_var = "WEBSITE_INSTANCE_ID";

   int32_t current_pid();

   /// Kernel thread id of the calling thread.
   int64_t current_tid();

   std::string host_name();

   /**
    * Identity of this instance within the fleet: WEBSITE_INSTANCE_ID when the
    * host sets it, otherwise the host name.
    */
   std::string instance_id_from_environment();

   /**
    * Reads a boolean switch from the environment. "1", "true", "yes" and "on"
    * (any case) are true, any other value is false, unset returns default_value.
    */
   bool env_flag(const char* name, bool default_value);

}  // namespace daas
