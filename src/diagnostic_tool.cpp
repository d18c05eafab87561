#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <sstream>
#include <system_error>
#include <thread>

#include <daas/debug.hpp>
#include <daas/diagnostic_tool.hpp>
#include <daas/error.hpp>

namespace daas
{
   std::vector<std::string> split_tool_params(const std::string& tool_params)
   {
      std::vector<std::string> words;
      std::istringstream       in(tool_params);
      std::string              word;
      while (in >> word)
         words.push_back(word);
      return words;
   }

   process_tool::process_tool(std::filesystem::path executable,
                              std::string           extension,
                              tool_config           cfg,
                              const clock&          clk)
       : _config(std::move(cfg)),
         _executable(std::move(executable)),
         _extension(std::move(extension)),
         _clock(clk)
   {
   }

   std::filesystem::path process_tool::output_file(const std::filesystem::path& output_dir) const
   {
      static std::atomic<uint32_t> counter{0};
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    _clock.now().time_since_epoch())
                    .count();
      auto name = _executable.stem().string() + "_" + std::to_string(getpid()) + "_" +
                  std::to_string(ms) + "_" + std::to_string(counter++) + _extension;
      return output_dir / name;
   }

   std::vector<std::string> process_tool::arguments(const std::string&           tool_params,
                                                    const std::filesystem::path& output) const
   {
      std::vector<std::string> args{"collect"};
      if (_config.target_pid > 0)
      {
         args.push_back("-p");
         args.push_back(std::to_string(_config.target_pid));
      }
      args.push_back("--output");
      args.push_back(output.string());
      for (auto& p : split_tool_params(tool_params))
         args.push_back(std::move(p));
      return args;
   }

   int process_tool::run(const std::vector<std::string>& args,
                         const cancellation_token&       cancel) const
   {
      std::vector<char*> argv;
      argv.reserve(args.size() + 2);
      argv.push_back(const_cast<char*>(_executable.c_str()));
      for (const auto& s : args)
         argv.push_back(const_cast<char*>(s.c_str()));
      argv.push_back(nullptr);

      pid_t pid = fork();
      if (pid < 0)
         throw std::system_error{errno, std::generic_category()};
      if (pid == 0)
      {
         execvp(_executable.c_str(), argv.data());
         _exit(127);
      }

      DAAS_INFO("started ", _executable.string(), " as pid ", pid);

      bool                                  terminated = false;
      std::chrono::steady_clock::time_point kill_at;
      while (true)
      {
         int   status = 0;
         pid_t r      = waitpid(pid, &status, WNOHANG);
         if (r < 0)
         {
            if (errno == EINTR)
               continue;
            throw std::system_error{errno, std::generic_category()};
         }
         if (r == pid)
         {
            if (terminated)
               throw operation_canceled();
            if (WIFEXITED(status))
               return WEXITSTATUS(status);
            return -1;
         }

         if (cancel.is_canceled())
         {
            if (!terminated)
            {
               DAAS_WARN("canceling ", _executable.string(), " (pid ", pid, ")");
               kill(pid, SIGTERM);
               terminated = true;
               kill_at    = std::chrono::steady_clock::now() + _config.kill_grace;
            }
            else if (std::chrono::steady_clock::now() >= kill_at)
            {
               kill(pid, SIGKILL);
               kill_at = std::chrono::steady_clock::time_point::max();
            }
         }
         std::this_thread::sleep_for(_config.wait_poll);
      }
   }

   std::vector<log_file> process_tool::invoke(const std::string&           tool_params,
                                              const std::filesystem::path& output_dir,
                                              const cancellation_token&    cancel)
   {
      cancel.throw_if_canceled();
      std::filesystem::create_directories(output_dir);

      auto output    = output_file(output_dir);
      int  exit_code = run(arguments(tool_params, output), cancel);
      if (exit_code == 127)
         throw tool_failed_error("unable to execute " + _executable.string());
      if (exit_code != 0)
         throw tool_failed_error(_executable.string() + " exited with code " +
                                 std::to_string(exit_code));

      std::error_code ec;
      if (!std::filesystem::exists(output, ec))
         throw tool_failed_error(_executable.string() + " did not produce " + output.string());

      log_file l;
      l.full_path = output;
      return {l};
   }

   std::unique_ptr<diagnostic_tool> process_tool_factory::make(diagnostic_tool_kind kind) const
   {
      switch (kind)
      {
         case diagnostic_tool_kind::memory_dump:
            return std::make_unique<memory_dump_tool>(_config, _clock);
         case diagnostic_tool_kind::profiler:
            return std::make_unique<trace_tool>(_config, _clock);
         default:
         {
            std::ostringstream msg;
            msg << "Diagnostic Tool of type " << kind << " not found";
            throw unsupported_tool_error(msg.str());
         }
      }
   }
}  // namespace daas
