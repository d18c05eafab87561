#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <daas/cancellation.hpp>
#include <daas/config.hpp>
#include <daas/session.hpp>
#include <daas/time.hpp>

namespace daas
{
   /**
    * Something that collects diagnostic artifacts on this instance.
    */
   class diagnostic_tool
   {
     public:
      virtual ~diagnostic_tool() = default;

      /**
       * Runs the collection to completion, which may take minutes.
       *
       * @param tool_params  opaque parameters from the session
       * @param output_dir   directory the artifacts go to, created if needed
       * @return the artifacts in the order produced; only full_path is set
       * @throw operation_canceled when cancel fires before completion
       * @throw tool_failed_error when the collection did not succeed
       */
      virtual std::vector<log_file> invoke(const std::string&           tool_params,
                                           const std::filesystem::path& output_dir,
                                           const cancellation_token&    cancel) = 0;
   };

   /**
    * Runs an external collector as a child process:
    *
    *    <executable> collect [-p <pid>] --output <file> <tool_params...>
    *
    * and reports <file> as the single artifact. tool_params is split on
    * whitespace. On cancellation the child gets SIGTERM, then SIGKILL after
    * tool_config::kill_grace. Artifact names carry clk's time.
    */
   class process_tool : public diagnostic_tool
   {
     public:
      process_tool(std::filesystem::path executable,
                   std::string           extension,
                   tool_config           cfg,
                   const clock&          clk = system_clock_source::instance());

      std::vector<log_file> invoke(const std::string&           tool_params,
                                   const std::filesystem::path& output_dir,
                                   const cancellation_token&    cancel) override;

      const std::filesystem::path& executable() const { return _executable; }

     protected:
      virtual std::vector<std::string> arguments(const std::string&           tool_params,
                                                 const std::filesystem::path& output) const;

      tool_config _config;

     private:
      std::filesystem::path output_file(const std::filesystem::path& output_dir) const;
      int                   run(const std::vector<std::string>& args,
                                const cancellation_token&       cancel) const;

      std::filesystem::path _executable;
      std::string           _extension;
      const clock&          _clock;
   };

   class memory_dump_tool : public process_tool
   {
     public:
      explicit memory_dump_tool(tool_config cfg, const clock& clk = system_clock_source::instance())
          : process_tool(cfg.memory_dump_executable, ".dmp", cfg, clk)
      {
      }
   };

   /// CPU/CLR execution trace.
   class trace_tool : public process_tool
   {
     public:
      explicit trace_tool(tool_config cfg, const clock& clk = system_clock_source::instance())
          : process_tool(cfg.trace_executable, ".nettrace", cfg, clk)
      {
      }
   };

   /**
    * The one place that maps a session's tool kind to a collector.
    */
   class diagnostic_tool_factory
   {
     public:
      virtual ~diagnostic_tool_factory() = default;

      /// @throw unsupported_tool_error for diagnostic_tool_kind::unknown
      virtual std::unique_ptr<diagnostic_tool> make(diagnostic_tool_kind kind) const = 0;
   };

   class process_tool_factory : public diagnostic_tool_factory
   {
     public:
      explicit process_tool_factory(tool_config  cfg,
                                    const clock& clk = system_clock_source::instance())
          : _config(std::move(cfg)), _clock(clk)
      {
      }

      std::unique_ptr<diagnostic_tool> make(diagnostic_tool_kind kind) const override;

     private:
      tool_config  _config;
      const clock& _clock;
   };

   std::vector<std::string> split_tool_params(const std::string& tool_params);

}  // namespace daas
