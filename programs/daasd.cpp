#include <signal.h>
#include <boost/program_options.hpp>
#include <iostream>
#include <string>

#include <daas/debug.hpp>
#include <daas/diagnostic_tool.hpp>
#include <daas/environment.hpp>
#include <daas/file_session_store.hpp>
#include <daas/session_runner.hpp>

using namespace daas;

int main(int argc, char** argv)
{
   namespace po = boost::program_options;

   runner_config rcfg;
   tool_config   tcfg;
   store_config  scfg;
   std::string   root;
   std::string   instance_id;
   std::string   gate_var;
   int           poll_sec;
   int           max_minutes;

   // clang-format off
   po::options_description desc("daasd options");
   desc.add_options()
      ("help,h", "Print help message")
      ("root", po::value<std::string>(&root)->default_value("/home/site/daas"),
                "Shared directory holding sessions, locks and instance heartbeats")
      ("instance-id", po::value<std::string>(&instance_id)->default_value(instance_id_from_environment()),
                "Identity of this instance in the fleet")
      ("output-dir", po::value<std::string>()->default_value(rcfg.output_dir.string()),
                "Where collected artifacts are written, one subdirectory per session")
      ("poll-interval-sec", po::value<int>(&poll_sec)->default_value(60), "Seconds between two polls of the session store")
      ("max-session-minutes", po::value<int>(&max_minutes)->default_value(15),
                "Sessions older than this are forced complete")
      ("keep-overrun-collections", po::bool_switch()->default_value(false),
                "Let local collections run on after their session was forced complete")
      ("dump-tool", po::value<std::string>()->default_value(tcfg.memory_dump_executable.string()),
                "Memory dump collector executable")
      ("trace-tool", po::value<std::string>()->default_value(tcfg.trace_executable.string()),
                "CPU trace collector executable")
      ("target-pid", po::value<int>(&tcfg.target_pid)->default_value(0), "Process the collectors attach to")
      ("enable-var", po::value<std::string>(&gate_var)->default_value("DAAS_ENABLED"),
                "Environment variable that switches collection on; polling pauses while it is off");
   // clang-format on

   po::variables_map vm;
   try
   {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);
   }
   catch (const po::error& e)
   {
      std::cerr << e.what() << "\n" << desc << "\n";
      return 2;
   }

   if (vm.count("help"))
   {
      std::cout << desc << "\n";
      return 0;
   }

   if (poll_sec <= 0 || max_minutes <= 0)
   {
      std::cerr << "--poll-interval-sec and --max-session-minutes must be positive\n";
      return 2;
   }

   rcfg.poll_interval               = std::chrono::seconds(poll_sec);
   rcfg.max_session_duration        = std::chrono::minutes(max_minutes);
   rcfg.cancel_on_forced_completion = !vm["keep-overrun-collections"].as<bool>();
   rcfg.output_dir                  = vm["output-dir"].as<std::string>();
   tcfg.memory_dump_executable      = vm["dump-tool"].as<std::string>();
   tcfg.trace_executable            = vm["trace-tool"].as<std::string>();
   scfg.heartbeat_ttl               = heartbeat_ttl_for(rcfg.poll_interval);

   // handled by sigwait below, blocked before any thread starts so all inherit it
   sigset_t signals;
   sigemptyset(&signals);
   sigaddset(&signals, SIGINT);
   sigaddset(&signals, SIGTERM);
   pthread_sigmask(SIG_BLOCK, &signals, nullptr);

   set_current_thread_name("main");
   try
   {
      file_session_store   store(root, instance_id, scfg);
      process_tool_factory tools(tcfg);
      session_runner       runner(store, tools, rcfg, system_clock_source::instance(),
                                  [gate_var]() { return env_flag(gate_var.c_str(), true); });

      DAAS_INFO("daasd for instance ", instance_id, " on ", root);
      runner.start();

      int sig = 0;
      sigwait(&signals, &sig);
      DAAS_INFO("received signal ", sig, ", shutting down");
      runner.stop();
   }
   catch (const std::exception& e)
   {
      DAAS_FATAL("daasd: ", e.what());
      return 1;
   }
   return 0;
}
