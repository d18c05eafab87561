#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/program_options.hpp>
#include <cerrno>
#include <iomanip>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include <daas/environment.hpp>
#include <daas/error.hpp>
#include <daas/fencing_lock.hpp>
#include <daas/file_session_store.hpp>

using namespace daas;

namespace
{
   void print_session(std::ostream& os, const session& s)
   {
      os << std::left << std::setw(24) << s.session_id << std::setw(12) << s.tool
         << std::setw(26) << format_utc(s.start_time)
         << (s.complete ? "complete" : "active") << "  started " << s.started.size()
         << ", completed " << s.completed.size() << ", logs " << s.logs.size() << "\n";
   }

   void print_session_details(std::ostream& os, const session& s)
   {
      print_session(os, s);
      os << "  params:    " << s.tool_params << "\n";
      os << "  scope:     ";
      if (s.all_instances)
         os << "all instances";
      for (const auto& i : s.instances)
         os << " " << i;
      os << "\n";
      if (s.end_time)
         os << "  ended:     " << format_utc(*s.end_time) << "\n";
      for (const auto& l : s.logs)
         os << "  log:       " << l.instance << "  " << l.name << "  " << l.size << " bytes  "
            << l.full_path.string() << "\n";
   }

   // runs argv as a child and returns its exit code
   int run_child(const std::vector<std::string>& args)
   {
      std::vector<char*> argv;
      for (const auto& a : args)
         argv.push_back(const_cast<char*>(a.c_str()));
      argv.push_back(nullptr);

      pid_t pid = fork();
      if (pid < 0)
         throw std::system_error{errno, std::generic_category()};
      if (pid == 0)
      {
         execvp(argv[0], argv.data());
         _exit(127);
      }

      int status = 0;
      while (waitpid(pid, &status, 0) < 0)
      {
         if (errno != EINTR)
            throw std::system_error{errno, std::generic_category()};
      }
      return WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
   }
}  // namespace

int main(int argc, char** argv)
{
   namespace po = boost::program_options;

   std::string              command;
   std::vector<std::string> args;
   std::string              root;
   std::string              resource;
   std::string              operation;
   std::string              instance_id;
   std::string              message;
   int                      ttl_sec;

   // clang-format off
   po::options_description desc("daasctl options");
   desc.add_options()
      ("help,h", "Print help message")
      ("root", po::value<std::string>(&root)->default_value("/home/site/daas"), "Shared state directory")
      ("instance-id", po::value<std::string>(&instance_id)->default_value(instance_id_from_environment()),
                "Identity of this instance in the fleet")
      ("resource", po::value<std::string>(&resource)->default_value("deployment"), "Name of the locked resource")
      ("operation", po::value<std::string>(&operation)->default_value("deployment"), "Operation recorded in the lock")
      ("message", po::value<std::string>(&message), "Message shown to whoever finds the resource locked")
      ("lock-ttl-sec", po::value<int>(&ttl_sec)->default_value(1200), "Lifetime of a lock")
      ("tool", po::value<diagnostic_tool_kind>()->default_value(diagnostic_tool_kind::memory_dump),
                "MemoryDump or Profiler")
      ("params", po::value<std::string>()->default_value(""), "Parameters passed to the collector")
      ("instance", po::value<std::vector<std::string>>()->composing(),
                "Instance that takes part in the session, repeatable; default all");
   po::options_description hidden;
   hidden.add_options()
      ("command", po::value<std::string>(&command))
      ("args", po::value<std::vector<std::string>>(&args));
   // clang-format on

   po::options_description all;
   all.add(desc).add(hidden);
   po::positional_options_description positional;
   positional.add("command", 1).add("args", -1);

   auto usage = [&](std::ostream& os)
   {
      os << "usage: daasctl [options] <command> [args]\n\n"
            "commands:\n"
            "  lock                  take the lock on --resource\n"
            "  unlock                release the lock on --resource\n"
            "  status                show who holds the lock on --resource\n"
            "  run -- <cmd...>       run a command while holding the lock\n"
            "  submit                start a session with --tool/--params/--instance\n"
            "  list                  list sessions\n"
            "  show <session>        show one session\n\n"
         << desc << "\n";
   };

   po::variables_map vm;
   try
   {
      po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(),
                vm);
      po::notify(vm);
   }
   catch (const po::error& e)
   {
      std::cerr << e.what() << "\n";
      usage(std::cerr);
      return 2;
   }

   if (vm.count("help") || command.empty())
   {
      usage(std::cout);
      return vm.count("help") ? 0 : 2;
   }

   lock_config lcfg;
   lcfg.ttl = std::chrono::seconds(ttl_sec);

   try
   {
      if (command == "lock" || command == "unlock" || command == "status" || command == "run")
      {
         fencing_lock lock(std::filesystem::path(root) / "locks", resource, instance_id, lcfg);
         if (vm.count("message"))
            lock.set_lock_message(message);

         if (command == "status")
         {
            if (auto info = lock.lock_info())
            {
               std::cout << resource << ": locked (" << *info << ")\n";
               return 1;
            }
            std::cout << resource << ": free\n";
            return 0;
         }
         if (command == "unlock")
         {
            lock.release();
            return 0;
         }
         if (command == "lock")
         {
            if (!lock.lock(operation))
            {
               std::cerr << lock.lock_message() << "\n";
               return 1;
            }
            return 0;
         }

         // run
         if (args.empty())
         {
            std::cerr << "run: no command given\n";
            return 2;
         }
         scoped_fencing_lock guard(lock, operation);
         if (!guard)
         {
            std::cerr << lock.lock_message() << "\n";
            return 1;
         }
         return run_child(args);
      }

      file_session_store store(root, instance_id);
      if (command == "submit")
      {
         std::vector<std::string> instances;
         if (vm.count("instance"))
            instances = vm["instance"].as<std::vector<std::string>>();
         auto s = store.create_session(vm["tool"].as<diagnostic_tool_kind>(),
                                       vm["params"].as<std::string>(), instances);
         std::cout << s.session_id << "\n";
         return 0;
      }
      if (command == "list")
      {
         for (const auto& s : store.list_sessions())
            print_session(std::cout, s);
         return 0;
      }
      if (command == "show")
      {
         if (args.empty())
         {
            std::cerr << "show: no session id given\n";
            return 2;
         }
         auto s = store.get_session(args.front());
         if (!s)
         {
            std::cerr << "no session " << args.front() << "\n";
            return 1;
         }
         print_session_details(std::cout, *s);
         return 0;
      }

      std::cerr << "unknown command '" << command << "'\n";
      usage(std::cerr);
      return 2;
   }
   catch (const session_conflict_error& e)
   {
      std::cerr << e.what() << "\n";
      return 1;
   }
   catch (const std::exception& e)
   {
      std::cerr << "daasctl: " << e.what() << "\n";
      return 1;
   }
}
