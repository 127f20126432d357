#include "util/flags.hpp"

DEFINE_string(temp_directory, "/tmp",
              "Ephemeral directory under which the sandboxes are created");
DEFINE_string(python, "python3",
              "Interpreter used to run the submissions, looked up in PATH");
DEFINE_int32(mem, 512,
             "Memory limit in MB. One of 256, 384, 512, 768, 1024");
DEFINE_int32(timeout, 30, "Wall-clock limit for each run, in seconds");
DEFINE_bool(allow_network, false, "Allow submissions to open network sockets");
DEFINE_bool(unsafe, false,
            "Run submissions even if the security audit did not pass");
DEFINE_bool(trusted_model, false,
            "Skip the interactive confirmation required by --unsafe");
DEFINE_int32(workers, 1, "Maximum number of concurrent sandboxes");
DEFINE_bool(keep_sandboxes, false,
            "Do not remove the sandbox directories (debug only)");
DEFINE_int32(max_file_size_mb, 16,
             "Maximum size of a file written by a submission, in MB");
DEFINE_int32(max_open_files, 64,
             "Maximum number of file descriptors a submission can open");
DEFINE_int32(max_processes, 1,
             "Maximum number of active processes in a Windows job object");
DEFINE_bool(syscall_filter, true,
            "Install the seccomp filter in the child on Linux");
DEFINE_string(limiter, "",
              "Resource limiter to use (posix-rlimit, job-object, watchdog). "
              "Empty means the strongest one available");
DEFINE_bool(audit_only, false,
            "Run the security audit, print its report and exit");
