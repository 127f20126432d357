#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

DECLARE_string(temp_directory);
DECLARE_string(python);
DECLARE_int32(mem);
DECLARE_int32(timeout);
DECLARE_bool(allow_network);
DECLARE_bool(unsafe);
DECLARE_bool(trusted_model);
DECLARE_int32(workers);
DECLARE_bool(keep_sandboxes);
DECLARE_int32(max_file_size_mb);
DECLARE_int32(max_open_files);
DECLARE_int32(max_processes);
DECLARE_bool(syscall_filter);
DECLARE_string(limiter);
DECLARE_bool(audit_only);

#endif
