#include "sandbox/guard_module.hpp"

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "sandbox/errors.hpp"
#include "util/file.hpp"

namespace sandbox {

namespace {

const char* kDeserializationModules[] = {
    "pickle", "_pickle", "cPickle", "shelve",
    "dill",   "cloudpickle", "jsonpickle", "marshal",
};

const char* kNativeMemoryModules[] = {"ctypes", "_ctypes", "cffi", "mmap"};

// Standard library files that generate code only from identifiers they
// validate themselves and need eval/exec/compile to work. Modules that
// evaluate strings chosen by the caller (typing, inspect, annotationlib) must
// never be listed here.
const char* kTrustedEvalCallers[] = {
    "collections/__init__.py",
    "dataclasses.py",
    "unittest/mock.py",
};

std::string PyString(const std::string& s) {
  std::string out = "\"";
  for (char c : s) {
    if (c == '\\' || c == '"') out += '\\';
    out += c;
  }
  return out + "\"";
}

// The pieces below are concatenated into the guard module. Everything after
// kInstallBegin is indented inside _evalbox_install(), whose locals hold the
// original primitives.

const char* kHeader = R"PY(# Generated by evalbox. Imported automatically at interpreter startup, before
# any submitted code runs. Do not edit.
import sys as _sys

)PY";

const char* kPrologue = R"PY(
_LABEL = "EVALBOX-GUARD[%s]"
_LIMIT_MARKER = "EVALBOX-LIMIT[memory]"
_LIMIT_EXIT_CODE = 86
_SETUP_EXIT_CODE = 87


class GuardViolation(PermissionError):
    """A blocked capability was used."""

    def __init__(self, capability, detail):
        PermissionError.__init__(self, "%s %s" % (_LABEL % capability, detail))
        self.capability = capability


class GuardImportViolation(ImportError):
    """A deny-listed module was imported."""

    def __init__(self, capability, module):
        ImportError.__init__(
            self,
            "%s import of '%s' is blocked" % (_LABEL % capability, module),
            name=module)
        self.capability = capability

)PY";

const char* kInstallBegin = R"PY(
def _evalbox_install():
    import builtins
    import importlib
    import io
    import os
    import sysconfig
    import threading
    # Imported before anything is patched, so that their own setup runs with
    # the original primitives.
    import shutil
    import socket
    import subprocess
    import _io
    import _socket

    posix = _sys.modules.get("posix") or _sys.modules.get("nt")
    posixsubprocess = _sys.modules.get("_posixsubprocess")
    winapi = _sys.modules.get("_winapi")
    environ = dict(os.environ)
    allow_network = environ.get("EVALBOX_ALLOW_NETWORK") == "1"

    def normalize_root(path):
        if not path:
            return None
        path = os.path.normcase(os.path.realpath(path))
        if os.path.dirname(path) == path:
            return None
        return path

    def is_under(path, root):
        return path == root or path.startswith(root.rstrip(os.sep) + os.sep)

    sandbox_root = normalize_root(environ.get("EVALBOX_SANDBOX_ROOT", ""))
    guard_dir = os.path.dirname(os.path.realpath(__file__))
    install_paths = sysconfig.get_paths()
    read_roots = [guard_dir, "/usr/share/zoneinfo", "/dev/urandom"]
    for key in ("stdlib", "platstdlib", "purelib", "platlib"):
        read_roots.append(install_paths.get(key))
    for entry in _sys.path:
        if entry and os.path.isabs(entry) and os.path.isdir(entry):
            read_roots.append(entry)
    read_roots = [r for r in map(normalize_root, read_roots) if r]
    write_roots = [r for r in (sandbox_root, os.path.normcase(os.devnull)) if r]

    write_flags = os.O_WRONLY | os.O_RDWR | os.O_APPEND | os.O_CREAT
    write_flags |= os.O_TRUNC

    def is_write_mode(mode):
        return any(c in mode for c in "wax+")

    def resolve(path, dir_fd=None):
        if isinstance(path, int):
            return None
        path = os.fsdecode(os.fspath(path))
        if not path or "\0" in path:
            return ""
        if dir_fd is not None and dir_fd >= 0 and not os.path.isabs(path):
            try:
                base = os.readlink("/proc/self/fd/%d" % dir_fd)
            except OSError:
                return ""
            path = os.path.join(base, path)
        return os.path.normcase(os.path.realpath(path))

    def path_allowed(path, write, dir_fd=None):
        resolved = resolve(path, dir_fd)
        if resolved is None:
            return True
        if not resolved:
            return False
        if any(is_under(resolved, root) for root in write_roots):
            return True
        return not write and any(is_under(resolved, r) for r in read_roots)

    def check_path(path, write, what, dir_fd=None):
        if not path_allowed(path, write, dir_fd):
            raise GuardViolation(
                "file-access", "%s %s of %r outside the sandbox is blocked" %
                (what, "write" if write else "read", path))

    allowed_families = frozenset(
        getattr(_socket, name) for name in ("AF_UNIX",)
        if hasattr(_socket, name))

    def family_name(family):
        try:
            return socket.AddressFamily(family).name
        except ValueError:
            return str(family)

    def check_family(family):
        if allow_network or family in allowed_families:
            return
        raise GuardViolation(
            "network", "socket of family %s is blocked" % family_name(family))

    def denied_capability(name):
        if not isinstance(name, str):
            return None
        parts = name.split(".")
        for end in range(len(parts), 0, -1):
            capability = _DENIED_MODULES.get(".".join(parts[:end]))
            if capability is not None:
                return capability
        return None

    frozen_loaders = frozenset([
        "<frozen importlib._bootstrap>",
        "<frozen importlib._bootstrap_external>",
        "<frozen zipimport>",
    ])
    trusted_files = set()
    for key in ("stdlib", "platstdlib"):
        root = normalize_root(install_paths.get(key))
        if root:
            for relative in _TRUSTED_EVAL_CALLERS:
                trusted_files.add(
                    os.path.normcase(os.path.join(root, *relative.split("/"))))
    trusted_cache = {}

    def trusted_frame(frame):
        if frame is None:
            # Raised by the interpreter itself, outside of any Python code.
            return True
        filename = frame.f_code.co_filename
        if filename in frozen_loaders:
            # Only the import system itself may go through its trampolines.
            caller = frame.f_back
            return caller is not None and (
                caller.f_code.co_filename in frozen_loaders)
        trusted = trusted_cache.get(filename)
        if trusted is None:
            trusted = os.path.normcase(os.path.realpath(filename)) in (
                trusted_files)
            trusted_cache[filename] = trusted
        return trusted

)PY";

const char* kTamperGuard = R"PY(
    if getattr(_sys, "_evalbox_guard_installed", False):
        raise GuardViolation("guard-tamper", "the guard was loaded twice")
    _sys._evalbox_guard_installed = True

    def reload(module):
        raise GuardViolation("guard-tamper", "importlib.reload() is blocked")
    importlib.reload = reload
)PY";

const char* kImportGuard = R"PY(
    class DenyListFinder(object):
        def find_spec(self, fullname, path=None, target=None):
            capability = denied_capability(fullname)
            if capability is not None:
                raise GuardImportViolation(capability, fullname)
            return None

        def find_module(self, fullname, path=None):
            return self.find_spec(fullname, path)

    finder = DenyListFinder()

    def keep_finder(method):
        def guarded(self, *args, **kwargs):
            result = method(self, *args, **kwargs)
            if not any(entry is finder for entry in self):
                list.insert(self, 0, finder)
                raise GuardViolation(
                    "guard-tamper", "the import guard cannot be removed")
            return result
        return guarded

    meta_path_type = type("MetaPath", (list,), dict(
        (name, keep_finder(getattr(list, name)))
        for name in ("remove", "pop", "clear", "__delitem__", "__setitem__",
                     "__iadd__", "__imul__")))
    _sys.meta_path = meta_path_type([finder] + list(_sys.meta_path))
    for name in list(_sys.modules):
        if denied_capability(name) is not None:
            del _sys.modules[name]

    original_import = builtins.__import__

    def guarded_import(name, globals=None, locals=None, fromlist=(), level=0):
        if level == 0:
            capability = denied_capability(name)
            if capability is not None:
                raise GuardImportViolation(capability, name)
        return original_import(name, globals, locals, fromlist, level)
    builtins.__import__ = guarded_import

    original_import_module = importlib.import_module

    def import_module(name, package=None):
        if not name.startswith("."):
            capability = denied_capability(name)
            if capability is not None:
                raise GuardImportViolation(capability, name)
        return original_import_module(name, package)
    importlib.import_module = import_module
)PY";

const char* kSpawnGuard = R"PY(
    def blocked_spawn(name):
        def blocked(*args, **kwargs):
            raise GuardViolation("process-spawn", "%s() is blocked" % name)
        blocked.__name__ = name
        return blocked

    for module in (os, posix):
        if module is None:
            continue
        for name in ("system", "popen", "fork", "forkpty", "execv", "execve",
                     "execl", "execle", "execlp", "execlpe", "execvp",
                     "execvpe", "spawnv", "spawnve", "spawnvp", "spawnvpe",
                     "spawnl", "spawnle", "spawnlp", "spawnlpe", "posix_spawn",
                     "posix_spawnp", "startfile"):
            if hasattr(module, name):
                setattr(module, name, blocked_spawn(name))
    if posixsubprocess is not None:
        posixsubprocess.fork_exec = blocked_spawn("fork_exec")
    if winapi is not None:
        winapi.CreateProcess = blocked_spawn("CreateProcess")

    def popen_init(self, *args, **kwargs):
        self._child_created = False
        raise GuardViolation("process-spawn", "subprocess.Popen() is blocked")
    subprocess.Popen.__init__ = popen_init

    def guard_signal(module, name, own_targets):
        original = getattr(module, name, None)
        if original is None:
            return

        def guarded(target, sig):
            if target not in own_targets():
                raise GuardViolation(
                    "process-spawn", "%s() of another process is blocked" %
                    name)
            return original(target, sig)
        guarded.__name__ = name
        setattr(module, name, guarded)

    def own_pids():
        targets = [0, os.getpid()]
        if hasattr(os, "getpgrp"):
            targets.append(-os.getpgrp())
        return targets

    def own_groups():
        return [0, os.getpgrp()]

    for module in (os, posix):
        if module is not None:
            guard_signal(module, "kill", own_pids)
            if hasattr(module, "killpg"):
                guard_signal(module, "killpg", own_groups)
)PY";

const char* kNetworkGuard = R"PY(
    def requested_family(args, kwargs):
        family = args[0] if args else kwargs.get("family", -1)
        fileno = args[3] if len(args) > 3 else kwargs.get("fileno")
        if fileno is not None:
            return None
        if family is None or family == -1:
            return _socket.AF_INET
        return family

    original_socket_init = socket.socket.__init__

    def socket_init(self, *args, **kwargs):
        family = requested_family(args, kwargs)
        if family is not None:
            check_family(family)
        original_socket_init(self, *args, **kwargs)
        if not allow_network and self.family not in allowed_families:
            self.close()
            check_family(self.family)
    socket.socket.__init__ = socket_init

    raw_socket = _socket.socket

    class GuardedSocket(raw_socket):
        def __init__(self, *args, **kwargs):
            family = requested_family(args, kwargs)
            if family is not None:
                check_family(family)
            raw_socket.__init__(self, *args, **kwargs)
    GuardedSocket.__name__ = "socket"
    _socket.socket = GuardedSocket
    _socket.SocketType = GuardedSocket

    def blocked_resolver(name):
        def blocked(*args, **kwargs):
            raise GuardViolation("network", "%s() is blocked" % name)
        blocked.__name__ = name
        return blocked

    if not allow_network:
        for module in (socket, _socket):
            for name in ("getaddrinfo", "gethostbyname", "gethostbyname_ex",
                         "gethostbyaddr", "getnameinfo", "create_connection",
                         "create_server"):
                if hasattr(module, name):
                    setattr(module, name, blocked_resolver(name))
)PY";

const char* kFileGuard = R"PY(
    def guard_paths(module, name, params):
        original = getattr(module, name, None)
        if original is None:
            return

        def guarded(*args, **kwargs):
            for index, (param, write) in enumerate(params):
                if index < len(args):
                    value = args[index]
                elif param in kwargs:
                    value = kwargs[param]
                else:
                    continue
                dir_fd = kwargs.get(param + "_dir_fd", kwargs.get("dir_fd"))
                check_path(value, write, "%s()" % name, dir_fd)
            return original(*args, **kwargs)
        guarded.__name__ = getattr(original, "__name__", name)
        guarded.__doc__ = getattr(original, "__doc__", None)
        setattr(module, name, guarded)

    original_open = builtins.open

    def guarded_open(file, mode="r", *args, **kwargs):
        check_path(file, is_write_mode(mode), "open()")
        return original_open(file, mode, *args, **kwargs)
    guarded_open.__doc__ = original_open.__doc__
    builtins.open = guarded_open
    io.open = guarded_open
    _io.open = guarded_open
    guard_paths(io, "open_code", (("path", False),))

    def guard_os_open(module):
        original = module.open

        def guarded(path, flags, *args, **kwargs):
            check_path(path, bool(flags & write_flags), "os.open()",
                       kwargs.get("dir_fd"))
            return original(path, flags, *args, **kwargs)
        module.open = guarded

    one_path = (("path", True),)
    two_paths = (("src", True), ("dst", True))
    for module in (os, posix):
        if module is None:
            continue
        guard_os_open(module)
        for name in ("remove", "unlink", "rmdir", "mkdir", "chmod", "lchmod",
                     "chown", "lchown", "truncate", "utime", "mkfifo", "mknod",
                     "chflags", "lchflags", "setxattr", "removexattr"):
            guard_paths(module, name, one_path)
        for name in ("rename", "replace", "link"):
            guard_paths(module, name, two_paths)
        guard_paths(module, "symlink", (("src", False), ("dst", True)))
    guard_paths(os, "renames", (("old", True), ("new", True)))
    guard_paths(os, "removedirs", (("name", True),))
    guard_paths(os, "makedirs", (("name", True),))

    guard_paths(shutil, "rmtree", one_path)
    for name in ("copy", "copy2", "copyfile", "copytree"):
        guard_paths(shutil, name, (("src", False), ("dst", True)))
    guard_paths(shutil, "move", two_paths)
)PY";

const char* kDynamicCodeGuard = R"PY(
    original_eval = builtins.eval
    original_exec = builtins.exec
    original_compile = builtins.compile
    only_ast = 0x400

    def caller_namespace(args, kwargs, frame):
        # Without explicit globals, eval and exec run in the caller's scope.
        if len(args) == 1 and "globals" not in kwargs:
            return (args[0], frame.f_globals, frame.f_locals)
        return args

    def guarded_eval(*args, **kwargs):
        frame = _sys._getframe(1)
        if not trusted_frame(frame):
            raise GuardViolation("dynamic-code", "eval() is blocked")
        return original_eval(*caller_namespace(args, kwargs, frame), **kwargs)

    def guarded_exec(*args, **kwargs):
        frame = _sys._getframe(1)
        if not trusted_frame(frame):
            raise GuardViolation("dynamic-code", "exec() is blocked")
        return original_exec(*caller_namespace(args, kwargs, frame), **kwargs)

    def guarded_compile(*args, **kwargs):
        flags = args[3] if len(args) > 3 else kwargs.get("flags", 0)
        if not flags & only_ast and not trusted_frame(_sys._getframe(1)):
            raise GuardViolation("dynamic-code", "compile() is blocked")
        return original_compile(*args, **kwargs)

    for name, function in (("eval", guarded_eval), ("exec", guarded_exec),
                           ("compile", guarded_compile)):
        function.__name__ = name
        function.__doc__ = getattr(builtins, name).__doc__
        setattr(builtins, name, function)

    # dataclasses pastes field names into the code it generates without
    # checking them.
    import dataclasses
    original_process_class = dataclasses._process_class

    def process_class(cls, *args, **kwargs):
        for field in cls.__dict__.get("__annotations__", {}):
            if not isinstance(field, str) or not field.isidentifier():
                raise GuardViolation(
                    "dynamic-code",
                    "dataclass field %r is not an identifier" % (field,))
        return original_process_class(cls, *args, **kwargs)
    dataclasses._process_class = process_class
)PY";

// The audit hook sees the operations performed by the interpreter itself, so
// it also catches uses of the private modules that the patches above do not
// cover. Hooks cannot be removed once added.
const char* kAuditHook = R"PY(
    spawn_events = frozenset([
        "os.system", "os.exec", "os.fork", "os.forkpty", "os.posix_spawn",
        "os.spawn", "os.startfile", "subprocess.Popen",
        "_winapi.CreateProcess",
    ])
    resolver_events = frozenset([
        "socket.getaddrinfo", "socket.gethostbyname", "socket.gethostbyaddr",
        "socket.getnameinfo",
    ])
    # event -> ((path argument, dir_fd argument), ...)
    path_events = {
        "os.remove": ((0, 1),),
        "os.rmdir": ((0, 1),),
        "os.mkdir": ((0, 2),),
        "os.chmod": ((0, 2),),
        "os.chown": ((0, 3),),
        "os.utime": ((0, 3),),
        "os.truncate": ((0, None),),
        "os.rename": ((0, 2), (1, 3)),
        "os.link": ((0, 2), (1, 3)),
        "os.symlink": ((1, 2),),
    }
    busy = threading.local()

    def check_event(event, args, frame):
        if event == "open":
            if "file-access" in _BLOCKED:
                path, mode, flags = args
                if isinstance(mode, str):
                    write = is_write_mode(mode)
                else:
                    write = bool(flags & write_flags)
                check_path(path, write, "open()")
        elif event in path_events:
            if "file-access" in _BLOCKED:
                for index, dir_fd_index in path_events[event]:
                    if index >= len(args):
                        continue
                    dir_fd = None
                    if dir_fd_index is not None and dir_fd_index < len(args):
                        dir_fd = args[dir_fd_index]
                    check_path(args[index], True, event + "()", dir_fd)
        elif event in spawn_events:
            if "process-spawn" in _BLOCKED:
                raise GuardViolation("process-spawn", "%s is blocked" % event)
        elif event == "socket.__new__":
            if "network" in _BLOCKED and args[1] != -1:
                check_family(args[1])
        elif event in ("socket.connect", "socket.bind", "socket.sendto"):
            if "network" in _BLOCKED:
                check_family(args[0].family)
        elif event in resolver_events:
            if "network" in _BLOCKED and not allow_network:
                raise GuardViolation("network", "%s is blocked" % event)
        elif event.startswith("ctypes.") or event == "mmap.__new__":
            if "native-memory" in _BLOCKED:
                raise GuardViolation("native-memory", "%s is blocked" % event)
        elif event == "pickle.find_class":
            if "deserialization" in _BLOCKED:
                raise GuardViolation("deserialization", "unpickling is blocked")
        elif event in ("marshal.loads", "marshal.load"):
            if "deserialization" in _BLOCKED and not trusted_frame(frame):
                raise GuardViolation("deserialization", "%s is blocked" % event)

    def audit(event, args):
        if getattr(busy, "active", False):
            return
        busy.active = True
        try:
            try:
                frame = _sys._getframe(1)
            except ValueError:
                frame = None
            check_event(event, args, frame)
        finally:
            busy.active = False

    if _BLOCKED and hasattr(_sys, "addaudithook"):
        _sys.addaudithook(audit)
)PY";

const char* kEpilogue = R"PY(
    previous_excepthook = _sys.excepthook

    def excepthook(exc_type, value, traceback):
        if not issubclass(exc_type, MemoryError):
            return previous_excepthook(exc_type, value, traceback)
        try:
            previous_excepthook(exc_type, value, traceback)
            _sys.stderr.write("\n%s\n" % _LIMIT_MARKER)
            _sys.stderr.flush()
        finally:
            os._exit(_LIMIT_EXIT_CODE)
    _sys.excepthook = excepthook


try:
    _evalbox_install()
except BaseException as _error:
    try:
        _sys.stderr.write("%s guard installation failed: %s\n" %
                          (_LABEL % "guard-tamper", _error))
        _sys.stderr.flush()
    finally:
        import os as _os
        _os._exit(_SETUP_EXIT_CODE)
finally:
    del _evalbox_install
)PY";

}  // namespace

const char* CapabilityName(Capability capability) {
  switch (capability) {
    case Capability::kDynamicCode:
      return "dynamic-code";
    case Capability::kProcessSpawn:
      return "process-spawn";
    case Capability::kDeserialization:
      return "deserialization";
    case Capability::kNativeMemory:
      return "native-memory";
    case Capability::kFileAccess:
      return "file-access";
    case Capability::kNetwork:
      return "network";
    case Capability::kGuardTamper:
      return "guard-tamper";
  }
  return "unknown";
}

const std::vector<Capability>& AllCapabilities() {
  static const std::vector<Capability> all = {
      Capability::kDynamicCode,     Capability::kProcessSpawn,
      Capability::kDeserialization, Capability::kNativeMemory,
      Capability::kFileAccess,      Capability::kNetwork,
      Capability::kGuardTamper};
  return all;
}

std::string GuardLabel(Capability capability) {
  return absl::StrCat(kGuardLabelPrefix, "[", CapabilityName(capability), "]");
}

GuardManifest GuardManifest::Default() {
  GuardManifest manifest;
  for (Capability capability : AllCapabilities()) {
    manifest.blocked_.insert(capability);
  }
  return manifest;
}

GuardManifest& GuardManifest::Remove(Capability capability) {
  blocked_.erase(capability);
  return *this;
}

std::map<std::string, Capability> GuardManifest::DeniedModules() const {
  std::map<std::string, Capability> denied;
  if (Blocks(Capability::kDeserialization)) {
    for (const char* module : kDeserializationModules)
      denied[module] = Capability::kDeserialization;
  }
  if (Blocks(Capability::kNativeMemory)) {
    for (const char* module : kNativeMemoryModules)
      denied[module] = Capability::kNativeMemory;
  }
  return denied;
}

std::string GuardManifest::Describe() const {
  std::vector<std::string> names;
  for (Capability capability : blocked_) {
    names.push_back(CapabilityName(capability));
  }
  return absl::StrJoin(names, ", ");
}

GuardModule::GuardModule(GuardManifest manifest)
    : manifest_(std::move(manifest)), source_(Generate()) {}

std::string GuardModule::Generate() const {
  std::string src = kHeader;

  std::vector<std::string> blocked;
  for (Capability capability : manifest_.Blocked()) {
    blocked.push_back(PyString(CapabilityName(capability)));
  }
  absl::StrAppend(&src, "_BLOCKED = frozenset([", absl::StrJoin(blocked, ", "),
                  "])\n");

  std::vector<std::string> denied;
  for (const auto& module : manifest_.DeniedModules()) {
    denied.push_back(absl::StrCat(PyString(module.first), ": ",
                                  PyString(CapabilityName(module.second))));
  }
  absl::StrAppend(&src, "_DENIED_MODULES = {", absl::StrJoin(denied, ", "),
                  "}\n");

  std::vector<std::string> trusted;
  for (const char* file : kTrustedEvalCallers) trusted.push_back(PyString(file));
  absl::StrAppend(&src, "_TRUSTED_EVAL_CALLERS = (",
                  absl::StrJoin(trusted, ", "), ",)\n");

  src += kPrologue;
  src += kInstallBegin;
  // The tamper check runs first so that a second load stops before patching
  // anything again.
  if (manifest_.Blocks(Capability::kGuardTamper)) src += kTamperGuard;
  if (!manifest_.DeniedModules().empty()) src += kImportGuard;
  if (manifest_.Blocks(Capability::kProcessSpawn)) src += kSpawnGuard;
  if (manifest_.Blocks(Capability::kNetwork)) src += kNetworkGuard;
  if (manifest_.Blocks(Capability::kFileAccess)) src += kFileGuard;
  // Last, since the patches above must not go through the guarded builtins.
  if (manifest_.Blocks(Capability::kDynamicCode)) src += kDynamicCodeGuard;
  src += kAuditHook;
  src += kEpilogue;
  return src;
}

void GuardModule::Install(const SandboxSession& session) const {
  std::string path = util::File::JoinPath(session.GuardDir(), kFileName);
  try {
    util::File::WriteAll(path, source_, /*overwrite=*/true);
    util::File::MakeImmutable(path);
  } catch (const std::system_error& exc) {
    throw WorkspaceError(exc, "Cannot install the guard module");
  }
}

}  // namespace sandbox
