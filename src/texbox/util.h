// Texbox - LaTeX Compilation Sandbox
// Copyright (c) 2026 Sandstorm Development Group, Inc. and contributors
// All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef TEXBOX_UTIL_H_
#define TEXBOX_UTIL_H_
// This file contains various utility functions used in texbox.

#include <kj/io.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>
#include <kj/debug.h>
#include <kj/vector.h>
#include <unistd.h>
#include <kj/async.h>

namespace kj {
  class UnixEventPort;
}

namespace texbox {

#define KJ_MVCAP(var) var = ::kj::mv(var)
// Capture the given variable by move.  Place this in a lambda capture list.  Requires C++14.

typedef unsigned int uint;
typedef unsigned char byte;

struct Pipe {
  kj::AutoCloseFd readEnd;
  kj::AutoCloseFd writeEnd;

  static Pipe make();
};

kj::AutoCloseFd raiiOpen(kj::StringPtr name, int flags, mode_t mode = 0666);

kj::Maybe<kj::AutoCloseFd> raiiOpenIfExists(
    kj::StringPtr name, int flags, mode_t mode = 0666);

kj::String trim(kj::ArrayPtr<const char> slice);
kj::ArrayPtr<const char> trimArray(kj::ArrayPtr<const char> slice);
// Remove whitespace from both ends of the char array and return what's left as a String.

void toLower(kj::ArrayPtr<char> text);
// Force entire array of chars to lower-case.

kj::Maybe<uint> parseUInt(kj::StringPtr s, int base);
kj::Maybe<uint64_t> parseUInt64(kj::StringPtr s, int base);
// Try to parse an integer with strtoul(), return null if parsing fails or doesn't consume all
// input.

bool isDirectory(kj::StringPtr path);

kj::Array<kj::String> listDirectory(kj::StringPtr dirname);
// Get names of all files in the given directory except for "." and "..".

void recursivelyDelete(kj::StringPtr path);
// Delete the given path, recursively if it is a directory. Symlinks are removed, never followed.
// Directories without owner rwx permission are chmod()ed first so that read-only trees (e.g. git
// pack directories) can be removed.
//
// Since this may be used in KJ_DEFER to delete temporary directories, all exceptions are
// recoverable (won't throw if already unwinding).

void recursivelyCreateParent(kj::StringPtr path);
// Create the parent directory of `path` if it doesn't exist, and the parent's parent, and so on.

kj::Maybe<kj::String> realPath(kj::StringPtr path);
// realpath(3). Returns null if the path (or some component of it) doesn't exist.

kj::String readAll(int fd);
// Read entire contents of the file descirptor to a String.

kj::String readAll(kj::StringPtr name);
// Read entire contents of a named file to a String.

kj::Array<byte> readAllBytes(int fd);
// Read entire contents of the file descirptor to a byte array.

void writeFile(kj::StringPtr name, kj::ArrayPtr<const byte> content);
// Create (or truncate) the named file with mode 0600 and write `content` to it. Refuses to
// follow a symlink at the final path component.

kj::Array<kj::String> splitLines(kj::StringPtr input);
// Split the input into lines, trimming whitespace, and ignoring blank lines or lines that start
// with #.

kj::Vector<kj::ArrayPtr<const char>> split(kj::ArrayPtr<const char> input, char delim);
// Split the char array on an arbitrary delimiter character.

kj::String replaceAll(kj::StringPtr text, kj::StringPtr needle, kj::StringPtr replacement);
// Replace every non-overlapping occurrence of `needle`, scanning left to right.

kj::String randomHex(size_t bytes);
// Hex-encoded random bytes from libsodium's CSPRNG.

class SubprocessSet;

class Subprocess {
public:
  struct Options {
    kj::StringPtr executable;
    // Executable file name.

    bool searchPath = true;
    // Whether to search for `executable` in the `PATH` (e.g. use `execvp()` rather than
    // `execv()`). If `executable` contains a '/' character, this has no effect (`PATH` is never
    // searched).

    kj::ArrayPtr<const kj::StringPtr> argv;
    // Arguments to the program. By convention, the first argument should be the same as
    // `executable`.

    int stdin = STDIN_FILENO;
    int stdout = STDOUT_FILENO;
    int stderr = STDERR_FILENO;
    // What file descriptors to substitute for standard I/O.
    //
    // Note that if you override these, then the overridden FD is expected to be close-on-exec.
    // `Subprocess` does NOT close the old FD after dup2()ing it over the standard I/O FD.

    kj::Maybe<kj::ArrayPtr<const kj::StringPtr>> environment;
    // An array of 'NAME=VALUE' pairs specifying the child's environment. If null, inherits the
    // parent's environment.

    kj::Maybe<kj::StringPtr> workingDirectory;
    // Directory to chdir() into before exec. Leave null to inherit ours.

    bool newProcessGroup = false;
    // Put the child in a new process group whose ID is the child's PID. signalGroup() and the
    // destructor then reach every process the child spawns.

    Options(kj::StringPtr executable): executable(executable), argv(&this->executable, 1) {}
    Options(kj::ArrayPtr<const kj::StringPtr> argv): executable(argv[0]), argv(argv) {}
    Options(kj::Array<const kj::StringPtr>&& argv)
        : executable(argv[0]), argv(argv), ownArgv(kj::mv(argv)) {}
    Options(std::initializer_list<const kj::StringPtr> argv)
        : Options(kj::heapArray(argv)) {}

  private:
    kj::Array<const kj::StringPtr> ownArgv;
  };

  Subprocess(Options&& options);
  // Start a subprocess based on the given options.
  //
  // If the child cannot be started (bad working directory, exec() failure, ...) the child
  // reports the failure back over a close-on-exec pipe, is reaped, and this constructor throws.

  Subprocess(std::initializer_list<const kj::StringPtr> argv)
      : Subprocess(Options(kj::mv(argv))) {}
  // Start a subprocess given a simple command argument array. The first argument is the executable
  // name.

  KJ_DISALLOW_COPY(Subprocess);

  ~Subprocess() noexcept(false);
  // Kills the subprocess (with SIGKILL) and waitpid()s it if it hasn't already finished. If the
  // child leads its own process group, the whole group is killed.

  void signalGroup(int signo);
  // Sends the given signal to the child's process group, or to the child alone if it was not
  // started with `newProcessGroup`. Works after the child itself has exited, for reaching
  // stragglers. Sending to a group with no members left is not an error.

  int waitForExitOrSignal() KJ_WARN_UNUSED_RESULT;
  // Waits for the child to exit or be killed by a signal. Returns an exit status that can be
  // interpreted by WIFEXITED(), WEXITSTATUS(), etc. as described in the wait(2) man page.

  pid_t getPid() {
    KJ_IREQUIRE(pid != 0, "already exited");
    return pid;
  }

  void notifyExited(int status) {
    // Call if you receive exit notification from elsewhere, e.g. calling wait() yourself. It is
    // NECESSARY to call this immediately upon receiving an exit notification, otherwise the
    // destructor will try to SIGKILL the pid which might have been re-assigned by then.

    pid = 0;
  }

private:
  kj::String name;
  kj::UnwindDetector unwindDetector;
  pid_t pid = 0;  // 0 = not running
  pid_t group = 0;  // 0 = shares our process group
  kj::Maybe<SubprocessSet&> subprocessSet;

  static void forceFdAbove(int& fd, int minValue);

  friend class SubprocessSet;
};

class SubprocessSet {
  // Represents a set of subprocesses and allows you to asynchronously wait for them to complete.
  // In order to use SubprocessSet, it is necessary that *all* subprocesses of this process are
  // managed through it, and wait() is always called immediately on creation of a new subprocess.

public:
  explicit SubprocessSet(kj::UnixEventPort& eventPort);
  ~SubprocessSet() noexcept(false);
  KJ_DISALLOW_COPY(SubprocessSet);

  kj::Promise<int> waitForExitOrSignal(Subprocess& subprocess);
  // Resolves with the wait(2) status once the child exits or is killed. `subprocess` must
  // outlive the promise.

private:
  struct WaitMap;
  kj::UnixEventPort& eventPort;
  kj::Own<WaitMap> waitMap;
  kj::Promise<void> waitTask;

  kj::Promise<void> waitLoop();

  void alreadyReaped(pid_t pid);
  // Called if the subprocess is destroyed and thus canceled. See ~Subprocess().

  friend class Subprocess;
};

}  // namespace texbox

#endif // TEXBOX_UTIL_H_
