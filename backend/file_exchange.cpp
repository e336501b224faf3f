#include "backend/file_exchange.hpp"

#include <sys/stat.h>
#include <cerrno>
#include <algorithm>
#include <system_error>

#include <kj/debug.h>

#include "core/errors.hpp"
#include "util/file.hpp"
#include "util/misc.hpp"

namespace backend {

namespace {

std::string Resolve(const std::string& workspace,
                    const std::string& remote_path) {
  if (!util::File::IsSafeRelativePath(remote_path)) {
    throw core::transfer_error("Path outside of the workspace: " +
                               remote_path);
  }
  return util::File::JoinPath(workspace, remote_path);
}

// Containers run without capabilities, so their root user needs the
// permission bits to access files created here.
void MakeAccessible(const std::string& path, mode_t mode) {
  if (chmod(path.c_str(), mode) == -1) {
    throw std::system_error(errno, std::system_category(), "chmod " + path);
  }
}

}  // namespace

void FileExchange::PushTree(const std::string& workspace,
                            const std::string& local_dir,
                            const std::string& remote_dir) {
  std::vector<std::string> files;
  try {
    files = util::File::ListFiles(local_dir);
  } catch (const std::system_error& e) {
    throw core::transfer_error(std::string("Push ") + local_dir + ": " +
                               e.what());
  }
  for (const std::string& name : files) {
    std::string data;
    try {
      data = util::File::ReadAll(util::File::JoinPath(local_dir, name));
    } catch (const std::system_error& e) {
      throw core::transfer_error(std::string("Push ") + name + ": " +
                                 e.what());
    }
    Push(workspace, data, util::File::JoinPath(remote_dir, name));
  }
}

std::vector<std::string> FileExchange::PullTree(const std::string& workspace,
                                                const std::string& remote_dir,
                                                const std::string& local_dir) {
  std::vector<std::string> files = List(workspace, remote_dir);
  for (const std::string& name : files) {
    std::string data = Pull(workspace, util::File::JoinPath(remote_dir, name));
    try {
      util::File::WriteAll(util::File::JoinPath(local_dir, name), data);
    } catch (const std::system_error& e) {
      throw core::transfer_error(std::string("Pull ") + name + ": " +
                                 e.what());
    }
  }
  return files;
}

/*
 * MountedFileExchange
 */

std::string MountedFileExchange::CreateWorkspace(
    const std::string& session_id) {
  try {
    util::TempDir dir(base_dir_);
    dir.Keep();
    MakeAccessible(dir.Path(), 0777);
    KJ_LOG(INFO, "Workspace of " + session_id + " at " + dir.Path());
    return dir.Path();
  } catch (const std::system_error& e) {
    throw core::transfer_error(std::string("Cannot create workspace: ") +
                               e.what());
  }
}

void MountedFileExchange::RemoveWorkspace(const std::string& workspace) {
  if (keep_) {
    KJ_LOG(INFO, "Keeping workspace " + workspace);
    return;
  }
  if (!util::File::Exists(workspace)) return;
  try {
    util::File::RemoveTree(workspace);
  } catch (const std::system_error& e) {
    throw core::transfer_error(std::string("Cannot remove workspace: ") +
                               e.what());
  }
}

void MountedFileExchange::Push(const std::string& workspace,
                               const std::string& data,
                               const std::string& remote_path) {
  std::string path = Resolve(workspace, remote_path);
  try {
    util::File::WriteAll(path, data);
    MakeAccessible(path, 0666);
    for (std::string dir = util::File::BaseDir(path);
         dir.size() > workspace.size(); dir = util::File::BaseDir(dir)) {
      MakeAccessible(dir, 0777);
    }
  } catch (const std::system_error& e) {
    throw core::transfer_error(std::string("Push ") + remote_path + ": " +
                               e.what());
  }
}

std::string MountedFileExchange::Pull(const std::string& workspace,
                                      const std::string& remote_path) {
  try {
    return util::File::ReadAll(Resolve(workspace, remote_path));
  } catch (const std::system_error& e) {
    throw core::transfer_error(std::string("Pull ") + remote_path + ": " +
                               e.what());
  }
}

std::vector<std::string> MountedFileExchange::List(
    const std::string& workspace, const std::string& remote_dir) {
  try {
    return util::File::ListFiles(Resolve(workspace, remote_dir));
  } catch (const std::system_error& e) {
    throw core::transfer_error(std::string("List ") + remote_dir + ": " +
                               e.what());
  }
}

/*
 * VmFileExchange
 */

util::ProcessResult VmFileExchange::Run(const std::vector<std::string>& argv,
                                        const std::string& stdin_data,
                                        const char* what) {
  util::ProcessResult result;
  try {
    result = vm_->Run(argv, stdin_data, timeout_);
  } catch (const std::system_error& e) {
    throw core::transfer_error(std::string(what) + ": " + e.what());
  }
  if (result.timed_out) {
    throw core::transfer_error(std::string(what) + ": timed out");
  }
  if (!result.Success()) {
    throw core::transfer_error(std::string(what) + ": exit code " +
                               std::to_string(result.exit_code) + ": " +
                               util::trim(result.stderr_data));
  }
  return result;
}

std::string VmFileExchange::CreateWorkspace(const std::string& session_id) {
  util::ProcessResult result = Run(
      {"sh", "-c",
       "mkdir -p \"$1\" && d=$(mktemp -d \"$1/$2.XXXXXX\") && "
       "chmod 777 \"$d\" && echo \"$d\"",
       "sh", base_dir_, session_id},
      "", "Cannot create workspace");
  std::string path = util::trim(result.stdout_data);
  if (path.empty()) {
    throw core::transfer_error("Cannot create workspace: no path returned");
  }
  KJ_LOG(INFO, "Workspace of " + session_id + " at " + path);
  return path;
}

void VmFileExchange::RemoveWorkspace(const std::string& workspace) {
  Run({"rm", "-rf", workspace}, "", "Cannot remove workspace");
}

void VmFileExchange::Push(const std::string& workspace,
                          const std::string& data,
                          const std::string& remote_path) {
  std::string path = Resolve(workspace, remote_path);
  // The data appears at path only once it is complete.
  Run({"sh", "-c",
       "mkdir -p \"$(dirname \"$1\")\" && cat > \"$1.tmp\" && "
       "chmod 666 \"$1.tmp\" && mv \"$1.tmp\" \"$1\"",
       "sh", path},
      data, "Push");
}

std::string VmFileExchange::Pull(const std::string& workspace,
                                 const std::string& remote_path) {
  return Run({"cat", Resolve(workspace, remote_path)}, "", "Pull")
      .stdout_data;
}

std::vector<std::string> VmFileExchange::List(const std::string& workspace,
                                              const std::string& remote_dir) {
  util::ProcessResult result = Run(
      {"sh", "-c", "test -d \"$1\" || exit 0; cd \"$1\" && find . -type f",
       "sh", Resolve(workspace, remote_dir)},
      "", "List");
  std::vector<std::string> files;
  for (const std::string& line : util::split(result.stdout_data, '\n')) {
    if (util::startsWith(line, "./")) files.push_back(line.substr(2));
  }
  std::sort(files.begin(), files.end());
  return files;
}

}  // namespace backend
