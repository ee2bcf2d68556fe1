// Single-file SCP transfers over a RemoteSession.
#pragma once
#include "RemoteFile.hpp"
#include "RemoteSession.hpp"
#include "ScpTypes.hpp"

#include <memory>
#include <string>
#include <vector>

namespace scplite {

// Runs `scp -qf <path>` remotely and hands back the file as soon as its
// directive has been acknowledged. The content is streamed by a background
// task while the caller reads `out->content()`.
//
// Errors before streaming starts are returned here. Errors during content
// reception surface as read errors on the content stream. Closing or
// destroying the content stream stops the transfer and releases the remote
// command. A remote warning in reply to the request is fatal here.
bool readFile(RemoteSession& session, const std::string& path,
              std::unique_ptr<RemoteFile>& out, ScpError& err,
              const TransferOptions& options = {});

// Runs `scp -t <dir>` remotely and sends `file` (exactly file.size() bytes of
// its content). Remote warnings are collected in `warnings` and do not stop
// the upload; remote errors are fatal. On failure `warnings` is left empty.
bool writeFile(RemoteSession& session, const std::string& dir, RemoteFile& file,
               std::vector<std::string>& warnings, ScpError& err,
               const TransferOptions& options = {});

} // namespace scplite
