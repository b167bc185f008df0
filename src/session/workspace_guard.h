/** LICENSE TEMPLATE */
#pragma once

// cdpr
#include <common.h>
#include <common/error.h>

// stdlib
#include <string_view>

namespace cdpr {

// Resolves paths handed to us by clients against the workspace root and refuses anything that lands outside of
// it, following symlinks.
class WorkspaceGuard
{
  Path mRoot;

public:
  // `root` is canonicalized when it exists.
  explicit WorkspaceGuard(Path root) noexcept;

  const Path &Root() const noexcept;

  // Absolute, symlink-free path for `requested`. An absolute `requested` is taken relative to the root. When the
  // file does not exist its parent directory is resolved instead and the file name appended.
  // PathViolationError when the result is not inside the root.
  RelayResult<Path> Resolve(std::string_view requested) const noexcept;

  bool Contains(const Path &resolved) const noexcept;
};

} // namespace cdpr
