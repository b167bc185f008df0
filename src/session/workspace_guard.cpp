/** LICENSE TEMPLATE */
#include "workspace_guard.h"

// cdpr
#include <utils/logger.h>

// stdlib
#include <algorithm>
#include <system_error>

namespace cdpr {

static Path
CanonicalOrLexical(const Path &path) noexcept
{
  std::error_code ec;
  auto canonical = fs::canonical(path, ec);
  if (!ec) {
    return canonical;
  }
  // Missing file: resolve what exists and keep the last component as written.
  auto parent = fs::canonical(path.parent_path(), ec);
  if (!ec) {
    return parent / path.filename();
  }
  return path.lexically_normal();
}

WorkspaceGuard::WorkspaceGuard(Path root) noexcept : mRoot(CanonicalOrLexical(fs::absolute(root))) {}

const Path &
WorkspaceGuard::Root() const noexcept
{
  return mRoot;
}

RelayResult<Path>
WorkspaceGuard::Resolve(std::string_view requested) const noexcept
{
  if (requested.empty()) {
    return std::unexpected(RelayError::Invalid("Empty path"));
  }
  Path relative{ requested };
  if (relative.is_absolute()) {
    relative = relative.relative_path();
  }

  const auto joined = (mRoot / relative).lexically_normal();
  auto resolved = CanonicalOrLexical(joined);
  if (!Contains(resolved)) {
    DBGLOG(session, "rejected '{}', resolves to {}", requested, resolved.c_str());
    return std::unexpected(RelayError::PathViolation("Path traversal detected: path escapes workspace"));
  }
  return resolved;
}

bool
WorkspaceGuard::Contains(const Path &resolved) const noexcept
{
  // Compare component wise so that /work/root-other is not inside /work/root.
  auto [rootEnd, _] = std::mismatch(mRoot.begin(), mRoot.end(), resolved.begin(), resolved.end());
  if (rootEnd == mRoot.end()) {
    return true;
  }
  // A root given with a trailing separator ends in an empty component.
  return std::next(rootEnd) == mRoot.end() && rootEnd->empty();
}

} // namespace cdpr
