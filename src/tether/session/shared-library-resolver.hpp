#pragma once

#include "invocation-target.hpp"

namespace tether::session {

/**
 * @brief Resolves target `id` to `<directory>/lib<id>.so`, loaded for each request.
 *
 * The library is opened on `resolve` and closed when the returned `Invokable` is released,
 * so a library rebuilt between requests takes effect without restarting the session.
 * The library exports `tether_invoke` (see target-abi.h).
 *
 * Exceptions (from `resolve`)
 * + SessionError(ecode::invocation_failure) if the id is not a plain file name, the library
 *   cannot be loaded, or it lacks the entry point.
 */
class SharedLibraryResolver final : public TargetResolver {
private:
  string directory_;

public:
  explicit SharedLibraryResolver(string directory) : directory_{std::move(directory)} {}

  const string& directory() const { return directory_; }

  shared_ptr<Invokable> resolve(std::string_view id) override;

  static string library_path(std::string_view directory, std::string_view id);
};

} // namespace tether::session
