#include "shared-library-resolver.hpp"

#include "target-abi.h"

#include <dlfcn.h>

#include <cctype>
#include <stdexcept>

namespace tether::session {

namespace {

string last_dl_error() {
  const char* message = ::dlerror();
  return (message == nullptr) ? string{"unknown error"} : string{message};
}

void append_to_string(void* sink, const char* data, size_t size) {
  static_cast<string*>(sink)->append(data, size);
}

bool is_plain_name(std::string_view id) {
  if (id.empty() || id == "." || id == "..")
    return false;
  return ranges::all_of(id, [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
  });
}

// --------------------------------------------------------------------------------- LibraryTarget

class LibraryTarget final : public Invokable {
private:
  string path_;
  void* handle_ = nullptr;
  tether_invoke_fn invoke_ = nullptr;

public:
  LibraryTarget(string path, void* handle, tether_invoke_fn invoke)
      : path_{std::move(path)}, handle_{handle}, invoke_{invoke} {}
  LibraryTarget(const LibraryTarget&) = delete;
  LibraryTarget& operator=(const LibraryTarget&) = delete;

  ~LibraryTarget() override {
    if (::dlclose(handle_) != 0)
      WARN("failed to unload '{}': {}", path_, last_dl_error());
  }

  string call(std::string_view request_payload) override {
    string out;
    const int result = invoke_(request_payload.data(), request_payload.size(), &out,
                               append_to_string);
    if (result != 0) {
      if (out.empty())
        out = format("{} returned {}", path_, result);
      throw std::runtime_error{out};
    }
    return out;
  }
};

} // namespace

string SharedLibraryResolver::library_path(std::string_view directory, std::string_view id) {
  return join_path(directory, format("lib{}.so", id));
}

shared_ptr<Invokable> SharedLibraryResolver::resolve(std::string_view id) {
  if (!is_plain_name(id))
    throw SessionError{ecode::invocation_failure, format("invalid target id '{}'", id)};

  auto path = library_path(directory_, id);
  if (!is_regular_file(path))
    throw SessionError{ecode::invocation_failure, format("target library '{}' not found", path)};

  ::dlerror(); // clear any stale error
  void* handle = ::dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
  if (handle == nullptr)
    throw SessionError{ecode::invocation_failure,
                       format("failed to load '{}': {}", path, last_dl_error())};

  void* symbol = ::dlsym(handle, TETHER_INVOKE_SYMBOL);
  if (symbol == nullptr) {
    const auto message = format("'{}' has no `{}`: {}", path, TETHER_INVOKE_SYMBOL,
                                last_dl_error());
    if (::dlclose(handle) != 0)
      WARN("failed to unload '{}': {}", path, last_dl_error());
    throw SessionError{ecode::invocation_failure, message};
  }

  TRACE("loaded target library '{}'", path);
  return make_shared<LibraryTarget>(std::move(path), handle,
                                    reinterpret_cast<tether_invoke_fn>(symbol));
}

} // namespace tether::session
