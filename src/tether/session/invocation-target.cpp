#include "invocation-target.hpp"

#include <stdexcept>

namespace tether::session {

void TargetRegistry::add(string id, factory_type factory) {
  if (!factory)
    throw std::invalid_argument{format("empty factory for target '{}'", id)};
  std::lock_guard lock{padlock_};
  factories_.insert_or_assign(std::move(id), std::move(factory));
}

void TargetRegistry::add_function(string id, function<string(std::string_view)> fn,
                                  bool reports_failures) {
  if (!fn)
    throw std::invalid_argument{format("empty function for target '{}'", id)};
  add(std::move(id), [fn = std::move(fn), reports_failures]() -> shared_ptr<Invokable> {
    return make_shared<FunctionTarget>(fn, reports_failures);
  });
}

bool TargetRegistry::contains(std::string_view id) const {
  std::lock_guard lock{padlock_};
  return factories_.find(id) != factories_.end();
}

shared_ptr<Invokable> TargetRegistry::resolve(std::string_view id) {
  factory_type factory;
  {
    std::lock_guard lock{padlock_};
    const auto ii = factories_.find(id);
    if (ii == factories_.end())
      return nullptr;
    factory = ii->second;
  }
  return factory(); // unlocked
}

} // namespace tether::session
