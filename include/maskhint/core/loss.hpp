#pragma once

#include <map>
#include <string>

namespace maskhint::core {

/// Loss name -> scalar value. Keys of disabled heads are absent, never zero-filled.
using LossMap = std::map<std::string, float>;

/// dict.update semantics: entries of \p from overwrite entries of \p into.
inline void update_losses(LossMap& into, const LossMap& from) {
  for (const auto& [name, value] : from) {
    into.insert_or_assign(name, value);
  }
}

}  // namespace maskhint::core
