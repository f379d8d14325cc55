#pragma once

#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace covmark {

// Refers to a mark name interned in a mark_registry.  Handles are
// cheap to copy and stay valid for the lifetime of the registry that
// issued them.  Two handles from the same registry refer to the same
// mark if and only if they compare equal.
class mark_handle {
 public:
  mark_handle() = default;

  bool valid() const { return m_name != nullptr; }
  const std::string& name() const { return *m_name; }

  bool operator==(const mark_handle& rhs) const { return m_name == rhs.m_name; }
  bool operator!=(const mark_handle& rhs) const { return m_name != rhs.m_name; }

 private:
  friend class mark_registry;
  explicit mark_handle(const std::string* name) : m_name(name) {}

  const std::string* m_name = nullptr;
};

// Table of every mark name seen by a check_state, either from an
// instrumented call site or from a check_scope expecting it.
// Registration is idempotent and safe to race from multiple threads.
class mark_registry {
 public:
  mark_registry() = default;
  mark_registry(const mark_registry&) = delete;
  mark_registry& operator=(const mark_registry&) = delete;

  // Returns the handle for "name", creating the entry on first use.
  mark_handle register_mark(absl::string_view name);

  bool is_registered(absl::string_view name) const;
  size_t size() const;

  // Returns a sorted copy of every registered name.
  std::vector<std::string> names() const;

 private:
  mutable std::mutex m_mu;
  // std::set never moves its elements, so handles can point into it.
  std::set<std::string, std::less<>> m_names;
};

}  // namespace covmark
