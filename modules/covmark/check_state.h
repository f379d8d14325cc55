#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "modules/covmark/check_reporter.h"
#include "modules/covmark/mark_registry.h"

namespace covmark {

class check_scope;

// Everything the mark/check engine keeps across calls: the registry of
// mark names, the reporter used for failed checks, the runtime enable
// flag, and access to each thread's stack of open check scopes.
//
// Most code uses the process-wide instance returned by global(), which
// is created on first use and destroyed at process exit.  Tests that
// want to be fully hermetic can construct their own check_state; hits
// and scopes on different check_state instances never interact.
//
// Per-thread stacks are keyed by a process-unique id assigned at
// construction, never by address, so a check_state built where an
// older one used to live does not inherit scopes another thread left
// open on the old one.
//
// Hits only count on the thread that delivers them.  A hit from a
// worker thread is not seen by scopes opened on the thread that
// spawned it, even if the worker is running on its behalf.
class check_state {
 public:
  // Reads COVMARK_CHECKS from the environment to decide whether
  // checking starts enabled (default: enabled).  An unparsable value is
  // logged and treated as enabled.
  check_state();
  ~check_state();
  check_state(const check_state&) = delete;
  check_state& operator=(const check_state&) = delete;

  static check_state& global();

  mark_registry& registry() { return m_registry; }
  const mark_registry& registry() const { return m_registry; }

  // Credits every open scope on the calling thread that expects "name".
  // A hit nobody is watching for is ignored.
  void hit(absl::string_view name);
  void hit(const mark_handle& mark) { hit(absl::string_view(mark.name())); }

  // While disabled, hits are ignored and newly opened scopes are inert.
  // Scopes that are already open keep validating when they close.
  bool enabled() const { return m_enabled.load(std::memory_order_relaxed); }
  void set_enabled(bool enabled);

  // Replaces the reporter used by scopes when they close with unmet
  // expectations.  A null reporter restores the throwing_reporter.
  // Not thread-safe; install reporters before any scopes are open.
  void set_reporter(std::unique_ptr<check_reporter> reporter);
  check_reporter& reporter();

  // Number of scopes currently open on the calling thread.
  size_t open_scopes() const;

  // Logs and dies.  Used for API misuse that makes further results
  // untrustworthy, such as unbalanced scopes.
  [[noreturn]] static void usage_fault(const std::string& message);

 private:
  friend class check_scope;
  using scope_stack = std::vector<check_scope*>;

  // Returns the calling thread's stack for this state, or null if it
  // has no open scopes.
  scope_stack* thread_stack() const;

  void push_scope(check_scope* scope);
  void pop_scope(check_scope* scope);

  const uint64_t m_id;
  mark_registry m_registry;
  std::atomic<bool> m_enabled{true};

  std::unique_ptr<check_reporter> m_reporter;
};

}  // namespace covmark
