#pragma once

#include <string>
#include <thread>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/string_view.h"
#include "modules/covmark/check_state.h"
#include "modules/covmark/expectation.h"

namespace covmark {

// A check_scope declares which marks must be hit on the current thread
// while it is alive.  When it is destroyed it compares the hits it saw
// against its expectations and reports any mismatch through the
// state's reporter, which by default throws check_failure:
//
//   {
//     check_scope cov({{"fast-path", expectation::at_least_once()},
//                      {"slow-path", expectation::never()}});
//     parse_date("2013-02-27");
//   }
//
// Scopes nest.  A hit credits every open scope on the thread that
// expects the mark, not just the innermost one.  Scopes must be
// destroyed in the reverse order they were created, on the thread that
// created them; anything else is a fatal usage fault.
//
// If the scope is destroyed while an exception is propagating, it
// still removes itself from the thread's scope stack but does not
// validate, so a test that is already failing does not get a second
// failure.
class check_scope {
 public:
  // Expects "name" to be hit at least once, using check_state::global().
  explicit check_scope(const std::string& name);
  explicit check_scope(const expectations& expected);
  check_scope(check_state& state, const expectations& expected);

  ~check_scope() noexcept(false);

  check_scope(const check_scope&) = delete;
  check_scope& operator=(const check_scope&) = delete;

  // False if checking was disabled when the scope was opened.  Inactive
  // scopes see no hits and never fail.
  bool active() const { return m_active; }

  // Hits seen so far for "name"; 0 if "name" is not expected here.
  size_t observed(absl::string_view name) const;

 private:
  friend class check_state;

  struct entry {
    expectation expected;
    size_t observed = 0;
  };

  void record(absl::string_view name);
  void validate();

  check_state& m_state;
  bool m_active = false;
  std::thread::id m_thread;
  absl::flat_hash_map<std::string, entry> m_entries;
};

}  // namespace covmark
