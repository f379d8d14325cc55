#include "modules/covmark/check_state.h"
#include "modules/covmark/check_scope.h"
#include "modules/io/config.h"
#include "modules/io/log.h"
#include "base/base.h"

#include "absl/container/flat_hash_map.h"

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <memory>

namespace covmark {

namespace {

using stack_map = absl::flat_hash_map<uint64_t, std::vector<check_scope*>>;

// Open scopes for each check_state on this thread, keyed by state id,
// innermost last.  Allocated by the first push and freed when the last
// stack empties, so a thread with no open scopes holds a null pointer.
// A plain pointer has no thread-exit destructor and stays readable from
// static destructors that run after thread storage is gone.
thread_local stack_map* tl_stacks = nullptr;

std::atomic<uint64_t> g_next_state_id{1};

}  // namespace

check_state::check_state()
    : m_id(g_next_state_id.fetch_add(1)), m_reporter(std::make_unique<throwing_reporter>()) {
  try {
    m_enabled = getenv_bool("COVMARK_CHECKS", true);
  } catch (const config_exception& e) {
    COVLOG_P(LOG_WARNING, "%s; leaving coverage mark checking enabled", e.what());
    m_enabled = true;
  }
  if (!m_enabled) {
    COVLOG("Coverage mark checking disabled by COVMARK_CHECKS");
  }
}

check_state::~check_state() {
  if (open_scopes() != 0) {
    usage_fault("Unbalanced scope: check_state destroyed while check scopes are still open");
  }
}

check_state& check_state::global() {
  static check_state g_state;
  return g_state;
}

void check_state::hit(absl::string_view name) {
  if (!enabled()) {
    return;
  }
  scope_stack* stack = thread_stack();
  if (!stack) {
    return;
  }
  for (check_scope* scope : *stack) {
    scope->record(name);
  }
}

void check_state::set_enabled(bool enabled) {
  bool was_enabled = m_enabled.exchange(enabled);
  if (was_enabled != enabled) {
    COVLOG("Coverage mark checking %s", enabled ? "enabled" : "disabled");
  }
}

void check_state::set_reporter(std::unique_ptr<check_reporter> reporter) {
  if (reporter) {
    m_reporter = std::move(reporter);
  } else {
    m_reporter = std::make_unique<throwing_reporter>();
  }
}

check_reporter& check_state::reporter() { return *m_reporter; }

size_t check_state::open_scopes() const {
  scope_stack* stack = thread_stack();
  if (!stack) {
    return 0;
  }
  return stack->size();
}

void check_state::usage_fault(const std::string& message) {
  COVLOG_P(LOG_CRIT, "Coverage mark usage fault: %s", message.c_str());
  LOG(FATAL) << "Coverage mark usage fault: " << message;
  // LOG(FATAL) does not return, but the compiler doesn't know that.
  abort();
}

check_state::scope_stack* check_state::thread_stack() const {
  if (!tl_stacks) {
    return nullptr;
  }
  auto it = tl_stacks->find(m_id);
  if (it == tl_stacks->end()) {
    return nullptr;
  }
  return &it->second;
}

void check_state::push_scope(check_scope* scope) {
  if (!tl_stacks) {
    tl_stacks = new stack_map;
  }
  (*tl_stacks)[m_id].push_back(scope);
}

void check_state::pop_scope(check_scope* scope) {
  scope_stack* stack = thread_stack();
  if (!stack) {
    usage_fault("Unbalanced scope: closing a check scope on a thread with no open scopes; "
                "scopes must be closed on the thread that opened them");
  }
  if (stack->back() != scope) {
    usage_fault("Unbalanced scope: closing a check scope that is not the innermost open scope "
                "on this thread; scopes must be closed in reverse order of opening");
  }
  stack->pop_back();
  if (stack->empty()) {
    tl_stacks->erase(m_id);
    if (tl_stacks->empty()) {
      delete tl_stacks;
      tl_stacks = nullptr;
    }
  }
}

}  // namespace covmark
