#include "modules/covmark/check_scope.h"
#include "modules/covmark/check_reporter.h"

#include <algorithm>
#include <exception>

namespace covmark {

check_scope::check_scope(const std::string& name)
    : check_scope(check_state::global(), expectations{{name, expectation::at_least_once()}}) {}

check_scope::check_scope(const expectations& expected)
    : check_scope(check_state::global(), expected) {}

check_scope::check_scope(check_state& state, const expectations& expected)
    : m_state(state), m_thread(std::this_thread::get_id()) {
  if (!m_state.enabled()) {
    return;
  }
  m_entries.reserve(expected.size());
  for (const auto& e : expected) {
    m_state.registry().register_mark(e.first);
    m_entries[e.first].expected = e.second;
  }
  m_active = true;
  m_state.push_scope(this);
}

check_scope::~check_scope() noexcept(false) {
  if (!m_active) {
    return;
  }
  if (std::this_thread::get_id() != m_thread) {
    check_state::usage_fault(
        "Unbalanced scope: check scope closed on a different thread than the one that opened it");
  }
  m_state.pop_scope(this);
  m_active = false;

  if (std::uncaught_exception()) {
    // The region is already failing; don't pile a second failure on top.
    return;
  }
  validate();
}

size_t check_scope::observed(absl::string_view name) const {
  auto it = m_entries.find(name);
  if (it == m_entries.end()) {
    return 0;
  }
  return it->second.observed;
}

void check_scope::record(absl::string_view name) {
  auto it = m_entries.find(name);
  if (it != m_entries.end()) {
    it->second.observed++;
  }
}

void check_scope::validate() {
  std::vector<mark_failure> failures;
  for (const auto& e : m_entries) {
    if (!e.second.expected.satisfied_by(e.second.observed)) {
      failures.push_back(mark_failure::make(e.first, e.second.expected, e.second.observed));
    }
  }
  if (failures.empty()) {
    return;
  }
  std::sort(failures.begin(), failures.end(),
            [](const mark_failure& lhs, const mark_failure& rhs) { return lhs.name < rhs.name; });
  m_state.reporter().report_failures(failures);
}

}  // namespace covmark
