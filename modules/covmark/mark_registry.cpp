#include "modules/covmark/mark_registry.h"

namespace covmark {

mark_handle mark_registry::register_mark(absl::string_view name) {
  std::lock_guard<std::mutex> l(m_mu);
  auto it = m_names.find(name);
  if (it == m_names.end()) {
    it = m_names.emplace(name.data(), name.size()).first;
  }
  return mark_handle(&*it);
}

bool mark_registry::is_registered(absl::string_view name) const {
  std::lock_guard<std::mutex> l(m_mu);
  return m_names.find(name) != m_names.end();
}

size_t mark_registry::size() const {
  std::lock_guard<std::mutex> l(m_mu);
  return m_names.size();
}

std::vector<std::string> mark_registry::names() const {
  std::lock_guard<std::mutex> l(m_mu);
  return std::vector<std::string>(m_names.begin(), m_names.end());
}

}  // namespace covmark
