#include "detector/thread_filters.hpp"

#include "detector/thread_registry.hpp"

#include <utility>

namespace stallwatch::detector {

CombinedThreadFilter::CombinedThreadFilter(std::vector<std::shared_ptr<IThreadFilter>> filters)
    : filters_(std::move(filters)) {}

bool CombinedThreadFilter::IsAllowed(const ThreadRef& thread) const {
  for (const auto& filter : filters_) {
    if (filter != nullptr && !filter->IsAllowed(thread)) {
      return false;
    }
  }
  return true;
}

bool BackgroundThreadFilter::IsAllowed(const ThreadRef& thread) const {
  return !thread.background;
}

bool LibraryThreadFilter::IsAllowed(const ThreadRef& thread) const {
  return thread.group_name != kLibraryThreadGroup;
}

} // namespace stallwatch::detector
