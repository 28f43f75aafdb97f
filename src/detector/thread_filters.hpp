#pragma once

#include "detector/capabilities.hpp"

#include <memory>
#include <vector>

namespace stallwatch::detector {

// Allows a thread only when every filter allows it. Evaluation stops at the
// first rejection, in list order. An empty list allows every thread.
class CombinedThreadFilter final : public IThreadFilter {
public:
  explicit CombinedThreadFilter(std::vector<std::shared_ptr<IThreadFilter>> filters);

  bool IsAllowed(const ThreadRef& thread) const override;

private:
  std::vector<std::shared_ptr<IThreadFilter>> filters_;
};

// Rejects threads tagged as background helpers. Used by the default provider
// so reports focus on application threads.
class BackgroundThreadFilter final : public IThreadFilter {
public:
  bool IsAllowed(const ThreadRef& thread) const override;
};

// Rejects the detector's own inspector and reporter threads.
class LibraryThreadFilter final : public IThreadFilter {
public:
  bool IsAllowed(const ThreadRef& thread) const override;
};

} // namespace stallwatch::detector
