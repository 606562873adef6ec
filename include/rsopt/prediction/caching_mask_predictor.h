#pragma once

#include "rsopt/prediction/mask_predictor.h"

#include <cstddef>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

namespace rsopt::prediction {

// CachingMaskPredictor decorates another predictor with a bounded LRU cache.
// Only successful predictions are cached; errors are retried on the next call.
// Thread-safe: one instance can be shared by concurrent runs.
class CachingMaskPredictor final : public IMaskPredictor {
 public:
  static constexpr std::size_t kDefaultCapacity = 500;

  explicit CachingMaskPredictor(const IMaskPredictor& inner,
                                std::size_t capacity = kDefaultCapacity);

  [[nodiscard]] Prediction predict(std::string_view context, std::size_t top_k) const override;

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t hits() const;
  [[nodiscard]] std::size_t misses() const;

 private:
  using Entry = std::pair<std::string, std::vector<std::string>>;

  const IMaskPredictor& inner_;
  std::size_t capacity_;

  mutable std::mutex mutex_;
  mutable std::list<Entry> entries_;  // most recently used first
  mutable std::unordered_map<std::string, std::list<Entry>::iterator> index_;
  mutable std::size_t hits_{0};
  mutable std::size_t misses_{0};
};

}  // namespace rsopt::prediction
