#include "rsopt/prediction/caching_mask_predictor.h"

namespace rsopt::prediction {

namespace {

std::string cache_key(const std::string_view context, const std::size_t top_k) {
  std::string key(context);
  key.push_back('\x1f');
  key += std::to_string(top_k);
  return key;
}

}  // namespace

CachingMaskPredictor::CachingMaskPredictor(const IMaskPredictor& inner, const std::size_t capacity)
    : inner_(inner), capacity_(capacity) {}

Prediction CachingMaskPredictor::predict(const std::string_view context,
                                         const std::size_t top_k) const {
  const std::string key = cache_key(context, top_k);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = index_.find(key);
    if (it != index_.end()) {
      ++hits_;
      entries_.splice(entries_.begin(), entries_, it->second);
      return Prediction::ok(it->second->second);
    }
    ++misses_;
  }

  // The inner call runs unlocked; a concurrent miss on the same key just computes it twice.
  auto result = inner_.predict(context, top_k);
  if (!result.has_value() || capacity_ == 0) {
    return result;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (index_.find(key) == index_.end()) {
    entries_.emplace_front(key, result.value());
    index_[key] = entries_.begin();
    if (entries_.size() > capacity_) {
      index_.erase(entries_.back().first);
      entries_.pop_back();
    }
  }
  return result;
}

std::size_t CachingMaskPredictor::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::size_t CachingMaskPredictor::hits() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return hits_;
}

std::size_t CachingMaskPredictor::misses() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return misses_;
}

}  // namespace rsopt::prediction
