#pragma once

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace ratinggraph::mapping {

// Dense zero-based index space over raw identifiers, numbered by first occurrence.
template <typename Key>
class IdMap {
 public:
  // Returns the index of `key`, assigning the next free one on first sight.
  int64_t Add(const Key& key) {
    auto it = index_.find(key);
    if (it != index_.end()) {
      return it->second;
    }
    const auto next = static_cast<int64_t>(keys_.size());
    index_.emplace(key, next);
    keys_.push_back(key);
    return next;
  }

  std::optional<int64_t> Find(const Key& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  bool Contains(const Key& key) const { return index_.count(key) > 0; }

  // Raw identifier for a dense index.
  const Key& RawId(int64_t index) const { return keys_.at(static_cast<size_t>(index)); }

  const std::vector<Key>& RawIds() const { return keys_; }
  int64_t size() const { return static_cast<int64_t>(keys_.size()); }
  bool empty() const { return keys_.empty(); }

 private:
  std::unordered_map<Key, int64_t> index_;
  std::vector<Key> keys_;
};

template <typename Key>
struct MappedIds {
  std::vector<int64_t> indices;  // dense index per input position
  IdMap<Key> map;
  int64_t num_distinct{0};
};

template <typename Key>
MappedIds<Key> MapIds(const std::vector<Key>& raw_ids) {
  MappedIds<Key> out;
  out.indices.reserve(raw_ids.size());
  for (const auto& id : raw_ids) {
    out.indices.push_back(out.map.Add(id));
  }
  out.num_distinct = out.map.size();
  return out;
}

}  // namespace ratinggraph::mapping
