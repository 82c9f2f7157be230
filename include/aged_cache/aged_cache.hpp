#pragma once

#include "aged_cache/options.hpp"
#include "aged_cache/time_source.hpp"
#include "aged_cache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace aged_cache {

// Key/value store whose entries vanish once their retention elapses.
//
// Storage is a singly linked chain of uniquely owned nodes, newest insert
// first. Expired entries are unlinked lazily: get(), empty() and size() sweep
// the whole chain against a single now() reading before answering. put()
// does not sweep unless CacheOptions::sweep_on_put is set.
//
// Not thread-safe. Callers sharing an instance must guard every call with
// one external mutex.
template <typename K, typename V> class AgedCache {
public:
  AgedCache() : AgedCache(std::make_unique<SystemTimeSource>()) {}

  explicit AgedCache(std::unique_ptr<ITimeSource> time_source,
                     CacheOptions opts = {})
      : time_source_(std::move(time_source)), opts_(std::move(opts)) {
    if (!time_source_)
      time_source_ = std::make_unique<SystemTimeSource>();
  }

  ~AgedCache() { clear(); }

  AgedCache(const AgedCache &) = delete;
  AgedCache &operator=(const AgedCache &) = delete;
  AgedCache(AgedCache &&) = delete;
  AgedCache &operator=(AgedCache &&) = delete;

  // A zero or negative retention stores an entry that is already expired
  // (or expires at this very instant).
  void put(const K &key, V value, std::int64_t retention_ms) {
    if (opts_.sweep_on_put)
      sweep();
    const EpochMillis expires_at =
        deadline_after(time_source_->now_ms(), retention_ms);
    if (remove(key))
      ++stats_.replacements;
    auto node = std::make_unique<Node>(key, std::move(value), expires_at);
    node->next = std::move(head_);
    head_ = std::move(node);
    ++stats_.puts;
  }

  std::optional<V> get(const K &key) {
    sweep();
    for (const Node *n = head_.get(); n != nullptr; n = n->next.get()) {
      if (n->key == key) {
        ++stats_.hits;
        return n->value;
      }
    }
    ++stats_.misses;
    return std::nullopt;
  }

  bool empty() {
    sweep();
    return head_ == nullptr;
  }

  std::size_t size() {
    sweep();
    return linked_count();
  }

  void clear() {
    while (head_)
      head_ = std::move(head_->next);
  }

  std::string info() const {
    return render_info(stats_, opts_, time_source_->name(), linked_count());
  }

  const CacheStats &stats() const { return stats_; }
  void reset_stats() { stats_ = CacheStats{}; }
  const CacheOptions &options() const { return opts_; }
  const ITimeSource &time_source() const { return *time_source_; }

private:
  struct Node {
    Node(const K &k, V v, EpochMillis expires)
        : key(k), value(std::move(v)), expires_at_ms(expires) {}

    const K key;
    const V value;
    const EpochMillis expires_at_ms;
    std::unique_ptr<Node> next;
  };

  static EpochMillis deadline_after(EpochMillis now, std::int64_t retention_ms) {
    constexpr auto kMax = std::numeric_limits<EpochMillis>::max();
    constexpr auto kMin = std::numeric_limits<EpochMillis>::min();
    if (retention_ms > 0 && now > kMax - retention_ms)
      return kMax;
    if (retention_ms < 0 && now < kMin - retention_ms)
      return kMin;
    return now + retention_ms;
  }

  // One pass over the full chain; entries are not ordered by deadline.
  // An entry whose deadline equals now survives.
  std::size_t sweep() {
    const EpochMillis now = time_source_->now_ms();
    std::size_t removed = 0;
    std::unique_ptr<Node> *link = &head_;
    while (*link) {
      if ((*link)->expires_at_ms < now) {
        *link = std::move((*link)->next);
        ++removed;
      } else {
        link = &(*link)->next;
      }
    }
    ++stats_.sweeps;
    stats_.expirations += removed;
    return removed;
  }

  bool remove(const K &key) {
    std::unique_ptr<Node> *link = &head_;
    while (*link) {
      if ((*link)->key == key) {
        *link = std::move((*link)->next);
        return true;
      }
      link = &(*link)->next;
    }
    return false;
  }

  std::size_t linked_count() const {
    std::size_t count = 0;
    for (const Node *n = head_.get(); n != nullptr; n = n->next.get())
      ++count;
    return count;
  }

  std::unique_ptr<ITimeSource> time_source_;
  CacheOptions opts_;
  std::unique_ptr<Node> head_;
  CacheStats stats_;
};

} // namespace aged_cache
