#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>

namespace registrar::util {

/*
  Sharded per-key mutexes.

  Two callers touching the same key always land on the same shard, so a
  read-modify-write under Lock(key) cannot interleave with another one for
  that key. Disjoint keys usually map to different shards and proceed in
  parallel; a hash collision only costs contention, never correctness.
*/
template <std::size_t ShardCount = 64>
class KeyLocks {
 public:
  [[nodiscard]] std::unique_lock<std::mutex> Lock(const std::string& key) {
    return std::unique_lock<std::mutex>(shards_[std::hash<std::string>{}(key) % ShardCount]);
  }

 private:
  std::array<std::mutex, ShardCount> shards_;
};

} // namespace registrar::util
