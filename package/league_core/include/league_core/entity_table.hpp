#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace league_core {

// Id-keyed table of entities that carry an `id` member. Ordered by id so
// iteration is deterministic across runs.
template <typename T> class EntityTable {
public:
  using Id = std::int64_t;
  using const_iterator = typename std::map<Id, T>::const_iterator;

  EntityTable() = default;

  void upsert(const T &row) { rows_[row.id] = row; }

  bool has(const Id &id) const { return rows_.find(id) != rows_.end(); }

  // nullptr when absent. Stages use this so stale references are skipped.
  const T *find(const Id &id) const {
    auto it = rows_.find(id);
    return it == rows_.end() ? nullptr : &it->second;
  }

  T *find_mutable(const Id &id) {
    auto it = rows_.find(id);
    return it == rows_.end() ? nullptr : &it->second;
  }

  const T &get(const Id &id) const {
    auto it = rows_.find(id);
    if (it == rows_.end()) {
      throw std::out_of_range("EntityTable: id " + std::to_string(id) +
                              " not found");
    }
    return it->second;
  }

  bool erase(const Id &id) { return rows_.erase(id) > 0; }

  std::size_t size() const { return rows_.size(); }
  bool empty() const { return rows_.empty(); }

  std::vector<Id> ids() const {
    std::vector<Id> out;
    out.reserve(rows_.size());
    for (const auto &kv : rows_)
      out.push_back(kv.first);
    return out;
  }

  std::vector<T> rows() const {
    std::vector<T> out;
    out.reserve(rows_.size());
    for (const auto &kv : rows_)
      out.push_back(kv.second);
    return out;
  }

  const_iterator begin() const { return rows_.begin(); }
  const_iterator end() const { return rows_.end(); }

private:
  std::map<Id, T> rows_;
};

} // namespace league_core
