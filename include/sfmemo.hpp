
#include <cstddef>
#include <initializer_list>
#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>

#ifndef _SFIB_MEMO_H_
#define _SFIB_MEMO_H_

namespace sfib {

/*---------------------------------------------------------------------*/
/* Concurrent memo table */

/* Entries are committed at most once and never removed. A racing insert
 * for a key that is already present leaves the committed value in place
 * and hands it back to the caller, so every reader of a key observes the
 * same value.
 */

template <class Key, class Value>
class memo_table {
private:

  mutable std::mutex mutex;

  std::unordered_map<Key, Value> table;

public:

  memo_table() { }

  memo_table(std::initializer_list<std::pair<const Key, Value>> seed)
  : table(seed) { }

  memo_table(const memo_table&) = delete;
  memo_table& operator=(const memo_table&) = delete;

  bool find(const Key& key, Value& dst) const {
    std::lock_guard<std::mutex> guard(mutex);
    auto it = table.find(key);
    if (it == table.end()) {
      return false;
    }
    dst = it->second;
    return true;
  }

  Value insert(const Key& key, const Value& value) {
    std::lock_guard<std::mutex> guard(mutex);
    return table.emplace(key, value).first->second;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> guard(mutex);
    return table.size();
  }

  std::map<Key, Value> snapshot() const {
    std::lock_guard<std::mutex> guard(mutex);
    return std::map<Key, Value>(table.begin(), table.end());
  }

};

} // end namespace

#endif
