#pragma once

#include <mpchat/common.h>

#include <algorithm>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <ostream>
#include <tuple>
#include <vector>

namespace mpchat {

///
/// An immutable set of values, kept sorted and free of duplicates.  Two
/// elements are considered the same if neither orders before the other
/// under `Compare`.  Every operation returns a new set.
///
template<typename T, typename Compare = std::less<T>>
class OrderedSet
{
public:
  using value_type = T;
  using const_iterator = typename std::vector<T>::const_iterator;

  OrderedSet() = default;

  OrderedSet(std::initializer_list<T> items)
    : _items(items)
  {
    normalize();
  }

  explicit OrderedSet(std::vector<T> items, Compare compare = Compare())
    : _compare(std::move(compare))
    , _items(std::move(items))
  {
    normalize();
  }

  template<typename It>
  OrderedSet(It first, It last)
    : _items(first, last)
  {
    normalize();
  }

  static OrderedSet from(std::vector<T> items)
  {
    return OrderedSet(std::move(items));
  }

  // An absent sequence is the empty set
  static OrderedSet from(const std::optional<std::vector<T>>& items)
  {
    if (!items) {
      return OrderedSet();
    }

    return OrderedSet(items.value());
  }

  const std::vector<T>& to_vector() const { return _items; }

  size_t size() const { return _items.size(); }
  bool empty() const { return _items.empty(); }
  const_iterator begin() const { return _items.begin(); }
  const_iterator end() const { return _items.end(); }

  // Groups are small, so a scan is fine here
  bool contains(const T& val) const
  {
    return std::any_of(_items.begin(), _items.end(), [&](const auto& item) {
      return equivalent(item, val);
    });
  }

  bool equals(const OrderedSet& other) const
  {
    return std::equal(_items.begin(),
                      _items.end(),
                      other._items.begin(),
                      other._items.end(),
                      [&](const auto& a, const auto& b) {
                        return equivalent(a, b);
                      });
  }

  OrderedSet unite(const OrderedSet& other) const
  {
    auto out = std::vector<T>{};
    std::set_union(_items.begin(),
                   _items.end(),
                   other._items.begin(),
                   other._items.end(),
                   std::back_inserter(out),
                   _compare);
    return OrderedSet(std::move(out), _compare);
  }

  OrderedSet intersect(const OrderedSet& other) const
  {
    auto out = std::vector<T>{};
    std::set_intersection(_items.begin(),
                          _items.end(),
                          other._items.begin(),
                          other._items.end(),
                          std::back_inserter(out),
                          _compare);
    return OrderedSet(std::move(out), _compare);
  }

  OrderedSet subtract(const OrderedSet& other) const
  {
    auto out = std::vector<T>{};
    std::set_difference(_items.begin(),
                        _items.end(),
                        other._items.begin(),
                        other._items.end(),
                        std::back_inserter(out),
                        _compare);
    return OrderedSet(std::move(out), _compare);
  }

  bool is_disjoint(const OrderedSet& other) const
  {
    return intersect(other).empty();
  }

  bool is_subset_of(const OrderedSet& other) const
  {
    return std::includes(other._items.begin(),
                         other._items.end(),
                         _items.begin(),
                         _items.end(),
                         _compare);
  }

  // Returns (added, removed) such that
  //
  //   newer == this->subtract(removed).unite(added)
  std::tuple<OrderedSet, OrderedSet> changed(const OrderedSet& newer) const
  {
    return { newer.subtract(*this), subtract(newer) };
  }

  // Apply a delta produced by `changed`.  The two halves of the delta must
  // not overlap.
  OrderedSet patch(const OrderedSet& added, const OrderedSet& removed) const
  {
    if (!added.is_disjoint(removed)) {
      throw InvalidParameterError("Patch adds and removes the same element");
    }

    return subtract(removed).unite(added);
  }

  OrderedSet patch(const std::tuple<OrderedSet, OrderedSet>& delta) const
  {
    return patch(std::get<0>(delta), std::get<1>(delta));
  }

  // 3-way merge of two sets that were both derived from this one
  OrderedSet merge(const OrderedSet& child0, const OrderedSet& child1) const
  {
    return child1.patch(changed(child0));
  }

private:
  Compare _compare;
  std::vector<T> _items;

  bool equivalent(const T& a, const T& b) const
  {
    return !_compare(a, b) && !_compare(b, a);
  }

  void normalize()
  {
    std::sort(_items.begin(), _items.end(), _compare);
    auto last = std::unique(
      _items.begin(), _items.end(), [&](const auto& a, const auto& b) {
        return equivalent(a, b);
      });
    _items.erase(last, _items.end());
  }
};

template<typename T, typename C>
bool
operator==(const OrderedSet<T, C>& lhs, const OrderedSet<T, C>& rhs)
{
  return lhs.equals(rhs);
}

template<typename T, typename C>
bool
operator!=(const OrderedSet<T, C>& lhs, const OrderedSet<T, C>& rhs)
{
  return !lhs.equals(rhs);
}

template<typename T, typename C>
OrderedSet<T, C>
operator|(const OrderedSet<T, C>& lhs, const OrderedSet<T, C>& rhs)
{
  return lhs.unite(rhs);
}

template<typename T, typename C>
OrderedSet<T, C>
operator&(const OrderedSet<T, C>& lhs, const OrderedSet<T, C>& rhs)
{
  return lhs.intersect(rhs);
}

template<typename T, typename C>
OrderedSet<T, C>
operator-(const OrderedSet<T, C>& lhs, const OrderedSet<T, C>& rhs)
{
  return lhs.subtract(rhs);
}

template<typename T, typename C>
std::ostream&
operator<<(std::ostream& str, const OrderedSet<T, C>& set)
{
  str << "{";
  auto first = true;
  for (const auto& item : set) {
    if (!first) {
      str << ", ";
    }
    str << item;
    first = false;
  }
  return str << "}";
}

} // namespace mpchat
