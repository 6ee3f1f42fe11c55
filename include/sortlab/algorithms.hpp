// Reference sorting algorithms.
// Every function copies its input and returns a new sorted vector; the input
// is never modified. Elements only need operator<.

#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>
#include <vector>

namespace sortlab {
namespace algos {

// Adjacent compare/swap passes; stops after a pass without swaps.
// Stable. O(n^2) average/worst, O(n) on sorted input.
template <class T> std::vector<T> bubble_sort(const std::vector<T> &input) {
  std::vector<T> a(input);
  const std::size_t n = a.size();
  for (std::size_t i = 0; i < n; ++i) {
    bool swapped = false;
    // a[n-i, n) already holds the i largest elements
    for (std::size_t j = 0; j + 1 < n - i; ++j) {
      if (a[j + 1] < a[j]) {
        std::swap(a[j], a[j + 1]);
        swapped = true;
      }
    }
    if (!swapped)
      break;
  }
  return a;
}

// Stable. O(n^2) average/worst, O(n) on sorted input.
template <class T> std::vector<T> insertion_sort(const std::vector<T> &input) {
  std::vector<T> a(input);
  for (std::size_t i = 1; i < a.size(); ++i) {
    T key = std::move(a[i]);
    std::size_t j = i;
    while (j > 0 && key < a[j - 1]) {
      a[j] = std::move(a[j - 1]);
      --j;
    }
    a[j] = std::move(key);
  }
  return a;
}

namespace detail {

// Ties take the left element, which keeps merge_sort stable.
template <class T>
std::vector<T> merge(const std::vector<T> &left, const std::vector<T> &right) {
  std::vector<T> out;
  out.reserve(left.size() + right.size());
  std::size_t i = 0, j = 0;
  while (i < left.size() && j < right.size()) {
    if (!(right[j] < left[i]))
      out.push_back(left[i++]);
    else
      out.push_back(right[j++]);
  }
  out.insert(out.end(), left.begin() + static_cast<std::ptrdiff_t>(i),
             left.end());
  out.insert(out.end(), right.begin() + static_cast<std::ptrdiff_t>(j),
             right.end());
  return out;
}

} // namespace detail

// Top-down recursive merge sort. Stable. O(n log n), O(n) extra per level.
template <class T> std::vector<T> merge_sort(const std::vector<T> &input) {
  if (input.size() <= 1)
    return std::vector<T>(input);
  const auto mid = static_cast<std::ptrdiff_t>(input.size() / 2);
  std::vector<T> left(input.begin(), input.begin() + mid);
  std::vector<T> right(input.begin() + mid, input.end());
  return detail::merge(merge_sort(left), merge_sort(right));
}

// Three-way partition around the middle element, then recurse on the strictly
// smaller and strictly larger groups. Not stable by contract.
// O(n log n) average, O(n^2) worst; recursion depth O(n) worst.
template <class T> std::vector<T> quick_sort(const std::vector<T> &input) {
  std::vector<T> a(input);
  if (a.size() <= 1)
    return a;
  const T pivot = a[a.size() / 2];
  std::vector<T> less, equal, greater;
  for (const auto &x : a)
    if (x < pivot)
      less.push_back(x);
  for (const auto &x : a)
    if (!(x < pivot) && !(pivot < x))
      equal.push_back(x);
  for (const auto &x : a)
    if (pivot < x)
      greater.push_back(x);

  std::vector<T> out = quick_sort(less);
  out.reserve(a.size());
  out.insert(out.end(), equal.begin(), equal.end());
  std::vector<T> hi = quick_sort(greater);
  out.insert(out.end(), std::make_move_iterator(hi.begin()),
             std::make_move_iterator(hi.end()));
  return out;
}

// Library sort (std::stable_sort) on a copy.
template <class T> std::vector<T> builtin_sort(const std::vector<T> &input) {
  std::vector<T> a(input);
  std::stable_sort(a.begin(), a.end());
  return a;
}

} // namespace algos
} // namespace sortlab
