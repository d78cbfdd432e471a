#pragma once

#include <cstddef>
#include <cstdint>
#include <ranges>
#include <string>
#include <vector>

#include "core/model/types.hpp"

namespace sentinel {

inline Result validate_page_limit(std::size_t limit, std::size_t max_page_size) {
  if (limit == 0U || limit > max_page_size) {
    return Result::failure(ErrorCode::InvalidInput,
                           "Page limit must be between 1 and " + std::to_string(max_page_size) + ".");
  }
  return Result::success();
}

// Slice of `ids` in stored order. An offset past the end yields an empty page.
template <std::ranges::sized_range Range>
std::vector<std::uint64_t> page_forward(const Range& ids, std::size_t offset, std::size_t limit) {
  std::vector<std::uint64_t> page;
  if (offset >= std::ranges::size(ids)) {
    return page;
  }
  for (const auto id : ids | std::views::drop(offset) | std::views::take(limit)) {
    page.push_back(id);
  }
  return page;
}

// Same as page_forward but over `ids` read newest first.
template <std::ranges::sized_range Range>
std::vector<std::uint64_t> page_reverse(const Range& ids, std::size_t offset, std::size_t limit) {
  std::vector<std::uint64_t> page;
  if (offset >= std::ranges::size(ids)) {
    return page;
  }
  for (const auto id : ids | std::views::reverse | std::views::drop(offset) | std::views::take(limit)) {
    page.push_back(id);
  }
  return page;
}

// Pages over the records matching `keep`, visiting `records` in the given order.
template <typename Records, typename Predicate>
std::vector<std::uint64_t> page_matching(const Records& records, std::size_t offset, std::size_t limit,
                                         Predicate keep) {
  std::vector<std::uint64_t> page;
  std::size_t skipped = 0;
  for (const auto& record : records) {
    if (!keep(record)) {
      continue;
    }
    if (skipped < offset) {
      ++skipped;
      continue;
    }
    page.push_back(record.id);
    if (page.size() == limit) {
      break;
    }
  }
  return page;
}

}  // namespace sentinel
