#pragma once

#include <doc_chunker/section.h>
#include <doc_chunker/tokenizer.h>
#include <string>
#include <vector>

namespace doc_chunker {

// Singleton groups are coalesced until the running count reaches this
constexpr size_t kSingletonTokenCeiling = 218;

/**
 * Groups fragments without building a tree.
 *
 * Fragment indices are bucketed by level and the buckets are walked in
 * reverse level order. Every unread index of the first `depth` buckets opens
 * a group, and each later bucket contributes its nearest index preceding the
 * group's opening index. Groups come back in ascending index order.
 *
 * Single-fragment groups are packed together while they stay under
 * kSingletonTokenCeiling tokens (position tags excluded from the count);
 * multi-fragment groups always stand alone.
 *
 * Returns an empty list for an empty input or style < 0.
 */
std::vector<std::vector<std::string>> hierarchical_merge(int style,
                                                         const std::vector<Section>& sections,
                                                         int depth,
                                                         const Tokenizer& tokenizer);

} // namespace doc_chunker
