// VINDEX - Merkle Tree
// Copyright (c) 2024 VINDEX Developers
// MIT License
//
// Binary Merkle tree over transaction content digests. Interior nodes are
// SHA256(left || right); a level with an odd count pairs its last node with
// itself. The root of an empty tree is SHA256 of the empty string.

#ifndef VINDEX_CORE_MERKLE_H
#define VINDEX_CORE_MERKLE_H

#include "vindex/core/types.h"

#include <cstddef>
#include <vector>

namespace vindex {

/// SHA256 over the 64-byte concatenation of two nodes
Hash256 HashPair(const Hash256& left, const Hash256& right);

/// Root of the tree over the given leaves
Hash256 ComputeMerkleRoot(const std::vector<Hash256>& leaves);

/// Sibling hashes from the leaf at position up to the root (empty if
/// position is out of range or the tree has a single leaf)
std::vector<Hash256> ComputeMerklePath(const std::vector<Hash256>& leaves, size_t position);

/// Check that leaf at position hashes up to root along proof
bool VerifyMerkleProof(const Hash256& leaf, size_t position,
                       const Hash256& root, const std::vector<Hash256>& proof);

} // namespace vindex

#endif // VINDEX_CORE_MERKLE_H
