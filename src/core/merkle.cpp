// VINDEX - Merkle Tree Implementation
// Copyright (c) 2024 VINDEX Developers
// MIT License

#include "vindex/core/merkle.h"
#include "vindex/crypto/sha256.h"

namespace vindex {

namespace {

/// Replace a level with its parent level
void ReduceLevel(std::vector<Hash256>& level) {
    if (level.size() & 1) {
        level.push_back(level.back());
    }
    const size_t parents = level.size() / 2;
    for (size_t i = 0; i < parents; ++i) {
        level[i] = HashPair(level[2 * i], level[2 * i + 1]);
    }
    level.resize(parents);
}

} // namespace

Hash256 HashPair(const Hash256& left, const Hash256& right) {
    SHA256 hasher;
    hasher.Write(left.data(), Hash256::SIZE);
    hasher.Write(right.data(), Hash256::SIZE);
    return hasher.Finalize();
}

Hash256 ComputeMerkleRoot(const std::vector<Hash256>& leaves) {
    if (leaves.empty()) {
        return SHA256Hash(std::string());
    }
    std::vector<Hash256> level = leaves;
    while (level.size() > 1) {
        ReduceLevel(level);
    }
    return level.front();
}

std::vector<Hash256> ComputeMerklePath(const std::vector<Hash256>& leaves, size_t position) {
    std::vector<Hash256> proof;
    if (position >= leaves.size()) {
        return proof;
    }

    std::vector<Hash256> level = leaves;
    size_t pos = position;
    while (level.size() > 1) {
        size_t sibling = (pos & 1) ? pos - 1 : pos + 1;
        // Odd level: the last node is its own sibling
        proof.push_back(sibling < level.size() ? level[sibling] : level[pos]);
        ReduceLevel(level);
        pos /= 2;
    }
    return proof;
}

bool VerifyMerkleProof(const Hash256& leaf, size_t position,
                       const Hash256& root, const std::vector<Hash256>& proof) {
    Hash256 current = leaf;
    size_t pos = position;
    for (const Hash256& sibling : proof) {
        current = (pos & 1) ? HashPair(sibling, current) : HashPair(current, sibling);
        pos /= 2;
    }
    return current == root;
}

} // namespace vindex
