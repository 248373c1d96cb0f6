#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace pqgate {

// Proof exchange format: {"root": hex, "leafIndex": int, "siblings": [hex]}
// plus an optional "leafCount". Without the leaf count a verifier cannot
// tell where an unpaired trailing node was paired with itself.
struct MerkleProof {
    std::string root;
    std::size_t leaf_index{0};
    std::vector<std::string> siblings;
    std::size_t leaf_count{0}; // 0 when unknown
};

void to_json(nlohmann::json &j, const MerkleProof &proof);
void from_json(const nlohmann::json &j, MerkleProof &proof);

// Binary SHA-256 hash tree over opaque leaves. Node hashes are lowercase
// hex; a parent is SHA-256 over the concatenated hex text of its children.
// An unpaired trailing node is paired with itself, and a proof carries no
// element for that level.
class MerkleAccumulator {
public:
    MerkleAccumulator() = default;
    explicit MerkleAccumulator(std::vector<std::string> leaves);

    // Empty string for a tree with no leaves.
    std::string root() const;

    // Throws std::out_of_range for an index outside [0, leaf_count).
    std::vector<std::string> get_proof(std::size_t index) const;
    MerkleProof make_proof(std::size_t index) const;

    // With leaf_count == 0 every proof element is folded in by index
    // parity. With the tree's leaf count, the self-pairing of an unpaired
    // trailing node is re-derived at the levels where the proof omits it.
    static bool verify(const std::string &leaf,
                       std::size_t index,
                       const std::vector<std::string> &proof,
                       const std::string &root,
                       std::size_t leaf_count = 0);
    static bool verify(const std::string &leaf, const MerkleProof &proof);

    // Appends and rebuilds the whole tree.
    void add_leaf(const std::string &leaf);

    // Root of an independent tree over leaves [start, end] (inclusive,
    // end clamped to the last leaf). Empty string for an empty range.
    std::string get_batch_root(std::size_t start, std::size_t end) const;

    std::size_t leaf_count() const { return leaves_.size(); }
    const std::vector<std::vector<std::string>> &levels() const { return levels_; }

    static std::string hash_leaf(const std::string &leaf);
    static std::string hash_pair(const std::string &left, const std::string &right);

private:
    void rebuild();

    std::vector<std::string> leaves_;
    std::vector<std::vector<std::string>> levels_;
};

} // namespace pqgate
