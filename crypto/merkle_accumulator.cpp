#include "merkle_accumulator.hpp"

#include "primitives.hpp"

#include <algorithm>
#include <stdexcept>

namespace pqgate {

void to_json(nlohmann::json &j, const MerkleProof &proof) {
    j = nlohmann::json{{"root", proof.root},
                       {"leafIndex", proof.leaf_index},
                       {"siblings", proof.siblings}};
    if (proof.leaf_count > 0) {
        j["leafCount"] = proof.leaf_count;
    }
}

// Older producers wrote snake_case keys; both spellings are read.
void from_json(const nlohmann::json &j, MerkleProof &proof) {
    j.at("root").get_to(proof.root);
    if (j.contains("leafIndex")) {
        j.at("leafIndex").get_to(proof.leaf_index);
    } else {
        j.at("leaf_index").get_to(proof.leaf_index);
    }
    j.at("siblings").get_to(proof.siblings);
    proof.leaf_count = j.contains("leafCount") ? j.at("leafCount").get<std::size_t>()
                                               : j.value("leaf_count", std::size_t{0});
}

MerkleAccumulator::MerkleAccumulator(std::vector<std::string> leaves)
    : leaves_(std::move(leaves)) {
    rebuild();
}

std::string MerkleAccumulator::hash_leaf(const std::string &leaf) {
    return sha256_hex(leaf);
}

std::string MerkleAccumulator::hash_pair(const std::string &left, const std::string &right) {
    return sha256_hex(left + right);
}

void MerkleAccumulator::rebuild() {
    levels_.clear();
    if (leaves_.empty()) {
        return;
    }

    std::vector<std::string> current;
    current.reserve(leaves_.size());
    for (const auto &leaf : leaves_) {
        current.push_back(hash_leaf(leaf));
    }
    levels_.push_back(current);

    while (current.size() > 1) {
        std::vector<std::string> next;
        next.reserve((current.size() + 1) / 2);
        for (std::size_t i = 0; i < current.size(); i += 2) {
            const std::string &left = current[i];
            const std::string &right = (i + 1 < current.size()) ? current[i + 1] : left;
            next.push_back(hash_pair(left, right));
        }
        levels_.push_back(next);
        current = std::move(next);
    }
}

std::string MerkleAccumulator::root() const {
    if (levels_.empty()) {
        return {};
    }
    return levels_.back().front();
}

std::vector<std::string> MerkleAccumulator::get_proof(std::size_t index) const {
    if (index >= leaves_.size()) {
        throw std::out_of_range("Merkle leaf index out of range");
    }

    std::vector<std::string> proof;
    std::size_t current = index;
    for (std::size_t level = 0; level + 1 < levels_.size(); ++level) {
        const bool is_right = current % 2 == 1;
        const std::size_t sibling = is_right ? current - 1 : current + 1;
        if (sibling < levels_[level].size()) {
            proof.push_back(levels_[level][sibling]);
        }
        current /= 2;
    }
    return proof;
}

MerkleProof MerkleAccumulator::make_proof(std::size_t index) const {
    MerkleProof proof;
    proof.siblings = get_proof(index);
    proof.leaf_index = index;
    proof.root = root();
    proof.leaf_count = leaves_.size();
    return proof;
}

bool MerkleAccumulator::verify(const std::string &leaf,
                               std::size_t index,
                               const std::vector<std::string> &proof,
                               const std::string &root,
                               std::size_t leaf_count) {
    std::string hash = hash_leaf(leaf);
    std::size_t current = index;

    if (leaf_count == 0) {
        for (const auto &sibling : proof) {
            const bool is_right = current % 2 == 1;
            hash = is_right ? hash_pair(sibling, hash) : hash_pair(hash, sibling);
            current /= 2;
        }
        return hash == root;
    }

    if (index >= leaf_count) {
        return false;
    }
    std::size_t next = 0;
    for (std::size_t width = leaf_count; width > 1; width = (width + 1) / 2) {
        const bool is_right = current % 2 == 1;
        if (!is_right && current + 1 == width) {
            hash = hash_pair(hash, hash);
        } else {
            if (next >= proof.size()) {
                return false;
            }
            const std::string &sibling = proof[next++];
            hash = is_right ? hash_pair(sibling, hash) : hash_pair(hash, sibling);
        }
        current /= 2;
    }
    return next == proof.size() && hash == root;
}

bool MerkleAccumulator::verify(const std::string &leaf, const MerkleProof &proof) {
    return verify(leaf, proof.leaf_index, proof.siblings, proof.root, proof.leaf_count);
}

void MerkleAccumulator::add_leaf(const std::string &leaf) {
    leaves_.push_back(leaf);
    rebuild();
}

std::string MerkleAccumulator::get_batch_root(std::size_t start, std::size_t end) const {
    if (leaves_.empty() || start >= leaves_.size() || end < start) {
        return {};
    }
    const std::size_t last = std::min(end, leaves_.size() - 1);
    std::vector<std::string> batch(leaves_.begin() + static_cast<std::ptrdiff_t>(start),
                                   leaves_.begin() + static_cast<std::ptrdiff_t>(last) + 1);
    return MerkleAccumulator(std::move(batch)).root();
}

} // namespace pqgate
