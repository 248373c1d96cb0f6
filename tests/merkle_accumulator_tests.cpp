#include "crypto/merkle_accumulator.hpp"
#include "crypto/primitives.hpp"

#include <boost/test/unit_test.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace pqgate;

namespace {

std::vector<std::string> make_leaves(std::size_t n)
{
    std::vector<std::string> leaves;
    for (std::size_t i = 0; i < n; ++i) {
        leaves.push_back("record-" + std::to_string(i));
    }
    return leaves;
}

} // namespace

BOOST_AUTO_TEST_SUITE(merkle_accumulator_tests)

BOOST_AUTO_TEST_CASE(four_leaf_tree_root_and_proof)
{
    MerkleAccumulator tree({"a", "b", "c", "d"});

    const std::string ha = sha256_hex("a");
    const std::string hb = sha256_hex("b");
    const std::string hc = sha256_hex("c");
    const std::string hd = sha256_hex("d");
    const std::string expected = sha256_hex(sha256_hex(ha + hb) + sha256_hex(hc + hd));
    BOOST_CHECK_EQUAL(tree.root(), expected);

    // Rebuilding from the same leaves is reproducible.
    MerkleAccumulator again({"a", "b", "c", "d"});
    BOOST_CHECK_EQUAL(again.root(), tree.root());

    std::vector<std::string> proof = tree.get_proof(2);
    BOOST_REQUIRE_EQUAL(proof.size(), 2u);
    BOOST_CHECK_EQUAL(proof[0], hd);
    BOOST_CHECK_EQUAL(proof[1], sha256_hex(ha + hb));
    BOOST_CHECK(MerkleAccumulator::verify("c", 2, proof, tree.root()));
}

BOOST_AUTO_TEST_CASE(empty_tree_has_empty_root)
{
    MerkleAccumulator tree;
    BOOST_CHECK(tree.root().empty());
    BOOST_CHECK_EQUAL(tree.leaf_count(), 0u);
    BOOST_CHECK_THROW(tree.get_proof(0), std::out_of_range);
}

BOOST_AUTO_TEST_CASE(single_leaf_root_is_leaf_hash)
{
    MerkleAccumulator tree({"only"});
    BOOST_CHECK_EQUAL(tree.root(), sha256_hex("only"));
    BOOST_CHECK(tree.get_proof(0).empty());
    BOOST_CHECK(MerkleAccumulator::verify("only", 0, {}, tree.root()));
    BOOST_CHECK(MerkleAccumulator::verify("only", tree.make_proof(0)));
}

BOOST_AUTO_TEST_CASE(odd_leaf_count_duplicates_last)
{
    MerkleAccumulator tree({"a", "b", "c"});
    const std::string hc = sha256_hex("c");
    const std::string expected = sha256_hex(sha256_hex(sha256_hex("a") + sha256_hex("b")) +
                                            sha256_hex(hc + hc));
    BOOST_CHECK_EQUAL(tree.root(), expected);

    // The unpaired trailing leaf carries no element for the bottom level.
    BOOST_CHECK_EQUAL(tree.get_proof(2).size(), 1u);
}

BOOST_AUTO_TEST_CASE(every_leaf_verifies_for_many_sizes)
{
    for (std::size_t n = 1; n <= 13; ++n) {
        const auto leaves = make_leaves(n);
        MerkleAccumulator tree(leaves);
        for (std::size_t i = 0; i < n; ++i) {
            MerkleProof proof = tree.make_proof(i);
            BOOST_CHECK_MESSAGE(MerkleAccumulator::verify(leaves[i], proof),
                                "leaf " << i << " of " << n);
        }
    }
}

BOOST_AUTO_TEST_CASE(paired_leaves_verify_without_leaf_count)
{
    const auto leaves = make_leaves(8);
    MerkleAccumulator tree(leaves);
    for (std::size_t i = 0; i < leaves.size(); ++i) {
        BOOST_CHECK(MerkleAccumulator::verify(leaves[i], i, tree.get_proof(i), tree.root()));
    }
}

BOOST_AUTO_TEST_CASE(tampering_breaks_verification)
{
    const auto leaves = make_leaves(6);
    MerkleAccumulator tree(leaves);
    MerkleProof proof = tree.make_proof(3);
    BOOST_REQUIRE(MerkleAccumulator::verify(leaves[3], proof));

    BOOST_CHECK(!MerkleAccumulator::verify("record-X", proof));

    MerkleProof bad_sibling = proof;
    bad_sibling.siblings[0][0] = bad_sibling.siblings[0][0] == 'a' ? 'b' : 'a';
    BOOST_CHECK(!MerkleAccumulator::verify(leaves[3], bad_sibling));

    MerkleProof bad_root = proof;
    bad_root.root[5] = bad_root.root[5] == '0' ? '1' : '0';
    BOOST_CHECK(!MerkleAccumulator::verify(leaves[3], bad_root));

    MerkleProof wrong_index = proof;
    wrong_index.leaf_index = 2;
    BOOST_CHECK(!MerkleAccumulator::verify(leaves[3], wrong_index));

    MerkleProof truncated = proof;
    truncated.siblings.pop_back();
    BOOST_CHECK(!MerkleAccumulator::verify(leaves[3], truncated));
}

BOOST_AUTO_TEST_CASE(add_leaf_rebuilds)
{
    MerkleAccumulator tree({"a", "b", "c"});
    tree.add_leaf("d");
    BOOST_CHECK_EQUAL(tree.leaf_count(), 4u);
    BOOST_CHECK_EQUAL(tree.root(), MerkleAccumulator({"a", "b", "c", "d"}).root());
    BOOST_CHECK_EQUAL(tree.levels().size(), 3u);
}

BOOST_AUTO_TEST_CASE(batch_root_is_independent_subtree)
{
    MerkleAccumulator tree({"a", "b", "c", "d", "e"});
    BOOST_CHECK_EQUAL(tree.get_batch_root(1, 3), MerkleAccumulator({"b", "c", "d"}).root());
    // End is clamped to the last leaf.
    BOOST_CHECK_EQUAL(tree.get_batch_root(3, 100), MerkleAccumulator({"d", "e"}).root());
    BOOST_CHECK(tree.get_batch_root(7, 9).empty());
}

BOOST_AUTO_TEST_CASE(proof_json_exchange)
{
    const auto leaves = make_leaves(5);
    MerkleAccumulator tree(leaves);
    MerkleProof proof = tree.make_proof(4);

    nlohmann::json j = proof;
    BOOST_CHECK(j.contains("root"));
    BOOST_CHECK(j.contains("leafIndex"));
    BOOST_CHECK(j.contains("siblings"));
    BOOST_CHECK_EQUAL(j["leafCount"].get<std::size_t>(), 5u);

    MerkleProof parsed = nlohmann::json::parse(j.dump()).get<MerkleProof>();
    BOOST_CHECK(MerkleAccumulator::verify(leaves[4], parsed));

    nlohmann::json minimal{{"root", tree.root()},
                           {"leaf_index", 0},
                           {"siblings", tree.get_proof(0)}};
    MerkleProof from_minimal = minimal.get<MerkleProof>();
    BOOST_CHECK_EQUAL(from_minimal.leaf_count, 0u);
    BOOST_CHECK(MerkleAccumulator::verify(leaves[0], from_minimal));
}

BOOST_AUTO_TEST_CASE(parses_exchange_format_text)
{
    MerkleAccumulator tree({"a", "b", "c", "d"});
    const auto siblings = tree.get_proof(2);
    BOOST_REQUIRE_EQUAL(siblings.size(), 2u);

    const std::string text = "{\"root\": \"" + tree.root() + "\", \"leafIndex\": 2, "
                             "\"siblings\": [\"" + siblings[0] + "\", \"" + siblings[1] + "\"]}";
    MerkleProof proof = nlohmann::json::parse(text).get<MerkleProof>();
    BOOST_CHECK_EQUAL(proof.leaf_index, 2u);
    BOOST_CHECK_EQUAL(proof.leaf_count, 0u);
    BOOST_CHECK(MerkleAccumulator::verify("c", proof));
    BOOST_CHECK(!MerkleAccumulator::verify("d", proof));

    nlohmann::json round = proof;
    BOOST_CHECK_EQUAL(round["leafIndex"].get<std::size_t>(), 2u);
    BOOST_CHECK(!round.contains("leaf_index"));
}

BOOST_AUTO_TEST_SUITE_END()
