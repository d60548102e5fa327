#include <catch2/catch.hpp>

#include <set>
#include <cstdint>

#include "bit_array_operations.hpp"

TEST_CASE("introduce_errors flips exactly floor(n * p) bits", "[bits]")
{
    std::mt19937 prng(7);
    std::vector<int> alice = generate_random_bit_array(prng, 1000);
    std::vector<int> bob;

    double actual_QBER = introduce_errors(prng, alice, 0.05, bob);

    REQUIRE(bob.size() == alice.size());
    REQUIRE(count_mismatches(alice, bob) == 50);
    REQUIRE(actual_QBER == Approx(0.05));
}

TEST_CASE("introduce_errors with zero probability copies the key", "[bits]")
{
    std::mt19937 prng(7);
    std::vector<int> alice = generate_random_bit_array(prng, 100);
    std::vector<int> bob;

    REQUIRE(introduce_errors(prng, alice, 0., bob) == 0.);
    REQUIRE(arrays_equal(alice, bob));
    REQUIRE_THROWS_AS(introduce_errors(prng, alice, 1.5, bob), std::invalid_argument);
}

TEST_CASE("remove_positions keeps the order of the remaining bits", "[bits]")
{
    std::vector<int> bits{1, 0, 1, 1, 0, 0, 1};

    remove_positions(bits, {5, 0, 3, 3});

    REQUIRE(bits == std::vector<int>{0, 1, 0, 1});
    REQUIRE_THROWS_AS(remove_positions(bits, {4}), std::out_of_range);
}

TEST_CASE("calculate_parity follows the permutation", "[bits]")
{
    std::vector<int> bits{1, 0, 0, 1, 1};
    std::vector<size_t> permutation{4, 1, 3, 0, 2};

    REQUIRE(calculate_parity(bits, permutation, 0, 1) == 1);
    REQUIRE(calculate_parity(bits, permutation, 0, 3) == 0);
    REQUIRE(calculate_parity(bits, permutation, 1, 5) == 0);
    REQUIRE(calculate_parity(bits, permutation, 2, 2) == 0);
}

TEST_CASE("count_mismatches rejects arrays of different length", "[bits]")
{
    REQUIRE_THROWS_AS(count_mismatches({1, 0}, {1}), std::invalid_argument);
    REQUIRE_FALSE(arrays_equal({1, 0}, {1}));
}

TEST_CASE("make_prng streams are reproducible and independent", "[bits]")
{
    std::mt19937 first = make_prng(99, prng_stream::PERMUTATION, 3);
    std::mt19937 second = make_prng(99, prng_stream::PERMUTATION, 3);
    std::mt19937 other_pass = make_prng(99, prng_stream::PERMUTATION, 4);
    std::mt19937 other_stream = make_prng(99, prng_stream::SAMPLING, 3);

    std::vector<uint32_t> a, b, c, d;
    for (int i = 0; i < 8; i++)
    {
        a.push_back(first());
        b.push_back(second());
        c.push_back(other_pass());
        d.push_back(other_stream());
    }
    REQUIRE(a == b);
    REQUIRE(a != c);
    REQUIRE(a != d);
}

TEST_CASE("make_permutation is a permutation", "[bits]")
{
    std::mt19937 prng(1);
    std::vector<size_t> permutation = make_permutation(500, prng);

    std::set<size_t> unique(permutation.begin(), permutation.end());
    REQUIRE(unique.size() == 500);
    REQUIRE(*unique.rbegin() == 499);
}
