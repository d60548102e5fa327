#include <catch2/catch.hpp>

#include <set>
#include <cmath>
#include <algorithm>

#include "qber_sampler.hpp"
#include "test_helpers.hpp"

TEST_CASE("Sample positions are a sorted uniform subset of the requested size", "[sampler]")
{
    std::vector<size_t> positions = select_sample_positions(1000, 0.1, 5);

    REQUIRE(positions.size() == 100);
    REQUIRE(std::is_sorted(positions.begin(), positions.end()));
    REQUIRE(std::set<size_t>(positions.begin(), positions.end()).size() == 100);
    REQUIRE(positions.back() < 1000);
    REQUIRE(select_sample_positions(1000, 0.1, 5) == positions);
    REQUIRE(select_sample_positions(1000, 0.1, 6) != positions);
}

TEST_CASE("QBER estimate carries a Wald confidence margin", "[sampler]")
{
    qber_estimate estimate = estimate_qber(100, 40, 1.96);

    REQUIRE(estimate.qber == Approx(0.4));
    REQUIRE(estimate.confidence_margin == Approx(1.96 * std::sqrt(0.4 * 0.6 / 100)));

    qber_estimate clean = estimate_qber(100, 0, 1.96);
    REQUIRE(clean.qber == 0.);
    REQUIRE(clean.confidence_margin == 0.);

    REQUIRE_THROWS_AS(estimate_qber(10, 11, 1.96), std::invalid_argument);
}

TEST_CASE("An empty sample is insufficient key material", "[sampler]")
{
    try
    {
        estimate_qber(0, 0, 1.96);
        FAIL("Expected qkd_failure");
    }
    catch (const qkd_failure &e)
    {
        REQUIRE(e.reason() == failure_reason::INSUFFICIENT_KEY_MATERIAL);
    }
}

TEST_CASE("Margin counts against the abort threshold", "[sampler]")
{
    REQUIRE_NOTHROW(check_qber(estimate_qber(1000, 50, 1.96), 0.11));

    // 0.10 alone is below 0.11, but not with its margin.
    try
    {
        check_qber(estimate_qber(100, 10, 1.96), 0.11);
        FAIL("Expected qkd_failure");
    }
    catch (const qkd_failure &e)
    {
        REQUIRE(e.reason() == failure_reason::CHANNEL_TOO_NOISY);
    }
}

TEST_CASE("Sampling removes disclosed bits from both keys", "[sampler]")
{
    pipeline_config cfg = make_test_config();
    raw_key_pair keys = make_key_pair(1000, 10, 3);
    reference_link link(keys.alice, cfg);
    leakage_ledger ledger;

    std::vector<size_t> positions = select_sample_positions(1000, cfg.SAMPLE_FRACTION, cfg.PRNG_SEED);
    size_t expected_mismatches = 0;
    for (size_t position : positions)
    {
        expected_mismatches += static_cast<size_t>(keys.alice[position] != keys.bob[position]);
    }

    std::vector<int> bob = keys.bob;
    qber_estimate estimate = run_qber_sampling(bob, link.channel, cfg, ledger);

    REQUIRE(estimate.sample_size == 100);
    REQUIRE(estimate.mismatches == expected_mismatches);
    REQUIRE(bob.size() == 900);
    REQUIRE(link.party->key_length() == 900);
    REQUIRE(ledger.sampled_bits() == 100);
    REQUIRE(ledger.parity_bits() == 0);

    std::vector<int> alice = keys.alice;
    remove_positions(alice, positions);
    std::vector<int> expected_bob = keys.bob;
    remove_positions(expected_bob, positions);
    REQUIRE(bob == expected_bob);
    REQUIRE(count_mismatches(alice, bob) == 10 - expected_mismatches);
}

TEST_CASE("40 mismatches in a 100-bit sample abort before reconciliation", "[sampler][pipeline]")
{
    pipeline_config cfg = make_test_config();
    cfg.QBER_ABORT_THRESHOLD = 0.11;
    raw_key_pair keys = make_key_pair(1000, 0, 11);

    std::vector<size_t> positions = select_sample_positions(1000, cfg.SAMPLE_FRACTION, cfg.PRNG_SEED);
    REQUIRE(positions.size() == 100);
    for (size_t i = 0; i < 40; i++)
    {
        keys.bob[positions[i]] ^= 1;
    }

    reference_link link(keys.alice, cfg);
    scripted_channel channel(link.channel);
    leakage_ledger ledger;

    try
    {
        run_corrector_pipeline(keys.bob, channel, cfg, ledger);
        FAIL("Expected qkd_failure");
    }
    catch (const qkd_failure &e)
    {
        REQUIRE(e.reason() == failure_reason::CHANNEL_TOO_NOISY);
    }

    REQUIRE(channel.count(message_type::SAMPLE_DISCLOSE) == 1);
    REQUIRE(channel.count(message_type::BLOCK_PARITY) == 0);
    REQUIRE(channel.count(message_type::BISECT_QUERY) == 0);
    REQUIRE(channel.count(message_type::HASH_SEED_EXCHANGE) == 0);
    REQUIRE(channel.count(message_type::ABORT) == 1);
    REQUIRE(ledger.parity_bits() == 0);
    REQUIRE(link.party->aborted());
    REQUIRE(link.party->final_key_bits().empty());
}

TEST_CASE("A slow sample reply does not shrink the reference key twice", "[sampler][channel]")
{
    pipeline_config cfg = make_test_config();
    cfg.CHANNEL_TIMEOUT_MS = 50;
    cfg.CHANNEL_MAX_RETRIES = 5;
    raw_key_pair keys = make_key_pair(1000, 10, 23);
    slow_reference_link link(keys.alice, cfg, message_type::SAMPLE_DISCLOSE, std::chrono::milliseconds(80));
    leakage_ledger ledger;

    std::vector<int> bob = keys.bob;
    qber_estimate estimate = run_qber_sampling(bob, link.channel, cfg, ledger);

    REQUIRE(estimate.sample_size == 100);
    REQUIRE(bob.size() == 900);
    REQUIRE(link.party->key_length() == 900);
    REQUIRE(*link.handled == 1);
}
