#pragma once

/**
 * @file version_vector.hpp
 * @brief Per-entity causal clock
 *
 * WHY THIS FILE EXISTS:
 * Wall-clock timestamps cannot tell "edited after seeing the other edit" apart
 * from "edited at the same time without seeing it". A version vector can:
 * every node that edits an entity bumps its own counter, and comparing two
 * vectors entry by entry tells us whether one version causally contains the
 * other or whether they diverged.
 *
 * EXAMPLE:
 *   local  {laptop:2}            remote {laptop:1, web:1}
 *   laptop:2 > 1 but web:0 < 1   → Concurrent (both sides edited)
 *
 * DESIGN DECISIONS:
 * - Value type: every operation returns a new vector, old vectors stay valid
 *   and can be kept for debugging history.
 * - std::map keeps keys sorted, so printing and binary encoding are stable.
 * - An absent key means counter 0, so {A:0} and {} compare Equal.
 */

#include "osync/core/result.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace osync::sync {

enum class VectorOrdering {
    Equal,       // Same history
    Dominates,   // This vector has seen everything the other has, and more
    Dominated,   // The other vector has seen everything this one has, and more
    Concurrent   // Each side has seen something the other has not
};

const char* to_string(VectorOrdering ordering);

class VersionVector {
public:
    using Counters = std::map<std::string, std::uint64_t>;

    VersionVector() = default;
    explicit VersionVector(Counters counters);

    /**
     * @brief New vector with node_id's counter advanced by one
     */
    [[nodiscard]] VersionVector increment(const std::string& node_id) const;

    /**
     * @brief New vector holding the per-key maximum of both inputs
     *
     * Commutative, associative and idempotent. The result never compares
     * Dominated against either input.
     */
    [[nodiscard]] VersionVector merge(const VersionVector& other) const;

    [[nodiscard]] VectorOrdering compare(const VersionVector& other) const;

    /**
     * @brief Entries of other that are strictly newer than ours
     *
     * What this side is missing. Empty when this vector is Equal to or
     * Dominates other.
     */
    [[nodiscard]] Counters delta(const VersionVector& other) const;

    /**
     * @brief New vector with a delta from another node folded in
     *
     * Per-key maximum. a.apply_delta(a.delta(b)) equals a.merge(b).
     */
    [[nodiscard]] VersionVector apply_delta(const Counters& delta) const;

    /**
     * @brief New vector without entries whose counter is at most min_value
     *
     * Garbage collection for nodes that stopped editing. Only safe once every
     * peer has seen min_value for those nodes.
     */
    [[nodiscard]] VersionVector prune(std::uint64_t min_value) const;

    [[nodiscard]] std::uint64_t get(const std::string& node_id) const;
    [[nodiscard]] const Counters& entries() const noexcept { return counters_; }
    [[nodiscard]] bool empty() const noexcept { return counters_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return counters_.size(); }

    /**
     * @brief Human readable form, e.g. {A:1,B:2}
     */
    [[nodiscard]] std::string to_string() const;

    /**
     * @brief Compact little-endian encoding
     *
     * Layout: u32 entry count, then per entry (sorted by key)
     *         u16 key length, key bytes, u64 counter.
     *
     * Fails with InvalidPayload when a key is longer than 65535 bytes or the
     * vector has more entries than a u32 can count.
     */
    [[nodiscard]] Result<std::vector<std::uint8_t>> to_bytes() const;
    static Result<VersionVector> from_bytes(const std::vector<std::uint8_t>& bytes);

    bool operator==(const VersionVector& other) const;
    bool operator!=(const VersionVector& other) const { return !(*this == other); }

private:
    Counters counters_;
};

} // namespace osync::sync
