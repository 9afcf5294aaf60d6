#include "osync/sync/version_vector.hpp"

#include <algorithm>
#include <limits>
#include <sstream>

namespace osync::sync {
namespace {

void write_le(std::vector<std::uint8_t>& out, std::uint64_t value, std::size_t width) {
    for (std::size_t i = 0; i < width; ++i) {
        out.push_back(static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

bool read_le(const std::vector<std::uint8_t>& in, std::size_t& pos, std::size_t width, std::uint64_t& value) {
    if (in.size() < pos || in.size() - pos < width) {
        return false;
    }
    value = 0;
    for (std::size_t i = 0; i < width; ++i) {
        value |= static_cast<std::uint64_t>(in[pos + i]) << (8 * i);
    }
    pos += width;
    return true;
}

} // namespace

const char* to_string(VectorOrdering ordering) {
    switch (ordering) {
        case VectorOrdering::Equal: return "Equal";
        case VectorOrdering::Dominates: return "Dominates";
        case VectorOrdering::Dominated: return "Dominated";
        case VectorOrdering::Concurrent: return "Concurrent";
    }
    return "Unknown";
}

VersionVector::VersionVector(Counters counters) : counters_(std::move(counters)) {}

VersionVector VersionVector::increment(const std::string& node_id) const {
    Counters next = counters_;
    ++next[node_id];
    return VersionVector(std::move(next));
}

VersionVector VersionVector::merge(const VersionVector& other) const {
    Counters merged = counters_;
    for (const auto& [node, counter] : other.counters_) {
        auto& slot = merged[node];
        slot = std::max(slot, counter);
    }
    return VersionVector(std::move(merged));
}

VectorOrdering VersionVector::compare(const VersionVector& other) const {
    bool self_greater = false;
    bool other_greater = false;

    for (const auto& [node, counter] : counters_) {
        const auto theirs = other.get(node);
        if (counter > theirs) {
            self_greater = true;
        } else if (counter < theirs) {
            other_greater = true;
        }
    }
    for (const auto& [node, counter] : other.counters_) {
        if (counters_.find(node) == counters_.end() && counter > 0) {
            other_greater = true;
        }
    }

    if (self_greater && other_greater) {
        return VectorOrdering::Concurrent;
    }
    if (self_greater) {
        return VectorOrdering::Dominates;
    }
    if (other_greater) {
        return VectorOrdering::Dominated;
    }
    return VectorOrdering::Equal;
}

VersionVector::Counters VersionVector::delta(const VersionVector& other) const {
    Counters missing;
    for (const auto& [node, counter] : other.counters_) {
        if (counter > get(node)) {
            missing.emplace(node, counter);
        }
    }
    return missing;
}

VersionVector VersionVector::apply_delta(const Counters& delta) const {
    Counters next = counters_;
    for (const auto& [node, counter] : delta) {
        auto& slot = next[node];
        slot = std::max(slot, counter);
    }
    return VersionVector(std::move(next));
}

VersionVector VersionVector::prune(std::uint64_t min_value) const {
    Counters kept;
    for (const auto& [node, counter] : counters_) {
        if (counter > min_value) {
            kept.emplace(node, counter);
        }
    }
    return VersionVector(std::move(kept));
}

std::uint64_t VersionVector::get(const std::string& node_id) const {
    const auto it = counters_.find(node_id);
    return it == counters_.end() ? 0 : it->second;
}

std::string VersionVector::to_string() const {
    std::ostringstream oss;
    oss << '{';
    bool first = true;
    for (const auto& [node, counter] : counters_) {
        if (!first) {
            oss << ',';
        }
        oss << node << ':' << counter;
        first = false;
    }
    oss << '}';
    return oss.str();
}

Result<std::vector<std::uint8_t>> VersionVector::to_bytes() const {
    using Bytes = std::vector<std::uint8_t>;
    if (counters_.size() > std::numeric_limits<std::uint32_t>::max()) {
        return Fail<Bytes>(ErrorCode::InvalidPayload,
                           "Version vector has too many entries to encode: " + std::to_string(counters_.size()));
    }

    Bytes out;
    write_le(out, counters_.size(), 4);
    for (const auto& [node, counter] : counters_) {
        if (node.size() > std::numeric_limits<std::uint16_t>::max()) {
            return Fail<Bytes>(ErrorCode::InvalidPayload,
                               "Node id of " + std::to_string(node.size()) + " bytes is too long to encode");
        }
        write_le(out, node.size(), 2);
        out.insert(out.end(), node.begin(), node.end());
        write_le(out, counter, 8);
    }
    return Ok(std::move(out));
}

Result<VersionVector> VersionVector::from_bytes(const std::vector<std::uint8_t>& bytes) {
    std::size_t pos = 0;
    std::uint64_t count = 0;
    if (!read_le(bytes, pos, 4, count)) {
        return Fail<VersionVector>(ErrorCode::InvalidPayload, "Version vector header truncated");
    }

    Counters counters;
    for (std::uint64_t i = 0; i < count; ++i) {
        std::uint64_t key_length = 0;
        if (!read_le(bytes, pos, 2, key_length) || bytes.size() - pos < key_length) {
            return Fail<VersionVector>(ErrorCode::InvalidPayload, "Version vector key truncated");
        }
        std::string node(bytes.begin() + static_cast<std::ptrdiff_t>(pos),
                         bytes.begin() + static_cast<std::ptrdiff_t>(pos + key_length));
        pos += key_length;

        std::uint64_t counter = 0;
        if (!read_le(bytes, pos, 8, counter)) {
            return Fail<VersionVector>(ErrorCode::InvalidPayload, "Version vector counter truncated");
        }
        counters[node] = counter;
    }

    if (pos != bytes.size()) {
        return Fail<VersionVector>(ErrorCode::InvalidPayload, "Trailing bytes after version vector");
    }
    return Ok(VersionVector(std::move(counters)));
}

bool VersionVector::operator==(const VersionVector& other) const {
    return compare(other) == VectorOrdering::Equal;
}

} // namespace osync::sync
