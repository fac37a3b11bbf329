#pragma once

#include "cloudmux/byte_source.hpp"
#include "cloudmux/crypto.hpp"
#include "cloudmux/error.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cloudmux {

struct DedupCapabilities {
    bool dedup_enabled = false;
    bool supports_partial_hash = false;
    bool supports_full_hash = false;
    bool requires_seekable_source = false;
    bool full_hash_mandatory = false;  // backend refuses a match without the full hash
    size_t partial_hash_size = 128 * 1024;
    crypto::DigestAlgorithm digest = crypto::DigestAlgorithm::Sha1;
    bool uppercase_hex = true;
    int max_rounds = 4;
};

enum class DedupVerdict { Exists, NotFound, NeedsFullHash, NeedsRangeHash };

const char* dedup_verdict_name(DedupVerdict verdict);

/// What the negotiator knows so far, handed to the backend's dedup query.
struct DedupQuery {
    uint64_t size = 0;
    std::string name;
    int round = 0;
    std::string partial_hash;  // empty until computed
    std::string full_hash;     // empty until computed
    std::string range_key;     // "start-end" echoed back for range proofs
    std::string range_hash;
    /// Reads `length` bytes at `offset`. Only set for seekable sources.
    std::function<std::optional<std::vector<uint8_t>>(uint64_t offset, size_t length)> read_range;
};

struct DedupAnswer {
    DedupVerdict verdict = DedupVerdict::NotFound;
    std::string remote_id;
    uint64_t range_start = 0;
    uint64_t range_end = 0;  // inclusive
    std::string range_key;
    TransferError error;
    /// Backend state to carry into the chunked upload (e.g. a file id
    /// already created by the dedup call).
    std::vector<std::pair<std::string, std::string>> attributes;
};

using DedupQueryFn = std::function<DedupAnswer(const DedupQuery&)>;

struct DedupProbe {
    bool attempted = false;
    bool matched = false;
    bool full_hash_computed = false;
    std::string partial_hash;
    std::string full_hash;
    DedupAnswer answer;
    TransferError error;
    int rounds = 0;
    std::string skipped_reason;
    /// Prefix consumed from a one-shot source, to be replayed on upload.
    std::vector<uint8_t> captured_prefix;
};

struct HashResult {
    bool success = false;
    std::string hex;
    uint64_t bytes = 0;
    TransferError error;
};

/// Streaming content hashing and the rapid-upload negotiation loop.
///
/// Hash passes reuse the caller's chunk buffer, so hashing never adds a
/// second chunk of resident memory. Seekable sources are rewound to 0
/// after the probe.
class HashNegotiator {
public:
    static constexpr size_t kDefaultBufferSize = 1024 * 1024;

    HashNegotiator(DedupCapabilities caps, std::vector<uint8_t>& buffer);

    /// Digest of exactly the first min(n, size) bytes.
    HashResult partial_hash(ByteSource& source, size_t n,
                            std::vector<uint8_t>* captured = nullptr);

    /// Digest of the whole stream. A byte count different from
    /// `expected_size` is an IntegrityMismatch.
    HashResult full_hash(ByteSource& source, std::optional<uint64_t> expected_size);

    HashResult range_hash(ByteSource& source, uint64_t offset, uint64_t length);

    DedupProbe probe(ByteSource& source, uint64_t declared_size, const std::string& name,
                     const DedupQueryFn& query);

    std::string empty_digest() const;

    uint64_t full_hash_passes() const { return full_hash_passes_; }
    uint64_t bytes_hashed() const { return bytes_hashed_; }

private:
    uint8_t* scratch(size_t& size);

    DedupCapabilities caps_;
    std::vector<uint8_t>& buffer_;
    uint64_t full_hash_passes_ = 0;
    uint64_t bytes_hashed_ = 0;
};

}  // namespace cloudmux
