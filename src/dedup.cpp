#include "cloudmux/dedup.hpp"
#include "cloudmux/log.hpp"

#include <algorithm>

namespace cloudmux {

const char* dedup_verdict_name(DedupVerdict verdict) {
    switch (verdict) {
        case DedupVerdict::Exists: return "exists";
        case DedupVerdict::NotFound: return "not-found";
        case DedupVerdict::NeedsFullHash: return "needs-full-hash";
        case DedupVerdict::NeedsRangeHash: return "needs-range-hash";
    }
    return "unknown";
}

HashNegotiator::HashNegotiator(DedupCapabilities caps, std::vector<uint8_t>& buffer)
    : caps_(std::move(caps))
    , buffer_(buffer) {}

uint8_t* HashNegotiator::scratch(size_t& size) {
    if (buffer_.empty()) buffer_.resize(kDefaultBufferSize);
    size = buffer_.size();
    return buffer_.data();
}

std::string HashNegotiator::empty_digest() const {
    return crypto::digest_hex(caps_.digest, std::string_view{}, caps_.uppercase_hex);
}

HashResult HashNegotiator::partial_hash(ByteSource& source, size_t n,
                                        std::vector<uint8_t>* captured) {
    HashResult result;
    if (source.seekable() && !source.seek(0)) {
        result.error = TransferError::make(ErrorKind::Precondition,
                                           "cannot rewind source: " + source.error());
        return result;
    }

    crypto::Digest digest(caps_.digest);
    size_t cap = 0;
    uint8_t* buf = scratch(cap);
    while (result.bytes < n) {
        size_t want = std::min<uint64_t>(cap, n - result.bytes);
        size_t got = source.read(buf, want);
        if (got == 0) break;
        digest.update(buf, got);
        if (captured) captured->insert(captured->end(), buf, buf + got);
        result.bytes += got;
    }
    if (!source.error().empty()) {
        result.error = TransferError::make(ErrorKind::Precondition, source.error());
        return result;
    }

    bytes_hashed_ += result.bytes;
    result.hex = digest.finish_hex(caps_.uppercase_hex);
    result.success = true;
    return result;
}

HashResult HashNegotiator::full_hash(ByteSource& source, std::optional<uint64_t> expected_size) {
    HashResult result;
    if (!source.seekable() || !source.seek(0)) {
        result.error = TransferError::make(ErrorKind::Precondition,
                                           "full hash needs a seekable source");
        return result;
    }

    full_hash_passes_++;
    crypto::Digest digest(caps_.digest);
    size_t cap = 0;
    uint8_t* buf = scratch(cap);
    for (;;) {
        size_t got = source.read(buf, cap);
        if (got == 0) break;
        digest.update(buf, got);
        result.bytes += got;
    }
    if (!source.error().empty()) {
        result.error = TransferError::make(ErrorKind::Precondition, source.error());
        return result;
    }
    bytes_hashed_ += result.bytes;

    if (expected_size && *expected_size != result.bytes) {
        result.error = TransferError::make(
            ErrorKind::IntegrityMismatch,
            "source length " + std::to_string(result.bytes) + " differs from declared " +
                std::to_string(*expected_size));
        return result;
    }

    result.hex = digest.finish_hex(caps_.uppercase_hex);
    result.success = true;
    return result;
}

HashResult HashNegotiator::range_hash(ByteSource& source, uint64_t offset, uint64_t length) {
    HashResult result;
    if (!source.seekable() || !source.seek(offset)) {
        result.error = TransferError::make(ErrorKind::Precondition,
                                           "range hash needs a seekable source");
        return result;
    }

    crypto::Digest digest(caps_.digest);
    size_t cap = 0;
    uint8_t* buf = scratch(cap);
    while (result.bytes < length) {
        size_t want = std::min<uint64_t>(cap, length - result.bytes);
        size_t got = source.read(buf, want);
        if (got == 0) break;
        digest.update(buf, got);
        result.bytes += got;
    }
    if (result.bytes != length) {
        result.error = TransferError::make(ErrorKind::IntegrityMismatch,
                                           "range " + std::to_string(offset) + "+" +
                                               std::to_string(length) + " beyond end of source");
        return result;
    }
    bytes_hashed_ += result.bytes;
    result.hex = digest.finish_hex(caps_.uppercase_hex);
    result.success = true;
    return result;
}

DedupProbe HashNegotiator::probe(ByteSource& source, uint64_t declared_size,
                                 const std::string& name, const DedupQueryFn& query) {
    DedupProbe probe;
    if (!caps_.dedup_enabled || !query) {
        probe.skipped_reason = "dedup disabled";
        return probe;
    }

    const bool seekable = source.seekable();
    if (!seekable && (caps_.full_hash_mandatory || caps_.requires_seekable_source)) {
        probe.skipped_reason = "one-shot source cannot provide the mandatory full hash";
        log_warn("Rapid upload skipped for %s: %s", name.c_str(), probe.skipped_reason.c_str());
        return probe;
    }
    if (!caps_.supports_partial_hash && !caps_.supports_full_hash) {
        probe.skipped_reason = "backend accepts no content hash";
        return probe;
    }

    probe.attempted = true;

    DedupQuery q;
    q.size = declared_size;
    q.name = name;
    if (seekable) {
        q.read_range = [&source](uint64_t offset, size_t length)
            -> std::optional<std::vector<uint8_t>> {
            if (!source.seek(offset)) return std::nullopt;
            std::vector<uint8_t> out(length);
            out.resize(read_fully(source, out.data(), length));
            return out;
        };
    }

    try {
        if (declared_size == 0) {
            probe.partial_hash = probe.full_hash = empty_digest();
            probe.full_hash_computed = true;
        } else if (caps_.supports_partial_hash) {
            auto partial = partial_hash(source, caps_.partial_hash_size,
                                        seekable ? nullptr : &probe.captured_prefix);
            if (!partial.success) {
                probe.error = partial.error;
                return probe;
            }
            probe.partial_hash = partial.hex;
            if (declared_size <= caps_.partial_hash_size) {
                if (partial.bytes != declared_size) {
                    probe.error = TransferError::make(
                        ErrorKind::IntegrityMismatch,
                        "source length " + std::to_string(partial.bytes) +
                            " differs from declared " + std::to_string(declared_size));
                    return probe;
                }
                // Prefix covers the whole file
                probe.full_hash = partial.hex;
            }
        }
        if (probe.partial_hash.empty() && probe.full_hash.empty()) {
            auto full = full_hash(source, declared_size);
            if (!full.success) {
                probe.error = full.error;
                return probe;
            }
            probe.full_hash = full.hex;
            probe.full_hash_computed = true;
        }

        q.partial_hash = probe.partial_hash;
        // Backends without a partial-hash round only ever see the full hash
        if (caps_.supports_partial_hash || caps_.supports_full_hash) q.full_hash = probe.full_hash;
        if (!caps_.supports_partial_hash) q.partial_hash.clear();

        for (int round = 0; round < caps_.max_rounds; ++round) {
            q.round = round;
            probe.rounds = round + 1;
            DedupAnswer answer = query(q);
            probe.answer = answer;

            if (!answer.error.ok()) {
                probe.error = answer.error;
                break;
            }
            log_debug("Dedup round %d for %s: %s", round, name.c_str(),
                      dedup_verdict_name(answer.verdict));

            if (answer.verdict == DedupVerdict::Exists) {
                probe.matched = true;
                break;
            }
            if (answer.verdict == DedupVerdict::NotFound) break;

            if (answer.verdict == DedupVerdict::NeedsFullHash) {
                if (!q.full_hash.empty()) {
                    // The full hash was already on offer; asking again changes nothing
                    probe.answer.verdict = DedupVerdict::NotFound;
                    break;
                }
                if (!seekable) {
                    probe.skipped_reason = "full hash requested for a one-shot source";
                    log_warn("Rapid upload abandoned for %s: %s", name.c_str(),
                             probe.skipped_reason.c_str());
                    probe.answer.verdict = DedupVerdict::NotFound;
                    break;
                }
                if (probe.full_hash.empty()) {
                    auto full = full_hash(source, declared_size);
                    if (!full.success) {
                        probe.error = full.error;
                        break;
                    }
                    probe.full_hash = full.hex;
                    probe.full_hash_computed = true;
                }
                q.full_hash = probe.full_hash;
                continue;
            }

            // NeedsRangeHash
            if (!seekable) {
                probe.skipped_reason = "range proof requested for a one-shot source";
                probe.answer.verdict = DedupVerdict::NotFound;
                break;
            }
            if (answer.range_end < answer.range_start || answer.range_end >= declared_size) {
                probe.error = TransferError::make(
                    ErrorKind::BackendRejected,
                    "invalid proof range " + std::to_string(answer.range_start) + "-" +
                        std::to_string(answer.range_end));
                break;
            }
            auto range = range_hash(source, answer.range_start,
                                    answer.range_end - answer.range_start + 1);
            if (!range.success) {
                probe.error = range.error;
                break;
            }
            q.range_key = answer.range_key.empty()
                              ? std::to_string(answer.range_start) + "-" +
                                    std::to_string(answer.range_end)
                              : answer.range_key;
            q.range_hash = range.hex;
        }
    } catch (const std::exception& e) {
        probe.error = TransferError::make(ErrorKind::Precondition,
                                          std::string("hashing failed: ") + e.what());
    }

    if (seekable && !source.seek(0) && probe.error.ok()) {
        probe.error = TransferError::make(ErrorKind::Precondition,
                                          "cannot rewind source: " + source.error());
    }
    return probe;
}

}  // namespace cloudmux
