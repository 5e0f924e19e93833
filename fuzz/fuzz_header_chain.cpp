// Fuzz target for header decoding and chain verification
// Input is split into HEADER_SIZE records; a trailing partial record is
// fed to Deserialize() on its own and must be rejected.

#include "chain/header.hpp"
#include "chain/header_chain.hpp"
#include "chain/validation.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

using headerchain::chain::BlockHeader;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    const size_t record = BlockHeader::HEADER_SIZE;
    std::vector<BlockHeader> headers;

    size_t offset = 0;
    for (; offset + record <= size; offset += record) {
        BlockHeader header;
        if (!header.Deserialize(data + offset, record)) {
            // Exact-size input must always decode - BUG!
            __builtin_trap();
        }

        // Encoding must reproduce the input bytes exactly
        auto encoded = header.SerializeFixed();
        for (size_t i = 0; i < record; ++i) {
            if (encoded[i] != data[offset + i]) {
                __builtin_trap();
            }
        }
        headers.push_back(header);
    }

    if (offset < size) {
        BlockHeader partial;
        if (partial.Deserialize(data + offset, size - offset)) {
            // Short record accepted - BUG!
            __builtin_trap();
        }
    }

    if (headers.empty()) {
        return 0;
    }

    // Whole-sequence verification must agree with pairwise folding
    std::span<const BlockHeader> tail = std::span<const BlockHeader>(headers).subspan(1);
    bool whole = headerchain::validation::VerifySubChain(headers[0], tail);

    bool pairwise = true;
    for (size_t i = 1; i < headers.size() && pairwise; ++i) {
        pairwise = headerchain::validation::VerifySubChain(
            headers[i - 1], std::span<const BlockHeader>(&headers[i], 1));
    }
    if (whole != pairwise) {
        __builtin_trap();
    }

    // A header's own child always extends it, except at the maximum height
    BlockHeader child = headerchain::chain::ChildOf(headers.back());
    bool extends = headerchain::validation::VerifySubChain(
        headers.back(), std::span<const BlockHeader>(&child, 1));
    if (extends != (headers.back().nHeight != UINT64_MAX)) {
        __builtin_trap();
    }

    return 0;
}
