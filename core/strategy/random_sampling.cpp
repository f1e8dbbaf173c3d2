#include "strategy/random_sampling.hpp"

#include <algorithm>
#include <random>

namespace specsel {

std::vector<CandidateId> RandomSampling::select(const QueryContext& context,
                                                size_t k) const {
    validateQueryContext(context, false, false);

    // Sort first so the draw depends on the pool's contents, not its order
    std::vector<CandidateId> ids = context.pool_ids;
    std::sort(ids.begin(), ids.end());
    const size_t n = std::min(k, ids.size());

    std::seed_seq seq{static_cast<uint32_t>(context.seed & 0xffffffffu),
                      static_cast<uint32_t>(context.seed >> 32),
                      static_cast<uint32_t>(context.iteration)};
    std::mt19937_64 rng(seq);

    // Partial Fisher-Yates: the first n slots end up a uniform sample
    for (size_t i = 0; i < n; i++) {
        std::uniform_int_distribution<size_t> pick(i, ids.size() - 1);
        std::swap(ids[i], ids[pick(rng)]);
    }
    ids.resize(n);
    return ids;
}

} // namespace specsel
