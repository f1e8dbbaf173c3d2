#include "strategy/batch_bald_sampling.hpp"
#include "errors/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>

namespace specsel {

namespace {

// probs[k][n][c]
using Posterior = std::vector<ScoreMatrix>;

std::vector<double> normalizedRow(const std::vector<double>& row) {
    std::vector<double> p(row.size());
    double total = 0.0;
    for (size_t c = 0; c < row.size(); c++) {
        p[c] = std::isfinite(row[c]) ? std::max(row[c], 0.0) : 0.0;
        total += p[c];
    }
    if (total <= 0.0) {
        std::fill(p.begin(), p.end(), 1.0 / static_cast<double>(p.size()));
        return p;
    }
    for (double& v : p) v /= total;
    return p;
}

double plogp(double p) { return p > 0.0 ? p * std::log(p) : 0.0; }

// Joint label configurations of the batch so far. Row m, column k holds
// p(configuration m | draw k).
struct JointTable {
    size_t configs = 1;
    bool sampled = false;
    std::vector<double> weight;  // configs x draws, row-major
};

void extendExact(JointTable& joint, const Posterior& probs, size_t n) {
    const size_t draws = probs.size();
    const size_t classes = probs.front()[n].size();
    std::vector<double> next(joint.configs * classes * draws);
    for (size_t m = 0; m < joint.configs; m++) {
        for (size_t c = 0; c < classes; c++) {
            for (size_t k = 0; k < draws; k++) {
                next[(m * classes + c) * draws + k] = joint.weight[m * draws + k] * probs[k][n][c];
            }
        }
    }
    joint.configs *= classes;
    joint.weight = std::move(next);
}

// Draw `samples` configurations of `batch` from the posterior mixture:
// pick a draw uniformly, then one label per batch member from that draw.
void resample(JointTable& joint, const Posterior& probs,
              const std::vector<size_t>& batch, size_t samples, std::mt19937_64& rng) {
    const size_t draws = probs.size();
    std::uniform_int_distribution<size_t> pick_draw(0, draws - 1);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    joint.configs = samples;
    joint.sampled = true;
    joint.weight.assign(samples * draws, 1.0);
    for (size_t s = 0; s < samples; s++) {
        const size_t source = pick_draw(rng);
        for (size_t n : batch) {
            const std::vector<double>& row = probs[source][n];
            double u = unit(rng), acc = 0.0;
            size_t label = row.size() - 1;
            for (size_t c = 0; c < row.size(); c++) {
                acc += row[c];
                if (u < acc) { label = c; break; }
            }
            for (size_t k = 0; k < draws; k++) {
                joint.weight[s * draws + k] *= probs[k][n][label];
            }
        }
    }
}

// H(y_batch, y_n) under the current joint table.
double jointEntropy(const JointTable& joint, const Posterior& probs, size_t n) {
    const size_t draws = probs.size();
    const size_t classes = probs.front()[n].size();
    const double inv_draws = 1.0 / static_cast<double>(draws);
    double h = 0.0;

    if (!joint.sampled) {
        for (size_t m = 0; m < joint.configs; m++) {
            for (size_t c = 0; c < classes; c++) {
                double p = 0.0;
                for (size_t k = 0; k < draws; k++) {
                    p += joint.weight[m * draws + k] * probs[k][n][c];
                }
                h -= plogp(p * inv_draws);
            }
        }
        return h;
    }

    // Importance weights: sampled configuration s had probability q_s.
    const double inv_samples = 1.0 / static_cast<double>(joint.configs);
    for (size_t s = 0; s < joint.configs; s++) {
        double q = 0.0;
        for (size_t k = 0; k < draws; k++) q += joint.weight[s * draws + k];
        q *= inv_draws;
        if (q <= 0.0) continue;
        for (size_t c = 0; c < classes; c++) {
            double p = 0.0;
            for (size_t k = 0; k < draws; k++) {
                p += joint.weight[s * draws + k] * probs[k][n][c];
            }
            p *= inv_draws;
            if (p > 0.0) h -= std::log(p) * p / q * inv_samples;
        }
    }
    return h;
}

} // namespace

BatchBaldSampling::BatchBaldSampling(size_t max_exact_configs, size_t joint_samples)
    : max_exact_configs_(max_exact_configs), joint_samples_(joint_samples) {
    if (max_exact_configs_ == 0 || joint_samples_ == 0) {
        throw InvariantError("batch-bald needs positive max_exact_configs and joint_samples");
    }
}

std::vector<CandidateId> BatchBaldSampling::select(const QueryContext& context,
                                                   size_t k) const {
    const size_t pool = context.pool_ids.size();
    if (k == 0 || pool == 0) return {};
    validateQueryContext(context, false, false);
    validateScoreSamples(context);

    const size_t draws = context.pool_score_samples.size();
    Posterior probs(draws, ScoreMatrix(pool));
    for (size_t d = 0; d < draws; d++) {
        for (size_t n = 0; n < pool; n++) {
            probs[d][n] = normalizedRow(context.pool_score_samples[d][n]);
        }
    }
    const size_t classes = probs.front().front().size();

    // E_k[H(y_n | draw k)]
    std::vector<double> conditional(pool, 0.0);
    for (size_t n = 0; n < pool; n++) {
        for (size_t d = 0; d < draws; d++) {
            for (double p : probs[d][n]) conditional[n] -= plogp(p);
        }
        conditional[n] /= static_cast<double>(draws);
    }

    std::seed_seq seq{static_cast<uint32_t>(context.seed & 0xffffffffu),
                      static_cast<uint32_t>(context.seed >> 32),
                      static_cast<uint32_t>(context.iteration)};
    std::mt19937_64 rng(seq);

    const size_t target = std::min(k, pool);
    std::vector<size_t> batch;
    std::vector<bool> taken(pool, false);
    double batch_conditional = 0.0;
    JointTable joint;
    joint.weight.assign(draws, 1.0);

    while (batch.size() < target) {
        size_t best = pool;
        double best_score = -std::numeric_limits<double>::infinity();
        for (size_t n = 0; n < pool; n++) {
            if (taken[n]) continue;
            double score = jointEntropy(joint, probs, n) - (batch_conditional + conditional[n]);
            if (best == pool || score > best_score ||
                (score == best_score && context.pool_ids[n] < context.pool_ids[best])) {
                best = n;
                best_score = score;
            }
        }

        batch.push_back(best);
        taken[best] = true;
        batch_conditional += conditional[best];
        if (batch.size() == target) break;

        if (!joint.sampled && joint.configs * classes * classes <= max_exact_configs_) {
            extendExact(joint, probs, best);
        } else {
            resample(joint, probs, batch, joint_samples_, rng);
        }
    }

    std::vector<CandidateId> ids;
    ids.reserve(batch.size());
    for (size_t n : batch) ids.push_back(context.pool_ids[n]);
    return ids;
}

} // namespace specsel
