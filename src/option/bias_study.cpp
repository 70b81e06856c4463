// SPDX-License-Identifier: MIT
#include "src/option/bias_study.hpp"
#include "src/option/lsm_pricer.hpp"
#include "src/support/lsmc_trace.h"

namespace lsmc {

std::expected<BiasStudyResult, PricingError>
run_bias_study(const LsmConfig& config, const BiasStudyConfig& study) {
    if (study.n_repetitions < 1) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidRepetitionCount,
                                               static_cast<double>(study.n_repetitions)));
    }
    auto validation = validate_lsm_config(config);
    if (!validation.has_value()) {
        return std::unexpected(validation.error());
    }

    LSMC_TRACE_ALGO_START(LSMC_MODULE_BIAS_STUDY, config.n_timestep, config.n_path,
                          study.n_repetitions);

    BiasStudyResult out;
    out.npvs.reserve(study.n_repetitions);

    for (size_t i = 0; i < study.n_repetitions; ++i) {
        LsmConfig run = config;
        run.seed = study.first_seed + i;

        // Validated above; only the seed differs between repetitions
        auto result = LongstaffSchwartzPricer(run).solve();
        if (!result.has_value()) {
            return std::unexpected(result.error());
        }
        out.npvs.push_back(result->npv);
    }

    out.mean = sample_mean(out.npvs);
    out.standard_error = standard_error(out.npvs);
    if (study.reference_price.has_value()) {
        out.bias = out.mean - *study.reference_price;
    }
    out.histogram = make_histogram(out.npvs, study.n_bins);

    LSMC_TRACE_ALGO_COMPLETE(LSMC_MODULE_BIAS_STUDY, study.n_repetitions, out.mean);
    return out;
}

}  // namespace lsmc
