#include "ramancal/BatchCalibration.hpp"
#include "ramancal/ThreadPool.hpp"
#include <algorithm>
#include <future>
#include <iostream>

namespace ramancal {

std::vector<CalibrationRun> calibrate_batch(const std::vector<CalibrationPair>& pairs,
                                            const CalibrationConfig&            config,
                                            unsigned                            nthreads)
{
    const Calibrator calibrator(config);

    std::vector<CalibrationRun> runs;
    runs.reserve(pairs.size());
    if (pairs.empty()) return runs;

    nthreads = std::min<unsigned>(resolve_thread_count(nthreads),
                                  static_cast<unsigned>(pairs.size()));
    if (config.verbose)
        std::cout << "[Batch] calibrating " << pairs.size() << " pairs on "
                  << nthreads << " threads\n";

    ThreadPool pool(nthreads);
    std::vector<std::future<CalibrationRun>> futs;
    futs.reserve(pairs.size());
    for (const auto& p : pairs)
        futs.emplace_back(pool.enqueue([&calibrator, &p] {
            return calibrator.run_(p.excitation, p.emission, true);
        }));

    for (std::size_t i = 0; i < futs.size(); ++i) {
        runs.push_back(futs[i].get());
        if (!runs.back().ok())
            std::cerr << "[Batch] Warning: '" << pairs[i].name << "' failed: "
                      << runs.back().error_message() << '\n';
    }
    return runs;
}

} // namespace ramancal
