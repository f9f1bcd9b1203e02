#include "common.h"
#include <algorithm>

using namespace Reef;
using namespace Reef::Jobs;

void printStats(const JobSystem& jobSystem) {
	for (size_t i = 0; i < getThreadCount(jobSystem); ++i) {
		const auto stats = getThreadStats(jobSystem, i);
		print("Thread %zd%s", i, i == 0 ? " (main)" : "");
#if RF_JS_PROFILE
		print("  Total time: %.5f sec", static_cast<double>(stats.totalTime.count()) / 1e6);
		print("  Running time: %.5f sec", static_cast<double>(stats.runningTime.count()) / 1e6);
		print("  Idle time: %.5f sec", static_cast<double>(stats.totalTime.count() - stats.runningTime.count()) / 1e6);
#endif
		print("  Enqueued jobs: %zd", stats.numEnqueuedJobs);
		print("  Executed jobs: %zd", stats.numExecutedJobs);
		print("  Stolen jobs: %zd", stats.numStolenJobs);
		print("  Attempted stealings: %zd", stats.numAttemptedStealings);
		print("  Stealing efficiency : %.2f %%",
		      100.f * static_cast<float>(stats.numStolenJobs) / static_cast<float>(std::max<size_t>(1, stats.numAttemptedStealings)));
	}
}
