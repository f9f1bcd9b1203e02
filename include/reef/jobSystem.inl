#pragma once

#include <cstring>
#include <type_traits>

namespace Reef {

namespace Jobs {

namespace detail {

JobId createChildJobImpl(JobSystem& jobSystem, JobId parent, JobFunction function, const void* data = nullptr, size_t dataSize = 0);

struct ParallelForJobData {
	ParallelForFunction function;
	uint32_t            batchSize;
	uint32_t            offset;
	uint32_t            count;
	char                functionArgs[24];
};

void parallelForImpl(const JobParams& prm);

} // namespace detail

template <typename... ArgType>
JobId createChildJob(JobSystem& jobSystem, JobId parentJobId, JobFunction function, ArgType... args) {
	static_assert((std::is_trivially_copyable_v<ArgType> && ... && true));

	auto argTuple = std::make_tuple(args...);
	return detail::createChildJobImpl(jobSystem, parentJobId, function, &argTuple, sizeof argTuple);
}

template <typename... ArgType>
JobId parallelFor(JobSystem& jobSystem, JobId parent, size_t batchSize, ParallelForFunction function, size_t elementCount,
                  const ArgType&... args) {
	static_assert((std::is_trivially_copyable_v<ArgType> && ... && true));

	auto                       argTuple = std::make_tuple(args...);
	detail::ParallelForJobData jobData { function, (uint32_t)batchSize, 0, (uint32_t)elementCount, {} };
	// Store extra arguments in the job data
	static_assert(sizeof argTuple <= sizeof jobData.functionArgs);
	std::memcpy(jobData.functionArgs, &argTuple, sizeof argTuple);
	return detail::createChildJobImpl(jobSystem, parent, detail::parallelForImpl, &jobData, sizeof jobData);
}

template <typename ArgType>
ArgType unpackJobArg(const void* args) {
	static_assert((std::is_trivially_copyable_v<ArgType>));

	ArgType arg;
	std::memcpy(&arg, args, sizeof arg);
	return arg;
}

template <typename... ArgType>
std::tuple<ArgType...> unpackJobArgs(const void* args) {
	static_assert((std::is_trivially_copyable_v<ArgType> && ... && true));

	std::tuple<ArgType...> tuple;
	std::memcpy(&tuple, args, sizeof tuple);
	return tuple;
}

} // namespace Jobs

} // namespace Reef
