#pragma once

#include <reef/jobSystem.h>
#include <reef/log.h>

// Print the statistics of every thread of the job system
void printStats(const Reef::Jobs::JobSystem& jobSystem);
