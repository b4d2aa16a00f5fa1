#include <IcoDual/GlobalBenchmark.hh>

#ifdef BENCHMARK
// Stage timings of every mesh built by this process.
Timer g_timer;
#endif
