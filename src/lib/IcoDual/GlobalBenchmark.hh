////////////////////////////////////////////////////////////////////////////////
// GlobalBenchmark.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      Process-wide stage timer. The construction pipeline opens a section
//      per stage (refinement, links, patches and corners, faces, cells); the
//      sections only record anything when compiled with -DBENCHMARK, and
//      otherwise cost nothing.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef GLOBALBENCHMARK_HH
#define GLOBALBENCHMARK_HH
#include <string>
#include <iostream>
#include <IcoDual_export.h>

#ifdef BENCHMARK
#include <IcoDual/Timer.hh>

ICODUAL_EXPORT extern Timer g_timer;

inline void BENCHMARK_START_TIMER_SECTION(const std::string &name) { g_timer.startSection(name); }
inline void  BENCHMARK_STOP_TIMER_SECTION(const std::string &name) { g_timer.stopSection(name); }
inline void               BENCHMARK_RESET()                        { g_timer.reset(); }
inline void BENCHMARK_REPORT(std::ostream &os = std::cout)         { g_timer.report(os); }
#else
inline void BENCHMARK_START_TIMER_SECTION(const std::string &/* name */) { }
inline void  BENCHMARK_STOP_TIMER_SECTION(const std::string &/* name */) { }
inline void               BENCHMARK_RESET() { }
inline void BENCHMARK_REPORT(std::ostream &/* os */ = std::cout) {
    std::cerr << "WARNING: built without -DBENCHMARK; no stage timings were recorded." << std::endl;
}
#endif

// Times the enclosing scope as a (possibly nested) section.
class BENCHMARK_SCOPED_TIMER_SECTION {
public:
    explicit BENCHMARK_SCOPED_TIMER_SECTION(const std::string &name) : m_name(name) {
        BENCHMARK_START_TIMER_SECTION(m_name);
    }
    ~BENCHMARK_SCOPED_TIMER_SECTION() { BENCHMARK_STOP_TIMER_SECTION(m_name); }

    BENCHMARK_SCOPED_TIMER_SECTION(const BENCHMARK_SCOPED_TIMER_SECTION &) = delete;
    BENCHMARK_SCOPED_TIMER_SECTION &operator=(const BENCHMARK_SCOPED_TIMER_SECTION &) = delete;
private:
    std::string m_name;
};

#endif /* end of include guard: GLOBALBENCHMARK_HH */
